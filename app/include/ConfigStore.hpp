#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include "CullAction.hpp"
#include <QString>
#include <QJsonObject>
#include <QJsonValue>

enum class ConfigStatus {
    Ok,          // v2 document loaded as-is
    Missing,     // no file yet, defaults in use
    Migrated,    // v1 document upgraded to v2
    Invalid,     // schema violation or malformed JSON, defaults in use
    IoError      // file present but unreadable / unwritable
};

struct ValidationResult {
    bool ok = true;
    QString reason;
};

// Owns the persisted settings document:
//
// {
//   "src": "", "keep": "",
//   "button_mappings": { "left_click": "keep", "right_click": "reject" },
//   "wheel_mappings": { "wheel_up": "previous", "wheel_down": "next" },
//   "options": { "recursive_loading": false }
// }
//
// The on-disk file is always schema-valid: save() refuses anything that
// does not pass validate().
class ConfigStore {
public:
    static constexpr const char* kDefaultFileName = "culler_settings.json";
    static constexpr const char* kBrokenSuffix = ".broken";

    explicit ConfigStore(const QString& file_path);

    // Reads the file into the in-memory document and returns it. Never fails:
    // falls back to defaults and records the reason in last_status()/last_error().
    QJsonObject load();

    bool save(const QJsonObject& doc);
    bool save();

    // Validate + save, with the reason when it did not go through
    ValidationResult apply(const QJsonObject& doc);

    static ValidationResult validate(const QJsonObject& doc);
    static bool is_v1(const QJsonObject& doc);
    static QJsonObject migrate(const QJsonObject& v1_doc);
    static QJsonObject defaults();

    // Dotted-path accessors, e.g. get("options.recursive_loading", false)
    QJsonValue get(const QString& path, const QJsonValue& fallback = QJsonValue()) const;
    void set(const QString& path, const QJsonValue& value);

    QString source_dir() const;
    QString keep_dir() const;
    bool recursive_loading() const;
    GestureMapping gesture_mapping() const;

    const QJsonObject& document() const { return document_; }
    QString file_path() const { return file_path_; }
    ConfigStatus last_status() const { return last_status_; }
    QString last_error() const { return last_error_; }

private:
    QJsonObject fall_back(ConfigStatus status, const QString& reason);
    void preserve_broken_copy() const;

    QString file_path_;
    QJsonObject document_;
    ConfigStatus last_status_;
    QString last_error_;
};

#endif // CONFIG_STORE_HPP
