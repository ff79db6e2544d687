#include "ConfigStore.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStringList>

namespace {

const QStringList kRequiredKeys = {"src", "keep", "button_mappings", "wheel_mappings", "options"};

ValidationResult fail(const QString& reason) {
    return ValidationResult{false, reason};
}

// Checks one mapping section ("button_mappings" / "wheel_mappings")
ValidationResult validate_section(const QJsonObject& doc, const QString& section,
                                  const QStringList& keys, const QString& missing_label) {
    const QJsonValue section_value = doc.value(section);
    if (!section_value.isObject()) {
        return fail(QString("%1 must be an object").arg(section));
    }

    const QJsonObject mappings = section_value.toObject();
    const QStringList valid = valid_action_names();
    for (const QString& key : keys) {
        if (!mappings.contains(key)) {
            return fail(QString("Missing %1: %2").arg(missing_label, key));
        }
        const QJsonValue action = mappings.value(key);
        if (!action.isString()) {
            return fail(QString("Action for %1 must be a string").arg(key));
        }
        if (!valid.contains(action.toString())) {
            return fail(QString("Invalid action '%1' for %2").arg(action.toString(), key));
        }
    }
    return ValidationResult{};
}

void set_path(QJsonObject& obj, const QStringList& keys, int index, const QJsonValue& value) {
    const QString& key = keys[index];
    if (index == keys.size() - 1) {
        obj.insert(key, value);
        return;
    }
    // Missing or non-object intermediates are replaced by an object
    QJsonObject child = obj.value(key).toObject();
    set_path(child, keys, index + 1, value);
    obj.insert(key, child);
}

} // namespace

ConfigStore::ConfigStore(const QString& file_path)
    : file_path_(file_path)
    , document_(defaults())
    , last_status_(ConfigStatus::Missing) {
}

QJsonObject ConfigStore::defaults() {
    QJsonObject button_mappings;
    button_mappings.insert("left_click", action_name(CullAction::Keep));
    button_mappings.insert("right_click", action_name(CullAction::Reject));

    QJsonObject wheel_mappings;
    wheel_mappings.insert("wheel_up", action_name(CullAction::Previous));
    wheel_mappings.insert("wheel_down", action_name(CullAction::Next));

    QJsonObject options;
    options.insert("recursive_loading", false);

    QJsonObject doc;
    doc.insert("src", QString());
    doc.insert("keep", QString());
    doc.insert("button_mappings", button_mappings);
    doc.insert("wheel_mappings", wheel_mappings);
    doc.insert("options", options);
    return doc;
}

bool ConfigStore::is_v1(const QJsonObject& doc) {
    return doc.contains("src") && doc.contains("keep") && !doc.contains("button_mappings");
}

ValidationResult ConfigStore::validate(const QJsonObject& doc) {
    // Old two-key documents are accepted so load() can migrate them
    if (is_v1(doc)) {
        return ValidationResult{};
    }

    for (const QString& key : kRequiredKeys) {
        if (!doc.contains(key)) {
            return fail(QString("Missing required key: %1").arg(key));
        }
    }

    if (!doc.value("src").isString()) {
        return fail("src must be a string");
    }
    if (!doc.value("keep").isString()) {
        return fail("keep must be a string");
    }

    ValidationResult result = validate_section(doc, "button_mappings",
                                               {"left_click", "right_click"}, "button mapping");
    if (!result.ok) return result;

    result = validate_section(doc, "wheel_mappings", {"wheel_up", "wheel_down"}, "wheel mapping");
    if (!result.ok) return result;

    const QJsonValue options_value = doc.value("options");
    if (!options_value.isObject()) {
        return fail("options must be an object");
    }
    const QJsonObject options = options_value.toObject();
    if (!options.contains("recursive_loading")) {
        return fail("Missing option: recursive_loading");
    }
    if (!options.value("recursive_loading").isBool()) {
        return fail("recursive_loading must be a boolean");
    }

    return ValidationResult{};
}

QJsonObject ConfigStore::migrate(const QJsonObject& v1_doc) {
    if (v1_doc.contains("button_mappings")) {
        return v1_doc;
    }

    QJsonObject migrated = defaults();
    migrated.insert("src", v1_doc.value("src").toString());
    migrated.insert("keep", v1_doc.value("keep").toString());
    return migrated;
}

QJsonObject ConfigStore::fall_back(ConfigStatus status, const QString& reason) {
    last_status_ = status;
    last_error_ = reason;
    document_ = defaults();
    return document_;
}

void ConfigStore::preserve_broken_copy() const {
    const QString backup = file_path_ + kBrokenSuffix;
    if (QFile::exists(backup) && !QFile::remove(backup)) {
        LOG_WARN("Config", QString("Could not replace old backup %1").arg(backup));
        return;
    }
    if (QFile::copy(file_path_, backup)) {
        LOG_INFO("Config", QString("Kept unusable settings file as %1").arg(backup));
    } else {
        LOG_WARN("Config", QString("Could not back up unusable settings file to %1").arg(backup));
    }
}

QJsonObject ConfigStore::load() {
    last_error_.clear();

    if (!QFileInfo::exists(file_path_)) {
        LOG_DEBUG("Config", QString("No settings file at %1, using defaults").arg(file_path_));
        return fall_back(ConfigStatus::Missing, QString());
    }

    QFile file(file_path_);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString reason = QString("Cannot read %1: %2").arg(file_path_, file.errorString());
        LOG_ERROR("Config", reason + ". Using defaults.");
        return fall_back(ConfigStatus::IoError, reason);
    }

    QJsonParseError parse_error;
    const QJsonDocument json = QJsonDocument::fromJson(file.readAll(), &parse_error);
    file.close();

    QString reason;
    if (parse_error.error != QJsonParseError::NoError) {
        reason = QString("Malformed JSON at offset %1: %2")
                 .arg(parse_error.offset).arg(parse_error.errorString());
    } else if (!json.isObject()) {
        reason = "Config must be a JSON object";
    } else {
        const ValidationResult validation = validate(json.object());
        if (!validation.ok) {
            reason = QString("Invalid config schema: %1").arg(validation.reason);
        }
    }

    if (!reason.isEmpty()) {
        LOG_WARN("Config", reason + ". Using defaults.");
        preserve_broken_copy();
        return fall_back(ConfigStatus::Invalid, reason);
    }

    const QJsonObject loaded = json.object();
    if (!is_v1(loaded)) {
        document_ = loaded;
        last_status_ = ConfigStatus::Ok;
        return document_;
    }

    LOG_INFO("Config", "Migrating config from v1 to v2 format");
    const QJsonObject migrated = migrate(loaded);
    if (!save(migrated)) {
        LOG_WARN("Config", "Migrated settings could not be written back; continuing in memory");
        document_ = migrated;
    }
    last_status_ = ConfigStatus::Migrated;
    return document_;
}

bool ConfigStore::save(const QJsonObject& doc) {
    const ValidationResult validation = validate(doc);
    if (!validation.ok) {
        LOG_ERROR("Config", QString("Cannot save invalid config: %1").arg(validation.reason));
        return false;
    }
    // Anything written is v2, even if a v1 document is handed in
    const QJsonObject to_write = migrate(doc);

    const QFileInfo info(file_path_);
    if (!QDir().mkpath(info.absolutePath())) {
        LOG_ERROR("Config", QString("Cannot create settings directory %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile file(file_path_);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR("Config", QString("Failed to save settings: %1").arg(file.errorString()));
        return false;
    }

    const QByteArray payload = QJsonDocument(to_write).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        LOG_ERROR("Config", QString("Failed to save settings: %1").arg(file.errorString()));
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        LOG_ERROR("Config", QString("Failed to save settings: %1").arg(file.errorString()));
        return false;
    }

    document_ = to_write;
    LOG_DEBUG("Config", QString("Settings saved to %1").arg(file_path_));
    return true;
}

bool ConfigStore::save() {
    return save(document_);
}

ValidationResult ConfigStore::apply(const QJsonObject& doc) {
    const ValidationResult validation = validate(doc);
    if (!validation.ok) {
        return validation;
    }
    if (!save(doc)) {
        return fail(QString("Could not write settings to %1").arg(file_path_));
    }
    return ValidationResult{};
}

QJsonValue ConfigStore::get(const QString& path, const QJsonValue& fallback) const {
    const QStringList keys = path.split('.');
    QJsonValue value = document_;

    for (const QString& key : keys) {
        if (!value.isObject()) {
            return fallback;
        }
        const QJsonObject obj = value.toObject();
        if (!obj.contains(key)) {
            return fallback;
        }
        value = obj.value(key);
    }

    // A typed fallback also guards against a leaf of the wrong type
    if (!fallback.isNull() && !fallback.isUndefined() && value.type() != fallback.type()) {
        return fallback;
    }
    return value;
}

void ConfigStore::set(const QString& path, const QJsonValue& value) {
    const QStringList keys = path.split('.');
    set_path(document_, keys, 0, value);
}

QString ConfigStore::source_dir() const {
    return get("src", QString()).toString();
}

QString ConfigStore::keep_dir() const {
    return get("keep", QString()).toString();
}

bool ConfigStore::recursive_loading() const {
    return get("options.recursive_loading", false).toBool();
}

GestureMapping ConfigStore::gesture_mapping() const {
    const QJsonObject fallback = defaults();
    GestureMapping mapping;
    for (Gesture gesture : kAllGestures) {
        const QString default_name = fallback.value(gesture_config_section(gesture)).toObject()
                                             .value(gesture_config_key(gesture)).toString();
        mapping[gesture] = get(gesture_config_path(gesture), default_name).toString();
    }
    return mapping;
}
