#ifndef SETTINGS_DIALOG_HPP
#define SETTINGS_DIALOG_HPP

#include "CullAction.hpp"
#include <QDialog>
#include <QJsonObject>
#include <QString>
#include <map>

class ConfigStore;
class QComboBox;
class QCheckBox;
class QGroupBox;
class QVBoxLayout;

// Modal editor for gesture mappings and loading options. Works on a copy of
// the settings document; nothing is persisted until Save passes validation.
class SettingsDialog : public QDialog {
    Q_OBJECT

public:
    explicit SettingsDialog(ConfigStore& config, QWidget* parent = nullptr);

    // Non-blocking warnings for a document that is valid but unhelpful,
    // empty when there is nothing to warn about
    static QString check_warnings(const QJsonObject& doc);

signals:
    void settings_saved(const QJsonObject& doc);

private slots:
    void on_save();
    void on_reset_defaults();

private:
    void setup_ui();
    QGroupBox* build_mapping_group(const QString& title, Gesture first, Gesture second);
    QGroupBox* build_options_group();
    void load_widgets(const QJsonObject& doc);
    QJsonObject collect_document() const;

    ConfigStore& config_;
    QJsonObject working_doc_;
    std::map<Gesture, QComboBox*> action_combos_;
    QCheckBox* recursive_check_;
};

#endif // SETTINGS_DIALOG_HPP
