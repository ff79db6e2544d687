#include "SettingsDialog.hpp"
#include "ConfigStore.hpp"
#include "AppLogger.hpp"
#include "ui_constants.hpp"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGridLayout>
#include <QGroupBox>
#include <QLabel>
#include <QComboBox>
#include <QCheckBox>
#include <QPushButton>
#include <QMessageBox>
#include <QSet>

SettingsDialog::SettingsDialog(ConfigStore& config, QWidget* parent)
    : QDialog(parent)
    , config_(config)
    , working_doc_(config.document())
    , recursive_check_(nullptr) {
    setWindowTitle("Settings");
    setModal(true);
    resize(ui::scaling::scaled(ui::dimensions::kSettingsDialogWidth),
           ui::scaling::scaled(ui::dimensions::kSettingsDialogHeight));

    setup_ui();
    load_widgets(working_doc_);
}

void SettingsDialog::setup_ui() {
    auto* main_layout = new QVBoxLayout(this);
    main_layout->setContentsMargins(10, 10, 10, 10);

    main_layout->addWidget(build_mapping_group("Button Mappings",
                                               Gesture::PrimaryClick, Gesture::SecondaryClick));
    main_layout->addWidget(build_mapping_group("Mouse Wheel Mappings",
                                               Gesture::WheelUp, Gesture::WheelDown));
    main_layout->addWidget(build_options_group());
    main_layout->addStretch();

    // Button bar: Reset on the left, Save/Cancel on the right
    auto* button_bar = new QHBoxLayout();

    auto* reset_btn = new QPushButton("Reset Defaults");
    reset_btn->setStyleSheet(QString(
        "QPushButton { background-color: %1; color: white; padding: 5px 12px; }"
    ).arg(ui::colors::kNeutralColor));
    connect(reset_btn, &QPushButton::clicked, this, &SettingsDialog::on_reset_defaults);
    button_bar->addWidget(reset_btn);

    button_bar->addStretch();

    auto* save_btn = new QPushButton("Save");
    save_btn->setDefault(true);
    save_btn->setStyleSheet(QString(
        "QPushButton { background-color: %1; color: white; font-weight: bold; padding: 5px 12px; }"
    ).arg(ui::colors::kStartColor));
    connect(save_btn, &QPushButton::clicked, this, &SettingsDialog::on_save);
    button_bar->addWidget(save_btn);

    auto* cancel_btn = new QPushButton("Cancel");
    cancel_btn->setStyleSheet(QString(
        "QPushButton { background-color: %1; color: white; padding: 5px 12px; }"
    ).arg(ui::colors::kNeutralColor));
    connect(cancel_btn, &QPushButton::clicked, this, &QDialog::reject);
    button_bar->addWidget(cancel_btn);

    main_layout->addLayout(button_bar);
}

QGroupBox* SettingsDialog::build_mapping_group(const QString& title, Gesture first, Gesture second) {
    auto* group = new QGroupBox(title);
    auto* grid = new QGridLayout(group);

    int row = 0;
    for (Gesture gesture : {first, second}) {
        grid->addWidget(new QLabel(gesture_label(gesture) + ":"), row, 0);

        auto* combo = new QComboBox();
        for (CullAction action : kAllActions) {
            combo->addItem(action_label(action), action_name(action));
        }
        combo->setFixedWidth(ui::scaling::scaled(ui::dimensions::kActionComboWidth));
        grid->addWidget(combo, row, 1, Qt::AlignLeft);

        action_combos_[gesture] = combo;
        ++row;
    }
    grid->setColumnStretch(1, 1);
    return group;
}

QGroupBox* SettingsDialog::build_options_group() {
    auto* group = new QGroupBox("Loading Options");
    auto* layout = new QVBoxLayout(group);

    recursive_check_ = new QCheckBox("Load images from subdirectories recursively");
    layout->addWidget(recursive_check_);
    return group;
}

void SettingsDialog::load_widgets(const QJsonObject& doc) {
    for (auto& [gesture, combo] : action_combos_) {
        const QString name = doc.value(gesture_config_section(gesture)).toObject()
                                .value(gesture_config_key(gesture)).toString();
        int index = combo->findData(name);
        if (index < 0) {
            index = combo->findData(action_name(CullAction::Disabled));
        }
        combo->setCurrentIndex(index);
    }

    const bool recursive = doc.value("options").toObject().value("recursive_loading").toBool();
    recursive_check_->setChecked(recursive);
}

QJsonObject SettingsDialog::collect_document() const {
    QJsonObject doc = working_doc_;

    for (const auto& [gesture, combo] : action_combos_) {
        const QString section = gesture_config_section(gesture);
        QJsonObject mappings = doc.value(section).toObject();
        mappings.insert(gesture_config_key(gesture), combo->currentData().toString());
        doc.insert(section, mappings);
    }

    QJsonObject options = doc.value("options").toObject();
    options.insert("recursive_loading", recursive_check_->isChecked());
    doc.insert("options", options);
    return doc;
}

QString SettingsDialog::check_warnings(const QJsonObject& doc) {
    QSet<QString> mapped;
    for (Gesture gesture : kAllGestures) {
        mapped.insert(doc.value(gesture_config_section(gesture)).toObject()
                         .value(gesture_config_key(gesture)).toString());
    }

    if (!mapped.contains(action_name(CullAction::Keep)) &&
        !mapped.contains(action_name(CullAction::Reject))) {
        return "No buttons or wheel actions mapped to Keep or Reject.\n"
               "You won't be able to sort images!";
    }
    return QString();
}

void SettingsDialog::on_save() {
    const QJsonObject doc = collect_document();

    const ValidationResult validation = ConfigStore::validate(doc);
    if (!validation.ok) {
        QMessageBox::critical(this, "Invalid Settings", validation.reason);
        return;
    }

    const QString warnings = check_warnings(doc);
    if (!warnings.isEmpty()) {
        auto reply = QMessageBox::question(this, "Configuration Warning",
            warnings + "\n\nProceed anyway?",
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (reply != QMessageBox::Yes) {
            return;
        }
    }

    const ValidationResult applied = config_.apply(doc);
    if (!applied.ok) {
        QMessageBox::critical(this, "Save Failed",
            QString("Could not save settings.\n%1\n\nSee the log for details.").arg(applied.reason));
        return;
    }

    LOG_INFO("Settings", "Settings saved");
    emit settings_saved(config_.document());
    accept();
}

void SettingsDialog::on_reset_defaults() {
    // Folder choices are not settings; keep them
    QJsonObject defaults = ConfigStore::defaults();
    defaults.insert("src", working_doc_.value("src"));
    defaults.insert("keep", working_doc_.value("keep"));
    working_doc_ = defaults;
    load_widgets(working_doc_);
}
