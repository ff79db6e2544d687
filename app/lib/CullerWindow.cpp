#include "CullerWindow.hpp"
#include "ActionRouter.hpp"
#include "AppLogger.hpp"
#include "ConfigStore.hpp"
#include "CullSession.hpp"
#include "ImageCanvas.hpp"
#include "ImageLoader.hpp"
#include "SettingsDialog.hpp"
#include "ui_constants.hpp"
#include <QApplication>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QShortcut>
#include <QTimer>
#include <QVBoxLayout>

CullerWindow::CullerWindow(ConfigStore& config, QWidget* parent)
    : QWidget(parent)
    , config_(config)
    , session_(nullptr)
    , canvas_(nullptr)
    , source_label_(nullptr)
    , keep_label_(nullptr)
    , instructions_label_(nullptr)
    , status_label_(nullptr)
    , start_btn_(nullptr)
    , settings_btn_(nullptr)
    , refresh_timer_(nullptr)
    , resize_timer_(nullptr) {

    setWindowTitle("Rapid Image Culler for Datasets");
    resize(ui::scaling::scaled(ui::dimensions::kMainWindowWidth),
           ui::scaling::scaled(ui::dimensions::kMainWindowHeight));
    setMinimumSize(ui::scaling::scaled(ui::dimensions::kMainWindowMinWidth),
                   ui::scaling::scaled(ui::dimensions::kMainWindowMinHeight));

    setup_ui();
    setup_shortcuts();

    session_ = new CullSession(this);
    router_ = std::make_unique<ActionRouter>(*canvas_);
    install_action_handlers();

    // Short delay between advancing and decoding so the canvas can repaint
    refresh_timer_ = new QTimer(this);
    refresh_timer_->setSingleShot(true);
    refresh_timer_->setInterval(ui::timing::kAdvanceRefreshDelayMs);
    connect(refresh_timer_, &QTimer::timeout, this, &CullerWindow::show_current_image);

    resize_timer_ = new QTimer(this);
    resize_timer_->setSingleShot(true);
    resize_timer_->setInterval(ui::timing::kResizeDebounceMs);
    connect(resize_timer_, &QTimer::timeout, this, &CullerWindow::show_current_image);
    connect(canvas_, &ImageCanvas::resized, this, [this]() {
        if (session_->state() == SessionState::Browsing) {
            resize_timer_->start();
        }
    });

    connect(session_, &CullSession::current_changed, this, [this](int, int) {
        refresh_timer_->start();
    });
    connect(session_, &CullSession::move_failed, this, &CullerWindow::on_move_failed);
    connect(session_, &CullSession::finished, this, &CullerWindow::finish_culling);

    apply_config();

    // Message boxes need a visible parent; wait for the event loop
    QTimer::singleShot(0, this, &CullerWindow::report_config_status);
}

CullerWindow::~CullerWindow() = default;

void CullerWindow::setup_ui() {
    auto* main_layout = new QVBoxLayout(this);
    main_layout->setContentsMargins(0, 0, 0, 0);
    main_layout->setSpacing(0);

    // Top control panel
    auto* control_panel = new QWidget();
    control_panel->setAutoFillBackground(true);
    control_panel->setStyleSheet(QString("background-color: %1; color: black;")
                                 .arg(ui::colors::kControlPanelBg));
    auto* control_grid = new QGridLayout(control_panel);
    control_grid->setContentsMargins(10, 10, 10, 10);

    const QString picker_style = QString(
        "QPushButton { background-color: %1; color: black; padding: 5px 10px; }"
    ).arg(ui::colors::kPickerButtonBg);

    auto* source_btn = new QPushButton("1. Select SOURCE Folder");
    source_btn->setStyleSheet(picker_style);
    connect(source_btn, &QPushButton::clicked, this, &CullerWindow::select_source);
    control_grid->addWidget(source_btn, 0, 0);

    source_label_ = new QLabel("No folder selected");
    control_grid->addWidget(source_label_, 0, 1, 1, 2);

    auto* keep_btn = new QPushButton("2. Select KEEP Destination");
    keep_btn->setStyleSheet(picker_style);
    connect(keep_btn, &QPushButton::clicked, this, &CullerWindow::select_keep);
    control_grid->addWidget(keep_btn, 1, 0);

    keep_label_ = new QLabel("No folder selected");
    control_grid->addWidget(keep_label_, 1, 1, 1, 2);

    start_btn_ = new QPushButton("3. START CULLING");
    start_btn_->setEnabled(false);
    start_btn_->setStyleSheet(QString(
        "QPushButton { background-color: %1; color: white; font-weight: bold; "
        "font-size: %2pt; padding: 6px; }"
        "QPushButton:disabled { background-color: #7fbf8e; color: #eeeeee; }"
    ).arg(ui::colors::kStartColor).arg(ui::fonts::kStartButtonSize));
    connect(start_btn_, &QPushButton::clicked, this, &CullerWindow::start_culling);
    control_grid->addWidget(start_btn_, 2, 0, 1, 2);

    settings_btn_ = new QPushButton("Settings");
    settings_btn_->setStyleSheet(QString(
        "QPushButton { background-color: %1; color: white; padding: 6px 12px; }"
    ).arg(ui::colors::kNeutralColor));
    connect(settings_btn_, &QPushButton::clicked, this, &CullerWindow::open_settings);
    control_grid->addWidget(settings_btn_, 2, 2, Qt::AlignRight);

    control_grid->setColumnStretch(1, 1);
    main_layout->addWidget(control_panel);

    // Instructions and status
    auto* instructions_bar = new QWidget();
    instructions_bar->setStyleSheet(QString("background-color: %1;").arg(ui::colors::kInstructionsBg));
    auto* instructions_layout = new QHBoxLayout(instructions_bar);
    instructions_layout->setContentsMargins(10, 5, 10, 5);

    auto* instructions_title = new QLabel("INSTRUCTIONS:");
    instructions_title->setStyleSheet(QString("font-weight: bold; font-size: %1pt; color: black;")
                                      .arg(ui::fonts::kInstructionsSize));
    instructions_layout->addWidget(instructions_title);

    instructions_label_ = new QLabel();
    instructions_label_->setStyleSheet(QString("color: %1;").arg(ui::colors::kInstructionsText));
    instructions_layout->addWidget(instructions_label_);
    instructions_layout->addStretch();

    status_label_ = new QLabel("Waiting to start...");
    status_label_->setStyleSheet(QString("color: %1; font-size: %2pt;")
                                 .arg(ui::colors::kStatusText).arg(ui::fonts::kInstructionsSize));
    instructions_layout->addWidget(status_label_);

    main_layout->addWidget(instructions_bar);

    canvas_ = new ImageCanvas();
    canvas_->show_message("Load folders to begin");
    main_layout->addWidget(canvas_, 1);
}

void CullerWindow::setup_shortcuts() {
    auto* source_shortcut = new QShortcut(QKeySequence("Ctrl+O"), this);
    connect(source_shortcut, &QShortcut::activated, this, &CullerWindow::select_source);

    auto* keep_shortcut = new QShortcut(QKeySequence("Ctrl+K"), this);
    connect(keep_shortcut, &QShortcut::activated, this, &CullerWindow::select_keep);

    auto* settings_shortcut = new QShortcut(QKeySequence("Ctrl+,"), this);
    connect(settings_shortcut, &QShortcut::activated, this, &CullerWindow::open_settings);
}

void CullerWindow::install_action_handlers() {
    for (CullAction action : kAllActions) {
        if (action == CullAction::Disabled) continue;
        router_->set_action_handler(action, [this, action]() {
            session_->trigger(action);
        });
    }
}

void CullerWindow::report_config_status() {
    switch (config_.last_status()) {
        case ConfigStatus::Invalid:
        case ConfigStatus::IoError:
            QMessageBox::warning(this, "Settings Error",
                QString("Could not load settings. Using defaults.\n\n%1").arg(config_.last_error()));
            break;
        case ConfigStatus::Migrated:
            LOG_INFO("Window", "Settings were upgraded to the current format");
            break;
        case ConfigStatus::Ok:
        case ConfigStatus::Missing:
            break;
    }
}

void CullerWindow::apply_config() {
    const QString src = config_.source_dir();
    const QString keep = config_.keep_dir();

    if (!src.isEmpty() && QFileInfo(src).isDir()) {
        source_dir_ = src;
        source_label_->setText(src);
    }
    if (!keep.isEmpty() && QFileInfo(keep).isDir()) {
        keep_dir_ = keep;
        keep_label_->setText(keep);
    }

    router_->bind(config_.gesture_mapping());
    instructions_label_->setText(router_->instructions_text());

    check_ready();
}

void CullerWindow::check_ready() {
    const bool culling = session_->state() == SessionState::Browsing;
    start_btn_->setEnabled(!culling && !source_dir_.isEmpty() && !keep_dir_.isEmpty());
}

QString CullerWindow::pick_folder(const QString& title, const QString& start_dir) {
    return QFileDialog::getExistingDirectory(this, title,
        start_dir.isEmpty() ? QDir::homePath() : start_dir);
}

void CullerWindow::persist_folder(const QString& key, const QString& path) {
    config_.set(key, path);
    if (!config_.save()) {
        QMessageBox::warning(this, "Settings Error",
            QString("Could not save settings to\n%1").arg(config_.file_path()));
    }
}

void CullerWindow::select_source() {
    const QString path = pick_folder("Select Source Folder containing images", source_dir_);
    if (path.isEmpty()) return;

    source_dir_ = path;
    source_label_->setText(path);
    persist_folder("src", path);
    check_ready();
}

void CullerWindow::select_keep() {
    const QString path = pick_folder("Select Destination Folder for GOOD images", keep_dir_);
    if (path.isEmpty()) return;

    keep_dir_ = path;
    keep_label_->setText(path);
    persist_folder("keep", path);
    check_ready();
}

void CullerWindow::open_settings() {
    if (session_->state() == SessionState::Browsing) {
        auto reply = QMessageBox::question(this, "Culling In Progress",
            "Culling is currently in progress.\n"
            "Loading options apply to the next session; button and wheel mappings apply right away.\n\n"
            "Open settings anyway?",
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (reply != QMessageBox::Yes) return;
    }

    SettingsDialog dialog(config_, this);
    connect(&dialog, &SettingsDialog::settings_saved, this, [this](const QJsonObject&) {
        apply_config();
    });
    dialog.exec();
}

void CullerWindow::start_culling() {
    const StartResult result = session_->start(source_dir_, keep_dir_, config_.recursive_loading());
    if (!result.success) {
        if (result.no_images) {
            QMessageBox::warning(this, "No Images", result.error_message);
        } else {
            QMessageBox::critical(this, "Error", result.error_message);
        }
        return;
    }

    // Paths must not change mid-stream
    start_btn_->setEnabled(false);
    start_btn_->setText("Culling in progress...");
}

void CullerWindow::show_current_image() {
    const ImageRecord* record = session_->current_record();
    if (!record) return;

    QString status = QString("Image %1 of %2: %3")
                     .arg(session_->current_index() + 1)
                     .arg(session_->count())
                     .arg(record->display_path());
    if (!session_->skipped_directories().isEmpty()) {
        status += QString("  (%1 unreadable folder(s) skipped)")
                  .arg(session_->skipped_directories().size());
    }
    status_label_->setText(status);

    QSize bounds = canvas_->display_bounds();
    if (bounds.width() <= ui::dimensions::kMinCanvasExtent ||
        bounds.height() <= ui::dimensions::kMinCanvasExtent) {
        bounds = QSize();
    }

    const LoadResult loaded = ImageLoader::load(record->full_path, bounds);
    switch (loaded.status) {
        case LoadStatus::Ok:
            canvas_->show_image(loaded.image);
            break;
        case LoadStatus::NotFound:
            // Moved or deleted behind our back; nothing to move, let the user navigate on
            LOG_WARN("Window", loaded.error_message);
            canvas_->show_message(QString("File not found:\n%1").arg(record->display_path()));
            break;
        case LoadStatus::DecodeFailed:
            LOG_ERROR("Window", QString("Error loading image %1: %2")
                      .arg(record->display_path(), loaded.error_message));
            if (!session_->mark_current_unreadable(loaded.error_message)) {
                canvas_->show_message(QString("Cannot display:\n%1").arg(record->display_path()));
            }
            break;
    }
}

void CullerWindow::on_move_failed(const QString& message) {
    QMessageBox::critical(this, "File Error", QString("Could not move file:\n%1").arg(message));
}

void CullerWindow::finish_culling() {
    refresh_timer_->stop();
    resize_timer_->stop();

    canvas_->show_message("--- NO MORE IMAGES ---", ui::fonts::kFinishedSize);
    status_label_->setText("Finished.");
    start_btn_->setText("Finished");

    QMessageBox::information(this, "Done",
        QString("All images have been sorted!\n\n%1").arg(session_->summary_text()));
    QApplication::quit();
}
