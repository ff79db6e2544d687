#ifndef CULLER_WINDOW_HPP
#define CULLER_WINDOW_HPP

#include "CullAction.hpp"
#include <QWidget>
#include <QString>
#include <memory>

class ConfigStore;
class CullSession;
class ActionRouter;
class ImageCanvas;
class QLabel;
class QPushButton;
class QTimer;

class CullerWindow : public QWidget {
    Q_OBJECT

public:
    explicit CullerWindow(ConfigStore& config, QWidget* parent = nullptr);
    ~CullerWindow() override;

    // Single entry point after the settings document changed: folder labels,
    // gesture bindings, instruction line and start button all follow it.
    void apply_config();

private slots:
    void select_source();
    void select_keep();
    void start_culling();
    void open_settings();
    void show_current_image();
    void on_move_failed(const QString& message);
    void finish_culling();

private:
    void setup_ui();
    void setup_shortcuts();
    void install_action_handlers();
    void report_config_status();
    void check_ready();
    void persist_folder(const QString& key, const QString& path);
    QString pick_folder(const QString& title, const QString& start_dir);

    ConfigStore& config_;
    CullSession* session_;
    ImageCanvas* canvas_;
    std::unique_ptr<ActionRouter> router_;

    QString source_dir_;
    QString keep_dir_;

    QLabel* source_label_;
    QLabel* keep_label_;
    QLabel* instructions_label_;
    QLabel* status_label_;
    QPushButton* start_btn_;
    QPushButton* settings_btn_;

    QTimer* refresh_timer_;
    QTimer* resize_timer_;
};

#endif // CULLER_WINDOW_HPP
