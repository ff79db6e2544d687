#include <QApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QPalette>
#include <QStandardPaths>
#include <QStyleFactory>

#include "AppLogger.hpp"
#include "ConfigStore.hpp"
#include "CullerWindow.hpp"

namespace {

QString default_config_path() {
    QString config_dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(config_dir).filePath(ConfigStore::kDefaultFileName);
}

} // namespace

int main(int argc, char* argv[]) {
    QApplication qt_app(argc, argv);

    qt_app.setApplicationName("Rapid Culler");
    qt_app.setApplicationVersion("1.0.0");
    qt_app.setOrganizationName("RapidCuller");

    QCommandLineParser parser;
    parser.setApplicationDescription("Sort a folder of images into keep and reject piles with mouse clicks.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption config_option("config", "Settings file to use.", "file", default_config_path());
    QCommandLineOption level_option("log-level", "Minimum log severity (trace, debug, info, warn, error).",
                                    "level", "info");
    QCommandLineOption quiet_option("no-console-log", "Do not echo log entries to stderr.");
    parser.addOption(config_option);
    parser.addOption(level_option);
    parser.addOption(quiet_option);
    parser.process(qt_app);

    AppLogger& logger = AppLogger::instance();
    const auto severity = AppLogger::severity_from_string(parser.value(level_option));
    logger.set_minimum_severity(severity.value_or(LogSeverity::Info));
    logger.set_console_output(!parser.isSet(quiet_option));
    if (!logger.open_default_log()) {
        LOG_WARN("Main", "Log file unavailable, logging to console only");
    }
    if (!severity) {
        LOG_WARN("Main", QString("Unknown log level '%1', using info").arg(parser.value(level_option)));
    }
    LOG_INFO("Main", "Rapid Culler started");

    ConfigStore config(parser.value(config_option));
    config.load();
    LOG_INFO("Main", QString("Using settings file %1").arg(config.file_path()));

    // Use Fusion style for consistent look
    qt_app.setStyle(QStyleFactory::create("Fusion"));

    QPalette app_colors;
    app_colors.setColor(QPalette::Window, QColor(45, 45, 45));
    app_colors.setColor(QPalette::WindowText, QColor(230, 230, 230));
    app_colors.setColor(QPalette::Base, QColor(35, 35, 35));
    app_colors.setColor(QPalette::AlternateBase, QColor(55, 55, 55));
    app_colors.setColor(QPalette::Text, QColor(230, 230, 230));
    app_colors.setColor(QPalette::Button, QColor(50, 50, 50));
    app_colors.setColor(QPalette::ButtonText, QColor(230, 230, 230));
    app_colors.setColor(QPalette::Highlight, QColor(0, 120, 212));
    app_colors.setColor(QPalette::HighlightedText, QColor(255, 255, 255));
    qt_app.setPalette(app_colors);

    CullerWindow window(config);
    window.show();

    int exit_code = qt_app.exec();

    LOG_INFO("Main", "Application exiting");
    return exit_code;
}
