#include <algorithm>
#include <chrono>

#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QSystemTrayIcon>

#include <nlohmann/json.hpp>

#include "bluez/bluez_device_enumerator.hpp"
#include "bluez/bluez_event_source.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "monitor/device_monitor.hpp"
#include "monitor/watcher_supervisor.hpp"
#include "tray/BlueMeterTray.hpp"
#include "tray/DesktopNotificationSink.hpp"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("bluemeter"));
    QApplication::setApplicationVersion(QStringLiteral(BLUEMETER_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Bluetooth battery monitor for the system tray"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Configuration file."),
                                          QStringLiteral("path"));
    const QCommandLineOption intervalOption(QStringLiteral("interval"),
                                            QStringLiteral("Poll interval in seconds for this run."),
                                            QStringLiteral("seconds"));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Write debug-level trace logs."));
    parser.addOption(configOption);
    parser.addOption(intervalOption);
    parser.addOption(traceOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("BLUEMETER_TRACE") == 1;
    bluemeter::logging::initLogging(QStringLiteral("bluemeter-tray"), trace);
    BMLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("tray_start"),
               QStringLiteral("user_start"),
               QStringLiteral("qt_app"),
               bluemeter::logging::defaultWho(),
               QString(),
               nlohmann::json{{"version", BLUEMETER_VERSION}, {"trace", trace}});

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning() << "System tray not available. Exiting.";
        return 1;
    }
    app.setQuitOnLastWindowClosed(false);

    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : bluemeter::defaultConfigPath();
    bluemeter::AppConfig config = bluemeter::loadConfig(configPath);

    bluemeter::EventConfig eventConfig = config.toEventConfig();
    if (parser.isSet(intervalOption)) {
        bool ok = false;
        const int seconds = parser.value(intervalOption).toInt(&ok);
        if (!ok) {
            qWarning() << "Invalid --interval value:" << parser.value(intervalOption);
            return 2;
        }
        const auto interval = std::chrono::seconds(seconds);
        eventConfig.pollInterval = std::clamp(interval,
                                              bluemeter::kMinUpdateInterval,
                                              bluemeter::kMaxUpdateInterval);
    }

    bluemeter::BluezDeviceEnumerator enumerator;
    bluemeter::BluezEventSource eventSource;
    bluemeter::DesktopNotificationSink notificationSink;

    bluemeter::DeviceMonitor monitor(enumerator, notificationSink, eventConfig);
    bluemeter::WatcherSupervisor supervisor(eventSource, monitor.channel());

    BlueMeterTray tray(config, monitor, supervisor);
    notificationSink.setFallbackIcon(tray.trayIcon());

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&supervisor, &monitor]() {
        // Watch tasks first, so none is left pushing into a closed channel.
        supervisor.stop();
        monitor.stop();
    });

    monitor.start();
    return app.exec();
}
