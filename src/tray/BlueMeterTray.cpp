#include "tray/BlueMeterTray.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include <QCoreApplication>
#include <QIcon>
#include <QMessageBox>
#include <QSignalBlocker>

#include <nlohmann/json.hpp>

#include "common/autostart.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "monitor/device_monitor.hpp"
#include "monitor/watcher_supervisor.hpp"
#include "tray/TrayFormat.hpp"

using bluemeter::Address;
using bluemeter::DeviceRecord;
using bluemeter::Snapshot;

namespace {

constexpr int kRetryDelayMs = 100;

const QString kAppIcon = QStringLiteral("bluetooth-active");

struct IntervalChoice {
    const char *label;
    int seconds;
};

constexpr IntervalChoice kIntervalChoices[] = {
    {"15 seconds", 15},
    {"30 seconds", 30},
    {"1 minute", 60},
    {"5 minutes", 300},
    {"10 minutes", 600},
    {"30 minutes", 1800},
};

constexpr int kThresholdChoices[] = {0, 5, 10, 15, 20, 25};

} // namespace

BlueMeterTray::BlueMeterTray(bluemeter::AppConfig &config,
                             bluemeter::DeviceMonitor &monitor,
                             bluemeter::WatcherSupervisor &supervisor,
                             QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_monitor(monitor)
    , m_supervisor(supervisor)
{
    BMLOG_INFO(QStringLiteral("BlueMeterTray"),
               QStringLiteral("BlueMeterTray"),
               QStringLiteral("tray_start"),
               QStringLiteral("user_start"),
               QStringLiteral("tray"),
               bluemeter::logging::defaultWho(),
               QString(),
               nlohmann::json{{"config", m_config.path.toStdString()}});

    m_retryTimer.setSingleShot(true);
    m_retryTimer.setInterval(kRetryDelayMs);
    connect(&m_retryTimer, &QTimer::timeout, this, &BlueMeterTray::refreshFromMonitor);

    setupTrayIcon();
    setupMenu();

    // Emitted on the monitor's consumer thread; queued onto ours.
    connect(&m_monitor, &bluemeter::DeviceMonitor::snapshotUpdated,
            this, &BlueMeterTray::refreshFromMonitor, Qt::QueuedConnection);
    connect(&m_monitor, &bluemeter::DeviceMonitor::enumerationFailed,
            this, &BlueMeterTray::onEnumerationFailed, Qt::QueuedConnection);
}

BlueMeterTray::~BlueMeterTray() = default;

void BlueMeterTray::setupTrayIcon()
{
    m_trayIcon.setIcon(QIcon::fromTheme(kAppIcon));
    m_trayIcon.setToolTip(QStringLiteral("BlueMeter"));
    m_trayIcon.show();
}

void BlueMeterTray::setupMenu()
{
    m_noDevicesAction = m_menu.addAction(QStringLiteral("No devices with battery info"));
    m_noDevicesAction->setEnabled(false);
    m_deviceSeparator = m_menu.addSeparator();

    setupSettingsMenu();
    setupNotificationsMenu();

    m_menu.addSeparator();

    auto *refreshAction = m_menu.addAction(QStringLiteral("Refresh Now"));
    connect(refreshAction, &QAction::triggered, this, &BlueMeterTray::refreshNow);

    auto *aboutAction = m_menu.addAction(QStringLiteral("About BlueMeter"));
    connect(aboutAction, &QAction::triggered, this, &BlueMeterTray::showAboutDialog);

    auto *quitAction = m_menu.addAction(QStringLiteral("Quit"));
    connect(quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon.setContextMenu(&m_menu);
}

void BlueMeterTray::setupSettingsMenu()
{
    m_settingsMenu = m_menu.addMenu(QStringLiteral("Settings"));

    QMenu *intervalMenu = m_settingsMenu->addMenu(QStringLiteral("Update interval"));
    m_intervalGroup = new QActionGroup(this);
    m_intervalGroup->setExclusive(true);
    for (const IntervalChoice &choice : kIntervalChoices) {
        QAction *action = intervalMenu->addAction(QString::fromLatin1(choice.label));
        action->setCheckable(true);
        action->setChecked(m_config.tray.updateInterval.count() == choice.seconds);
        m_intervalGroup->addAction(action);
        const int seconds = choice.seconds;
        connect(action, &QAction::triggered, this, [this, seconds]() {
            m_config.tray.updateInterval = std::chrono::seconds(seconds);
            applyConfig();
        });
    }

    m_settingsMenu->addSeparator();

    addToggle(m_settingsMenu, QStringLiteral("Show disconnected devices"),
              m_config.tray.showDisconnected);
    addToggle(m_settingsMenu, QStringLiteral("Truncate long names"),
              m_config.tray.truncateName);
    addToggle(m_settingsMenu, QStringLiteral("Show battery before name"),
              m_config.tray.prefixBattery);

    m_settingsMenu->addSeparator();

    QAction *autostartAction = m_settingsMenu->addAction(QStringLiteral("Launch at login"));
    autostartAction->setCheckable(true);
    autostartAction->setChecked(bluemeter::isAutostartEnabled());
    connect(autostartAction, &QAction::toggled, this, [autostartAction](bool checked) {
        if (!bluemeter::setAutostartEnabled(checked)) {
            const QSignalBlocker blocker(autostartAction);
            autostartAction->setChecked(!checked);
        }
    });
}

void BlueMeterTray::addToggle(QMenu *menu, const QString &label, bool &option)
{
    QAction *action = menu->addAction(label);
    action->setCheckable(true);
    action->setChecked(option);
    connect(action, &QAction::toggled, this, [this, &option](bool checked) {
        option = checked;
        applyConfig();
    });
}

void BlueMeterTray::setupNotificationsMenu()
{
    m_notificationsMenu = m_menu.addMenu(QStringLiteral("Notifications"));

    QMenu *thresholdMenu = m_notificationsMenu->addMenu(QStringLiteral("Low battery alert"));
    m_thresholdGroup = new QActionGroup(this);
    m_thresholdGroup->setExclusive(true);
    for (const int threshold : kThresholdChoices) {
        const QString label = threshold == 0 ? QStringLiteral("Off")
                                             : QStringLiteral("Below %1%").arg(threshold);
        QAction *action = thresholdMenu->addAction(label);
        action->setCheckable(true);
        action->setChecked(m_config.notify.lowBattery == threshold);
        m_thresholdGroup->addAction(action);
        connect(action, &QAction::triggered, this, [this, threshold]() {
            m_config.notify.lowBattery = static_cast<std::uint8_t>(threshold);
            applyConfig();
        });
    }

    addToggle(m_notificationsMenu, QStringLiteral("Mute sound"), m_config.notify.mute);
    m_notificationsMenu->addSeparator();
    addToggle(m_notificationsMenu, QStringLiteral("On disconnection"),
              m_config.notify.disconnection);
    addToggle(m_notificationsMenu, QStringLiteral("On reconnection"),
              m_config.notify.reconnection);
    addToggle(m_notificationsMenu, QStringLiteral("On device added"), m_config.notify.added);
    addToggle(m_notificationsMenu, QStringLiteral("On device removed"), m_config.notify.removed);
}

void BlueMeterTray::applyConfig()
{
    bluemeter::saveConfig(m_config);
    m_monitor.setEventConfig(m_config.toEventConfig());

    Snapshot snapshot;
    if (m_monitor.tryCopySnapshot(snapshot)) {
        updateTooltipAndIcon(snapshot);
    }
}

void BlueMeterTray::refreshFromMonitor()
{
    Snapshot snapshot;
    if (!m_monitor.tryCopySnapshot(snapshot)) {
        // Consumer is mid-update or no snapshot yet.
        m_retryTimer.start();
        return;
    }

    m_reportedFailure = false;
    syncWatch(snapshot);
    rebuildDeviceActions(snapshot);
    updateTooltipAndIcon(snapshot);
}

void BlueMeterTray::syncWatch(const Snapshot &snapshot)
{
    if (!m_config.tray.watchedDevice) {
        return;
    }

    const DeviceRecord *record = snapshot.find(*m_config.tray.watchedDevice);
    if (!record) {
        BMLOG_INFO(QStringLiteral("BlueMeterTray"),
                   QStringLiteral("syncWatch"),
                   QStringLiteral("watch_cleared"),
                   QStringLiteral("device_disappeared"),
                   QStringLiteral("select_none"),
                   bluemeter::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"address",
                                   bluemeter::formatAddress(*m_config.tray.watchedDevice)}});
        m_config.tray.watchedDevice.reset();
        m_supervisor.selectAsync(std::nullopt);
        bluemeter::saveConfig(m_config);
        return;
    }

    // No-op while the same device is already watched; restarts a failed watch.
    m_supervisor.selectAsync(bluemeter::WatchTarget::fromRecord(*record));
}

void BlueMeterTray::rebuildDeviceActions(const Snapshot &snapshot)
{
    for (QAction *action : m_deviceActions) {
        m_menu.removeAction(action);
        action->deleteLater();
    }
    m_deviceActions.clear();

    const std::vector<DeviceRecord> records = snapshot.records();
    m_noDevicesAction->setVisible(records.empty());

    for (const DeviceRecord &record : records) {
        bluemeter::TrayOptions lineOptions = m_config.tray;
        lineOptions.truncateName = false;
        auto *action = new QAction(bluemeter::formatDeviceLine(record, lineOptions), &m_menu);
        action->setCheckable(true);
        action->setChecked(m_config.tray.watchedDevice == record.address);
        const Address address = record.address;
        connect(action, &QAction::triggered, this, [this, address](bool checked) {
            selectDevice(address, checked);
        });
        m_menu.insertAction(m_deviceSeparator, action);
        m_deviceActions.push_back(action);
    }
}

void BlueMeterTray::selectDevice(Address address, bool checked)
{
    Snapshot snapshot;
    const std::optional<Snapshot> current = m_monitor.snapshot();
    if (current) {
        snapshot = *current;
    }

    const DeviceRecord *record = snapshot.find(address);
    if (!checked || !record) {
        m_config.tray.watchedDevice.reset();
        m_supervisor.selectAsync(std::nullopt);
    } else {
        m_config.tray.watchedDevice = address;
        // Switching waits for the old watch to exit; keep that off the GUI thread.
        m_supervisor.selectAsync(bluemeter::WatchTarget::fromRecord(*record));
    }

    BMLOG_INFO(QStringLiteral("BlueMeterTray"),
               QStringLiteral("selectDevice"),
               QStringLiteral("watch_selected"),
               QStringLiteral("user_action"),
               checked ? QStringLiteral("select") : QStringLiteral("clear"),
               bluemeter::logging::defaultWho(),
               QString(),
               nlohmann::json{{"address", bluemeter::formatAddress(address)}});

    bluemeter::saveConfig(m_config);
    m_monitor.forceUpdate();
    rebuildDeviceActions(snapshot);
    updateTooltipAndIcon(snapshot);
}

void BlueMeterTray::updateTooltipAndIcon(const Snapshot &snapshot)
{
    const QStringList lines = bluemeter::formatTooltipLines(snapshot, m_config.tray);
    m_trayIcon.setToolTip(lines.isEmpty() ? QStringLiteral("BlueMeter")
                                          : lines.join(QLatin1Char('\n')));

    const DeviceRecord *watched =
        m_config.tray.watchedDevice ? snapshot.find(*m_config.tray.watchedDevice) : nullptr;
    if (watched) {
        m_trayIcon.setIcon(QIcon::fromTheme(bluemeter::batteryIconName(watched->battery),
                                            QIcon::fromTheme(kAppIcon)));
    } else {
        m_trayIcon.setIcon(QIcon::fromTheme(kAppIcon));
    }
}

void BlueMeterTray::onEnumerationFailed(const QString &message)
{
    // One balloon per failure streak; details are in the log.
    if (m_reportedFailure) {
        return;
    }
    m_reportedFailure = true;
    m_trayIcon.showMessage(QStringLiteral("BlueMeter"),
                           QStringLiteral("Failed to read Bluetooth devices: %1").arg(message),
                           QSystemTrayIcon::Warning);
}

void BlueMeterTray::refreshNow()
{
    BMLOG_INFO(QStringLiteral("BlueMeterTray"),
               QStringLiteral("refreshNow"),
               QStringLiteral("force_update"),
               QStringLiteral("user_action"),
               QStringLiteral("wake_poll"),
               bluemeter::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    m_monitor.forceUpdate();
}

void BlueMeterTray::showAboutDialog()
{
    QMessageBox box;
    box.setWindowTitle(QStringLiteral("About BlueMeter"));
    box.setTextFormat(Qt::RichText);
    box.setStandardButtons(QMessageBox::Ok);
    box.setText(QStringLiteral("<b>BlueMeter %1</b><br/>"
                               "Battery levels of paired Bluetooth devices in the system tray.")
                    .arg(QCoreApplication::applicationVersion()));
    box.exec();
}
