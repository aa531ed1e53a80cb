#pragma once

#include <vector>

#include <QAction>
#include <QActionGroup>
#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>
#include <QTimer>

#include "common/config.hpp"
#include "common/models.hpp"

namespace bluemeter {
class DeviceMonitor;
class WatcherSupervisor;
}

// BlueMeterTray shows battery levels of paired devices and edits settings.
// All canonical state lives in DeviceMonitor; the tray only reads copies.
class BlueMeterTray : public QObject
{
    Q_OBJECT
public:
    BlueMeterTray(bluemeter::AppConfig &config,
                  bluemeter::DeviceMonitor &monitor,
                  bluemeter::WatcherSupervisor &supervisor,
                  QObject *parent = nullptr);
    ~BlueMeterTray() override;

    QSystemTrayIcon *trayIcon() { return &m_trayIcon; }

private slots:
    void refreshFromMonitor();
    void onEnumerationFailed(const QString &message);
    void refreshNow();
    void showAboutDialog();

private:
    void setupTrayIcon();
    void setupMenu();
    void setupSettingsMenu();
    void setupNotificationsMenu();
    void addToggle(QMenu *menu, const QString &label, bool &option);
    void rebuildDeviceActions(const bluemeter::Snapshot &snapshot);
    void updateTooltipAndIcon(const bluemeter::Snapshot &snapshot);
    void syncWatch(const bluemeter::Snapshot &snapshot);
    void selectDevice(bluemeter::Address address, bool checked);
    void applyConfig();

    bluemeter::AppConfig &m_config;
    bluemeter::DeviceMonitor &m_monitor;
    bluemeter::WatcherSupervisor &m_supervisor;

    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    QMenu *m_settingsMenu = nullptr;
    QMenu *m_notificationsMenu = nullptr;
    QAction *m_deviceSeparator = nullptr;
    QAction *m_noDevicesAction = nullptr;
    std::vector<QAction *> m_deviceActions;
    QActionGroup *m_intervalGroup = nullptr;
    QActionGroup *m_thresholdGroup = nullptr;
    // Retries a snapshot copy that lost the try-lock race.
    QTimer m_retryTimer;
    bool m_reportedFailure = false;
};
