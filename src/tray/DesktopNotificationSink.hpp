#pragma once

#include <vector>

#include <QDBusConnection>
#include <QString>

#include "monitor/notification_sink.hpp"

class QSystemTrayIcon;

namespace bluemeter {

// Desktop notifications through org.freedesktop.Notifications, falling back
// to the tray icon's balloon when the session bus is unavailable.
class DesktopNotificationSink : public NotificationSink {
public:
    DesktopNotificationSink();
    explicit DesktopNotificationSink(QDBusConnection sessionBus);

    // Must outlive the sink's use. Set before the monitor starts.
    void setFallbackIcon(QSystemTrayIcon *icon) { m_fallbackIcon = icon; }

    void notify(EventKind kind,
                const std::vector<DeviceRecord> &devices,
                const EventConfig &config) override;

private:
    bool sendDesktopNotification(const QString &title, const QString &body, bool mute);
    void showFallback(const QString &title, const QString &body);

    QDBusConnection m_bus;
    QSystemTrayIcon *m_fallbackIcon = nullptr;
};

} // namespace bluemeter
