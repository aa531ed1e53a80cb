#include "tray/DesktopNotificationSink.hpp"

#include <stdexcept>
#include <utility>

#include <QDBusMessage>
#include <QMetaObject>
#include <QStringList>
#include <QSystemTrayIcon>
#include <QVariantMap>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "tray/TrayFormat.hpp"

namespace bluemeter {

namespace {

constexpr int kExpireTimeoutMs = 5000;

} // namespace

DesktopNotificationSink::DesktopNotificationSink()
    : DesktopNotificationSink(QDBusConnection::sessionBus())
{
}

DesktopNotificationSink::DesktopNotificationSink(QDBusConnection sessionBus)
    : m_bus(std::move(sessionBus))
{
}

void DesktopNotificationSink::notify(EventKind kind,
                                     const std::vector<DeviceRecord> &devices,
                                     const EventConfig &config)
{
    if (devices.empty()) {
        return;
    }

    const QString title = notificationTitle(kind, config.lowBatteryThreshold);
    const QString body = notificationBody(kind, devices);

    BMLOG_INFO(QStringLiteral("DesktopNotificationSink"),
               QStringLiteral("notify"),
               QStringLiteral("notification_emit"),
               QString::fromStdString(toEventKindString(kind)),
               QStringLiteral("desktop_notification"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               nlohmann::json{{"devices", devices.size()},
                              {"mute", config.mute}});

    if (sendDesktopNotification(title, body, config.mute)) {
        return;
    }
    if (!m_fallbackIcon) {
        throw std::runtime_error("no notification service available");
    }
    showFallback(title, body);
}

bool DesktopNotificationSink::sendDesktopNotification(const QString &title,
                                                      const QString &body,
                                                      bool mute)
{
    if (!m_bus.isConnected()) {
        return false;
    }

    QDBusMessage call = QDBusMessage::createMethodCall(
        QStringLiteral("org.freedesktop.Notifications"),
        QStringLiteral("/org/freedesktop/Notifications"),
        QStringLiteral("org.freedesktop.Notifications"),
        QStringLiteral("Notify"));

    QVariantMap hints;
    hints.insert(QStringLiteral("category"), QStringLiteral("device"));
    hints.insert(QStringLiteral("suppress-sound"), mute);

    call << QStringLiteral("BlueMeter")
         << 0u
         << QStringLiteral("bluetooth")
         << title
         << body
         << QStringList()
         << hints
         << kExpireTimeoutMs;

    return m_bus.send(call);
}

void DesktopNotificationSink::showFallback(const QString &title, const QString &body)
{
    QSystemTrayIcon *icon = m_fallbackIcon;
    // Called from the monitor's consumer thread; the icon belongs to the GUI.
    QMetaObject::invokeMethod(icon, [icon, title, body]() {
        icon->showMessage(title, body, QSystemTrayIcon::Information, kExpireTimeoutMs);
    }, Qt::QueuedConnection);
}

} // namespace bluemeter
