#include "tray/TrayFormat.hpp"

#include <algorithm>

namespace bluemeter {

namespace {

QString connectionMarker(bool connected)
{
    return connected ? QStringLiteral("\U0001F7E2") : QStringLiteral("\U0001F534");
}

} // namespace

QString truncateName(const QString &name, bool truncate, int maxChars)
{
    if (!truncate || name.size() <= maxChars) {
        return name;
    }
    return name.left(maxChars) + QStringLiteral("...");
}

QString formatDeviceLine(const DeviceRecord &record, const TrayOptions &options)
{
    const QString name = truncateName(QString::fromStdString(record.name), options.truncateName);
    const QString battery = QStringLiteral("%1%").arg(static_cast<int>(record.battery), 3);
    if (options.prefixBattery) {
        return connectionMarker(record.connected) + battery + QStringLiteral(" - ") + name;
    }
    return connectionMarker(record.connected) + name + QStringLiteral(" - ") + battery;
}

QStringList formatTooltipLines(const Snapshot &snapshot, const TrayOptions &options)
{
    QStringList lines;
    for (const DeviceRecord &record : snapshot.records()) {
        if (!record.connected && !options.showDisconnected) {
            continue;
        }
        lines << formatDeviceLine(record, options);
    }
    return lines;
}

QString batteryIconName(std::uint8_t battery)
{
    const int clamped = std::min<int>(battery, 100);
    const int level = ((clamped + 5) / 10) * 10;
    return QStringLiteral("battery-level-%1-symbolic").arg(level);
}

QString notificationTitle(EventKind kind, std::uint8_t lowBatteryThreshold)
{
    switch (kind) {
    case EventKind::LowBattery:
        return QStringLiteral("Battery below %1%").arg(static_cast<int>(lowBatteryThreshold));
    case EventKind::Disconnected:
        return QStringLiteral("Bluetooth device disconnected");
    case EventKind::Reconnected:
        return QStringLiteral("Bluetooth device reconnected");
    case EventKind::Added:
        return QStringLiteral("New Bluetooth device added");
    case EventKind::Removed:
        return QStringLiteral("Bluetooth device removed");
    }
    return QString();
}

QString notificationBody(EventKind kind, const std::vector<DeviceRecord> &devices)
{
    QStringList lines;
    for (const DeviceRecord &device : devices) {
        const QString name = QString::fromStdString(device.name);
        if (kind == EventKind::LowBattery) {
            lines << QStringLiteral("%1: %2%").arg(name, QString::number(device.battery));
        } else {
            lines << QStringLiteral("Device name: %1").arg(name);
        }
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace bluemeter
