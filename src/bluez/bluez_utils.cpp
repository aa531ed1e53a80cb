#include "bluez/bluez_utils.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include <QDBusMetaType>

#include "common/json_utils.hpp"

namespace bluemeter {

namespace {

constexpr int kMaxBattery = 100;

QString deviceName(const QVariantMap &properties)
{
    const QString alias = properties.value(QStringLiteral("Alias")).toString();
    if (!alias.isEmpty()) {
        return alias;
    }
    return properties.value(QStringLiteral("Name")).toString();
}

} // namespace

void registerBluezTypes()
{
    static std::once_flag once;
    std::call_once(once, []() {
        qDBusRegisterMetaType<BluezInterfaceMap>();
        qDBusRegisterMetaType<BluezManagedObjects>();
    });
}

std::optional<Address> addressFromObjectPath(const QString &path)
{
    const QString leaf = path.section(QLatin1Char('/'), -1);
    if (!leaf.startsWith(QStringLiteral("dev_"))) {
        return std::nullopt;
    }
    return parseAddress(leaf.mid(4).toStdString());
}

bool advertisesBatteryService(const QStringList &uuids)
{
    return std::any_of(uuids.begin(), uuids.end(), [](const QString &uuid) {
        return uuid.compare(bluez::kBatteryServiceUuid, Qt::CaseInsensitive) == 0;
    });
}

TransportKind classifyTransport(const QString &objectPath, const QStringList &uuids)
{
    if (advertisesBatteryService(uuids)) {
        return TransportKind::lowEnergy();
    }
    return TransportKind::classic(objectPath.toStdString());
}

std::optional<std::uint8_t> decodeBatteryLevel(const QByteArray &value)
{
    if (value.isEmpty()) {
        return std::nullopt;
    }
    const int level = static_cast<unsigned char>(value.at(0));
    return static_cast<std::uint8_t>(std::min(level, kMaxBattery));
}

std::optional<std::uint8_t> batteryFromVariant(const QVariant &value)
{
    bool ok = false;
    const double percentage = value.toDouble(&ok);
    if (!ok || std::isnan(percentage)) {
        return std::nullopt;
    }
    const long rounded = std::lround(std::clamp(percentage, 0.0, static_cast<double>(kMaxBattery)));
    return static_cast<std::uint8_t>(rounded);
}

std::vector<BluezDeviceInfo> collectPairedDevices(const BluezManagedObjects &objects)
{
    std::vector<BluezDeviceInfo> devices;

    for (auto it = objects.cbegin(); it != objects.cend(); ++it) {
        const BluezInterfaceMap &interfaces = it.value();
        const auto device = interfaces.constFind(bluez::kDeviceInterface);
        if (device == interfaces.cend()) {
            continue;
        }
        const QVariantMap &properties = device.value();
        if (!properties.value(QStringLiteral("Paired")).toBool()) {
            continue;
        }

        BluezDeviceInfo info;
        info.path = it.key().path();

        std::optional<Address> address =
            parseAddress(properties.value(QStringLiteral("Address")).toString().toStdString());
        if (!address) {
            address = addressFromObjectPath(info.path);
        }
        if (!address) {
            continue;
        }
        info.address = *address;
        info.name = deviceName(properties);
        info.connected = properties.value(QStringLiteral("Connected")).toBool();
        info.uuids = properties.value(QStringLiteral("UUIDs")).toStringList();

        const auto battery = interfaces.constFind(bluez::kBatteryInterface);
        if (battery != interfaces.cend()) {
            info.batteryPercentage = batteryFromVariant(battery.value().value(QStringLiteral("Percentage")));
        }

        devices.push_back(info);
    }

    // Battery Level characteristics live below their device's object path.
    const QString levelUuid = bluez::kBatteryLevelUuid;
    for (auto it = objects.cbegin(); it != objects.cend(); ++it) {
        const auto characteristic = it.value().constFind(bluez::kGattCharacteristicInterface);
        if (characteristic == it.value().cend()) {
            continue;
        }
        const QString uuid = characteristic.value().value(QStringLiteral("UUID")).toString();
        if (uuid.compare(levelUuid, Qt::CaseInsensitive) != 0) {
            continue;
        }
        const QString path = it.key().path();
        for (BluezDeviceInfo &info : devices) {
            if (info.batteryCharacteristicPath.isEmpty()
                && path.startsWith(info.path + QLatin1Char('/'))) {
                info.batteryCharacteristicPath = path;
                break;
            }
        }
    }

    return devices;
}

} // namespace bluemeter
