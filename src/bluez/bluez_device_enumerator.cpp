#include "bluez/bluez_device_enumerator.hpp"

#include <utility>

#include <QDBusError>
#include <QDBusMessage>
#include <QDBusReply>
#include <QDBusVariant>
#include <QList>
#include <QVariant>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace bluemeter {

namespace {

// Bus calls happen on the poll thread; a hung daemon must not stall it.
constexpr int kCallTimeoutMs = 5000;

std::string errorText(const QDBusError &error)
{
    return (error.name() + QStringLiteral(": ") + error.message()).toStdString();
}

QVariantMap getAllProperties(const QDBusConnection &bus,
                             const QString &service,
                             const QString &path,
                             const QString &interface,
                             QDBusError *error)
{
    QDBusMessage call = QDBusMessage::createMethodCall(service, path,
                                                       bluez::kPropertiesInterface,
                                                       QStringLiteral("GetAll"));
    call << interface;
    QDBusReply<QVariantMap> reply = bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!reply.isValid()) {
        if (error) {
            *error = reply.error();
        }
        return {};
    }
    return reply.value();
}

} // namespace

std::map<Address, std::uint8_t> readUPowerBatteryTable(const QDBusConnection &bus)
{
    QDBusMessage call = QDBusMessage::createMethodCall(bluez::kUPowerService,
                                                       bluez::kUPowerPath,
                                                       bluez::kUPowerService,
                                                       QStringLiteral("EnumerateDevices"));
    QDBusReply<QList<QDBusObjectPath>> reply = bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!reply.isValid()) {
        throw EnumerationError("UPower EnumerateDevices failed: " + errorText(reply.error()));
    }

    std::map<Address, std::uint8_t> table;
    for (const QDBusObjectPath &devicePath : reply.value()) {
        QDBusError error;
        const QVariantMap properties = getAllProperties(bus, bluez::kUPowerService,
                                                        devicePath.path(),
                                                        bluez::kUPowerDeviceInterface,
                                                        &error);
        if (error.isValid()) {
            BMLOG_DEBUG(QStringLiteral("BluezDeviceEnumerator"),
                        QStringLiteral("readUPowerBatteryTable"),
                        QStringLiteral("upower_device_unreadable"),
                        QStringLiteral("dbus_error"),
                        QStringLiteral("skip_entry"),
                        logging::defaultWho(),
                        logging::currentCorrelationId(),
                        nlohmann::json{{"path", devicePath.path().toStdString()},
                                       {"error", errorText(error)}});
            continue;
        }

        // Bluetooth entries carry the device address as their serial; the
        // native path names the BlueZ object on older UPower releases.
        std::optional<Address> address =
            parseAddress(properties.value(QStringLiteral("Serial")).toString().toStdString());
        if (!address) {
            address = addressFromObjectPath(properties.value(QStringLiteral("NativePath")).toString());
        }
        if (!address) {
            continue;
        }

        const std::optional<std::uint8_t> battery =
            batteryFromVariant(properties.value(QStringLiteral("Percentage")));
        if (battery) {
            table.emplace(*address, *battery);
        }
    }
    return table;
}

BluezDeviceHandle::BluezDeviceHandle(QDBusConnection bus, BluezDeviceInfo info)
    : m_bus(std::move(bus))
    , m_info(std::move(info))
    , m_kind(classifyTransport(m_info.path, m_info.uuids))
{
}

std::string BluezDeviceHandle::describe() const
{
    return m_info.path.toStdString() + " (" + formatAddress(m_info.address) + ")";
}

RawObservation BluezDeviceHandle::query()
{
    QDBusError error;
    const QVariantMap properties = getAllProperties(m_bus, bluez::kService, m_info.path,
                                                    bluez::kDeviceInterface, &error);
    if (error.isValid()) {
        throw QueryError("Device1 properties unavailable: " + errorText(error));
    }

    RawObservation observation;
    observation.address = m_info.address;
    observation.name = properties.value(QStringLiteral("Alias"),
                                        properties.value(QStringLiteral("Name")))
                           .toString()
                           .toStdString();
    if (observation.name.empty()) {
        observation.name = m_info.name.toStdString();
    }
    observation.connected = properties.value(QStringLiteral("Connected")).toBool();
    observation.kind = m_kind;

    if (!m_kind.isClassic()) {
        observation.battery = readLowEnergyBattery();
    }
    return observation;
}

std::uint8_t BluezDeviceHandle::readLowEnergyBattery()
{
    QDBusError error;
    const QVariantMap battery = getAllProperties(m_bus, bluez::kService, m_info.path,
                                                 bluez::kBatteryInterface, &error);
    if (!error.isValid()) {
        const std::optional<std::uint8_t> level =
            batteryFromVariant(battery.value(QStringLiteral("Percentage")));
        if (level) {
            return *level;
        }
    }

    if (m_info.batteryCharacteristicPath.isEmpty()) {
        throw QueryError("no battery level characteristic exported");
    }

    QDBusMessage call = QDBusMessage::createMethodCall(bluez::kService,
                                                       m_info.batteryCharacteristicPath,
                                                       bluez::kGattCharacteristicInterface,
                                                       QStringLiteral("ReadValue"));
    call << QVariantMap();
    QDBusReply<QByteArray> reply = m_bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!reply.isValid()) {
        throw QueryError("battery level read failed: " + errorText(reply.error()));
    }
    const std::optional<std::uint8_t> level = decodeBatteryLevel(reply.value());
    if (!level) {
        throw QueryError("battery level characteristic returned no data");
    }
    return *level;
}

BluezDeviceEnumerator::BluezDeviceEnumerator()
    : BluezDeviceEnumerator(QDBusConnection::systemBus())
{
}

BluezDeviceEnumerator::BluezDeviceEnumerator(QDBusConnection systemBus)
    : m_bus(std::move(systemBus))
{
    registerBluezTypes();
}

std::vector<std::unique_ptr<DeviceHandle>> BluezDeviceEnumerator::enumeratePairedDevices()
{
    if (!m_bus.isConnected()) {
        throw EnumerationError("system bus unavailable: " + errorText(m_bus.lastError()));
    }

    QDBusMessage call = QDBusMessage::createMethodCall(bluez::kService,
                                                       QStringLiteral("/"),
                                                       bluez::kObjectManagerInterface,
                                                       QStringLiteral("GetManagedObjects"));
    QDBusReply<BluezManagedObjects> reply = m_bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!reply.isValid()) {
        throw EnumerationError("GetManagedObjects failed: " + errorText(reply.error()));
    }

    std::vector<std::unique_ptr<DeviceHandle>> handles;
    for (BluezDeviceInfo &info : collectPairedDevices(reply.value())) {
        handles.push_back(std::make_unique<BluezDeviceHandle>(m_bus, std::move(info)));
    }
    return handles;
}

std::map<Address, std::uint8_t> BluezDeviceEnumerator::queryClassicBatteryTable()
{
    return readUPowerBatteryTable(m_bus);
}

} // namespace bluemeter
