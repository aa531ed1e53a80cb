#include "bluez/bluez_event_source.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <QDBusError>
#include <QDBusMessage>
#include <QDBusReply>
#include <QDBusVariant>
#include <QList>

#include "bluez/bluez_device_enumerator.hpp"
#include "bluez/bluez_utils.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace bluemeter {

namespace {

constexpr int kCallTimeoutMs = 5000;

const char *const kPropertiesChangedSlot = SLOT(onPropertiesChanged(QString,QVariantMap,QStringList));

struct SignalMatch {
    QString service;
    QString path;
};

// Owns the bus matches for one watch. Destruction removes them, stops GATT
// notifications and hands the receiver back to its thread for deletion.
class BluezSubscription : public DeviceSubscription {
public:
    BluezSubscription(QDBusConnection bus, BluezPropertyReceiver *receiver)
        : m_bus(std::move(bus))
        , m_receiver(receiver)
    {
    }

    ~BluezSubscription() override
    {
        for (const SignalMatch &match : m_matches) {
            m_bus.disconnect(match.service, match.path, bluez::kPropertiesInterface,
                             QStringLiteral("PropertiesChanged"),
                             m_receiver, kPropertiesChangedSlot);
        }
        if (!m_notifyingCharacteristic.isEmpty()) {
            QDBusMessage call = QDBusMessage::createMethodCall(bluez::kService,
                                                               m_notifyingCharacteristic,
                                                               bluez::kGattCharacteristicInterface,
                                                               QStringLiteral("StopNotify"));
            // Fire and forget: the device may already be gone.
            m_bus.send(call);
        }
        m_receiver->deleteLater();
    }

    bool watch(const QString &service, const QString &path)
    {
        if (!m_bus.connect(service, path, bluez::kPropertiesInterface,
                           QStringLiteral("PropertiesChanged"),
                           m_receiver, kPropertiesChangedSlot)) {
            return false;
        }
        m_matches.push_back(SignalMatch{service, path});
        return true;
    }

    void setNotifyingCharacteristic(const QString &path) { m_notifyingCharacteristic = path; }

private:
    QDBusConnection m_bus;
    BluezPropertyReceiver *m_receiver;
    std::vector<SignalMatch> m_matches;
    QString m_notifyingCharacteristic;
};

std::string errorText(const QDBusError &error)
{
    return (error.name() + QStringLiteral(": ") + error.message()).toStdString();
}

// Battery Level characteristic below `devicePath`, if BlueZ exports one.
QString findBatteryCharacteristic(const QDBusConnection &bus, const QString &devicePath)
{
    QDBusMessage call = QDBusMessage::createMethodCall(bluez::kService,
                                                       QStringLiteral("/"),
                                                       bluez::kObjectManagerInterface,
                                                       QStringLiteral("GetManagedObjects"));
    QDBusReply<BluezManagedObjects> reply = bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!reply.isValid()) {
        return {};
    }
    for (const BluezDeviceInfo &info : collectPairedDevices(reply.value())) {
        if (info.path == devicePath) {
            return info.batteryCharacteristicPath;
        }
    }
    return {};
}

// UPower object whose serial or native path names this device.
QString findUPowerDevice(const QDBusConnection &bus, Address address)
{
    QDBusMessage call = QDBusMessage::createMethodCall(bluez::kUPowerService,
                                                       bluez::kUPowerPath,
                                                       bluez::kUPowerService,
                                                       QStringLiteral("EnumerateDevices"));
    QDBusReply<QList<QDBusObjectPath>> reply = bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!reply.isValid()) {
        return {};
    }
    for (const QDBusObjectPath &path : reply.value()) {
        QDBusMessage get = QDBusMessage::createMethodCall(bluez::kUPowerService,
                                                          path.path(),
                                                          bluez::kPropertiesInterface,
                                                          QStringLiteral("GetAll"));
        get << bluez::kUPowerDeviceInterface;
        QDBusReply<QVariantMap> properties = bus.call(get, QDBus::Block, kCallTimeoutMs);
        if (!properties.isValid()) {
            continue;
        }
        std::optional<Address> candidate =
            parseAddress(properties.value().value(QStringLiteral("Serial")).toString().toStdString());
        if (!candidate) {
            candidate = addressFromObjectPath(properties.value().value(QStringLiteral("NativePath")).toString());
        }
        if (candidate && *candidate == address) {
            return path.path();
        }
    }
    return {};
}

} // namespace

BluezPropertyReceiver::BluezPropertyReceiver(DeviceEventSource::UpdateCallback callback)
    : QObject(nullptr)
    , m_callback(std::move(callback))
{
}

void BluezPropertyReceiver::onPropertiesChanged(const QString &interface,
                                                const QVariantMap &changed,
                                                const QStringList &invalidated)
{
    Q_UNUSED(invalidated);

    WatchUpdate update;
    if (interface == bluez::kDeviceInterface) {
        const auto connected = changed.constFind(QStringLiteral("Connected"));
        if (connected != changed.cend()) {
            update.connected = connected.value().toBool();
        }
    } else if (interface == bluez::kBatteryInterface
               || interface == bluez::kUPowerDeviceInterface) {
        update.battery = batteryFromVariant(changed.value(QStringLiteral("Percentage")));
    } else if (interface == bluez::kGattCharacteristicInterface) {
        update.battery = decodeBatteryLevel(changed.value(QStringLiteral("Value")).toByteArray());
    }

    if (!update.empty() && m_callback) {
        m_callback(update);
    }
}

BluezEventSource::BluezEventSource()
    : BluezEventSource(QDBusConnection::systemBus())
{
}

BluezEventSource::BluezEventSource(QDBusConnection systemBus)
    : m_bus(std::move(systemBus))
    , m_eventThread(QThread::currentThread())
{
    registerBluezTypes();
}

QString BluezEventSource::devicePath(const WatchTarget &target) const
{
    if (target.kind.isClassic() && !target.kind.instanceId.empty()) {
        return QString::fromStdString(target.kind.instanceId);
    }
    // LowEnergy targets carry no instance id; resolve through the object tree.
    QDBusMessage call = QDBusMessage::createMethodCall(bluez::kService,
                                                       QStringLiteral("/"),
                                                       bluez::kObjectManagerInterface,
                                                       QStringLiteral("GetManagedObjects"));
    QDBusReply<BluezManagedObjects> reply = m_bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!reply.isValid()) {
        throw SubscriptionError("GetManagedObjects failed: " + errorText(reply.error()));
    }
    for (const BluezDeviceInfo &info : collectPairedDevices(reply.value())) {
        if (info.address == target.address) {
            return info.path;
        }
    }
    throw SubscriptionError("device " + formatAddress(target.address) + " is not paired");
}

std::unique_ptr<DeviceSubscription> BluezEventSource::subscribe(const WatchTarget &target,
                                                                UpdateCallback callback)
{
    if (!m_bus.isConnected()) {
        throw SubscriptionError("system bus unavailable: " + errorText(m_bus.lastError()));
    }

    const QString path = devicePath(target);

    auto *receiver = new BluezPropertyReceiver(std::move(callback));
    receiver->moveToThread(m_eventThread);
    auto subscription = std::make_unique<BluezSubscription>(m_bus, receiver);

    if (!subscription->watch(bluez::kService, path)) {
        throw SubscriptionError("cannot watch " + path.toStdString() + ": "
                                + errorText(m_bus.lastError()));
    }

    if (target.kind.isClassic()) {
        const QString upowerPath = findUPowerDevice(m_bus, target.address);
        if (!upowerPath.isEmpty()) {
            subscription->watch(bluez::kUPowerService, upowerPath);
        }
    } else {
        const QString characteristic = findBatteryCharacteristic(m_bus, path);
        if (!characteristic.isEmpty() && subscription->watch(bluez::kService, characteristic)) {
            QDBusMessage call = QDBusMessage::createMethodCall(bluez::kService,
                                                               characteristic,
                                                               bluez::kGattCharacteristicInterface,
                                                               QStringLiteral("StartNotify"));
            const QDBusMessage reply = m_bus.call(call, QDBus::Block, kCallTimeoutMs);
            if (reply.type() == QDBusMessage::ErrorMessage) {
                // Battery1 and Device1 changes still arrive.
                BMLOG_WARN(QStringLiteral("BluezEventSource"),
                           QStringLiteral("subscribe"),
                           QStringLiteral("start_notify_failed"),
                           QStringLiteral("dbus_error"),
                           QStringLiteral("continue_without_gatt_notify"),
                           logging::defaultWho(),
                           logging::currentCorrelationId(),
                           nlohmann::json{{"characteristic", characteristic.toStdString()},
                                          {"error", (reply.errorName() + QStringLiteral(": ")
                                                     + reply.errorMessage()).toStdString()}});
            } else {
                subscription->setNotifyingCharacteristic(characteristic);
            }
        }
    }

    BMLOG_DEBUG(QStringLiteral("BluezEventSource"),
                QStringLiteral("subscribe"),
                QStringLiteral("subscription_registered"),
                QStringLiteral("watch_started"),
                QStringLiteral("dbus_match"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                nlohmann::json{{"address", formatAddress(target.address)},
                               {"path", path.toStdString()}});
    return subscription;
}

bool BluezEventSource::needsPolling(const WatchTarget &target) const
{
    return target.kind.isClassic();
}

WatchUpdate BluezEventSource::poll(const WatchTarget &target)
{
    WatchUpdate update;

    QDBusMessage call = QDBusMessage::createMethodCall(bluez::kService,
                                                       QString::fromStdString(target.kind.instanceId),
                                                       bluez::kPropertiesInterface,
                                                       QStringLiteral("Get"));
    call << bluez::kDeviceInterface << QStringLiteral("Connected");
    QDBusReply<QDBusVariant> connected = m_bus.call(call, QDBus::Block, kCallTimeoutMs);
    if (!connected.isValid()) {
        throw QueryError("Connected unavailable: " + errorText(connected.error()));
    }
    update.connected = connected.value().variant().toBool();

    std::map<Address, std::uint8_t> table;
    try {
        table = readUPowerBatteryTable(m_bus);
    } catch (const EnumerationError &ex) {
        throw QueryError(ex.what());
    }
    const auto it = table.find(target.address);
    if (it != table.end()) {
        update.battery = it->second;
    }
    return update;
}

} // namespace bluemeter
