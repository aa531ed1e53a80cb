#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <QByteArray>
#include <QDBusObjectPath>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include "common/models.hpp"

namespace bluemeter {

namespace bluez {

inline const QString kService = QStringLiteral("org.bluez");
inline const QString kDeviceInterface = QStringLiteral("org.bluez.Device1");
inline const QString kBatteryInterface = QStringLiteral("org.bluez.Battery1");
inline const QString kGattCharacteristicInterface = QStringLiteral("org.bluez.GattCharacteristic1");
inline const QString kPropertiesInterface = QStringLiteral("org.freedesktop.DBus.Properties");
inline const QString kObjectManagerInterface = QStringLiteral("org.freedesktop.DBus.ObjectManager");

inline const QString kUPowerService = QStringLiteral("org.freedesktop.UPower");
inline const QString kUPowerPath = QStringLiteral("/org/freedesktop/UPower");
inline const QString kUPowerDeviceInterface = QStringLiteral("org.freedesktop.UPower.Device");

// GATT Battery Service and its Battery Level characteristic.
inline const QString kBatteryServiceUuid = QStringLiteral("0000180f-0000-1000-8000-00805f9b34fb");
inline const QString kBatteryLevelUuid = QStringLiteral("00002a19-0000-1000-8000-00805f9b34fb");

} // namespace bluez

// a{sa{sv}} and a{oa{sa{sv}}} as returned by ObjectManager.GetManagedObjects.
using BluezInterfaceMap = QMap<QString, QVariantMap>;
using BluezManagedObjects = QMap<QDBusObjectPath, BluezInterfaceMap>;

// Registers the container types with QtDBus. Safe to call repeatedly.
void registerBluezTypes();

// What GetManagedObjects tells us about one paired device.
struct BluezDeviceInfo {
    QString path;
    Address address = 0;
    QString name;
    bool connected = false;
    QStringList uuids;
    // org.bluez.Battery1 Percentage, when BlueZ exposes it.
    std::optional<std::uint8_t> batteryPercentage;
    // Battery Level characteristic object path, when exported.
    QString batteryCharacteristicPath;
};

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> address.
std::optional<Address> addressFromObjectPath(const QString &path);

bool advertisesBatteryService(const QStringList &uuids);

// Devices advertising the GATT Battery Service are LowEnergy; everything else
// is Classic and keyed by its object path.
TransportKind classifyTransport(const QString &objectPath, const QStringList &uuids);

// Battery Level characteristic value: first byte, clamped to 100.
std::optional<std::uint8_t> decodeBatteryLevel(const QByteArray &value);

// UPower Percentage (double) or Battery1 Percentage (byte), clamped to 0..100.
std::optional<std::uint8_t> batteryFromVariant(const QVariant &value);

// Paired devices found in a GetManagedObjects reply, ordered by object path.
std::vector<BluezDeviceInfo> collectPairedDevices(const BluezManagedObjects &objects);

} // namespace bluemeter

Q_DECLARE_METATYPE(bluemeter::BluezInterfaceMap)
Q_DECLARE_METATYPE(bluemeter::BluezManagedObjects)
