#pragma once

#include <map>
#include <memory>
#include <vector>

#include <QDBusConnection>
#include <QString>

#include "bluez/bluez_utils.hpp"
#include "monitor/device_source.hpp"

namespace bluemeter {

// Reads the UPower device list and returns Bluetooth entries keyed by
// address. Throws EnumerationError when UPower cannot be reached.
std::map<Address, std::uint8_t> readUPowerBatteryTable(const QDBusConnection &bus);

// Queries one paired BlueZ device. LowEnergy devices read the Battery Service;
// classic devices report connection state only.
class BluezDeviceHandle : public DeviceHandle {
public:
    BluezDeviceHandle(QDBusConnection bus, BluezDeviceInfo info);

    std::string describe() const override;
    RawObservation query() override;

private:
    std::uint8_t readLowEnergyBattery();

    QDBusConnection m_bus;
    BluezDeviceInfo m_info;
    TransportKind m_kind;
};

// Paired devices from the BlueZ object manager; classic battery levels from
// UPower.
class BluezDeviceEnumerator : public DeviceEnumerator {
public:
    BluezDeviceEnumerator();
    explicit BluezDeviceEnumerator(QDBusConnection systemBus);

    std::vector<std::unique_ptr<DeviceHandle>> enumeratePairedDevices() override;
    std::map<Address, std::uint8_t> queryClassicBatteryTable() override;

private:
    QDBusConnection m_bus;
};

} // namespace bluemeter
