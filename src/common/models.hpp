#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common/enums.hpp"

namespace bluemeter {

// 48-bit Bluetooth device address stored in the low bits.
using Address = std::uint64_t;

constexpr Address kAddressMask = 0xFFFFFFFFFFFFULL;

struct TransportKind {
    TransportType type = TransportType::LowEnergy;
    // Platform instance id (BlueZ object path) for classic devices. Only the
    // device query collaborator interprets it.
    std::string instanceId;

    static TransportKind classic(std::string instanceId)
    {
        return TransportKind{TransportType::Classic, std::move(instanceId)};
    }

    static TransportKind lowEnergy()
    {
        return TransportKind{TransportType::LowEnergy, std::string()};
    }

    bool isClassic() const { return type == TransportType::Classic; }

    bool operator==(const TransportKind &other) const
    {
        return type == other.type && instanceId == other.instanceId;
    }

    bool operator!=(const TransportKind &other) const { return !(*this == other); }
};

struct DeviceRecord {
    Address address = 0;
    std::string name;
    std::uint8_t battery = 0;
    bool connected = false;
    TransportKind kind;

    bool operator==(const DeviceRecord &other) const
    {
        return address == other.address
            && name == other.name
            && battery == other.battery
            && connected == other.connected
            && kind == other.kind;
    }

    bool operator!=(const DeviceRecord &other) const { return !(*this == other); }
};

// Hashes every observable field, so structurally different records are
// distinct set members.
struct DeviceRecordHash {
    std::size_t operator()(const DeviceRecord &record) const;
};

// Immutable observation of all known devices, unique by address.
class Snapshot {
public:
    Snapshot() = default;

    // Keeps the first record for each address. Later duplicates are appended
    // to `rejected` when provided.
    static Snapshot fromRecords(const std::vector<DeviceRecord> &records,
                                std::vector<DeviceRecord> *rejected = nullptr);

    const DeviceRecord *find(Address address) const;
    bool contains(const DeviceRecord &record) const;

    // Records ordered by address.
    std::vector<DeviceRecord> records() const;
    std::size_t size() const { return m_devices.size(); }
    bool empty() const { return m_devices.empty(); }

    // Copy of this snapshot with the record for `record.address` replaced.
    Snapshot withRecord(const DeviceRecord &record) const;

    // Structural set difference: records of this snapshot that do not occur,
    // field for field, in `other`.
    std::vector<DeviceRecord> difference(const Snapshot &other) const;

    bool operator==(const Snapshot &other) const { return m_devices == other.m_devices; }
    bool operator!=(const Snapshot &other) const { return !(*this == other); }

private:
    std::map<Address, DeviceRecord> m_devices;
};

// Address -> "currently alerted". Entries are cleared, never erased.
using NotifiedLowBatterySet = std::unordered_map<Address, bool>;

struct WatchTarget {
    Address address = 0;
    TransportKind kind;
    DeviceRecord lastKnown;

    static WatchTarget fromRecord(const DeviceRecord &record)
    {
        return WatchTarget{record.address, record.kind, record};
    }

    bool sameDevice(const WatchTarget &other) const
    {
        return address == other.address && kind == other.kind;
    }
};

struct EventConfig {
    std::uint8_t lowBatteryThreshold = 15;
    bool notifyAdded = false;
    bool notifyRemoved = false;
    bool notifyReconnect = false;
    bool notifyDisconnect = false;
    bool mute = false;
    std::chrono::seconds pollInterval{60};
};

struct DeviceEvent {
    EventKind kind;
    DeviceRecord device;
    std::optional<DeviceRecord> previous;
};

struct DeviceChange {
    DeviceRecord before;
    DeviceRecord after;
};

struct ChangeReport {
    // False when nothing distinguishable changed and no force was requested.
    bool updateNeeded = false;
    std::vector<DeviceEvent> events;

    // Classification before event gating.
    std::vector<DeviceRecord> added;
    std::vector<DeviceRecord> removed;
    std::vector<DeviceChange> updated;

    Snapshot snapshot;
};

// What the device query collaborator reports for one device. Classic devices
// carry no battery; it is correlated from the property store.
struct RawObservation {
    Address address = 0;
    std::string name;
    bool connected = false;
    std::optional<std::uint8_t> battery;
    TransportKind kind;
};

} // namespace bluemeter
