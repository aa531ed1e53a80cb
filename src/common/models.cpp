#include "common/models.hpp"

#include <functional>

namespace bluemeter {

namespace {

void hashCombine(std::size_t &seed, std::size_t value)
{
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

std::size_t DeviceRecordHash::operator()(const DeviceRecord &record) const
{
    std::size_t seed = std::hash<Address>{}(record.address);
    hashCombine(seed, std::hash<std::string>{}(record.name));
    hashCombine(seed, std::hash<unsigned>{}(record.battery));
    hashCombine(seed, std::hash<bool>{}(record.connected));
    hashCombine(seed, std::hash<int>{}(static_cast<int>(record.kind.type)));
    hashCombine(seed, std::hash<std::string>{}(record.kind.instanceId));
    return seed;
}

Snapshot Snapshot::fromRecords(const std::vector<DeviceRecord> &records,
                               std::vector<DeviceRecord> *rejected)
{
    Snapshot snapshot;
    for (const auto &record : records) {
        const auto inserted = snapshot.m_devices.emplace(record.address, record);
        if (!inserted.second && rejected) {
            rejected->push_back(record);
        }
    }
    return snapshot;
}

const DeviceRecord *Snapshot::find(Address address) const
{
    const auto it = m_devices.find(address);
    if (it == m_devices.end()) {
        return nullptr;
    }
    return &it->second;
}

bool Snapshot::contains(const DeviceRecord &record) const
{
    const DeviceRecord *existing = find(record.address);
    return existing && *existing == record;
}

std::vector<DeviceRecord> Snapshot::records() const
{
    std::vector<DeviceRecord> result;
    result.reserve(m_devices.size());
    for (const auto &entry : m_devices) {
        result.push_back(entry.second);
    }
    return result;
}

Snapshot Snapshot::withRecord(const DeviceRecord &record) const
{
    Snapshot copy = *this;
    copy.m_devices[record.address] = record;
    return copy;
}

std::vector<DeviceRecord> Snapshot::difference(const Snapshot &other) const
{
    std::vector<DeviceRecord> result;
    for (const auto &entry : m_devices) {
        if (!other.contains(entry.second)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

} // namespace bluemeter
