#include "monitor/reconciliation_engine.hpp"

#include <map>
#include <unordered_set>
#include <vector>

namespace bluemeter {

namespace {

using RecordSet = std::unordered_set<DeviceRecord, DeviceRecordHash>;

void clearAlert(NotifiedLowBatterySet &notified, Address address)
{
    const auto it = notified.find(address);
    if (it != notified.end()) {
        it->second = false;
    }
}

void evaluateBattery(const DeviceRecord &before,
                     const DeviceRecord &after,
                     NotifiedLowBatterySet &notified,
                     const EventConfig &config,
                     std::vector<DeviceEvent> &events)
{
    if (after.battery > before.battery) {
        // Charging re-arms the alert even below the threshold.
        clearAlert(notified, after.address);
        return;
    }

    if (after.battery >= config.lowBatteryThreshold) {
        clearAlert(notified, after.address);
        return;
    }

    bool &alerted = notified[after.address];
    if (!alerted) {
        alerted = true;
        events.push_back(DeviceEvent{EventKind::LowBattery, after, before});
    }
}

} // namespace

ChangeReport reconcile(const Snapshot &previous,
                       const Snapshot &current,
                       NotifiedLowBatterySet &notified,
                       const EventConfig &config,
                       bool force)
{
    ChangeReport report;
    report.snapshot = current;

    const std::vector<DeviceRecord> removedRaw = previous.difference(current);
    const std::vector<DeviceRecord> addedRaw = current.difference(previous);

    const RecordSet removedSet(removedRaw.begin(), removedRaw.end());
    const RecordSet addedSet(addedRaw.begin(), addedRaw.end());
    if (removedSet == addedSet) {
        report.updateNeeded = force;
        return report;
    }
    report.updateNeeded = true;

    std::map<Address, DeviceRecord> unpairedRemoved;
    for (const DeviceRecord &record : removedRaw) {
        unpairedRemoved.emplace(record.address, record);
    }

    for (const DeviceRecord &after : addedRaw) {
        const auto it = unpairedRemoved.find(after.address);
        if (it == unpairedRemoved.end()) {
            report.added.push_back(after);
            if (config.notifyAdded) {
                report.events.push_back(DeviceEvent{EventKind::Added, after, std::nullopt});
            }
            continue;
        }

        const DeviceRecord before = it->second;
        unpairedRemoved.erase(it);
        report.updated.push_back(DeviceChange{before, after});

        if (before.connected != after.connected) {
            if (after.connected && config.notifyReconnect) {
                report.events.push_back(DeviceEvent{EventKind::Reconnected, after, before});
            } else if (!after.connected && config.notifyDisconnect) {
                report.events.push_back(DeviceEvent{EventKind::Disconnected, after, before});
            }
        }

        if (before.battery != after.battery) {
            evaluateBattery(before, after, notified, config, report.events);
        }
    }

    for (const auto &entry : unpairedRemoved) {
        report.removed.push_back(entry.second);
        if (config.notifyRemoved) {
            report.events.push_back(DeviceEvent{EventKind::Removed, entry.second, std::nullopt});
        }
    }

    return report;
}

ChangeReport ReconciliationEngine::reconcile(const Snapshot &previous,
                                             const Snapshot &current,
                                             const EventConfig &config,
                                             bool force)
{
    return bluemeter::reconcile(previous, current, m_notified, config, force);
}

bool ReconciliationEngine::isAlerted(Address address) const
{
    const auto it = m_notified.find(address);
    return it != m_notified.end() && it->second;
}

} // namespace bluemeter
