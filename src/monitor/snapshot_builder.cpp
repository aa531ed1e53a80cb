#include "monitor/snapshot_builder.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <memory>
#include <utility>

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace bluemeter {

namespace {

constexpr std::uint8_t kMaxBattery = 100;

std::uint8_t clampBattery(std::uint8_t value)
{
    return std::min(value, kMaxBattery);
}

} // namespace

SnapshotBuilder::SnapshotBuilder(DeviceEnumerator &enumerator, RetryPolicy policy)
    : m_enumerator(enumerator)
    , m_policy(std::move(policy))
{
}

SnapshotBuildResult SnapshotBuilder::build(const std::optional<Snapshot> &lastKnown)
{
    const QString corrId = logging::currentCorrelationId();

    std::vector<std::unique_ptr<DeviceHandle>> handles;
    try {
        handles = m_policy.run("enumerate_paired_devices", [this]() {
            return m_enumerator.enumeratePairedDevices();
        });
    } catch (const EnumerationError &ex) {
        return failed(lastKnown, ex.what(), Snapshot());
    }

    std::vector<RawObservation> observations;
    observations.reserve(handles.size());
    int skipped = 0;
    for (const auto &handle : handles) {
        try {
            observations.push_back(handle->query());
        } catch (const std::exception &ex) {
            ++skipped;
            BMLOG_WARN(QStringLiteral("SnapshotBuilder"),
                       QStringLiteral("build"),
                       QStringLiteral("device_query_failed"),
                       QStringLiteral("query_error"),
                       QStringLiteral("skip_device"),
                       logging::defaultWho(),
                       corrId,
                       nlohmann::json{{"device", handle->describe()},
                                      {"error", ex.what()}});
        }
    }

    const bool anyClassic = std::any_of(observations.begin(), observations.end(),
                                        [](const RawObservation &obs) {
                                            return obs.kind.isClassic();
                                        });

    std::map<Address, std::uint8_t> classicBattery;
    if (anyClassic) {
        try {
            classicBattery = m_policy.run("query_classic_battery", [this]() {
                return m_enumerator.queryClassicBatteryTable();
            });
        } catch (const EnumerationError &ex) {
            std::vector<RawObservation> lowEnergyOnly;
            std::copy_if(observations.begin(), observations.end(),
                         std::back_inserter(lowEnergyOnly),
                         [](const RawObservation &obs) { return !obs.kind.isClassic(); });
            return failed(lastKnown, ex.what(), assemble(lowEnergyOnly, {}, nullptr));
        }
    }

    SnapshotBuildResult result;
    result.snapshot = assemble(observations, classicBattery, &skipped);
    result.skippedDevices = skipped;

    BMLOG_DEBUG(QStringLiteral("SnapshotBuilder"),
                QStringLiteral("build"),
                QStringLiteral("snapshot_built"),
                QStringLiteral("poll"),
                QStringLiteral("enumerate_and_query"),
                logging::defaultWho(),
                corrId,
                nlohmann::json{{"handles", handles.size()},
                               {"devices", result.snapshot.size()},
                               {"skipped", skipped}});
    return result;
}

Snapshot SnapshotBuilder::assemble(const std::vector<RawObservation> &observations,
                                   const std::map<Address, std::uint8_t> &classicBattery,
                                   int *skipped)
{
    std::vector<DeviceRecord> records;
    records.reserve(observations.size());

    for (const RawObservation &obs : observations) {
        DeviceRecord record;
        record.address = obs.address & kAddressMask;
        record.name = obs.name;
        record.connected = obs.connected;
        record.kind = obs.kind;

        if (obs.kind.isClassic()) {
            const auto it = classicBattery.find(record.address);
            if (it == classicBattery.end()) {
                // No property-store entry: the device does not report battery.
                if (skipped) {
                    ++*skipped;
                }
                BMLOG_DEBUG(QStringLiteral("SnapshotBuilder"),
                            QStringLiteral("assemble"),
                            QStringLiteral("classic_battery_missing"),
                            QStringLiteral("no_property_store_entry"),
                            QStringLiteral("omit_device"),
                            logging::defaultWho(),
                            logging::currentCorrelationId(),
                            nlohmann::json{{"address", formatAddress(record.address)}});
                continue;
            }
            record.battery = clampBattery(it->second);
        } else {
            if (!obs.battery) {
                if (skipped) {
                    ++*skipped;
                }
                continue;
            }
            record.battery = clampBattery(*obs.battery);
        }

        records.push_back(std::move(record));
    }

    std::vector<DeviceRecord> rejected;
    Snapshot snapshot = Snapshot::fromRecords(records, &rejected);
    for (const DeviceRecord &dup : rejected) {
        BMLOG_WARN(QStringLiteral("SnapshotBuilder"),
                   QStringLiteral("assemble"),
                   QStringLiteral("duplicate_address"),
                   QStringLiteral("address_seen_twice"),
                   QStringLiteral("keep_first"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   nlohmann::json{{"address", formatAddress(dup.address)},
                                  {"name", dup.name}});
    }
    return snapshot;
}

SnapshotBuildResult SnapshotBuilder::failed(const std::optional<Snapshot> &lastKnown,
                                            const std::string &error,
                                            const Snapshot &partial) const
{
    SnapshotBuildResult result;
    result.hadError = true;
    result.error = error;
    if (lastKnown) {
        result.snapshot = *lastKnown;
        result.degraded = true;
    } else {
        result.snapshot = partial;
    }

    BMLOG_ERROR(QStringLiteral("SnapshotBuilder"),
                QStringLiteral("build"),
                QStringLiteral("enumeration_failed"),
                QStringLiteral("retries_exhausted"),
                result.degraded ? QStringLiteral("keep_last_known")
                                : QStringLiteral("use_partial"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                nlohmann::json{{"error", error},
                               {"devices", result.snapshot.size()}});
    return result;
}

} // namespace bluemeter
