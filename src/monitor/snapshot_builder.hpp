#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/retry_policy.hpp"
#include "monitor/device_source.hpp"

namespace bluemeter {

struct SnapshotBuildResult {
    Snapshot snapshot;
    // Enumeration or the property store failed after retries.
    bool hadError = false;
    // `snapshot` is the caller's last known snapshot rather than a fresh one.
    bool degraded = false;
    std::string error;
    int skippedDevices = 0;
};

// Builds one full snapshot of paired devices. Device queries are independent:
// a device that fails its query is skipped and logged, the rest still count.
class SnapshotBuilder {
public:
    explicit SnapshotBuilder(DeviceEnumerator &enumerator,
                             RetryPolicy policy = RetryPolicy::enumerationDefault());

    SnapshotBuildResult build(const std::optional<Snapshot> &lastKnown);

    // Correlates classic observations with the property store by exact
    // address and dedupes by address. Classic devices without a matching
    // entry are omitted.
    static Snapshot assemble(const std::vector<RawObservation> &observations,
                             const std::map<Address, std::uint8_t> &classicBattery,
                             int *skipped = nullptr);

private:
    SnapshotBuildResult failed(const std::optional<Snapshot> &lastKnown,
                               const std::string &error,
                               const Snapshot &partial) const;

    DeviceEnumerator &m_enumerator;
    RetryPolicy m_policy;
};

} // namespace bluemeter
