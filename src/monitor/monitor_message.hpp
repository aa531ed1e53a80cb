#pragma once

#include <string>
#include <utility>

#include "common/bounded_channel.hpp"
#include "common/models.hpp"
#include "monitor/device_source.hpp"

namespace bluemeter {

// Unit of work on the update channel. Both producers (poll loop and live
// watch) send these; the monitor's consumer thread is the only reader.
struct MonitorMessage {
    enum class Kind {
        FullSnapshot,
        DeviceUpdate
    };

    Kind kind = Kind::FullSnapshot;
    Snapshot snapshot;
    // DeviceUpdate only: the fields the watch observed. Unset fields keep
    // their canonical value.
    Address address = 0;
    WatchUpdate update;
    bool force = false;
    // Set when the snapshot is a degraded last-known copy.
    std::string error;

    static MonitorMessage fullSnapshot(Snapshot snapshot, bool force, std::string error = {})
    {
        MonitorMessage message;
        message.kind = Kind::FullSnapshot;
        message.snapshot = std::move(snapshot);
        message.force = force;
        message.error = std::move(error);
        return message;
    }

    static MonitorMessage deviceUpdate(Address address, WatchUpdate update)
    {
        MonitorMessage message;
        message.kind = Kind::DeviceUpdate;
        message.address = address;
        message.update = std::move(update);
        return message;
    }
};

using UpdateChannel = BoundedChannel<MonitorMessage>;

} // namespace bluemeter
