#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace bluemeter {

// One paired device as handed out by the enumerator.
class DeviceHandle {
public:
    virtual ~DeviceHandle() = default;

    // Human-readable identity for logs (object path, address).
    virtual std::string describe() const = 0;

    // Throws QueryError. Independent per device.
    virtual RawObservation query() = 0;
};

class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;

    // Throws EnumerationError.
    virtual std::vector<std::unique_ptr<DeviceHandle>> enumeratePairedDevices() = 0;

    // Classic-transport battery side channel, keyed by exact address.
    // Throws EnumerationError.
    virtual std::map<Address, std::uint8_t> queryClassicBatteryTable() = 0;
};

// Single-device delta observed by a live watch.
struct WatchUpdate {
    std::optional<bool> connected;
    std::optional<std::uint8_t> battery;

    bool empty() const { return !connected && !battery; }
};

// Keeps OS event registrations alive. Destruction deregisters them.
class DeviceSubscription {
public:
    virtual ~DeviceSubscription() = default;
};

class DeviceEventSource {
public:
    // May be invoked on a platform-owned thread. Must only enqueue.
    using UpdateCallback = std::function<void(const WatchUpdate &)>;

    virtual ~DeviceEventSource() = default;

    // Throws SubscriptionError.
    virtual std::unique_ptr<DeviceSubscription> subscribe(const WatchTarget &target,
                                                          UpdateCallback callback) = 0;

    // Transports whose push notifications are unreliable are polled as well.
    virtual bool needsPolling(const WatchTarget &target) const
    {
        (void)target;
        return false;
    }

    // Throws QueryError.
    virtual WatchUpdate poll(const WatchTarget &target)
    {
        (void)target;
        return {};
    }
};

} // namespace bluemeter
