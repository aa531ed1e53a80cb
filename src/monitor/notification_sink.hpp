#pragma once

#include <vector>

#include "common/models.hpp"

namespace bluemeter {

// Renders classified events. Fire-and-forget: failures are logged by the
// caller and never retried.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void notify(EventKind kind,
                        const std::vector<DeviceRecord> &devices,
                        const EventConfig &config) = 0;
};

} // namespace bluemeter
