#pragma once

#include <stdexcept>
#include <string>

namespace bluemeter {

// Device-list or property-store enumeration failed. Transient; retried.
class EnumerationError : public std::runtime_error {
public:
    explicit EnumerationError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// A single device could not be queried. The device is skipped.
class QueryError : public std::runtime_error {
public:
    explicit QueryError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// A live-watch subscription could not be established.
class SubscriptionError : public std::runtime_error {
public:
    explicit SubscriptionError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// The update channel was closed underneath a producer.
class ChannelClosedError : public std::runtime_error {
public:
    ChannelClosedError()
        : std::runtime_error("update channel closed")
    {
    }
};

} // namespace bluemeter
