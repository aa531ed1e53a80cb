#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace bluemeter {

// "AA:BB:CC:DD:EE:FF", upper case.
inline std::string formatAddress(Address address)
{
    char buffer[18] = {};
    std::snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X",
                  static_cast<unsigned>((address >> 40) & 0xFF),
                  static_cast<unsigned>((address >> 32) & 0xFF),
                  static_cast<unsigned>((address >> 24) & 0xFF),
                  static_cast<unsigned>((address >> 16) & 0xFF),
                  static_cast<unsigned>((address >> 8) & 0xFF),
                  static_cast<unsigned>(address & 0xFF));
    return buffer;
}

// Accepts six hex octets separated by ':', '-' or '_' (BlueZ object paths use
// '_'), or twelve bare hex digits. Case-insensitive.
inline std::optional<Address> parseAddress(const std::string &value)
{
    Address result = 0;
    int digits = 0;
    int sinceSeparator = 0;
    for (const char c : value) {
        if (c == ':' || c == '-' || c == '_') {
            if (sinceSeparator != 2) {
                return std::nullopt;
            }
            sinceSeparator = 0;
            continue;
        }
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isxdigit(uc)) {
            return std::nullopt;
        }
        int nibble = 0;
        if (c >= '0' && c <= '9') {
            nibble = c - '0';
        } else {
            nibble = std::tolower(uc) - 'a' + 10;
        }
        result = (result << 4) | static_cast<Address>(nibble);
        ++digits;
        ++sinceSeparator;
        if (digits > 12) {
            return std::nullopt;
        }
    }
    if (digits != 12) {
        return std::nullopt;
    }
    return result;
}

inline std::string toEventKindString(EventKind kind)
{
    switch (kind) {
    case EventKind::Added:
        return "added";
    case EventKind::Removed:
        return "removed";
    case EventKind::Reconnected:
        return "reconnected";
    case EventKind::Disconnected:
        return "disconnected";
    case EventKind::LowBattery:
        return "low_battery";
    }
    return "added";
}

inline std::string toTransportString(TransportType type)
{
    switch (type) {
    case TransportType::Classic:
        return "classic";
    case TransportType::LowEnergy:
        return "low_energy";
    }
    return "low_energy";
}

inline TransportType parseTransportString(const std::string &value)
{
    if (value == "classic") {
        return TransportType::Classic;
    }
    return TransportType::LowEnergy;
}

inline std::string toWatchStateString(WatchState state)
{
    switch (state) {
    case WatchState::Idle:
        return "idle";
    case WatchState::Starting:
        return "starting";
    case WatchState::Running:
        return "running";
    case WatchState::Stopping:
        return "stopping";
    }
    return "idle";
}

inline void to_json(nlohmann::json &j, const EventKind &kind)
{
    j = toEventKindString(kind);
}

inline void to_json(nlohmann::json &j, const TransportKind &kind)
{
    j = nlohmann::json{{"type", toTransportString(kind.type)}};
    if (!kind.instanceId.empty()) {
        j["instanceId"] = kind.instanceId;
    }
}

inline void from_json(const nlohmann::json &j, TransportKind &kind)
{
    kind.type = parseTransportString(j.value("type", "low_energy"));
    kind.instanceId = j.value("instanceId", "");
}

inline void to_json(nlohmann::json &j, const DeviceRecord &record)
{
    j = nlohmann::json{
        {"address", formatAddress(record.address)},
        {"name", record.name},
        {"battery", record.battery},
        {"connected", record.connected},
        {"kind", record.kind}
    };
}

inline void from_json(const nlohmann::json &j, DeviceRecord &record)
{
    record.address = parseAddress(j.value("address", "")).value_or(0);
    record.name = j.value("name", "");
    const int battery = j.value("battery", 0);
    record.battery = static_cast<std::uint8_t>(battery < 0 ? 0 : (battery > 100 ? 100 : battery));
    record.connected = j.value("connected", false);
    if (j.contains("kind") && j.at("kind").is_object()) {
        record.kind = j.at("kind").get<TransportKind>();
    } else {
        record.kind = TransportKind::lowEnergy();
    }
}

inline void to_json(nlohmann::json &j, const DeviceEvent &event)
{
    j = nlohmann::json{{"kind", event.kind}, {"device", event.device}};
    if (event.previous) {
        j["previous"] = *event.previous;
    }
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = snapshot.records();
}

// Compact summary for log context; does not round-trip.
inline nlohmann::json changeReportSummary(const ChangeReport &report)
{
    nlohmann::json added = nlohmann::json::array();
    for (const auto &record : report.added) {
        added.push_back(formatAddress(record.address));
    }
    nlohmann::json removed = nlohmann::json::array();
    for (const auto &record : report.removed) {
        removed.push_back(formatAddress(record.address));
    }
    nlohmann::json updated = nlohmann::json::array();
    for (const auto &change : report.updated) {
        updated.push_back(formatAddress(change.after.address));
    }
    return nlohmann::json{
        {"updateNeeded", report.updateNeeded},
        {"events", report.events},
        {"added", added},
        {"removed", removed},
        {"updated", updated},
        {"devices", report.snapshot.size()}
    };
}

} // namespace bluemeter
