#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace bluemeter {

constexpr std::chrono::seconds kMinUpdateInterval{5};
constexpr std::chrono::seconds kMaxUpdateInterval{3600};

struct TrayOptions {
    std::chrono::seconds updateInterval{60};
    bool showDisconnected = false;
    bool truncateName = false;
    bool prefixBattery = false;
    // Device shown in the tray icon and live-watched.
    std::optional<Address> watchedDevice;
};

struct NotifyOptions {
    bool mute = false;
    std::uint8_t lowBattery = 15;
    bool disconnection = false;
    bool reconnection = false;
    bool added = false;
    bool removed = false;
};

struct AppConfig {
    QString path;
    TrayOptions tray;
    NotifyOptions notify;

    EventConfig toEventConfig() const;
};

// $XDG_CONFIG_HOME/bluemeter/config.json, falling back to ~/.config.
QString defaultConfigPath();

// Never fails: missing keys take defaults, and an unreadable or malformed file
// is replaced by the defaults.
AppConfig loadConfig(const QString &path);

bool saveConfig(const AppConfig &config);

void to_json(nlohmann::json &j, const TrayOptions &options);
void from_json(const nlohmann::json &j, TrayOptions &options);
void to_json(nlohmann::json &j, const NotifyOptions &options);
void from_json(const nlohmann::json &j, NotifyOptions &options);

} // namespace bluemeter
