#include "common/config.hpp"

#include <algorithm>
#include <string>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace bluemeter {

namespace {

std::chrono::seconds clampInterval(long long seconds)
{
    const long long clamped = std::clamp<long long>(
        seconds, kMinUpdateInterval.count(), kMaxUpdateInterval.count());
    return std::chrono::seconds(clamped);
}

std::uint8_t clampPercent(int value)
{
    return static_cast<std::uint8_t>(std::clamp(value, 0, 100));
}

AppConfig defaultsAt(const QString &path)
{
    AppConfig config;
    config.path = path;
    return config;
}

} // namespace

void to_json(nlohmann::json &j, const TrayOptions &options)
{
    j = nlohmann::json{
        {"updateInterval", options.updateInterval.count()},
        {"showDisconnected", options.showDisconnected},
        {"truncateName", options.truncateName},
        {"prefixBattery", options.prefixBattery},
        {"watchedDevice", options.watchedDevice ? formatAddress(*options.watchedDevice) : ""}
    };
}

void from_json(const nlohmann::json &j, TrayOptions &options)
{
    options.updateInterval = clampInterval(j.value("updateInterval", 60LL));
    options.showDisconnected = j.value("showDisconnected", false);
    options.truncateName = j.value("truncateName", false);
    options.prefixBattery = j.value("prefixBattery", false);
    options.watchedDevice = parseAddress(j.value("watchedDevice", ""));
}

void to_json(nlohmann::json &j, const NotifyOptions &options)
{
    j = nlohmann::json{
        {"mute", options.mute},
        {"lowBattery", options.lowBattery},
        {"disconnection", options.disconnection},
        {"reconnection", options.reconnection},
        {"added", options.added},
        {"removed", options.removed}
    };
}

void from_json(const nlohmann::json &j, NotifyOptions &options)
{
    options.mute = j.value("mute", false);
    options.lowBattery = clampPercent(j.value("lowBattery", 15));
    options.disconnection = j.value("disconnection", false);
    options.reconnection = j.value("reconnection", false);
    options.added = j.value("added", false);
    options.removed = j.value("removed", false);
}

EventConfig AppConfig::toEventConfig() const
{
    EventConfig cfg;
    cfg.lowBatteryThreshold = notify.lowBattery;
    cfg.notifyAdded = notify.added;
    cfg.notifyRemoved = notify.removed;
    cfg.notifyReconnect = notify.reconnection;
    cfg.notifyDisconnect = notify.disconnection;
    cfg.mute = notify.mute;
    cfg.pollInterval = tray.updateInterval;
    return cfg;
}

QString defaultConfigPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty()) {
        const QString home = qEnvironmentVariable("HOME");
        base = home.isEmpty() ? QStringLiteral(".config")
                              : home + QStringLiteral("/.config");
    }
    return base + QStringLiteral("/bluemeter/config.json");
}

AppConfig loadConfig(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        BMLOG_INFO(QStringLiteral("Config"),
                   QStringLiteral("loadConfig"),
                   QStringLiteral("config_created"),
                   QStringLiteral("first_run"),
                   QStringLiteral("write_defaults"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path.toStdString()}});
        AppConfig config = defaultsAt(path);
        saveConfig(config);
        return config;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        BMLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("loadConfig"),
                   QStringLiteral("config_unreadable"),
                   QStringLiteral("open_failed"),
                   QStringLiteral("use_defaults"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path.toStdString()},
                                  {"error", file.errorString().toStdString()}});
        return defaultsAt(path);
    }

    const QByteArray raw = file.readAll();
    file.close();

    AppConfig config = defaultsAt(path);
    std::string error;
    try {
        const auto root = nlohmann::json::parse(raw.toStdString());
        if (root.is_object()) {
            if (root.contains("tray") && root.at("tray").is_object()) {
                config.tray = root.at("tray").get<TrayOptions>();
            }
            if (root.contains("notify") && root.at("notify").is_object()) {
                config.notify = root.at("notify").get<NotifyOptions>();
            }
        } else {
            error = "config root is not an object";
        }
    } catch (const nlohmann::json::exception &ex) {
        error = ex.what();
    }

    if (!error.empty()) {
        BMLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("loadConfig"),
                   QStringLiteral("config_malformed"),
                   QStringLiteral("parse_failed"),
                   QStringLiteral("replace_with_defaults"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path.toStdString()},
                                  {"error", error}});
        config = defaultsAt(path);
        saveConfig(config);
    }

    return config;
}

bool saveConfig(const AppConfig &config)
{
    const nlohmann::json root = {
        {"tray", config.tray},
        {"notify", config.notify}
    };

    QDir().mkpath(QFileInfo(config.path).absolutePath());
    QSaveFile file(config.path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        BMLOG_ERROR(QStringLiteral("Config"),
                    QStringLiteral("saveConfig"),
                    QStringLiteral("config_save_failed"),
                    QStringLiteral("open_failed"),
                    QStringLiteral("qsavefile"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"path", config.path.toStdString()},
                                   {"error", file.errorString().toStdString()}});
        return false;
    }

    file.write(QByteArray::fromStdString(root.dump(4)));
    file.write("\n");
    if (!file.commit()) {
        BMLOG_ERROR(QStringLiteral("Config"),
                    QStringLiteral("saveConfig"),
                    QStringLiteral("config_save_failed"),
                    QStringLiteral("commit_failed"),
                    QStringLiteral("qsavefile"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"path", config.path.toStdString()},
                                   {"error", file.errorString().toStdString()}});
        return false;
    }
    return true;
}

} // namespace bluemeter
