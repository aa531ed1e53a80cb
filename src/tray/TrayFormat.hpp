#pragma once

#include <cstdint>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"

namespace bluemeter {

constexpr int kTruncatedNameLength = 10;

// Cuts names longer than `maxChars` and appends "...", when enabled.
QString truncateName(const QString &name, bool truncate, int maxChars = kTruncatedNameLength);

// "🟢Mouse -  80%" or, with prefixBattery, "🟢 80% - Mouse".
QString formatDeviceLine(const DeviceRecord &record, const TrayOptions &options);

// Tooltip lines in address order. Disconnected devices only with
// showDisconnected.
QStringList formatTooltipLines(const Snapshot &snapshot, const TrayOptions &options);

// Freedesktop battery icon for the nearest 10%.
QString batteryIconName(std::uint8_t battery);

QString notificationTitle(EventKind kind, std::uint8_t lowBatteryThreshold);
QString notificationBody(EventKind kind, const std::vector<DeviceRecord> &devices);

} // namespace bluemeter
