#pragma once

#include <QString>

namespace bluemeter {

// XDG autostart entry for the tray ($XDG_CONFIG_HOME/autostart/bluemeter.desktop).
QString autostartEntryPath();

// True when the entry exists and launches the running binary.
bool isAutostartEnabled();

bool setAutostartEnabled(bool enabled);

} // namespace bluemeter
