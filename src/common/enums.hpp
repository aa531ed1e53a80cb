#pragma once

namespace bluemeter {

enum class TransportType {
    Classic,
    LowEnergy
};

enum class EventKind {
    Added,
    Removed,
    Reconnected,
    Disconnected,
    LowBattery
};

enum class WatchState {
    Idle,
    Starting,
    Running,
    Stopping
};

} // namespace bluemeter
