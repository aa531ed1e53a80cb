#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <QString>

#include "common/models.hpp"
#include "monitor/device_source.hpp"
#include "monitor/monitor_message.hpp"

namespace bluemeter {

// Polling cadence for classic devices whose push notifications are
// unreliable: 5s while disconnected, 7s at or below 30%, 10s otherwise.
std::chrono::milliseconds classicPollInterval(const DeviceRecord &record);

struct WatcherOptions {
    // How often a task re-checks its cancel flag while idle.
    std::chrono::milliseconds cancelCheckInterval{200};
    // Bound on waiting for a task to exit during a switch.
    std::chrono::milliseconds joinTimeout{2000};
    // Bound on a single attempt to forward an update into the channel.
    std::chrono::milliseconds pushTimeout{500};
    std::size_t mailboxCapacity = 16;
    std::function<std::chrono::milliseconds(const DeviceRecord &)> pollInterval = classicPollInterval;
};

// One live watch task on its own thread. The OS subscription is created and
// destroyed inside the task, so it is released on every exit path.
class WatcherHandle {
public:
    WatcherHandle(WatchTarget target,
                  DeviceEventSource &source,
                  UpdateChannel &channel,
                  const WatcherOptions &options);
    ~WatcherHandle();

    WatcherHandle(const WatcherHandle &) = delete;
    WatcherHandle &operator=(const WatcherHandle &) = delete;

    const WatchTarget &target() const { return m_target; }

    void requestStop();
    bool isSubscribed() const;
    bool isFinished() const;
    bool channelClosed() const;
    std::string failure() const;

    // Waits up to `timeout` for the task to exit and joins it. Returns false
    // if the task is still running, in which case it stays joinable.
    bool join(std::chrono::milliseconds timeout);

private:
    struct TaskState {
        std::atomic<bool> cancel{false};
        std::atomic<bool> subscribed{false};
        mutable std::mutex mutex;
        std::condition_variable done;
        bool finished = false;
        bool channelClosed = false;
        std::string failure;
    };

    static void run(std::shared_ptr<TaskState> state,
                    WatchTarget target,
                    DeviceEventSource &source,
                    UpdateChannel &channel,
                    WatcherOptions options);

    WatchTarget m_target;
    std::shared_ptr<TaskState> m_state;
    std::thread m_thread;
};

/**
 * Keeps at most one live watch running.
 *
 * select() stops the current task (bounded wait) before starting the next,
 * so two targets are never watched at the same time. A task that does not
 * exit within the join timeout is reported and parked; it is cancelled and
 * can no longer forward updates, and it is joined when the supervisor is
 * destroyed. A task parked inside a slow subscribe() may briefly hold its OS
 * subscription next to the new target's; it drops it as soon as subscribe()
 * returns and never forwards from it.
 */
class WatcherSupervisor {
public:
    WatcherSupervisor(DeviceEventSource &source,
                      UpdateChannel &channel,
                      WatcherOptions options = {});
    ~WatcherSupervisor();

    WatcherSupervisor(const WatcherSupervisor &) = delete;
    WatcherSupervisor &operator=(const WatcherSupervisor &) = delete;

    // Returns false when the previous task failed to stop or had failed.
    // Blocks for up to the join timeout while the previous task exits.
    bool select(const std::optional<WatchTarget> &target);

    // Same as select() on the supervisor's control thread; returns at once.
    // Only the latest pending request is kept.
    void selectAsync(const std::optional<WatchTarget> &target);

    // Idempotent. Drops a pending selectAsync() request.
    void stop();

    WatchState state() const;
    std::optional<WatchTarget> currentTarget() const;
    std::string lastError() const;

private:
    bool selectLocked(const std::optional<WatchTarget> &target);
    void controlLoop();
    bool stopLocked();
    void reapParkedLocked();
    void reportFailureLocked(const QString &what, const std::string &error);

    DeviceEventSource &m_source;
    UpdateChannel &m_channel;
    WatcherOptions m_options;

    mutable std::mutex m_mutex;
    std::unique_ptr<WatcherHandle> m_current;
    std::vector<std::unique_ptr<WatcherHandle>> m_parked;
    std::atomic<bool> m_stopping{false};
    std::string m_lastError;

    // selectAsync() hand-off. A request carries the generation it was made
    // in; stop() bumps the generation so older requests are dropped.
    std::mutex m_requestMutex;
    std::condition_variable m_requestReady;
    std::optional<std::optional<WatchTarget>> m_pending;
    std::uint64_t m_pendingGeneration = 0;
    std::atomic<std::uint64_t> m_generation{0};
    bool m_controlStop = false;
    std::thread m_controlThread;
};

} // namespace bluemeter
