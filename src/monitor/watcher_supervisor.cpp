#include "monitor/watcher_supervisor.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace bluemeter {

namespace {

constexpr std::uint8_t kLowBatteryPollLevel = 30;
constexpr std::uint8_t kMaxBattery = 100;

nlohmann::json targetContext(const WatchTarget &target)
{
    return nlohmann::json{{"address", formatAddress(target.address)},
                          {"name", target.lastKnown.name},
                          {"transport", toTransportString(target.kind.type)}};
}

} // namespace

std::chrono::milliseconds classicPollInterval(const DeviceRecord &record)
{
    if (!record.connected) {
        return std::chrono::seconds(5);
    }
    if (record.battery <= kLowBatteryPollLevel) {
        return std::chrono::seconds(7);
    }
    return std::chrono::seconds(10);
}

WatcherHandle::WatcherHandle(WatchTarget target,
                             DeviceEventSource &source,
                             UpdateChannel &channel,
                             const WatcherOptions &options)
    : m_target(std::move(target))
    , m_state(std::make_shared<TaskState>())
{
    m_thread = std::thread(&WatcherHandle::run, m_state, m_target,
                           std::ref(source), std::ref(channel), options);
}

WatcherHandle::~WatcherHandle()
{
    requestStop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void WatcherHandle::requestStop()
{
    m_state->cancel.store(true);
}

bool WatcherHandle::isSubscribed() const
{
    return m_state->subscribed.load();
}

bool WatcherHandle::isFinished() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->finished;
}

bool WatcherHandle::channelClosed() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->channelClosed;
}

std::string WatcherHandle::failure() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->failure;
}

bool WatcherHandle::join(std::chrono::milliseconds timeout)
{
    {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        if (!m_state->done.wait_for(lock, timeout, [this]() { return m_state->finished; })) {
            return false;
        }
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    return true;
}

void WatcherHandle::run(std::shared_ptr<TaskState> state,
                        WatchTarget target,
                        DeviceEventSource &source,
                        UpdateChannel &channel,
                        WatcherOptions options)
{
    logging::CorrelationScope corrScope(logging::newCorrelationId(QStringLiteral("watch")));
    const QString corrId = logging::currentCorrelationId();

    bool closed = false;
    std::string failure;

    try {
        auto mailbox = std::make_shared<BoundedChannel<WatchUpdate>>(options.mailboxCapacity);
        std::unique_ptr<DeviceSubscription> subscription =
            source.subscribe(target, [mailbox](const WatchUpdate &update) {
                mailbox->tryPush(update);
            });

        const bool polling = source.needsPolling(target);
        // A task cancelled during subscribe() releases it without running.
        if (!state->cancel.load()) {
            state->subscribed.store(true);
            BMLOG_INFO(QStringLiteral("WatcherSupervisor"),
                       QStringLiteral("WatcherHandle::run"),
                       QStringLiteral("watch_started"),
                       QStringLiteral("target_selected"),
                       polling ? QStringLiteral("subscribe_and_poll")
                               : QStringLiteral("subscribe"),
                       logging::defaultWho(),
                       corrId,
                       targetContext(target));
        }

        // Only paces classic polling; the canonical record lives in the monitor.
        DeviceRecord cadence = target.lastKnown;
        auto nextPoll = std::chrono::steady_clock::now() + options.pollInterval(cadence);

        while (!state->cancel.load()) {
            if (channel.isClosed()) {
                throw ChannelClosedError();
            }

            std::optional<WatchUpdate> update = mailbox->popFor(options.cancelCheckInterval);
            if (!update && polling && std::chrono::steady_clock::now() >= nextPoll) {
                try {
                    update = source.poll(target);
                } catch (const QueryError &ex) {
                    BMLOG_WARN(QStringLiteral("WatcherSupervisor"),
                               QStringLiteral("WatcherHandle::run"),
                               QStringLiteral("watch_poll_failed"),
                               QStringLiteral("query_error"),
                               QStringLiteral("retry_next_interval"),
                               logging::defaultWho(),
                               corrId,
                               nlohmann::json{{"address", formatAddress(target.address)},
                                              {"error", ex.what()}});
                }
                nextPoll = std::chrono::steady_clock::now() + options.pollInterval(cadence);
            }

            if (!update || update->empty() || state->cancel.load()) {
                continue;
            }

            if (update->connected) {
                cadence.connected = *update->connected;
            }
            if (update->battery) {
                update->battery = std::min(*update->battery, kMaxBattery);
                cadence.battery = *update->battery;
            }

            // Forwarded even when unchanged here; a full poll may have moved
            // the canonical record since.
            while (!state->cancel.load()) {
                if (channel.pushFor(MonitorMessage::deviceUpdate(target.address, *update),
                                    options.pushTimeout)) {
                    break;
                }
                if (channel.isClosed()) {
                    throw ChannelClosedError();
                }
            }
        }
    } catch (const ChannelClosedError &) {
        closed = true;
    } catch (const std::exception &ex) {
        failure = ex.what();
    }

    state->subscribed.store(false);

    if (!failure.empty()) {
        BMLOG_ERROR(QStringLiteral("WatcherSupervisor"),
                    QStringLiteral("WatcherHandle::run"),
                    QStringLiteral("watch_failed"),
                    QStringLiteral("task_error"),
                    QStringLiteral("slot_idle"),
                    logging::defaultWho(),
                    corrId,
                    nlohmann::json{{"address", formatAddress(target.address)},
                                   {"error", failure}});
    } else {
        BMLOG_INFO(QStringLiteral("WatcherSupervisor"),
                   QStringLiteral("WatcherHandle::run"),
                   QStringLiteral("watch_stopped"),
                   closed ? QStringLiteral("channel_closed") : QStringLiteral("cancelled"),
                   QStringLiteral("subscription_released"),
                   logging::defaultWho(),
                   corrId,
                   targetContext(target));
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->finished = true;
        state->channelClosed = closed;
        state->failure = failure;
    }
    state->done.notify_all();
}

WatcherSupervisor::WatcherSupervisor(DeviceEventSource &source,
                                     UpdateChannel &channel,
                                     WatcherOptions options)
    : m_source(source)
    , m_channel(channel)
    , m_options(std::move(options))
{
    m_controlThread = std::thread(&WatcherSupervisor::controlLoop, this);
}

WatcherSupervisor::~WatcherSupervisor()
{
    {
        std::lock_guard<std::mutex> lock(m_requestMutex);
        m_controlStop = true;
    }
    m_requestReady.notify_all();
    if (m_controlThread.joinable()) {
        m_controlThread.join();
    }

    stop();
    std::lock_guard<std::mutex> lock(m_mutex);
    // Parked tasks were cancelled already; their destructors join.
    m_parked.clear();
}

bool WatcherSupervisor::select(const std::optional<WatchTarget> &target)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return selectLocked(target);
}

void WatcherSupervisor::selectAsync(const std::optional<WatchTarget> &target)
{
    {
        std::lock_guard<std::mutex> lock(m_requestMutex);
        m_pending = target;
        m_pendingGeneration = m_generation.load();
    }
    m_requestReady.notify_one();
}

void WatcherSupervisor::controlLoop()
{
    while (true) {
        std::optional<WatchTarget> target;
        std::uint64_t generation = 0;
        {
            std::unique_lock<std::mutex> lock(m_requestMutex);
            m_requestReady.wait(lock, [this]() { return m_controlStop || m_pending.has_value(); });
            if (m_controlStop) {
                return;
            }
            target = std::move(*m_pending);
            m_pending.reset();
            generation = m_pendingGeneration;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation.load()) {
            continue;
        }
        selectLocked(target);
    }
}

bool WatcherSupervisor::selectLocked(const std::optional<WatchTarget> &target)
{
    if (target && m_current && !m_current->isFinished()
        && m_current->target().sameDevice(*target)) {
        return true;
    }

    bool ok = stopLocked();
    if (!target) {
        return ok;
    }

    if (m_channel.isClosed()) {
        reportFailureLocked(QStringLiteral("watch_not_started"), "update channel closed");
        return false;
    }

    m_current = std::make_unique<WatcherHandle>(*target, m_source, m_channel, m_options);
    BMLOG_DEBUG(QStringLiteral("WatcherSupervisor"),
                QStringLiteral("select"),
                QStringLiteral("watch_spawned"),
                QStringLiteral("target_selected"),
                QStringLiteral("start_task"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                targetContext(*target));
    return ok;
}

void WatcherSupervisor::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_requestMutex);
        m_pending.reset();
        ++m_generation;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    stopLocked();
}

WatchState WatcherSupervisor::state() const
{
    if (m_stopping.load()) {
        return WatchState::Stopping;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_current || m_current->isFinished()) {
        return WatchState::Idle;
    }
    return m_current->isSubscribed() ? WatchState::Running : WatchState::Starting;
}

std::optional<WatchTarget> WatcherSupervisor::currentTarget() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_current || m_current->isFinished()) {
        return std::nullopt;
    }
    return m_current->target();
}

std::string WatcherSupervisor::lastError() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

bool WatcherSupervisor::stopLocked()
{
    reapParkedLocked();
    if (!m_current) {
        return true;
    }

    m_stopping.store(true);
    m_current->requestStop();

    bool ok = true;
    if (!m_current->join(m_options.joinTimeout)) {
        reportFailureLocked(QStringLiteral("watch_join_timeout"),
                            "watch task did not exit in time");
        m_parked.push_back(std::move(m_current));
        ok = false;
    } else {
        const std::string failure = m_current->failure();
        if (!failure.empty()) {
            reportFailureLocked(QStringLiteral("watch_task_failed"), failure);
            ok = false;
        }
        m_current.reset();
    }

    m_stopping.store(false);
    return ok;
}

void WatcherSupervisor::reapParkedLocked()
{
    auto finished = std::remove_if(m_parked.begin(), m_parked.end(),
                                   [](const std::unique_ptr<WatcherHandle> &handle) {
                                       return handle->isFinished();
                                   });
    // Destroying a finished handle joins an exited thread.
    m_parked.erase(finished, m_parked.end());
}

void WatcherSupervisor::reportFailureLocked(const QString &what, const std::string &error)
{
    m_lastError = error;
    BMLOG_WARN(QStringLiteral("WatcherSupervisor"),
               QStringLiteral("stop"),
               what,
               QStringLiteral("switch_target"),
               QStringLiteral("slot_idle"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               nlohmann::json{{"error", error},
                              {"parked", m_parked.size()}});
}

} // namespace bluemeter
