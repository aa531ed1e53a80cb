#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <QObject>
#include <QString>

#include "common/models.hpp"
#include "common/retry_policy.hpp"
#include "monitor/device_source.hpp"
#include "monitor/monitor_message.hpp"
#include "monitor/notification_sink.hpp"
#include "monitor/reconciliation_engine.hpp"
#include "monitor/snapshot_builder.hpp"

namespace bluemeter {

struct MonitorOptions {
    std::size_t channelCapacity = 32;
    // How long the consumer waits for a message before re-checking shutdown.
    std::chrono::milliseconds consumerWakeInterval{250};
    // Bound on a single attempt to hand a snapshot to the consumer.
    std::chrono::milliseconds pushTimeout{500};
    RetryPolicy enumerationPolicy = RetryPolicy::enumerationDefault();
};

/**
 * DeviceMonitor coordinates:
 * - a poll thread that builds a full snapshot every poll interval, or
 *   immediately on forceUpdate()
 * - a consumer thread that drains the update channel, reconciles each message
 *   against the canonical snapshot and hands events to the notification sink
 *
 * The consumer thread is the only writer of the canonical snapshot. Readers
 * take copies and never block the consumer for long.
 *
 * Live-watch tasks feed the same channel; see WatcherSupervisor.
 */
class DeviceMonitor : public QObject
{
    Q_OBJECT
public:
    DeviceMonitor(DeviceEnumerator &enumerator,
                  NotificationSink &sink,
                  const EventConfig &config,
                  MonitorOptions options = {},
                  QObject *parent = nullptr);
    ~DeviceMonitor() override;

    UpdateChannel &channel() { return m_channel; }

    void start();
    // Idempotent. Closes the channel, so watch tasks end as well; a stopped
    // monitor is not restarted.
    void stop();
    bool isRunning() const { return m_running.load(); }

    // Wakes the poll thread; the next pass is reconciled with force set.
    void forceUpdate();

    // Takes effect on the next pass and triggers a forced pass.
    void setEventConfig(const EventConfig &config);
    EventConfig eventConfig() const;

    // Copies the canonical snapshot unless the consumer holds it. Returns
    // false on contention or before the first snapshot.
    bool tryCopySnapshot(Snapshot &out) const;
    std::optional<Snapshot> snapshot() const;

    std::optional<std::string> lastEnumerationError() const;

signals:
    void snapshotUpdated();
    void enumerationFailed(const QString &message);

private:
    void pollLoop();
    void consumeLoop();
    void handleMessage(const MonitorMessage &message);
    void handleFullSnapshot(const MonitorMessage &message, const EventConfig &config);
    void handleDeviceUpdate(const MonitorMessage &message, const EventConfig &config);
    void applyReport(const ChangeReport &report, const EventConfig &config);
    void deliver(const ChangeReport &report, const EventConfig &config);

    NotificationSink &m_sink;
    MonitorOptions m_options;
    SnapshotBuilder m_builder;
    UpdateChannel m_channel;

    // Consumer thread only.
    ReconciliationEngine m_engine;

    mutable std::mutex m_snapshotMutex;
    std::optional<Snapshot> m_canonical;

    mutable std::mutex m_configMutex;
    EventConfig m_config;

    std::mutex m_wakeMutex;
    std::condition_variable m_wake;
    bool m_forceRequested = false;
    bool m_stopRequested = false;

    mutable std::mutex m_errorMutex;
    std::optional<std::string> m_lastError;

    std::atomic<bool> m_running{false};
    std::thread m_pollThread;
    std::thread m_consumerThread;
};

} // namespace bluemeter
