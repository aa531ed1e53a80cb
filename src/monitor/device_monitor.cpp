#include "monitor/device_monitor.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <utility>
#include <vector>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace bluemeter {

DeviceMonitor::DeviceMonitor(DeviceEnumerator &enumerator,
                             NotificationSink &sink,
                             const EventConfig &config,
                             MonitorOptions options,
                             QObject *parent)
    : QObject(parent)
    , m_sink(sink)
    , m_options(std::move(options))
    , m_builder(enumerator, m_options.enumerationPolicy)
    , m_channel(m_options.channelCapacity)
    , m_config(config)
{
}

DeviceMonitor::~DeviceMonitor()
{
    stop();
}

void DeviceMonitor::start()
{
    if (m_running.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = false;
    }

    BMLOG_INFO(QStringLiteral("DeviceMonitor"),
               QStringLiteral("start"),
               QStringLiteral("monitor_start"),
               QStringLiteral("startup"),
               QStringLiteral("spawn_poll_and_consumer"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"pollIntervalSec", eventConfig().pollInterval.count()},
                              {"channelCapacity", m_channel.capacity()}});

    m_consumerThread = std::thread(&DeviceMonitor::consumeLoop, this);
    m_pollThread = std::thread(&DeviceMonitor::pollLoop, this);
}

void DeviceMonitor::stop()
{
    if (!m_running.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = true;
    }
    m_wake.notify_all();
    m_channel.close();

    if (m_pollThread.joinable()) {
        m_pollThread.join();
    }
    if (m_consumerThread.joinable()) {
        m_consumerThread.join();
    }

    BMLOG_INFO(QStringLiteral("DeviceMonitor"),
               QStringLiteral("stop"),
               QStringLiteral("monitor_stop"),
               QStringLiteral("shutdown"),
               QStringLiteral("threads_joined"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());
}

void DeviceMonitor::forceUpdate()
{
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_forceRequested = true;
    }
    m_wake.notify_all();
}

void DeviceMonitor::setEventConfig(const EventConfig &config)
{
    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        m_config = config;
    }
    forceUpdate();
}

EventConfig DeviceMonitor::eventConfig() const
{
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_config;
}

bool DeviceMonitor::tryCopySnapshot(Snapshot &out) const
{
    std::unique_lock<std::mutex> lock(m_snapshotMutex, std::try_to_lock);
    if (!lock.owns_lock() || !m_canonical) {
        return false;
    }
    out = *m_canonical;
    return true;
}

std::optional<Snapshot> DeviceMonitor::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_canonical;
}

std::optional<std::string> DeviceMonitor::lastEnumerationError() const
{
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastError;
}

void DeviceMonitor::pollLoop()
{
    std::optional<Snapshot> lastBuilt;
    bool force = true;

    while (true) {
        logging::CorrelationScope corrScope(logging::newCorrelationId(QStringLiteral("poll")));

        SnapshotBuildResult result = m_builder.build(lastBuilt);
        if (!result.hadError) {
            lastBuilt = result.snapshot;
        }

        MonitorMessage message =
            MonitorMessage::fullSnapshot(std::move(result.snapshot), force, result.error);
        bool delivered = false;
        while (!delivered) {
            delivered = m_channel.pushFor(message, m_options.pushTimeout);
            if (!delivered && m_channel.isClosed()) {
                return;
            }
        }

        std::unique_lock<std::mutex> lock(m_wakeMutex);
        const auto interval = eventConfig().pollInterval;
        m_wake.wait_for(lock, interval, [this]() {
            return m_stopRequested || m_forceRequested;
        });
        if (m_stopRequested) {
            return;
        }
        force = m_forceRequested;
        m_forceRequested = false;
    }
}

void DeviceMonitor::consumeLoop()
{
    while (true) {
        std::optional<MonitorMessage> message = m_channel.popFor(m_options.consumerWakeInterval);
        if (!message) {
            if (m_channel.isClosed()) {
                return;
            }
            continue;
        }
        handleMessage(*message);
    }
}

void DeviceMonitor::handleMessage(const MonitorMessage &message)
{
    const EventConfig config = eventConfig();
    if (message.kind == MonitorMessage::Kind::FullSnapshot) {
        handleFullSnapshot(message, config);
    } else {
        handleDeviceUpdate(message, config);
    }
}

void DeviceMonitor::handleFullSnapshot(const MonitorMessage &message, const EventConfig &config)
{
    if (!message.error.empty()) {
        {
            std::lock_guard<std::mutex> lock(m_errorMutex);
            m_lastError = message.error;
        }

        bool seeded = false;
        {
            std::lock_guard<std::mutex> lock(m_snapshotMutex);
            if (!m_canonical) {
                // Nothing known yet: keep whatever was still readable.
                m_canonical = message.snapshot;
                seeded = true;
            }
        }

        emit enumerationFailed(QString::fromStdString(message.error));
        if (seeded) {
            emit snapshotUpdated();
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError.reset();
    }

    std::optional<Snapshot> previous;
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        previous = m_canonical;
        if (!previous) {
            // First observation is canonical without events.
            m_canonical = message.snapshot;
        }
    }
    if (!previous) {
        BMLOG_INFO(QStringLiteral("DeviceMonitor"),
                   QStringLiteral("handleFullSnapshot"),
                   QStringLiteral("initial_snapshot"),
                   QStringLiteral("first_poll"),
                   QStringLiteral("adopt_without_events"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   nlohmann::json{{"devices", message.snapshot.size()}});
        emit snapshotUpdated();
        return;
    }

    applyReport(m_engine.reconcile(*previous, message.snapshot, config, message.force), config);
}

void DeviceMonitor::handleDeviceUpdate(const MonitorMessage &message, const EventConfig &config)
{
    std::optional<Snapshot> previous;
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        previous = m_canonical;
    }

    const DeviceRecord *existing = previous ? previous->find(message.address) : nullptr;
    if (!existing) {
        BMLOG_DEBUG(QStringLiteral("DeviceMonitor"),
                    QStringLiteral("handleDeviceUpdate"),
                    QStringLiteral("device_update_ignored"),
                    QStringLiteral("address_not_in_snapshot"),
                    QStringLiteral("drop"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"address", formatAddress(message.address)}});
        return;
    }

    DeviceRecord merged = *existing;
    if (message.update.connected) {
        merged.connected = *message.update.connected;
    }
    if (message.update.battery) {
        merged.battery = std::min<std::uint8_t>(*message.update.battery, 100);
    }

    applyReport(m_engine.reconcile(*previous, previous->withRecord(merged), config, false), config);
}

void DeviceMonitor::applyReport(const ChangeReport &report, const EventConfig &config)
{
    if (!report.updateNeeded) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        m_canonical = report.snapshot;
    }

    BMLOG_DEBUG(QStringLiteral("DeviceMonitor"),
                QStringLiteral("applyReport"),
                QStringLiteral("snapshot_reconciled"),
                QStringLiteral("change_detected"),
                QStringLiteral("replace_canonical"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                changeReportSummary(report));

    deliver(report, config);
    emit snapshotUpdated();
}

void DeviceMonitor::deliver(const ChangeReport &report, const EventConfig &config)
{
    std::map<EventKind, std::vector<DeviceRecord>> grouped;
    for (const DeviceEvent &event : report.events) {
        grouped[event.kind].push_back(event.device);
    }

    for (const auto &entry : grouped) {
        try {
            m_sink.notify(entry.first, entry.second, config);
        } catch (const std::exception &ex) {
            BMLOG_WARN(QStringLiteral("DeviceMonitor"),
                       QStringLiteral("deliver"),
                       QStringLiteral("notification_failed"),
                       QStringLiteral("sink_error"),
                       QStringLiteral("drop_notification"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       nlohmann::json{{"kind", toEventKindString(entry.first)},
                                      {"devices", entry.second.size()},
                                      {"error", ex.what()}});
        }
    }
}

} // namespace bluemeter
