#pragma once

#include <memory>

#include <QDBusConnection>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThread>
#include <QVariantMap>

#include "monitor/device_source.hpp"

namespace bluemeter {

// Receives PropertiesChanged for the watched objects. Lives on the thread
// that runs the Qt event loop; the callback only enqueues.
class BluezPropertyReceiver : public QObject
{
    Q_OBJECT
public:
    explicit BluezPropertyReceiver(DeviceEventSource::UpdateCallback callback);

public slots:
    void onPropertiesChanged(const QString &interface,
                             const QVariantMap &changed,
                             const QStringList &invalidated);

private:
    DeviceEventSource::UpdateCallback m_callback;
};

/**
 * Live updates for one device from BlueZ and UPower.
 *
 * Device1 supplies connection changes. LowEnergy devices add Battery1 and
 * Battery Level characteristic notifications; classic devices add their
 * UPower entry and are also polled, because UPower refreshes them lazily.
 */
class BluezEventSource : public DeviceEventSource {
public:
    BluezEventSource();
    explicit BluezEventSource(QDBusConnection systemBus);

    std::unique_ptr<DeviceSubscription> subscribe(const WatchTarget &target,
                                                  UpdateCallback callback) override;
    bool needsPolling(const WatchTarget &target) const override;
    WatchUpdate poll(const WatchTarget &target) override;

private:
    QString devicePath(const WatchTarget &target) const;

    QDBusConnection m_bus;
    // Thread whose event loop delivers D-Bus signals to receivers.
    QThread *m_eventThread;
};

} // namespace bluemeter
