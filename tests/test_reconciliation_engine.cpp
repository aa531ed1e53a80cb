#include <QtTest/QtTest>

#include <set>
#include <vector>

#include "fakes/fake_devices.hpp"
#include "monitor/reconciliation_engine.hpp"

using bluemeter::ChangeReport;
using bluemeter::DeviceRecord;
using bluemeter::EventConfig;
using bluemeter::EventKind;
using bluemeter::Snapshot;
using bluemeter::fakes::makeRecord;

namespace {

constexpr bluemeter::Address kMouse = 0xA1A1A1A1A1A1ULL;
constexpr bluemeter::Address kHeadset = 0xB2B2B2B2B2B2ULL;
constexpr bluemeter::Address kKeyboard = 0xC3C3C3C3C3C3ULL;
constexpr bluemeter::Address kPad = 0xD4D4D4D4D4D4ULL;
constexpr bluemeter::Address kSpeaker = 0xE5E5E5E5E5E5ULL;

Snapshot snapshotOf(const std::vector<DeviceRecord> &records)
{
    return Snapshot::fromRecords(records);
}

int countKind(const ChangeReport &report, EventKind kind)
{
    int count = 0;
    for (const auto &event : report.events) {
        if (event.kind == kind) {
            ++count;
        }
    }
    return count;
}

EventConfig allNotifications()
{
    EventConfig cfg;
    cfg.lowBatteryThreshold = 15;
    cfg.notifyAdded = true;
    cfg.notifyRemoved = true;
    cfg.notifyReconnect = true;
    cfg.notifyDisconnect = true;
    return cfg;
}

} // namespace

class ReconciliationEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void testBatteryDropBelowThresholdAlerts();
    void testHysteresisFiresOncePerCrossing();
    void testMonotoneDropFiresOnce();
    void testRecoveryAtThresholdRearms();
    void testThresholdZeroNeverAlerts();
    void testIdenticalSnapshotsNeedNoUpdate();
    void testForceWithoutChangesHasNoEvents();
    void testBatteryChangeIsUpdateNotAddRemove();
    void testAddedAndRemovedGating();
    void testConnectionTransitions();
    void testConnectionAndBatteryChangeTogether();
    void testNameOnlyChangeIsSilentUpdate();
    void testEngineKeepsAlertStateAcrossPasses();
    void testClassificationCoversEveryChangedAddress();
    void testEmptyToTwoDevicesIsTwoAdds();
    void testVanishedConnectedDeviceIsRemovedNotDisconnected();
};

void ReconciliationEngineTests::testBatteryDropBelowThresholdAlerts()
{
    bluemeter::NotifiedLowBatterySet notified;
    EventConfig cfg;
    cfg.lowBatteryThreshold = 15;

    const auto report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 50)}),
                                             snapshotOf({makeRecord(kMouse, "Mouse", 10)}),
                                             notified, cfg);

    QVERIFY(report.updateNeeded);
    QCOMPARE(report.events.size(), static_cast<size_t>(1));
    QCOMPARE(report.events.front().kind, EventKind::LowBattery);
    QCOMPARE(static_cast<int>(report.events.front().device.battery), 10);
    QVERIFY(report.events.front().previous.has_value());
    QCOMPARE(static_cast<int>(report.events.front().previous->battery), 50);
    QVERIFY(notified.at(kMouse));
}

void ReconciliationEngineTests::testHysteresisFiresOncePerCrossing()
{
    bluemeter::NotifiedLowBatterySet notified;
    EventConfig cfg;
    cfg.lowBatteryThreshold = 15;

    const std::vector<int> levels = {50, 10, 8, 12, 5};
    Snapshot previous = snapshotOf({makeRecord(kMouse, "Mouse", 50)});
    int alerts = 0;
    std::vector<int> alertedAt;
    for (size_t i = 1; i < levels.size(); ++i) {
        const Snapshot current =
            snapshotOf({makeRecord(kMouse, "Mouse", static_cast<std::uint8_t>(levels[i]))});
        const auto report = bluemeter::reconcile(previous, current, notified, cfg);
        if (countKind(report, EventKind::LowBattery) > 0) {
            ++alerts;
            alertedAt.push_back(levels[i]);
        }
        previous = current;
    }

    QCOMPARE(alerts, 2);
    QCOMPARE(alertedAt, (std::vector<int>{10, 5}));
}

void ReconciliationEngineTests::testMonotoneDropFiresOnce()
{
    bluemeter::NotifiedLowBatterySet notified;
    EventConfig cfg;
    cfg.lowBatteryThreshold = 20;

    Snapshot previous = snapshotOf({makeRecord(kMouse, "Mouse", 30)});
    int alerts = 0;
    for (int level = 19; level >= 1; level -= 3) {
        const Snapshot current =
            snapshotOf({makeRecord(kMouse, "Mouse", static_cast<std::uint8_t>(level))});
        alerts += countKind(bluemeter::reconcile(previous, current, notified, cfg),
                            EventKind::LowBattery);
        previous = current;
    }
    QCOMPARE(alerts, 1);
}

void ReconciliationEngineTests::testRecoveryAtThresholdRearms()
{
    bluemeter::NotifiedLowBatterySet notified;
    EventConfig cfg;
    cfg.lowBatteryThreshold = 15;

    auto report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 20)}),
                                       snapshotOf({makeRecord(kMouse, "Mouse", 14)}),
                                       notified, cfg);
    QCOMPARE(countKind(report, EventKind::LowBattery), 1);

    // Recovery emits nothing but clears the flag.
    report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 14)}),
                                  snapshotOf({makeRecord(kMouse, "Mouse", 15)}),
                                  notified, cfg);
    QVERIFY(report.events.empty());
    QVERIFY(notified.count(kMouse) == 1);
    QVERIFY(!notified.at(kMouse));

    report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 15)}),
                                  snapshotOf({makeRecord(kMouse, "Mouse", 9)}),
                                  notified, cfg);
    QCOMPARE(countKind(report, EventKind::LowBattery), 1);
}

void ReconciliationEngineTests::testThresholdZeroNeverAlerts()
{
    bluemeter::NotifiedLowBatterySet notified;
    EventConfig cfg;
    cfg.lowBatteryThreshold = 0;

    const auto report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 5)}),
                                             snapshotOf({makeRecord(kMouse, "Mouse", 0)}),
                                             notified, cfg);
    QVERIFY(report.updateNeeded);
    QVERIFY(report.events.empty());
    QVERIFY(notified.empty());
}

void ReconciliationEngineTests::testIdenticalSnapshotsNeedNoUpdate()
{
    bluemeter::NotifiedLowBatterySet notified;
    const Snapshot snapshot = snapshotOf({makeRecord(kMouse, "Mouse", 5),
                                          makeRecord(kHeadset, "Headset", 80, false)});

    const auto report = bluemeter::reconcile(snapshot, snapshot, notified, allNotifications());
    QVERIFY(!report.updateNeeded);
    QVERIFY(report.events.empty());
    QVERIFY(report.added.empty());
    QVERIFY(report.removed.empty());
    QVERIFY(report.updated.empty());
}

void ReconciliationEngineTests::testForceWithoutChangesHasNoEvents()
{
    bluemeter::NotifiedLowBatterySet notified;
    const Snapshot snapshot = snapshotOf({makeRecord(kMouse, "Mouse", 5)});

    const auto report =
        bluemeter::reconcile(snapshot, snapshot, notified, allNotifications(), true);
    QVERIFY(report.updateNeeded);
    QVERIFY(report.events.empty());
    QCOMPARE(report.snapshot, snapshot);
}

void ReconciliationEngineTests::testBatteryChangeIsUpdateNotAddRemove()
{
    bluemeter::NotifiedLowBatterySet notified;
    const auto report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 60)}),
                                             snapshotOf({makeRecord(kMouse, "Mouse", 55)}),
                                             notified, allNotifications());

    QVERIFY(report.updateNeeded);
    QVERIFY(report.added.empty());
    QVERIFY(report.removed.empty());
    QCOMPARE(report.updated.size(), static_cast<size_t>(1));
    QCOMPARE(static_cast<int>(report.updated.front().before.battery), 60);
    QCOMPARE(static_cast<int>(report.updated.front().after.battery), 55);
    QVERIFY(report.events.empty());
}

void ReconciliationEngineTests::testAddedAndRemovedGating()
{
    bluemeter::NotifiedLowBatterySet notified;
    const Snapshot previous = snapshotOf({makeRecord(kMouse, "Mouse", 60)});
    const Snapshot current = snapshotOf({makeRecord(kHeadset, "Headset", 70)});

    EventConfig quiet;
    auto report = bluemeter::reconcile(previous, current, notified, quiet);
    QVERIFY(report.updateNeeded);
    QCOMPARE(report.added.size(), static_cast<size_t>(1));
    QCOMPARE(report.removed.size(), static_cast<size_t>(1));
    QVERIFY(report.events.empty());

    report = bluemeter::reconcile(previous, current, notified, allNotifications());
    QCOMPARE(countKind(report, EventKind::Added), 1);
    QCOMPARE(countKind(report, EventKind::Removed), 1);
    QCOMPARE(report.added.front().address, kHeadset);
    QCOMPARE(report.removed.front().address, kMouse);
}

void ReconciliationEngineTests::testConnectionTransitions()
{
    bluemeter::NotifiedLowBatterySet notified;
    const Snapshot connected = snapshotOf({makeRecord(kHeadset, "Headset", 70, true)});
    const Snapshot disconnected = snapshotOf({makeRecord(kHeadset, "Headset", 70, false)});

    auto report = bluemeter::reconcile(connected, disconnected, notified, allNotifications());
    QCOMPARE(report.events.size(), static_cast<size_t>(1));
    QCOMPARE(report.events.front().kind, EventKind::Disconnected);

    report = bluemeter::reconcile(disconnected, connected, notified, allNotifications());
    QCOMPARE(report.events.size(), static_cast<size_t>(1));
    QCOMPARE(report.events.front().kind, EventKind::Reconnected);

    EventConfig quiet;
    report = bluemeter::reconcile(connected, disconnected, notified, quiet);
    QVERIFY(report.updateNeeded);
    QVERIFY(report.events.empty());
}

void ReconciliationEngineTests::testConnectionAndBatteryChangeTogether()
{
    bluemeter::NotifiedLowBatterySet notified;
    const auto report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 40, true)}),
                                             snapshotOf({makeRecord(kMouse, "Mouse", 10, false)}),
                                             notified, allNotifications());

    QCOMPARE(countKind(report, EventKind::Disconnected), 1);
    QCOMPARE(countKind(report, EventKind::LowBattery), 1);
    QCOMPARE(report.updated.size(), static_cast<size_t>(1));
}

void ReconciliationEngineTests::testNameOnlyChangeIsSilentUpdate()
{
    bluemeter::NotifiedLowBatterySet notified;
    const auto report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 40)}),
                                             snapshotOf({makeRecord(kMouse, "Office Mouse", 40)}),
                                             notified, allNotifications());
    QVERIFY(report.updateNeeded);
    QCOMPARE(report.updated.size(), static_cast<size_t>(1));
    QVERIFY(report.events.empty());
}

void ReconciliationEngineTests::testEngineKeepsAlertStateAcrossPasses()
{
    bluemeter::ReconciliationEngine engine;
    EventConfig cfg;
    cfg.lowBatteryThreshold = 25;

    const Snapshot high = snapshotOf({makeRecord(kMouse, "Mouse", 30)});
    const Snapshot low = snapshotOf({makeRecord(kMouse, "Mouse", 20)});
    const Snapshot lower = snapshotOf({makeRecord(kMouse, "Mouse", 18)});

    QCOMPARE(countKind(engine.reconcile(high, low, cfg), EventKind::LowBattery), 1);
    QVERIFY(engine.isAlerted(kMouse));
    QCOMPARE(countKind(engine.reconcile(low, lower, cfg), EventKind::LowBattery), 0);
    QVERIFY(!engine.isAlerted(kHeadset));
}

void ReconciliationEngineTests::testClassificationCoversEveryChangedAddress()
{
    bluemeter::NotifiedLowBatterySet notified;
    const Snapshot previous = snapshotOf({makeRecord(kMouse, "Mouse", 50),
                                          makeRecord(kHeadset, "Headset", 80),
                                          makeRecord(kKeyboard, "Keyboard", 70),
                                          makeRecord(kPad, "Pad", 40)});
    const Snapshot current = snapshotOf({makeRecord(kMouse, "Mouse", 45),
                                         makeRecord(kHeadset, "Headset", 80, false),
                                         makeRecord(kPad, "Pad", 40),
                                         makeRecord(kSpeaker, "Speaker", 90)});

    const auto report = bluemeter::reconcile(previous, current, notified, allNotifications());

    std::set<bluemeter::Address> classified;
    for (const auto &record : report.added) {
        classified.insert(record.address);
    }
    for (const auto &record : report.removed) {
        classified.insert(record.address);
    }
    for (const auto &change : report.updated) {
        classified.insert(change.after.address);
    }

    std::set<bluemeter::Address> changed;
    for (const auto &record : previous.difference(current)) {
        changed.insert(record.address);
    }
    for (const auto &record : current.difference(previous)) {
        changed.insert(record.address);
    }

    QVERIFY(classified == changed);
    QVERIFY(classified.count(kPad) == 0);
    QCOMPARE(report.added.size(), static_cast<size_t>(1));
    QCOMPARE(report.added.front().address, kSpeaker);
    QCOMPARE(report.removed.size(), static_cast<size_t>(1));
    QCOMPARE(report.removed.front().address, kKeyboard);
    QCOMPARE(report.updated.size(), static_cast<size_t>(2));
}

void ReconciliationEngineTests::testEmptyToTwoDevicesIsTwoAdds()
{
    bluemeter::NotifiedLowBatterySet notified;
    const auto report = bluemeter::reconcile(
        Snapshot(),
        snapshotOf({makeRecord(kMouse, "Mouse", 50), makeRecord(kHeadset, "Headset", 10)}),
        notified, allNotifications());

    QVERIFY(report.updateNeeded);
    QCOMPARE(report.events.size(), static_cast<size_t>(2));
    std::set<bluemeter::Address> added;
    for (const auto &event : report.events) {
        QCOMPARE(event.kind, EventKind::Added);
        added.insert(event.device.address);
    }
    QVERIFY(added == (std::set<bluemeter::Address>{kMouse, kHeadset}));
}

void ReconciliationEngineTests::testVanishedConnectedDeviceIsRemovedNotDisconnected()
{
    bluemeter::NotifiedLowBatterySet notified;
    const auto report = bluemeter::reconcile(snapshotOf({makeRecord(kMouse, "Mouse", 50, true)}),
                                             Snapshot(), notified, allNotifications());

    QCOMPARE(report.events.size(), static_cast<size_t>(1));
    QCOMPARE(report.events.front().kind, EventKind::Removed);
    QCOMPARE(report.events.front().device.address, kMouse);
    QCOMPARE(countKind(report, EventKind::Disconnected), 0);
    QVERIFY(report.snapshot.empty());
}

QTEST_MAIN(ReconciliationEngineTests)
#include "test_reconciliation_engine.moc"
