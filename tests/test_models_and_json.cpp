#include <QtTest/QtTest>

#include <unordered_set>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

using bluemeter::DeviceRecord;
using bluemeter::Snapshot;
using bluemeter::TransportKind;

namespace {

constexpr bluemeter::Address kKeyboard = 0xA4C1385F2B9EULL;

DeviceRecord record(bluemeter::Address address, const std::string &name, std::uint8_t battery,
                    bool connected = true)
{
    DeviceRecord r;
    r.address = address;
    r.name = name;
    r.battery = battery;
    r.connected = connected;
    r.kind = TransportKind::lowEnergy();
    return r;
}

} // namespace

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testAddressFormatting();
    void testAddressParsing();
    void testSnapshotKeepsFirstDuplicate();
    void testSnapshotDifferenceIsStructural();
    void testWithRecordReplaces();
    void testRecordHashDistinguishesFields();
    void testDeviceRecordJson();
    void testMissingFieldsDefaults();
};

void ModelsJsonTests::testAddressFormatting()
{
    QCOMPARE(QString::fromStdString(bluemeter::formatAddress(kKeyboard)),
             QStringLiteral("A4:C1:38:5F:2B:9E"));
    QCOMPARE(QString::fromStdString(bluemeter::formatAddress(0)),
             QStringLiteral("00:00:00:00:00:00"));
}

void ModelsJsonTests::testAddressParsing()
{
    QCOMPARE(bluemeter::parseAddress("a4:c1:38:5f:2b:9e").value_or(0), kKeyboard);
    QCOMPARE(bluemeter::parseAddress("A4_C1_38_5F_2B_9E").value_or(0), kKeyboard);
    QCOMPARE(bluemeter::parseAddress("A4C1385F2B9E").value_or(0), kKeyboard);
    QVERIFY(!bluemeter::parseAddress("").has_value());
    QVERIFY(!bluemeter::parseAddress("A4:C1:38:5F:2B").has_value());
    QVERIFY(!bluemeter::parseAddress("A4:C1:38:5F:2B:9E:00").has_value());
    QVERIFY(!bluemeter::parseAddress("A4C:1:38:5F:2B:9E").has_value());
    QVERIFY(!bluemeter::parseAddress("G4:C1:38:5F:2B:9E").has_value());
}

void ModelsJsonTests::testSnapshotKeepsFirstDuplicate()
{
    std::vector<DeviceRecord> rejected;
    const Snapshot snapshot = Snapshot::fromRecords(
        {record(1, "first", 50), record(2, "other", 60), record(1, "second", 10)}, &rejected);

    QCOMPARE(snapshot.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(snapshot.find(1)->name), QStringLiteral("first"));
    QCOMPARE(rejected.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(rejected.front().name), QStringLiteral("second"));

    const auto ordered = snapshot.records();
    QCOMPARE(ordered.front().address, static_cast<bluemeter::Address>(1));
    QCOMPARE(ordered.back().address, static_cast<bluemeter::Address>(2));
}

void ModelsJsonTests::testSnapshotDifferenceIsStructural()
{
    const Snapshot before = Snapshot::fromRecords({record(1, "Mouse", 50), record(2, "Pad", 80)});
    const Snapshot after = Snapshot::fromRecords({record(1, "Mouse", 45), record(2, "Pad", 80)});

    const auto removed = before.difference(after);
    const auto added = after.difference(before);
    QCOMPARE(removed.size(), static_cast<size_t>(1));
    QCOMPARE(added.size(), static_cast<size_t>(1));
    QCOMPARE(static_cast<int>(removed.front().battery), 50);
    QCOMPARE(static_cast<int>(added.front().battery), 45);
    QVERIFY(before.difference(before).empty());
}

void ModelsJsonTests::testWithRecordReplaces()
{
    const Snapshot base = Snapshot::fromRecords({record(1, "Mouse", 50)});
    const Snapshot next = base.withRecord(record(1, "Mouse", 20, false));

    QCOMPARE(static_cast<int>(base.find(1)->battery), 50);
    QCOMPARE(static_cast<int>(next.find(1)->battery), 20);
    QVERIFY(!next.find(1)->connected);
    QVERIFY(base != next);
}

void ModelsJsonTests::testRecordHashDistinguishesFields()
{
    std::unordered_set<DeviceRecord, bluemeter::DeviceRecordHash> set;
    set.insert(record(1, "Mouse", 50));
    set.insert(record(1, "Mouse", 50));
    set.insert(record(1, "Mouse", 50, false));
    DeviceRecord classic = record(1, "Mouse", 50);
    classic.kind = TransportKind::classic("/org/bluez/hci0/dev_00_00_00_00_00_01");
    set.insert(classic);
    QCOMPARE(set.size(), static_cast<size_t>(3));
}

void ModelsJsonTests::testDeviceRecordJson()
{
    DeviceRecord keyboard = record(kKeyboard, "Keyboard", 77, false);
    keyboard.kind = TransportKind::classic("/org/bluez/hci0/dev_A4_C1_38_5F_2B_9E");

    const nlohmann::json j = keyboard;
    QCOMPARE(QString::fromStdString(j.at("address").get<std::string>()),
             QStringLiteral("A4:C1:38:5F:2B:9E"));
    QCOMPARE(QString::fromStdString(j.at("kind").at("type").get<std::string>()),
             QStringLiteral("classic"));

    const auto parsed = j.get<DeviceRecord>();
    QVERIFY(parsed == keyboard);
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto parsed = nlohmann::json{{"address", "00:11:22:33:44:55"}, {"battery", 250}}
                            .get<DeviceRecord>();
    QCOMPARE(parsed.address, static_cast<bluemeter::Address>(0x001122334455ULL));
    QCOMPARE(static_cast<int>(parsed.battery), 100);
    QVERIFY(parsed.name.empty());
    QVERIFY(!parsed.connected);
    QVERIFY(!parsed.kind.isClassic());

    const auto negative = nlohmann::json{{"battery", -5}}.get<DeviceRecord>();
    QCOMPARE(static_cast<int>(negative.battery), 0);
    QCOMPARE(negative.address, static_cast<bluemeter::Address>(0));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
