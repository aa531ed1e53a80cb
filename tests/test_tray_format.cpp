#include <QtTest/QtTest>

#include "fakes/fake_devices.hpp"
#include "tray/TrayFormat.hpp"

using bluemeter::EventKind;
using bluemeter::Snapshot;
using bluemeter::TrayOptions;
using bluemeter::fakes::makeRecord;

namespace {

const QString kGreen = QStringLiteral("\U0001F7E2");
const QString kRed = QStringLiteral("\U0001F534");

} // namespace

class TrayFormatTests : public QObject
{
    Q_OBJECT
private slots:
    void testTruncateName();
    void testDeviceLine();
    void testDeviceLineWithBatteryPrefix();
    void testTooltipHidesDisconnected();
    void testBatteryIconName();
    void testNotificationText();
};

void TrayFormatTests::testTruncateName()
{
    QCOMPARE(bluemeter::truncateName(QStringLiteral("Keyboard K380 Multi"), false),
             QStringLiteral("Keyboard K380 Multi"));
    QCOMPARE(bluemeter::truncateName(QStringLiteral("Keyboard K380 Multi"), true),
             QStringLiteral("Keyboard K..."));
    QCOMPARE(bluemeter::truncateName(QStringLiteral("Mouse"), true), QStringLiteral("Mouse"));
    QCOMPARE(bluemeter::truncateName(QStringLiteral("0123456789"), true),
             QStringLiteral("0123456789"));
}

void TrayFormatTests::testDeviceLine()
{
    TrayOptions options;
    QCOMPARE(bluemeter::formatDeviceLine(makeRecord(1, "Mouse", 80), options),
             kGreen + QStringLiteral("Mouse -  80%"));
    QCOMPARE(bluemeter::formatDeviceLine(makeRecord(1, "Mouse", 100, false), options),
             kRed + QStringLiteral("Mouse - 100%"));
    QCOMPARE(bluemeter::formatDeviceLine(makeRecord(1, "Mouse", 5), options),
             kGreen + QStringLiteral("Mouse -   5%"));
}

void TrayFormatTests::testDeviceLineWithBatteryPrefix()
{
    TrayOptions options;
    options.prefixBattery = true;
    options.truncateName = true;
    QCOMPARE(bluemeter::formatDeviceLine(makeRecord(1, "Headphones WH-1000", 42), options),
             kGreen + QStringLiteral(" 42% - Headphones..."));
}

void TrayFormatTests::testTooltipHidesDisconnected()
{
    const Snapshot snapshot = Snapshot::fromRecords(
        {makeRecord(2, "Pad", 60, false), makeRecord(1, "Mouse", 80)});

    TrayOptions options;
    QStringList lines = bluemeter::formatTooltipLines(snapshot, options);
    QCOMPARE(lines.size(), 1);
    QVERIFY(lines.front().contains(QStringLiteral("Mouse")));

    options.showDisconnected = true;
    lines = bluemeter::formatTooltipLines(snapshot, options);
    QCOMPARE(lines.size(), 2);
    QVERIFY(lines.at(0).contains(QStringLiteral("Mouse")));
    QVERIFY(lines.at(1).startsWith(kRed));
}

void TrayFormatTests::testBatteryIconName()
{
    QCOMPARE(bluemeter::batteryIconName(0), QStringLiteral("battery-level-0-symbolic"));
    QCOMPARE(bluemeter::batteryIconName(4), QStringLiteral("battery-level-0-symbolic"));
    QCOMPARE(bluemeter::batteryIconName(45), QStringLiteral("battery-level-50-symbolic"));
    QCOMPARE(bluemeter::batteryIconName(84), QStringLiteral("battery-level-80-symbolic"));
    QCOMPARE(bluemeter::batteryIconName(100), QStringLiteral("battery-level-100-symbolic"));
}

void TrayFormatTests::testNotificationText()
{
    QCOMPARE(bluemeter::notificationTitle(EventKind::LowBattery, 15),
             QStringLiteral("Battery below 15%"));
    QCOMPARE(bluemeter::notificationTitle(EventKind::Removed, 15),
             QStringLiteral("Bluetooth device removed"));

    const std::vector<bluemeter::DeviceRecord> devices = {
        makeRecord(1, "Mouse", 8), makeRecord(2, "Pad", 12)};
    QCOMPARE(bluemeter::notificationBody(EventKind::LowBattery, devices),
             QStringLiteral("Mouse: 8%\nPad: 12%"));
    QCOMPARE(bluemeter::notificationBody(EventKind::Disconnected, {devices.front()}),
             QStringLiteral("Device name: Mouse"));
}

QTEST_MAIN(TrayFormatTests)
#include "test_tray_format.moc"
