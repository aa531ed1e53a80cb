#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/autostart.hpp"

class AutostartTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testEntryPath();
    void testEnableWritesEntry();
    void testDisableRemovesEntry();
    void testForeignEntryIsNotEnabled();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevXdg;
};

void AutostartTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevXdg = qgetenv("XDG_CONFIG_HOME");
    qputenv("XDG_CONFIG_HOME", m_tempDir.path().toUtf8());
}

void AutostartTests::cleanupTestCase()
{
    if (m_prevXdg.isEmpty()) {
        qunsetenv("XDG_CONFIG_HOME");
    } else {
        qputenv("XDG_CONFIG_HOME", m_prevXdg);
    }
}

void AutostartTests::testEntryPath()
{
    QCOMPARE(bluemeter::autostartEntryPath(),
             m_tempDir.path() + QStringLiteral("/autostart/bluemeter.desktop"));
}

void AutostartTests::testEnableWritesEntry()
{
    QVERIFY(!bluemeter::isAutostartEnabled());
    QVERIFY(bluemeter::setAutostartEnabled(true));
    QVERIFY(bluemeter::isAutostartEnabled());

    QFile file(bluemeter::autostartEntryPath());
    QVERIFY(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString content = QString::fromUtf8(file.readAll());
    QVERIFY(content.startsWith(QStringLiteral("[Desktop Entry]")));
    QVERIFY(content.contains(QStringLiteral("Exec=") + QCoreApplication::applicationFilePath()));
}

void AutostartTests::testDisableRemovesEntry()
{
    QVERIFY(bluemeter::setAutostartEnabled(true));
    QVERIFY(bluemeter::setAutostartEnabled(false));
    QVERIFY(!QFile::exists(bluemeter::autostartEntryPath()));
    QVERIFY(!bluemeter::isAutostartEnabled());

    // Disabling twice is not an error.
    QVERIFY(bluemeter::setAutostartEnabled(false));
}

void AutostartTests::testForeignEntryIsNotEnabled()
{
    QVERIFY(bluemeter::setAutostartEnabled(true));
    QFile file(bluemeter::autostartEntryPath());
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text));
    file.write("[Desktop Entry]\nType=Application\nExec=/usr/bin/some-other-tray\n");
    file.close();

    QVERIFY(!bluemeter::isAutostartEnabled());
    QVERIFY(bluemeter::setAutostartEnabled(false));
}

QTEST_MAIN(AutostartTests)
#include "test_autostart.moc"
