#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScopeRestores();

private:
    QString logPath(const QString &suffix) const
    {
        return m_tempDir.path() + "/.local/share/bluemeter/logs/bluemeter-test" + suffix;
    }

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LoggingTests::testLogEventWrites()
{
    bluemeter::logging::initLogging(QStringLiteral("bluemeter-test"), false);

    bluemeter::logging::logEvent(bluemeter::logging::LogLevel::Info,
                                 QStringLiteral("bluemeter-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 bluemeter::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    bluemeter::logging::initLogging(QStringLiteral("bluemeter-test"), false);
    QVERIFY(!bluemeter::logging::isTraceEnabled());

    QFile::remove(logPath(QStringLiteral("-trace.log")));
    bluemeter::logging::logEvent(bluemeter::logging::LogLevel::Debug,
                                 QStringLiteral("bluemeter-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testDebugSuppressedWithoutTrace"),
                                 QStringLiteral("test_debug"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 bluemeter::logging::defaultWho(),
                                 QString(),
                                 nlohmann::json::object());

    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));
}

void LoggingTests::testTraceWrites()
{
    bluemeter::logging::initLogging(QStringLiteral("bluemeter-test"), true);

    bluemeter::logging::logEvent(bluemeter::logging::LogLevel::Debug,
                                 QStringLiteral("bluemeter-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testTraceWrites"),
                                 QStringLiteral("test_trace"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 bluemeter::logging::defaultWho(),
                                 QStringLiteral("corr-2"),
                                 nlohmann::json::object());

    QFile file(logPath(QStringLiteral("-trace.log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());
}

void LoggingTests::testCorrelationScopeRestores()
{
    bluemeter::logging::setCorrelationId(QStringLiteral("outer"));
    {
        bluemeter::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(bluemeter::logging::currentCorrelationId(), QStringLiteral("inner"));
    }
    QCOMPARE(bluemeter::logging::currentCorrelationId(), QStringLiteral("outer"));

    const QString id = bluemeter::logging::newCorrelationId(QStringLiteral("poll"));
    QVERIFY(id.startsWith(QStringLiteral("poll")));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
