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
    void testDebugSkippedWithoutTrace();
    void testTraceWrites();
    void testLevelFromEnvironment();
    void testCorrelationScopeRestores();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
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

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/timekeep/logs/timekeep-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    timekeep::logging::initLogging(QStringLiteral("timekeep-test"), false);

    timekeep::logging::logEvent(timekeep::logging::LogLevel::Info,
                                QStringLiteral("timekeep-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                timekeep::logging::defaultWho(),
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

void LoggingTests::testDebugSkippedWithoutTrace()
{
    timekeep::logging::initLogging(QStringLiteral("timekeep-test"), false);
    QFile::remove(logPath(QStringLiteral(".log")));

    timekeep::logging::logEvent(timekeep::logging::LogLevel::Debug,
                                QStringLiteral("timekeep-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testDebugSkippedWithoutTrace"),
                                QStringLiteral("debug_only"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                timekeep::logging::defaultWho(),
                                QString());

    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));
    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));
}

void LoggingTests::testTraceWrites()
{
    timekeep::logging::initLogging(QStringLiteral("timekeep-test"), true);
    QVERIFY(timekeep::logging::isTraceEnabled());

    timekeep::logging::logEvent(timekeep::logging::LogLevel::Debug,
                                QStringLiteral("timekeep-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testTraceWrites"),
                                QStringLiteral("test_trace"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                timekeep::logging::defaultWho(),
                                QStringLiteral("corr-2"),
                                nlohmann::json::object());

    QFile file(logPath(QStringLiteral("-trace.log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    timekeep::logging::initLogging(QStringLiteral("timekeep-test"), false);
}

void LoggingTests::testLevelFromEnvironment()
{
    qputenv("TIMEKEEP_LOG_LEVEL", "warn");
    timekeep::logging::initLogging(QStringLiteral("timekeep-test"), false);
    QFile::remove(logPath(QStringLiteral(".log")));

    timekeep::logging::logEvent(timekeep::logging::LogLevel::Info,
                                QStringLiteral("timekeep-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLevelFromEnvironment"),
                                QStringLiteral("below_threshold"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                timekeep::logging::defaultWho(),
                                QString());
    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));

    timekeep::logging::logEvent(timekeep::logging::LogLevel::Warn,
                                QStringLiteral("timekeep-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLevelFromEnvironment"),
                                QStringLiteral("at_threshold"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                timekeep::logging::defaultWho(),
                                QString());

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("WARN"));
    QVERIFY(!parsed.value("session", std::string()).empty());

    qunsetenv("TIMEKEEP_LOG_LEVEL");
    timekeep::logging::initLogging(QStringLiteral("timekeep-test"), false);
}

void LoggingTests::testCorrelationScopeRestores()
{
    timekeep::logging::setCorrelationId(QStringLiteral("outer"));
    {
        timekeep::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(timekeep::logging::currentCorrelationId(), QStringLiteral("inner"));
    }
    QCOMPARE(timekeep::logging::currentCorrelationId(), QStringLiteral("outer"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
