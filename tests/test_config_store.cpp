#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "daemon/config_store.hpp"

class ConfigStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDefaultsWrittenWhenMissing();
    void testCustomRuleOrderSurvivesReload();
    void testCustomRuleReplacedInPlace();
    void testMissingKeysMergedFromDefaults();
    void testCorruptFileIsRejected();
    void testInvalidValuesRejected();
    void testNonWholeSecondsInFileRejected_data();
    void testNonWholeSecondsInFileRejected();
    void testFocusPatternsNormalized();
    void testPasswordGate();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::filesystem::path configPath(const QString &name) const;
};

void ConfigStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigStoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path ConfigStoreTests::configPath(const QString &name) const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / name.toStdString();
}

void ConfigStoreTests::testDefaultsWrittenWhenMissing()
{
    const auto path = configPath(QStringLiteral("defaults.json"));
    timekeep::ConfigStore store(path);

    QVERIFY(std::filesystem::exists(path));
    const timekeep::TrackerConfig config = store.config();
    QCOMPARE(config.idleThresholdSeconds, 300);
    QCOMPARE(config.tickPeriodSeconds, 5);
    QCOMPARE(config.breakReminderInterval, 3600);
    QCOMPARE(config.goals.at("Coding"), 4.0);
    QCOMPARE(config.goals.at("Entertainment"), 2.0);
    QCOMPARE(config.productiveCategories.size(), std::size_t(3));
    QVERIFY(config.customCategories.empty());
    QVERIFY(!config.passwordHash.has_value());
}

void ConfigStoreTests::testCustomRuleOrderSurvivesReload()
{
    const auto path = configPath(QStringLiteral("order.json"));
    {
        timekeep::ConfigStore store(path);
        store.addCustomRule("zeta", "A");
        store.addCustomRule("alpha", "B");
        store.addCustomRule("mid", "C");
    }

    timekeep::ConfigStore reloaded(path);
    const auto rules = reloaded.config().customCategories;
    QCOMPARE(rules.size(), std::size_t(3));
    QCOMPARE(rules[0].first, std::string("zeta"));
    QCOMPARE(rules[1].first, std::string("alpha"));
    QCOMPARE(rules[2].first, std::string("mid"));
    QCOMPARE(reloaded.classifier().classify("alpha zeta"), std::string("A"));
}

void ConfigStoreTests::testCustomRuleReplacedInPlace()
{
    timekeep::ConfigStore store(configPath(QStringLiteral("replace.json")));
    store.addCustomRule("first", "A");
    store.addCustomRule("second", "B");
    store.addCustomRule("first", "Z");

    const auto rules = store.config().customCategories;
    QCOMPARE(rules.size(), std::size_t(2));
    QCOMPARE(rules[0].first, std::string("first"));
    QCOMPARE(rules[0].second, std::string("Z"));

    QVERIFY(store.removeCustomRule("first"));
    QVERIFY(!store.removeCustomRule("first"));
    QCOMPARE(store.config().customCategories.size(), std::size_t(1));
}

void ConfigStoreTests::testMissingKeysMergedFromDefaults()
{
    const auto path = configPath(QStringLiteral("partial.json"));
    QFile file(QString::fromStdString(path.string()));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"idle_threshold_seconds": 42, "custom_keys": "kept"})");
    file.close();

    timekeep::ConfigStore store(path);
    QCOMPARE(store.config().idleThresholdSeconds, 42);
    QCOMPARE(store.config().goals.at("Coding"), 4.0);

    store.setNotificationsEnabled(false);
    const auto doc = store.document();
    QCOMPARE(doc.value("custom_keys", std::string()), std::string("kept"));
    QCOMPARE(doc.value("notifications_enabled", true), false);
}

void ConfigStoreTests::testCorruptFileIsRejected()
{
    const auto path = configPath(QStringLiteral("corrupt.json"));
    QFile file(QString::fromStdString(path.string()));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY_EXCEPTION_THROWN(timekeep::ConfigStore store(path), timekeep::ConfigError);

    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("{ not json"));
}

void ConfigStoreTests::testInvalidValuesRejected()
{
    timekeep::ConfigStore store(configPath(QStringLiteral("invalid.json")));

    QVERIFY_EXCEPTION_THROWN(store.setIdleThreshold(-1), timekeep::ConfigError);
    QVERIFY_EXCEPTION_THROWN(store.setTickPeriod(0), timekeep::ConfigError);
    QVERIFY_EXCEPTION_THROWN(store.setGoal("Coding", -2.0), timekeep::ConfigError);
    QVERIFY_EXCEPTION_THROWN(store.setGoal("", 1.0), timekeep::ConfigError);
    QVERIFY_EXCEPTION_THROWN(store.addCustomRule("", "A"), timekeep::ConfigError);
    QVERIFY_EXCEPTION_THROWN(store.setExcludedApps({"ok", ""}), timekeep::ConfigError);

    QCOMPARE(store.config().idleThresholdSeconds, 300);
    QVERIFY(store.config().excludedApps.empty());

    store.setIdleThreshold(0);
    QCOMPARE(store.config().idleThresholdSeconds, 0);
}

void ConfigStoreTests::testNonWholeSecondsInFileRejected_data()
{
    QTest::addColumn<QByteArray>("document");

    QTest::newRow("fraction") << QByteArray(R"({"idle_threshold_seconds": 299.9})");
    QTest::newRow("negative fraction") << QByteArray(R"({"idle_threshold_seconds": -0.5})");
    QTest::newRow("beyond int") << QByteArray(R"({"idle_threshold_seconds": 3e9})");
    QTest::newRow("huge integer") << QByteArray(R"({"tick_period_seconds": 4294967301})");
}

void ConfigStoreTests::testNonWholeSecondsInFileRejected()
{
    QFETCH(QByteArray, document);

    const auto path = configPath(QStringLiteral("seconds.json"));
    QFile file(QString::fromStdString(path.string()));
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(document);
    file.close();

    QVERIFY_EXCEPTION_THROWN(timekeep::ConfigStore store(path), timekeep::ConfigError);
}

void ConfigStoreTests::testFocusPatternsNormalized()
{
    timekeep::ConfigStore store(configPath(QStringLiteral("focus.json")));
    store.setFocusModeBlocked({"YouTube", "Steam"});

    const auto blocked = store.config().focusModeBlocked;
    QCOMPARE(blocked.size(), std::size_t(2));
    QCOMPARE(blocked[0], std::string("youtube"));
    QCOMPARE(blocked[1], std::string("steam"));
}

void ConfigStoreTests::testPasswordGate()
{
    const auto path = configPath(QStringLiteral("password.json"));
    {
        timekeep::ConfigStore store(path);
        QVERIFY(store.checkPassword("anything"));
        store.setPassword("hunter2");
        QVERIFY(store.checkPassword("hunter2"));
        QVERIFY(!store.checkPassword("hunter3"));
        QCOMPARE(store.document().value("password_hash", std::string()), std::string("set"));
    }

    timekeep::ConfigStore reloaded(path);
    QVERIFY(reloaded.checkPassword("hunter2"));
    reloaded.clearPassword();
    QVERIFY(reloaded.checkPassword(""));
}

QTEST_MAIN(ConfigStoreTests)
#include "test_config_store.moc"
