#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "common/date_keys.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/config_store.hpp"
#include "daemon/notifier.hpp"
#include "daemon/reminder_engine.hpp"

namespace {

class RecordingNotifier : public timekeep::Notifier
{
public:
    void notify(const std::string &title, const std::string &) override
    {
        titles.push_back(title);
    }

    std::vector<std::string> titles;
};

} // namespace

class ReminderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testGoalAchievedFiresOnce();
    void testEntertainmentLimitWarning();
    void testBreakReminderAfterInterval();
    void testNothingBelowThresholds();
    void testRememberedKeysStayBounded();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::unique_ptr<timekeep::ConfigStore> m_config;
    std::unique_ptr<timekeep::AccountingStore> m_store;
    RecordingNotifier m_notifier;
    std::chrono::system_clock::time_point m_now;
};

void ReminderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    m_config = std::make_unique<timekeep::ConfigStore>(
        std::filesystem::path(m_tempDir.path().toStdString()) / "tracker_config.json");
}

void ReminderTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReminderTests::init()
{
    m_store = std::make_unique<timekeep::AccountingStore>(
        *m_config, std::filesystem::path(m_tempDir.path().toStdString()) / "time_tracking.json");
    m_notifier.titles.clear();
    m_now = std::chrono::system_clock::now();
}

void ReminderTests::cleanup()
{
    m_store.reset();
}

void ReminderTests::testGoalAchievedFiresOnce()
{
    timekeep::ReminderEngine engine(*m_store, *m_config, m_notifier);
    m_store->record("vim", 4 * 3600.0, std::nullopt, timekeep::dateKeyFor(m_now));

    const auto first = engine.evaluate(m_now, std::nullopt);
    QCOMPARE(first.size(), std::size_t(1));
    QCOMPARE(first.front().kind, timekeep::ReminderKind::GoalAchieved);
    QCOMPARE(m_notifier.titles.size(), std::size_t(1));

    m_store->record("vim", 600.0, std::nullopt, timekeep::dateKeyFor(m_now));
    QVERIFY(engine.evaluate(m_now, std::nullopt).empty());
    QCOMPARE(m_notifier.titles.size(), std::size_t(1));
}

void ReminderTests::testEntertainmentLimitWarning()
{
    timekeep::ReminderEngine engine(*m_store, *m_config, m_notifier);
    m_store->record("Spotify", 3.5 * 3600.0, std::nullopt, timekeep::dateKeyFor(m_now));

    const auto sent = engine.evaluate(m_now, std::nullopt);
    QCOMPARE(sent.size(), std::size_t(2));
    bool warned = false;
    for (const auto &reminder : sent) {
        if (reminder.kind == timekeep::ReminderKind::LimitWarning) {
            warned = true;
        }
    }
    QVERIFY(warned);
    QVERIFY(engine.evaluate(m_now, std::nullopt).empty());
}

void ReminderTests::testBreakReminderAfterInterval()
{
    timekeep::ReminderEngine engine(*m_store, *m_config, m_notifier);
    const auto sessionStart = m_now - std::chrono::seconds(3601);

    const auto sent = engine.evaluate(m_now, sessionStart);
    QCOMPARE(sent.size(), std::size_t(1));
    QCOMPARE(sent.front().kind, timekeep::ReminderKind::BreakReminder);
    QCOMPARE(m_notifier.titles.front(), std::string("Take a Break!"));

    QVERIFY(engine.evaluate(m_now, sessionStart).empty());
    QCOMPARE(m_notifier.titles.size(), std::size_t(1));
}

void ReminderTests::testNothingBelowThresholds()
{
    timekeep::ReminderEngine engine(*m_store, *m_config, m_notifier);
    m_store->record("vim", 600.0, std::nullopt, timekeep::dateKeyFor(m_now));

    QVERIFY(engine.evaluate(m_now, m_now - std::chrono::seconds(60)).empty());
    QVERIFY(m_notifier.titles.empty());
}

void ReminderTests::testRememberedKeysStayBounded()
{
    timekeep::ReminderEngine engine(*m_store, *m_config, m_notifier);
    const auto sessionStart = m_now - std::chrono::seconds(3601);

    for (int i = 0; i < 3; ++i) {
        const auto sent = engine.evaluate(m_now + std::chrono::hours(i), sessionStart);
        QCOMPARE(sent.size(), std::size_t(1));
    }
    QCOMPARE(engine.rememberedKeyCount(), std::size_t(1));

    const auto tomorrow = m_now + std::chrono::hours(24);
    m_store->record("vim", 4 * 3600.0, std::nullopt, timekeep::dateKeyFor(m_now));
    m_store->record("vim", 4 * 3600.0, std::nullopt, timekeep::dateKeyFor(tomorrow));

    QCOMPARE(engine.evaluate(m_now, std::nullopt).size(), std::size_t(1));
    QCOMPARE(engine.evaluate(tomorrow, std::nullopt).size(), std::size_t(1));
    // Yesterday's goal key is gone; the last break key is kept.
    QCOMPARE(engine.rememberedKeyCount(), std::size_t(2));
}

QTEST_MAIN(ReminderTests)
#include "test_reminders.moc"
