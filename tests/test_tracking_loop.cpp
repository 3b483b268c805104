#include <QtTest/QtTest>

#include <QDateTime>
#include <QFile>
#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "common/date_keys.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/config_store.hpp"
#include "daemon/notifier.hpp"
#include "daemon/probes.hpp"
#include "daemon/tracking_loop.hpp"

namespace {

using timekeep::ProbeResult;

class ScriptedWindowProbe : public timekeep::ActiveWindowProbe
{
public:
    ProbeResult<std::string> activeWindow() override { return next; }

    ProbeResult<std::string> next = ProbeResult<std::string>::unavailable("not scripted");
};

class ScriptedIdleProbe : public timekeep::IdleProbe
{
public:
    ProbeResult<double> idleSeconds() override { return next; }

    ProbeResult<double> next = ProbeResult<double>::known(0.0);
};

class RecordingNotifier : public timekeep::Notifier
{
public:
    void notify(const std::string &title, const std::string &message) override
    {
        messages.emplace_back(title, message);
    }

    int count(const std::string &title) const
    {
        int n = 0;
        for (const auto &entry : messages) {
            if (entry.first == title) {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::pair<std::string, std::string>> messages;
};

// Noon local time keeps every scenario inside one calendar day.
std::chrono::system_clock::time_point baseTime()
{
    const QDateTime noon(QDate::currentDate(), QTime(12, 0));
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(noon.toMSecsSinceEpoch()));
}

struct LoopFixture {
    LoopFixture(const QString &dir, const std::string &dataFile, int idleThreshold, int period)
        : config(std::filesystem::path(dir.toStdString()) / "tracker_config.json")
        , store(config, std::filesystem::path(dir.toStdString()) / dataFile)
        , base(baseTime())
        , now(base)
        , loop(store, config, window, idle, notifier, [this]() { return now; })
    {
        config.setIdleThreshold(idleThreshold);
        config.setTickPeriod(period);
    }

    void tickAt(int seconds, const std::string &app, double idleSeconds = 0.0)
    {
        now = base + std::chrono::seconds(seconds);
        window.next = ProbeResult<std::string>::known(app);
        idle.next = ProbeResult<double>::known(idleSeconds);
        loop.tick();
    }

    double appSeconds(const std::string &category, const std::string &app) const
    {
        const auto day = store.snapshotFor(timekeep::dateKeyFor(base));
        const auto bucket = day.find(category);
        if (bucket == day.end()) {
            return 0.0;
        }
        const auto it = bucket->second.apps.find(app);
        return it == bucket->second.apps.end() ? 0.0 : it->second;
    }

    timekeep::ConfigStore config;
    timekeep::AccountingStore store;
    ScriptedWindowProbe window;
    ScriptedIdleProbe idle;
    RecordingNotifier notifier;
    std::chrono::system_clock::time_point base;
    std::chrono::system_clock::time_point now;
    timekeep::TrackingLoop loop;
};

const std::string kEditor = "main.cpp - Visual Studio Code";
const std::string kChat = "Slack | general";

} // namespace

class TrackingLoopTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testStartEntersRunningIdle();
    void testSwitchFlushesPreviousApp();
    void testIdleFlushesOnce();
    void testUnknownWindowIsNoOp();
    void testRepeatedProbeFailuresMarkDegraded();
    void testFocusModeBlocksAccrual();
    void testPauseDiscardsUnflushedTime();
    void testStopFlushesAndPersists();
    void testLongGapIsCapped();
    void testMaximumIdleThresholdStillRecords();
    void testProjectTagsFlushedTime();
    void testTicksIgnoredWhenStopped();
    void testPersistFailureKeepsTracking();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void TrackingLoopTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void TrackingLoopTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void TrackingLoopTests::testStartEntersRunningIdle()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 5, 5);

    QCOMPARE(f.loop.state(), timekeep::TrackerState::Stopped);
    const auto outcome = f.loop.start();
    QVERIFY(outcome.evaluated);
    QCOMPARE(f.loop.state(), timekeep::TrackerState::RunningIdle);

    const auto status = f.loop.status();
    QVERIFY(!status.currentApp.has_value());
    QVERIFY(status.sessionStart.has_value());
    QVERIFY(*status.sessionStart == f.base);

    // A second start is ignored and evaluates nothing.
    QVERIFY(!f.loop.start().evaluated);

    f.tickAt(0, kEditor);
    QCOMPARE(f.loop.state(), timekeep::TrackerState::RunningActive);
}

void TrackingLoopTests::testSwitchFlushesPreviousApp()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 5, 5);
    f.loop.start();

    f.tickAt(0, kEditor);
    f.tickAt(5, kEditor);
    f.tickAt(10, kEditor);
    f.tickAt(12, kChat);
    f.tickAt(17, kChat);
    f.tickAt(20, kChat);
    f.now = f.base + std::chrono::seconds(20);
    f.loop.stop();

    QCOMPARE(f.appSeconds("Coding", kEditor), 12.0);
    QCOMPARE(f.appSeconds("Communication", kChat), 8.0);
    QCOMPARE(f.loop.state(), timekeep::TrackerState::Stopped);
}

void TrackingLoopTests::testIdleFlushesOnce()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
    f.loop.start();

    for (int t = 0; t <= 20; t += 5) {
        f.tickAt(t, kEditor);
    }
    QCOMPARE(f.appSeconds("Coding", kEditor), 20.0);

    f.tickAt(25, kEditor, 120.0);
    QCOMPARE(f.appSeconds("Coding", kEditor), 25.0);
    QCOMPARE(f.loop.state(), timekeep::TrackerState::RunningIdle);

    f.tickAt(30, kEditor, 125.0);
    f.tickAt(35, kEditor, 130.0);
    QCOMPARE(f.appSeconds("Coding", kEditor), 25.0);

    // Activity resumes: the app starts fresh from the first active tick.
    f.tickAt(40, kEditor);
    f.tickAt(45, kEditor);
    QCOMPARE(f.appSeconds("Coding", kEditor), 30.0);
}

void TrackingLoopTests::testUnknownWindowIsNoOp()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
    f.loop.start();

    f.tickAt(0, kEditor);
    f.tickAt(5, "Unknown");
    QCOMPARE(f.appSeconds("Coding", kEditor), 0.0);

    auto status = f.loop.status();
    QVERIFY(status.currentApp.has_value());
    QCOMPARE(*status.currentApp, kEditor);
    QCOMPARE(status.currentCategory, std::string("Coding"));
    QCOMPARE(status.consecutiveProbeFailures, 1);

    // Nothing was lost: the next good sample covers the whole interval.
    f.tickAt(10, kEditor);
    QCOMPARE(f.appSeconds("Coding", kEditor), 10.0);
    QCOMPARE(f.loop.status().consecutiveProbeFailures, 0);
}

void TrackingLoopTests::testRepeatedProbeFailuresMarkDegraded()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
    f.loop.start();

    f.window.next = ProbeResult<std::string>::unavailable("xdotool could not be started");
    f.loop.tick();
    f.loop.tick();
    QVERIFY(!f.loop.status().degraded);

    f.idle.next = ProbeResult<double>::unavailable("xprintidle could not be started");
    f.loop.tick();
    const auto status = f.loop.status();
    QVERIFY(status.degraded);
    QCOMPARE(status.consecutiveProbeFailures, 3);
    QVERIFY(f.loop.isRunning());

    f.tickAt(5, kEditor);
    QVERIFY(!f.loop.status().degraded);
}

void TrackingLoopTests::testFocusModeBlocksAccrual()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
    f.loop.start();
    f.loop.setFocusMode(true);

    f.tickAt(0, kEditor);
    f.tickAt(3, "YouTube - Mozilla Firefox");
    f.tickAt(8, "YouTube - Mozilla Firefox");
    f.tickAt(13, "YouTube - Mozilla Firefox");

    QCOMPARE(f.appSeconds("Coding", kEditor), 3.0);
    QCOMPARE(f.appSeconds("Entertainment", "YouTube - Mozilla Firefox"), 0.0);
    QCOMPARE(f.notifier.count("Blocked App"), 1);
    QVERIFY(!f.loop.status().currentApp.has_value());

    f.loop.setFocusMode(false);
    f.tickAt(15, "YouTube - Mozilla Firefox");
    f.tickAt(20, "YouTube - Mozilla Firefox");
    QCOMPARE(f.appSeconds("Entertainment", "YouTube - Mozilla Firefox"), 5.0);
}

void TrackingLoopTests::testPauseDiscardsUnflushedTime()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
    f.loop.start();

    f.tickAt(0, kEditor);
    f.now = f.base + std::chrono::seconds(3);
    f.loop.pause();
    QCOMPARE(f.loop.state(), timekeep::TrackerState::Paused);

    f.tickAt(6, kEditor);
    QCOMPARE(f.appSeconds("Coding", kEditor), 0.0);

    f.loop.resume();
    QCOMPARE(f.loop.state(), timekeep::TrackerState::RunningIdle);
    f.tickAt(10, kEditor);
    f.tickAt(15, kEditor);
    QCOMPARE(f.appSeconds("Coding", kEditor), 5.0);
}

void TrackingLoopTests::testStopFlushesAndPersists()
{
    QTemporaryDir dir;
    {
        LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
        f.loop.start();
        f.tickAt(0, kEditor);
        f.now = f.base + std::chrono::seconds(3);
        f.loop.stop();
        QVERIFY(!f.loop.status().sessionStart.has_value());
    }

    timekeep::ConfigStore config(std::filesystem::path(dir.path().toStdString())
                                 / "tracker_config.json");
    timekeep::AccountingStore reloaded(config, std::filesystem::path(dir.path().toStdString())
                                                   / "time_tracking.json");
    const auto day = reloaded.snapshotFor(timekeep::dateKeyFor(baseTime()));
    QCOMPARE(day.at("Coding").apps.at(kEditor), 3.0);
}

void TrackingLoopTests::testLongGapIsCapped()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
    f.loop.start();

    f.tickAt(0, kEditor);
    f.tickAt(3600, kEditor);
    QCOMPARE(f.appSeconds("Coding", kEditor), 65.0);
}

void TrackingLoopTests::testMaximumIdleThresholdStillRecords()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", std::numeric_limits<int>::max(), 5);
    f.loop.start();

    f.tickAt(0, kEditor);
    f.tickAt(12, kChat);
    f.now = f.base + std::chrono::seconds(20);
    f.loop.stop();

    QCOMPARE(f.appSeconds("Coding", kEditor), 12.0);
    QCOMPARE(f.appSeconds("Communication", kChat), 8.0);
    QVERIFY(!f.loop.status().persistFailing);
}

void TrackingLoopTests::testProjectTagsFlushedTime()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);
    f.loop.start();

    f.tickAt(0, kEditor);
    f.now = f.base + std::chrono::seconds(4);
    f.loop.setProject(std::string("thesis"));
    f.tickAt(9, kEditor);

    const auto coding = f.store.snapshotFor(timekeep::dateKeyFor(f.base)).at("Coding");
    QCOMPARE(coding.totalSeconds, 9.0);
    QVERIFY(coding.projects.has_value());
    QCOMPARE(coding.projects->at("thesis"), 5.0);
    QCOMPARE(*f.loop.status().currentProject, std::string("thesis"));
}

void TrackingLoopTests::testTicksIgnoredWhenStopped()
{
    QTemporaryDir dir;
    LoopFixture f(dir.path(), "time_tracking.json", 60, 5);

    f.tickAt(0, kEditor);
    f.tickAt(5, kEditor);
    QCOMPARE(f.loop.state(), timekeep::TrackerState::Stopped);
    QCOMPARE(f.appSeconds("Coding", kEditor), 0.0);
}

void TrackingLoopTests::testPersistFailureKeepsTracking()
{
    QTemporaryDir dir;
    // A regular file where the data directory should be makes every write fail.
    QFile blocker(dir.path() + "/blocker");
    QVERIFY(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    LoopFixture f(dir.path(), "blocker/time_tracking.json", 60, 5);
    f.loop.start();
    f.tickAt(0, kEditor);
    f.tickAt(5, kEditor);

    const auto status = f.loop.status();
    QVERIFY(status.persistFailing);
    QVERIFY(f.loop.isRunning());
    QCOMPARE(f.appSeconds("Coding", kEditor), 5.0);

    f.tickAt(10, kEditor);
    QCOMPARE(f.appSeconds("Coding", kEditor), 10.0);

    QVERIFY_EXCEPTION_THROWN(f.loop.stop(), timekeep::StoreWriteError);
}

QTEST_MAIN(TrackingLoopTests)
#include "test_tracking_loop.moc"
