#include "daemon/tracking_loop.hpp"

#include <algorithm>

#include <QDebug>

#include "common/date_keys.hpp"
#include "common/logging.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/classifier.hpp"
#include "daemon/config_store.hpp"
#include "daemon/notifier.hpp"
#include "daemon/probes.hpp"
#include "daemon/streak_evaluator.hpp"

namespace timekeep {

namespace {

double secondsBetween(std::chrono::system_clock::time_point from,
                      std::chrono::system_clock::time_point to)
{
    return std::chrono::duration<double>(to - from).count();
}

std::string shorten(const std::string &value, std::size_t length)
{
    return value.size() <= length ? value : value.substr(0, length);
}

} // namespace

TrackingLoop::TrackingLoop(AccountingStore &store,
                           const ConfigStore &config,
                           ActiveWindowProbe &windowProbe,
                           IdleProbe &idleProbe,
                           Notifier &notifier,
                           Clock clock)
    : m_store(store)
    , m_config(config)
    , m_windowProbe(windowProbe)
    , m_idleProbe(idleProbe)
    , m_notifier(notifier)
    , m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

std::chrono::system_clock::time_point TrackingLoop::now() const
{
    return m_clock();
}

double TrackingLoop::elapsedSince(std::chrono::system_clock::time_point start) const
{
    return secondsBetween(start, now());
}

std::chrono::seconds TrackingLoop::tickPeriod() const
{
    return std::chrono::seconds(m_config.config().tickPeriodSeconds);
}

StreakOutcome TrackingLoop::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != TrackerState::Stopped) {
        return StreakOutcome{};
    }

    const auto startedAt = now();
    const TrackerConfig config = m_config.config();
    m_sessionStart = startedAt;
    clearCurrentLocked();
    m_lastBlockedApp.clear();
    m_probeFailures = 0;
    m_degraded = false;
    m_state = TrackerState::RunningIdle;

    qInfo() << "Timekeep: tracking started, idle threshold" << config.idleThresholdSeconds
            << "s, period" << config.tickPeriodSeconds << "s";

    const StreakOutcome outcome =
        StreakEvaluator::updateStreaks(m_store, config, dateKeyFor(startedAt));
    if (outcome.evaluated) {
        persistLocked();
    }
    if (outcome.newRecord) {
        m_notifier.notify("New Record!", "New longest streak: "
                                             + std::to_string(outcome.ledger.longest)
                                             + " days!");
    }
    if (outcome.brokenStreak > 0) {
        m_notifier.notify("Streak Broken", "Your " + std::to_string(outcome.brokenStreak)
                                               + " day streak has ended");
    }
    return outcome;
}

void TrackingLoop::stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == TrackerState::Stopped) {
        return;
    }

    if (m_state != TrackerState::Paused) {
        recordElapsedLocked(now(), m_config.config());
    }
    clearCurrentLocked();
    m_sessionStart.reset();
    m_state = TrackerState::Stopped;

    // The final interval must reach disk; failures go to the caller.
    m_store.persist();
    m_persistFailing = false;

    TKLOG_INFO(QStringLiteral("TrackingLoop"),
               QStringLiteral("stop"),
               QStringLiteral("tracking_stopped"),
               QStringLiteral("user_stop"),
               QStringLiteral("final_flush"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());
}

void TrackingLoop::pause()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != TrackerState::RunningActive && m_state != TrackerState::RunningIdle) {
        return;
    }
    clearCurrentLocked();
    m_state = TrackerState::Paused;
    m_notifier.notify("Paused", "Tracking paused");
}

void TrackingLoop::resume()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != TrackerState::Paused) {
        return;
    }
    m_state = TrackerState::RunningIdle;
    m_notifier.notify("Resumed", "Tracking resumed");
}

void TrackingLoop::setFocusMode(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_focusMode == enabled) {
        return;
    }
    m_focusMode = enabled;
    m_lastBlockedApp.clear();
    m_notifier.notify("Focus Mode", enabled ? "Focus mode activated" : "Focus mode deactivated");
}

void TrackingLoop::setProject(std::optional<std::string> projectId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (projectId.has_value() && projectId->empty()) {
        projectId.reset();
    }
    if (projectId == m_currentProject) {
        return;
    }
    // Time so far belongs to the previous project.
    if (m_state == TrackerState::RunningActive && m_currentApp.has_value()) {
        const auto flushedAt = now();
        flushLocked(flushedAt, m_config.config());
        m_startTime = flushedAt;
    }
    m_currentProject = std::move(projectId);
}

TrackerState TrackingLoop::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool TrackingLoop::isRunning() const
{
    const TrackerState current = state();
    return current == TrackerState::RunningActive || current == TrackerState::RunningIdle;
}

TrackerStatus TrackingLoop::status() const
{
    TrackerStatus status;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        status.state = m_state;
        status.currentApp = m_currentApp;
        status.currentProject = m_currentProject;
        status.focusMode = m_focusMode;
        status.sessionStart = m_sessionStart;
        status.consecutiveProbeFailures = m_probeFailures;
        status.degraded = m_degraded;
        status.persistFailing = m_persistFailing;
        if (m_startTime.has_value()) {
            status.currentAppSeconds = std::max(0.0, secondsBetween(*m_startTime, now()));
        }
    }
    if (status.currentApp.has_value()) {
        status.currentCategory = m_config.classifier().classify(*status.currentApp);
    }
    status.unknownApps = m_store.unknownApps();
    return status;
}

void TrackingLoop::tick()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == TrackerState::Stopped || m_state == TrackerState::Paused) {
        return;
    }

    try {
        tickLocked();
    } catch (const std::exception &error) {
        // One bad sample never ends tracking.
        TKLOG_WARN(QStringLiteral("TrackingLoop"),
                   QStringLiteral("tick"),
                   QStringLiteral("tick_failed"),
                   QStringLiteral("sample_error"),
                   QStringLiteral("exception"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", error.what()}}));
    }
}

void TrackingLoop::tickLocked()
{
    const TrackerConfig config = m_config.config();

    if (m_persistFailing) {
        persistLocked();
    }

    const ProbeResult<double> idle = m_idleProbe.idleSeconds();
    if (!idle.isKnown()) {
        noteProbeFailureLocked("idle", idle.reason());
        return;
    }

    if (idle.value() >= config.idleThresholdSeconds) {
        clearProbeFailuresLocked();
        if (m_currentApp.has_value()) {
            TKLOG_DEBUG(QStringLiteral("TrackingLoop"),
                        QStringLiteral("tickLocked"),
                        QStringLiteral("idle_detected"),
                        QStringLiteral("no_input"),
                        QStringLiteral("idle_probe"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"idleSeconds", idle.value()},
                                        {"app", *m_currentApp}}));
            flushLocked(now(), config);
        }
        clearCurrentLocked();
        m_state = TrackerState::RunningIdle;
        return;
    }

    const ProbeResult<std::string> window = m_windowProbe.activeWindow();
    if (!window.isKnown()) {
        noteProbeFailureLocked("active_window", window.reason());
        return;
    }
    if (window.value().empty() || window.value() == kUnknownApp) {
        noteProbeFailureLocked("active_window", "unknown window");
        return;
    }
    clearProbeFailuresLocked();

    const std::string &app = window.value();
    const auto sampledAt = now();

    if (m_focusMode && matchesAnyPattern(app, config.focusModeBlocked)) {
        // Blocked apps accrue nothing; whatever ran before stops here.
        if (m_currentApp.has_value()) {
            flushLocked(sampledAt, config);
        }
        clearCurrentLocked();
        m_state = TrackerState::RunningIdle;
        if (app != m_lastBlockedApp) {
            m_lastBlockedApp = app;
            m_notifier.notify("Blocked App", shorten(app, 30) + " is blocked in focus mode");
        }
        return;
    }
    m_lastBlockedApp.clear();

    if (m_currentApp.has_value() && *m_currentApp == app) {
        if (secondsBetween(*m_startTime, sampledAt) >= config.tickPeriodSeconds) {
            flushLocked(sampledAt, config);
            m_startTime = sampledAt;
        }
        return;
    }

    // Switch: the previous app's time is closed before the new app starts.
    if (m_currentApp.has_value()) {
        flushLocked(sampledAt, config);
    }
    m_currentApp = app;
    m_startTime = sampledAt;
    m_state = TrackerState::RunningActive;

    TKLOG_DEBUG(QStringLiteral("TrackingLoop"),
                QStringLiteral("tickLocked"),
                QStringLiteral("app_switched"),
                QStringLiteral("foreground_changed"),
                QStringLiteral("window_probe"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"app", shorten(app, 60)}}));
}

void TrackingLoop::recordElapsedLocked(std::chrono::system_clock::time_point flushedAt,
                                       const TrackerConfig &config)
{
    if (!m_currentApp.has_value() || !m_startTime.has_value()) {
        return;
    }

    double elapsed = secondsBetween(*m_startTime, flushedAt);
    if (elapsed < 0.0) {
        elapsed = 0.0;
    }

    // A gap longer than idle threshold plus one period means the loop did
    // not run (suspend, stalled process); the user cannot have been active
    // for all of it without an idle sample in between.
    // Summed in double: a threshold of INT_MAX means "never idle".
    const double cap = static_cast<double>(config.idleThresholdSeconds)
        + static_cast<double>(config.tickPeriodSeconds);
    if (elapsed > cap) {
        TKLOG_WARN(QStringLiteral("TrackingLoop"),
                   QStringLiteral("recordElapsedLocked"),
                   QStringLiteral("elapsed_clamped"),
                   QStringLiteral("wall_clock_gap"),
                   QStringLiteral("increment_cap"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"elapsed", elapsed}, {"cap", cap}}));
        elapsed = cap;
    }

    m_store.record(*m_currentApp, elapsed, m_currentProject, dateKeyFor(flushedAt));
}

void TrackingLoop::flushLocked(std::chrono::system_clock::time_point flushedAt,
                               const TrackerConfig &config)
{
    recordElapsedLocked(flushedAt, config);
    persistLocked();
}

void TrackingLoop::persistLocked()
{
    try {
        m_store.persist();
        if (m_persistFailing) {
            qInfo() << "Timekeep: tracking data saved again after earlier failures";
        }
        m_persistFailing = false;
    } catch (const StoreWriteError &error) {
        // The in-memory store stays authoritative; the next tick retries.
        if (!m_persistFailing) {
            qWarning() << "Timekeep: failed to save tracking data:" << error.what();
        }
        TKLOG_ERROR(QStringLiteral("TrackingLoop"),
                    QStringLiteral("persistLocked"),
                    QStringLiteral("persist_failed"),
                    QStringLiteral("disk_write"),
                    QStringLiteral("retry_next_tick"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", error.what()}}));
        m_persistFailing = true;
    }
}

void TrackingLoop::clearCurrentLocked()
{
    m_currentApp.reset();
    m_startTime.reset();
}

void TrackingLoop::noteProbeFailureLocked(const char *probe, const std::string &reason)
{
    ++m_probeFailures;
    TKLOG_DEBUG(QStringLiteral("TrackingLoop"),
                QStringLiteral("noteProbeFailureLocked"),
                QStringLiteral("probe_unavailable"),
                QStringLiteral("os_probe"),
                QString::fromUtf8(probe),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"reason", reason}, {"consecutive", m_probeFailures}}));

    if (m_probeFailures >= kDegradedAfterFailures && !m_degraded) {
        m_degraded = true;
        qWarning() << "Timekeep: probes failing repeatedly, tracking is degraded:"
                   << QString::fromStdString(reason);
        TKLOG_WARN(QStringLiteral("TrackingLoop"),
                   QStringLiteral("noteProbeFailureLocked"),
                   QStringLiteral("tracking_degraded"),
                   QStringLiteral("repeated_probe_failure"),
                   QString::fromUtf8(probe),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"reason", reason}}));
    }
}

void TrackingLoop::clearProbeFailuresLocked()
{
    if (m_degraded) {
        qInfo() << "Timekeep: probes recovered";
    }
    m_probeFailures = 0;
    m_degraded = false;
}

} // namespace timekeep
