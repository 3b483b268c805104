#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace timekeep {

class AccountingStore;
class ActiveWindowProbe;
class ConfigStore;
class IdleProbe;
class Notifier;

/**
 * TrackingLoop is the sampling state machine:
 * - each tick reads the idle probe, then the active-window probe
 * - time is attributed to at most one app, flushed into the AccountingStore
 *   as wall-clock deltas on continuation, switch, idle and stop
 * - probe failures never stop the loop; three in a row mark it degraded
 *
 * It does not own a timer. The daemon calls tick() once per period and the
 * control methods from any thread; one mutex serializes them.
 */
class TrackingLoop
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kDegradedAfterFailures = 3;

    TrackingLoop(AccountingStore &store,
                 const ConfigStore &config,
                 ActiveWindowProbe &windowProbe,
                 IdleProbe &idleProbe,
                 Notifier &notifier,
                 Clock clock = {});

    // STOPPED -> RUNNING_IDLE. Evaluates streaks for today once.
    StreakOutcome start();
    // Flushes in-flight time and persists. Rethrows StoreWriteError.
    void stop();
    // Suspends without flushing; unflushed time for the current app is dropped.
    void pause();
    void resume();

    void tick();

    void setFocusMode(bool enabled);
    void setProject(std::optional<std::string> projectId);

    TrackerState state() const;
    bool isRunning() const;
    TrackerStatus status() const;

    std::chrono::system_clock::time_point now() const;
    double elapsedSince(std::chrono::system_clock::time_point start) const;
    std::chrono::seconds tickPeriod() const;

private:
    void tickLocked();
    void recordElapsedLocked(std::chrono::system_clock::time_point now,
                             const TrackerConfig &config);
    void flushLocked(std::chrono::system_clock::time_point now, const TrackerConfig &config);
    void persistLocked();
    void clearCurrentLocked();
    void noteProbeFailureLocked(const char *probe, const std::string &reason);
    void clearProbeFailuresLocked();

    AccountingStore &m_store;
    const ConfigStore &m_config;
    ActiveWindowProbe &m_windowProbe;
    IdleProbe &m_idleProbe;
    Notifier &m_notifier;
    Clock m_clock;

    mutable std::mutex m_mutex;
    TrackerState m_state = TrackerState::Stopped;
    std::optional<std::string> m_currentApp;
    std::optional<std::chrono::system_clock::time_point> m_startTime;
    std::optional<std::string> m_currentProject;
    std::optional<std::chrono::system_clock::time_point> m_sessionStart;
    bool m_focusMode = false;
    std::string m_lastBlockedApp;

    int m_probeFailures = 0;
    bool m_degraded = false;
    bool m_persistFailing = false;
};

} // namespace timekeep
