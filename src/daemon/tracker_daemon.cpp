#include "daemon/tracker_daemon.hpp"

#include <chrono>

#include <QTimer>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/timekeep_version.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/config_store.hpp"
#include "daemon/notifier.hpp"
#include "daemon/probes.hpp"
#include "daemon/reminder_engine.hpp"
#include "daemon/tracker_api_server.hpp"
#include "daemon/tracking_loop.hpp"

namespace timekeep {

namespace {

constexpr int kTicksPerReminderCheck = 6;

} // namespace

TrackerDaemon::TrackerDaemon(QObject *parent)
    : QObject(parent)
    , m_config(std::make_unique<ConfigStore>(configFilePath()))
    , m_store(std::make_unique<AccountingStore>(*m_config, dataFilePath()))
    , m_windowProbe(std::make_unique<XdotoolWindowProbe>())
    , m_idleProbe(std::make_unique<XprintidleProbe>())
    , m_notifier(std::make_unique<DesktopNotifier>(*m_config))
{
    m_loop = std::make_unique<TrackingLoop>(*m_store, *m_config, *m_windowProbe,
                                            *m_idleProbe, *m_notifier);
    m_reminders = std::make_unique<ReminderEngine>(*m_store, *m_config, *m_notifier);
    m_samplerThread.setObjectName(QStringLiteral("timekeep-sampler"));
}

TrackerDaemon::~TrackerDaemon()
{
    shutdown();
}

bool TrackerDaemon::start()
{
    qInfo() << "Timekeep: daemon starting (version" << TIMEKEEP_VERSION << ")";

    if (!m_apiServer) {
        m_apiServer = std::make_unique<TrackerApiServer>(*m_loop, *m_store, *m_config);
        if (!m_apiServer->start()) {
            qWarning() << "Timekeep: API server unavailable; front ends cannot reach the daemon.";
        }
    }

    const StreakOutcome outcome = m_loop->start();
    TKLOG_INFO(QStringLiteral("TrackerDaemon"),
               QStringLiteral("start"),
               QStringLiteral("tracking_started"),
               QStringLiteral("daemon_start"),
               QStringLiteral("sampler_thread"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"streakEvaluated", outcome.evaluated},
                               {"currentStreak", outcome.ledger.current},
                               {"periodSeconds", m_loop->tickPeriod().count()}}));

    // The timer lives on the sampler thread so probe subprocesses never
    // block the API server's event loop. The period is fixed for the
    // daemon's lifetime: tick_period_seconds is read once, at startup.
    auto *timer = new QTimer();
    timer->setInterval(std::chrono::duration_cast<std::chrono::milliseconds>(
                           m_loop->tickPeriod())
                           .count());
    timer->moveToThread(&m_samplerThread);
    connect(timer, &QTimer::timeout, timer, [this]() { runSample(); });
    connect(&m_samplerThread, &QThread::started, timer, qOverload<>(&QTimer::start));
    connect(&m_samplerThread, &QThread::finished, timer, &QObject::deleteLater);
    m_samplerThread.start();
    return true;
}

void TrackerDaemon::runSample()
{
    m_loop->tick();

    if (++m_ticksSinceReminderCheck < kTicksPerReminderCheck) {
        return;
    }
    m_ticksSinceReminderCheck = 0;
    if (!m_loop->isRunning()) {
        return;
    }
    try {
        const auto status = m_loop->status();
        m_reminders->evaluate(m_loop->now(), status.sessionStart);
    } catch (const std::exception &ex) {
        qWarning() << "Timekeep: reminder check failed:" << ex.what();
    }
}

void TrackerDaemon::shutdown()
{
    if (m_shutDown) {
        return;
    }
    m_shutDown = true;

    if (m_samplerThread.isRunning()) {
        m_samplerThread.quit();
        m_samplerThread.wait();
    }

    try {
        m_loop->stop();
    } catch (const std::exception &ex) {
        qWarning() << "Timekeep: final save failed, the last interval may be lost:" << ex.what();
        TKLOG_ERROR(QStringLiteral("TrackerDaemon"),
                    QStringLiteral("shutdown"),
                    QStringLiteral("final_persist_failed"),
                    QStringLiteral("daemon_shutdown"),
                    QStringLiteral("final_flush"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
    }
    qInfo() << "Timekeep: daemon stopped";
}

} // namespace timekeep
