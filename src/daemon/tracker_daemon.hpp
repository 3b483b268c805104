#pragma once

#include <memory>

#include <QObject>
#include <QThread>

namespace timekeep {

class AccountingStore;
class ConfigStore;
class DesktopNotifier;
class ReminderEngine;
class TrackerApiServer;
class TrackingLoop;
class XdotoolWindowProbe;
class XprintidleProbe;

/**
 * TrackerDaemon coordinates:
 * - loading the configuration and accounting documents
 * - driving the TrackingLoop from a timer on a dedicated sampler thread
 * - periodic reminder checks
 * - serving the front-end API on the local socket
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 * Construction throws ConfigError or StoreLoadError when a durable document
 * cannot be read.
 */
class TrackerDaemon : public QObject
{
    Q_OBJECT
public:
    explicit TrackerDaemon(QObject *parent = nullptr);
    ~TrackerDaemon() override;

    // Call this after constructing the daemon to start tracking and serving.
    bool start();
    // Stops the sampler thread, then flushes and persists the final interval.
    void shutdown();

private:
    void runSample();

    std::unique_ptr<ConfigStore> m_config;
    std::unique_ptr<AccountingStore> m_store;
    std::unique_ptr<XdotoolWindowProbe> m_windowProbe;
    std::unique_ptr<XprintidleProbe> m_idleProbe;
    std::unique_ptr<DesktopNotifier> m_notifier;
    std::unique_ptr<TrackingLoop> m_loop;
    std::unique_ptr<ReminderEngine> m_reminders;
    std::unique_ptr<TrackerApiServer> m_apiServer;

    QThread m_samplerThread;
    // Touched only on the sampler thread.
    int m_ticksSinceReminderCheck = 0;
    bool m_shutDown = false;
};

} // namespace timekeep
