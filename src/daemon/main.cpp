#include <csignal>
#include <cstdio>
#include <memory>

#include <QCoreApplication>
#include <QDebug>
#include <QSocketNotifier>

#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/config_store.hpp"
#include "daemon/tracker_daemon.hpp"

namespace {

int g_signalFds[2] = {-1, -1};

void handleTerminationSignal(int)
{
    const char byte = 1;
    [[maybe_unused]] const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
}

// SIGINT/SIGTERM quit the event loop so the final interval is flushed.
void installTerminationHandlers(QCoreApplication &app)
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        qWarning() << "Timekeep: cannot install signal handlers";
        return;
    }
    auto *notifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, &app);
    QObject::connect(notifier, &QSocketNotifier::activated, &app, [notifier]() {
        notifier->setEnabled(false);
        char byte = 0;
        [[maybe_unused]] const ssize_t read = ::read(g_signalFds[1], &byte, sizeof(byte));
        QCoreApplication::quit();
    });

    struct sigaction action {};
    action.sa_handler = handleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("timekeep-daemon"));
    qInfo() << "Timekeep daemon starting...";

    bool trace = qEnvironmentVariableIntValue("TIMEKEEP_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    timekeep::logging::initLogging(QStringLiteral("timekeep-daemon"), trace);
    TKLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("default_config"),
               timekeep::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    // A document that cannot be read stops the daemon; it is never replaced.
    std::unique_ptr<timekeep::TrackerDaemon> daemon;
    try {
        daemon = std::make_unique<timekeep::TrackerDaemon>();
    } catch (const timekeep::StoreLoadError &ex) {
        std::fprintf(stderr, "timekeep-daemon: tracking data cannot be loaded: %s\n"
                             "Move the file aside or repair it, then start again.\n",
                     ex.what());
        return 2;
    } catch (const timekeep::ConfigError &ex) {
        std::fprintf(stderr, "timekeep-daemon: configuration cannot be loaded: %s\n", ex.what());
        return 2;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     daemon.get(), &timekeep::TrackerDaemon::shutdown);
    installTerminationHandlers(app);
    daemon->start();

    return app.exec();
}
