#include "common/process_utils.hpp"

#include <QLocalSocket>
#include <QStandardPaths>

#include <unistd.h>

#include "common/logging.hpp"

namespace timekeep {

std::filesystem::path dataDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return std::filesystem::path(".local/share/timekeep");
    }
    return std::filesystem::path(home.toStdString()) / ".local/share/timekeep";
}

std::filesystem::path dataFilePath()
{
    return dataDirPath() / "time_tracking.json";
}

std::filesystem::path configFilePath()
{
    return dataDirPath() / "tracker_config.json";
}

QString daemonSocketPath()
{
    const QString socketName = qEnvironmentVariable("TIMEKEEP_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/timekeep.sock");
}

bool isDaemonRunning()
{
    QLocalSocket socket;
    socket.connectToServer(daemonSocketPath());
    if (socket.waitForConnected(200)) {
        socket.disconnectFromServer();
        return true;
    }
    return false;
}

std::optional<nlohmann::json> sendDaemonRequest(const std::string &method,
                                                const nlohmann::json &params,
                                                int timeoutMs)
{
    QLocalSocket socket;
    socket.connectToServer(daemonSocketPath());
    if (!socket.waitForConnected(timeoutMs)) {
        return std::nullopt;
    }

    const nlohmann::json request = {
        {"id", 1},
        {"method", method},
        {"params", params}
    };
    socket.write(QByteArray::fromStdString(request.dump()));
    if (!socket.waitForBytesWritten(timeoutMs)) {
        TKLOG_WARN(QStringLiteral("process_utils"),
                   QStringLiteral("sendDaemonRequest"),
                   QStringLiteral("daemon_write_timeout"),
                   QStringLiteral("client_call"),
                   QStringLiteral("local_socket"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"method", method}}));
        return std::nullopt;
    }

    QByteArray response;
    while (socket.waitForReadyRead(timeoutMs)) {
        response += socket.readAll();
    }
    response += socket.readAll();

    const auto parsed = nlohmann::json::parse(response.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace timekeep
