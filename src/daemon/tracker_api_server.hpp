#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

namespace timekeep {

class AccountingStore;
class ConfigStore;
class TrackingLoop;

/**
 * TrackerApiServer exposes the tracking loop, the accounting store and the
 * configuration to front ends over a local UNIX socket using a minimal
 * JSON-RPC-like protocol. One request per connection.
 */
class TrackerApiServer : public QObject
{
    Q_OBJECT
public:
    TrackerApiServer(TrackingLoop &loop,
                     AccountingStore &store,
                     ConfigStore &config,
                     QObject *parent = nullptr);
    ~TrackerApiServer() override;

    // Start listening on $XDG_RUNTIME_DIR/timekeep.sock
    bool start();
    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    TrackingLoop &m_loop;
    AccountingStore &m_store;
    ConfigStore &m_config;
    QLocalServer m_server;
};

} // namespace timekeep
