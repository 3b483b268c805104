#include "daemon/tracker_api_server.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QUuid>

#include "common/date_keys.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/config_store.hpp"
#include "daemon/goal_evaluator.hpp"
#include "daemon/tracking_loop.hpp"

namespace timekeep {

namespace {

std::string requireString(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("Missing or invalid '") + key + "'");
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("Invalid '") + key + "'");
    }
    return it->get<std::string>();
}

double requireNumber(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_number()) {
        throw std::invalid_argument(std::string("Missing or invalid '") + key + "'");
    }
    return it->get<double>();
}

// A whole number of seconds in [0, INT_MAX]; fractions and overflow are rejected.
int requireSeconds(const nlohmann::json &params, const char *key)
{
    const double value = requireNumber(params, key);
    if (!std::isfinite(value) || std::floor(value) != value || value < 0.0
        || value > static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string("'") + key
                                    + "' must be a whole number of seconds between 0 and "
                                    + std::to_string(std::numeric_limits<int>::max()));
    }
    return static_cast<int>(value);
}

bool requireBool(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_boolean()) {
        throw std::invalid_argument(std::string("Missing or invalid '") + key + "'");
    }
    return it->get<bool>();
}

std::vector<std::string> requireStringList(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_array()) {
        throw std::invalid_argument(std::string("Missing or invalid '") + key + "'");
    }
    std::vector<std::string> values;
    for (const auto &value : *it) {
        if (!value.is_string()) {
            throw std::invalid_argument(std::string("'") + key + "' must contain strings");
        }
        values.push_back(value.get<std::string>());
    }
    return values;
}

// from/to default to today; a lone bound makes a one-day range.
std::pair<std::string, std::string> dateRange(const nlohmann::json &params)
{
    const auto from = optionalString(params, "from");
    const auto to = optionalString(params, "to");
    const std::string fromKey = from.value_or(to.value_or(todayKey()));
    const std::string toKey = to.value_or(fromKey);
    if (!isDateKey(fromKey) || !isDateKey(toKey)) {
        throw std::invalid_argument("Dates must be YYYY-MM-DD");
    }
    if (toKey < fromKey) {
        throw std::invalid_argument("'to' is before 'from'");
    }
    return {fromKey, toKey};
}

nlohmann::json outcomeToJson(const StreakOutcome &outcome)
{
    return nlohmann::json{
        {"evaluated", outcome.evaluated},
        {"goalsMet", outcome.goalsMet},
        {"newRecord", outcome.newRecord},
        {"brokenStreak", outcome.brokenStreak},
        {"streaks", outcome.ledger}
    };
}

} // namespace

TrackerApiServer::TrackerApiServer(TrackingLoop &loop,
                                   AccountingStore &store,
                                   ConfigStore &config,
                                   QObject *parent)
    : QObject(parent)
    , m_loop(loop)
    , m_store(store)
    , m_config(config)
{
}

TrackerApiServer::~TrackerApiServer() = default;

bool TrackerApiServer::start()
{
    const QString socketPath = daemonSocketPath();
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing Timekeep socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on Timekeep socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &TrackerApiServer::handleNewConnection);

    qInfo() << "Timekeep API server listening on" << socketPath;
    return true;
}

void TrackerApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &TrackerApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void TrackerApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    handleRequest(socket, payload);
}

void TrackerApiServer::handleRequest(QLocalSocket *socket, const QByteArray &payload)
{
    if (!socket) {
        return;
    }
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray TrackerApiServer::handleRequestPayload(const QByteArray &payload)
{
    // All requests are local-only via UNIX socket.
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        TKLOG_WARN(QStringLiteral("TrackerApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        TKLOG_WARN(QStringLiteral("TrackerApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("missing_method"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params") && !parsed["params"].is_null()) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    TKLOG_INFO(QStringLiteral("TrackerApiServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("api_request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_rpc"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method}, {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = dispatch(method, params);
        if (result.is_discarded()) {
            TKLOG_WARN(QStringLiteral("TrackerApiServer"),
                       QStringLiteral("handleRequest"),
                       QStringLiteral("api_request_error"),
                       QStringLiteral("unknown_method"),
                       QStringLiteral("json_rpc"),
                       logging::defaultWho(),
                       corrId,
                       (nlohmann::json{{"method", method}}));
            return makeErrorResponse("Unknown method", id);
        }
        TKLOG_INFO(QStringLiteral("TrackerApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_completed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method},
                                  {"durationMs",
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const std::exception &ex) {
        TKLOG_ERROR(QStringLiteral("TrackerApiServer"),
                    QStringLiteral("handleRequest"),
                    QStringLiteral("api_request_error"),
                    QStringLiteral("exception"),
                    QStringLiteral("json_rpc"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    }
}

// Returns a discarded value for methods it does not know.
nlohmann::json TrackerApiServer::dispatch(const std::string &method,
                                          const nlohmann::json &params)
{
    if (method == "status") {
        return nlohmann::json(m_loop.status());
    }

    if (method == "start") {
        const bool wasStopped = m_loop.state() == TrackerState::Stopped;
        const StreakOutcome outcome = m_loop.start();
        nlohmann::json result = outcomeToJson(outcome);
        result["started"] = wasStopped;
        result["state"] = toStateString(m_loop.state());
        return result;
    }

    if (method == "stop") {
        m_loop.stop();
        return nlohmann::json{{"state", toStateString(m_loop.state())}};
    }

    if (method == "pause") {
        m_loop.pause();
        return nlohmann::json{{"state", toStateString(m_loop.state())}};
    }

    if (method == "resume") {
        m_loop.resume();
        return nlohmann::json{{"state", toStateString(m_loop.state())}};
    }

    if (method == "set_focus_mode") {
        const bool enabled = requireBool(params, "enabled");
        m_loop.setFocusMode(enabled);
        return nlohmann::json{{"focusMode", enabled}};
    }

    if (method == "set_project") {
        const auto project = optionalString(params, "project");
        if (project.has_value() && !project->empty()
            && !m_config.config().projects.contains(*project)) {
            throw std::invalid_argument("Unknown project '" + *project + "'");
        }
        m_loop.setProject(project);
        return nlohmann::json{{"project", project.has_value() && !project->empty()
                                              ? nlohmann::json(*project)
                                              : nlohmann::json(nullptr)}};
    }

    if (method == "get_snapshot") {
        const auto [from, to] = dateRange(params);
        nlohmann::json days = nlohmann::json::object();
        for (const auto &[dateKey, day] : m_store.snapshotRange(from, to)) {
            days[dateKey] = day;
        }
        return nlohmann::json{{"from", from}, {"to", to}, {"days", days}};
    }

    if (method == "record_manual") {
        const std::string app = requireString(params, "app");
        const std::string category = requireString(params, "category");
        const double minutes = requireNumber(params, "minutes");
        const auto project = optionalString(params, "project");
        const auto date = optionalString(params, "date");
        m_store.manualEntry(app, category, minutes, project, date);
        return nlohmann::json{{"recorded", true},
                              {"date", date.value_or(todayKey())},
                              {"seconds", minutes * 60.0}};
    }

    if (method == "export_range") {
        const auto [from, to] = dateRange(params);
        return nlohmann::json{{"rows", m_store.exportRange(from, to)}};
    }

    if (method == "goals_today") {
        const TrackerConfig config = m_config.config();
        nlohmann::json result = GoalEvaluator::evaluate(m_store.snapshotFor(todayKey()), config);
        result["streaks"] = m_store.streaks();
        return result;
    }

    if (method == "get_config") {
        nlohmann::json result = nlohmann::json::parse(m_config.document().dump());
        // JSON objects do not keep order on the way out; rules are listed again in order.
        nlohmann::json rules = nlohmann::json::array();
        for (const auto &[pattern, category] : m_config.config().customCategories) {
            rules.push_back({{"pattern", pattern}, {"category", category}});
        }
        result["custom_rules"] = rules;
        return result;
    }

    if (method == "set_idle_threshold") {
        m_config.setIdleThreshold(requireSeconds(params, "seconds"));
        return nlohmann::json{{"idle_threshold_seconds", m_config.config().idleThresholdSeconds}};
    }

    if (method == "set_goal") {
        const std::string category = requireString(params, "category");
        const auto hours = params.find("hours");
        if (hours != params.end() && hours->is_null()) {
            m_config.removeGoal(category);
        } else {
            m_config.setGoal(category, requireNumber(params, "hours"));
        }
        return nlohmann::json{{"goals", m_config.config().goals}};
    }

    if (method == "add_custom_rule") {
        m_config.addCustomRule(requireString(params, "pattern"), requireString(params, "category"));
        return nlohmann::json{{"rules", m_config.config().customCategories.size()}};
    }

    if (method == "remove_custom_rule") {
        const bool removed = m_config.removeCustomRule(requireString(params, "pattern"));
        return nlohmann::json{{"removed", removed}};
    }

    if (method == "set_excluded_apps") {
        m_config.setExcludedApps(requireStringList(params, "patterns"));
        return nlohmann::json{{"excluded_apps", m_config.config().excludedApps}};
    }

    if (method == "set_focus_blocklist") {
        m_config.setFocusModeBlocked(requireStringList(params, "patterns"));
        return nlohmann::json{{"focus_mode_blocked", m_config.config().focusModeBlocked}};
    }

    if (method == "clear_data") {
        const auto confirm = params.find("confirm");
        if (confirm == params.end() || !confirm->is_boolean() || !confirm->get<bool>()) {
            throw std::invalid_argument("clear_data requires \"confirm\": true");
        }
        const auto password = optionalString(params, "password");
        if (!m_config.checkPassword(password.value_or(std::string()))) {
            throw std::invalid_argument("Password required");
        }
        m_store.clearAll();
        return nlohmann::json{{"cleared", true}};
    }

    return nlohmann::json(nlohmann::json::value_t::discarded);
}

QByteArray TrackerApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

QByteArray TrackerApiServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace timekeep
