#include "daemon/config_store.hpp"

#include <cmath>
#include <limits>

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QSaveFile>

#include "common/logging.hpp"

namespace timekeep {

namespace {

std::string hashPassword(const std::string &password)
{
    const QByteArray digest = QCryptographicHash::hash(
        QByteArray::fromStdString(password), QCryptographicHash::Sha256);
    return digest.toHex().toStdString();
}

std::vector<std::string> stringList(const nlohmann::ordered_json &doc, const char *key)
{
    std::vector<std::string> out;
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_array()) {
        return out;
    }
    for (const auto &value : *it) {
        if (value.is_string()) {
            out.push_back(value.get<std::string>());
        }
    }
    return out;
}

int intValue(const nlohmann::ordered_json &doc, const char *key, int fallback)
{
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_number()) {
        return fallback;
    }
    const double value = it->get<double>();
    if (!std::isfinite(value) || std::floor(value) != value
        || value < static_cast<double>(std::numeric_limits<int>::min())
        || value > static_cast<double>(std::numeric_limits<int>::max())) {
        throw ConfigError(std::string("Configuration value '") + key
                          + "' is not a whole number of seconds");
    }
    return static_cast<int>(value);
}

std::vector<std::string> validatedPatterns(const std::vector<std::string> &patterns,
                                           const char *what)
{
    std::vector<std::string> out;
    for (const auto &pattern : patterns) {
        if (pattern.empty()) {
            throw ConfigError(std::string("Empty pattern in ") + what);
        }
        out.push_back(toLower(pattern));
    }
    return out;
}

} // namespace

ConfigStore::ConfigStore(std::filesystem::path path)
    : m_path(std::move(path))
{
    std::lock_guard<std::mutex> lock(m_mutex);
    load();
}

nlohmann::ordered_json ConfigStore::defaultDocument()
{
    nlohmann::ordered_json doc;
    doc["idle_threshold_seconds"] = 300;
    doc["tick_period_seconds"] = 5;
    doc["goals"] = nlohmann::ordered_json{{"Coding", 4}, {"Entertainment", 2}};
    doc["custom_categories"] = nlohmann::ordered_json::object();
    doc["excluded_apps"] = nlohmann::ordered_json::array();
    doc["focus_mode_blocked"] = {"facebook", "twitter", "instagram", "tiktok",
                                 "youtube", "netflix", "game"};
    doc["break_reminder_interval"] = 3600;
    doc["notifications_enabled"] = true;
    doc["password_hash"] = nullptr;
    doc["productive_categories"] = {"Coding", "Productivity", "Education"};
    doc["projects"] = nlohmann::ordered_json::object();
    return doc;
}

void ConfigStore::load()
{
    QFile file(QString::fromStdString(m_path.string()));
    if (!file.exists()) {
        m_doc = defaultDocument();
        rebuildConfig();
        save();
        qInfo() << "Timekeep: wrote default configuration to" << file.fileName();
        return;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("Cannot read configuration " + m_path.string() + ": "
                          + file.errorString().toStdString());
    }

    auto parsed = nlohmann::ordered_json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        TKLOG_ERROR(QStringLiteral("ConfigStore"),
                    QStringLiteral("load"),
                    QStringLiteral("config_corrupt"),
                    QStringLiteral("startup"),
                    QStringLiteral("json_parse"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", m_path.string()}}));
        throw ConfigError("Configuration " + m_path.string() + " is not valid JSON");
    }

    // Fill keys added since the file was written, keeping the user's order.
    for (const auto &item : defaultDocument().items()) {
        if (!parsed.contains(item.key())) {
            parsed[item.key()] = item.value();
        }
    }
    m_doc = std::move(parsed);
    rebuildConfig();

    if (m_config.idleThresholdSeconds < 0 || m_config.tickPeriodSeconds <= 0
        || m_config.breakReminderInterval <= 0) {
        throw ConfigError("Configuration " + m_path.string()
                          + " has a negative threshold or a non-positive period");
    }
}

void ConfigStore::save()
{
    QDir().mkpath(QString::fromStdString(m_path.parent_path().string()));

    QSaveFile file(QString::fromStdString(m_path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw ConfigError("Cannot write configuration " + m_path.string() + ": "
                          + file.errorString().toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(
        m_doc.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
    if (file.write(data) != data.size() || !file.commit()) {
        throw ConfigError("Cannot write configuration " + m_path.string() + ": "
                          + file.errorString().toStdString());
    }
}

void ConfigStore::rebuildConfig()
{
    TrackerConfig config;
    config.idleThresholdSeconds = intValue(m_doc, "idle_threshold_seconds", 300);
    config.tickPeriodSeconds = intValue(m_doc, "tick_period_seconds", 5);
    config.breakReminderInterval = intValue(m_doc, "break_reminder_interval", 3600);
    const auto notifications = m_doc.find("notifications_enabled");
    config.notificationsEnabled =
        notifications == m_doc.end() || !notifications->is_boolean() || notifications->get<bool>();

    const auto goals = m_doc.find("goals");
    if (goals != m_doc.end() && goals->is_object()) {
        for (const auto &item : goals->items()) {
            if (item.value().is_number()) {
                config.goals[item.key()] = item.value().get<double>();
            }
        }
    }

    const auto rules = m_doc.find("custom_categories");
    if (rules != m_doc.end() && rules->is_object()) {
        for (const auto &item : rules->items()) {
            if (item.value().is_string()) {
                config.customCategories.emplace_back(item.key(),
                                                     item.value().get<std::string>());
            }
        }
    }

    config.excludedApps = stringList(m_doc, "excluded_apps");
    config.focusModeBlocked = stringList(m_doc, "focus_mode_blocked");
    config.productiveCategories = stringList(m_doc, "productive_categories");

    const auto projects = m_doc.find("projects");
    if (projects != m_doc.end() && projects->is_object()) {
        config.projects = nlohmann::json::parse(projects->dump());
    }

    const auto hash = m_doc.find("password_hash");
    if (hash != m_doc.end() && hash->is_string() && !hash->get<std::string>().empty()) {
        config.passwordHash = hash->get<std::string>();
    }

    m_config = std::move(config);
}

TrackerConfig ConfigStore::config() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

Classifier ConfigStore::classifier() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return Classifier(m_config.customCategories);
}

nlohmann::ordered_json ConfigStore::document() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::ordered_json copy = m_doc;
    // The hash is never handed to front ends.
    copy["password_hash"] = m_config.passwordHash.has_value() ? nlohmann::ordered_json("set")
                                                              : nlohmann::ordered_json(nullptr);
    return copy;
}

void ConfigStore::setIdleThreshold(int seconds)
{
    if (seconds < 0) {
        throw ConfigError("Idle threshold must be non-negative");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["idle_threshold_seconds"] = seconds;
    rebuildConfig();
    save();
}

void ConfigStore::setTickPeriod(int seconds)
{
    if (seconds <= 0) {
        throw ConfigError("Tick period must be positive");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["tick_period_seconds"] = seconds;
    rebuildConfig();
    save();
}

void ConfigStore::setBreakReminderInterval(int seconds)
{
    if (seconds <= 0) {
        throw ConfigError("Break reminder interval must be positive");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["break_reminder_interval"] = seconds;
    rebuildConfig();
    save();
}

void ConfigStore::setNotificationsEnabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["notifications_enabled"] = enabled;
    rebuildConfig();
    save();
}

void ConfigStore::setGoal(const std::string &category, double hours)
{
    if (category.empty()) {
        throw ConfigError("Goal category must not be empty");
    }
    if (!std::isfinite(hours) || hours < 0.0) {
        throw ConfigError("Goal hours must be a non-negative number");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_doc["goals"].is_object()) {
        m_doc["goals"] = nlohmann::ordered_json::object();
    }
    m_doc["goals"][category] = hours;
    rebuildConfig();
    save();
}

void ConfigStore::removeGoal(const std::string &category)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_doc["goals"].is_object()) {
        m_doc["goals"].erase(category);
    }
    rebuildConfig();
    save();
}

void ConfigStore::addCustomRule(const std::string &pattern, const std::string &category)
{
    if (pattern.empty() || category.empty()) {
        throw ConfigError("Custom rules need a pattern and a category");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_doc["custom_categories"].is_object()) {
        m_doc["custom_categories"] = nlohmann::ordered_json::object();
    }
    m_doc["custom_categories"][pattern] = category;
    rebuildConfig();
    save();
}

bool ConfigStore::removeCustomRule(const std::string &pattern)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_doc["custom_categories"].is_object()) {
        return false;
    }
    const bool removed = m_doc["custom_categories"].erase(pattern) > 0;
    if (removed) {
        rebuildConfig();
        save();
    }
    return removed;
}

void ConfigStore::setExcludedApps(const std::vector<std::string> &patterns)
{
    const auto validated = validatedPatterns(patterns, "excluded_apps");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["excluded_apps"] = validated;
    rebuildConfig();
    save();
}

void ConfigStore::setFocusModeBlocked(const std::vector<std::string> &patterns)
{
    const auto validated = validatedPatterns(patterns, "focus_mode_blocked");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["focus_mode_blocked"] = validated;
    rebuildConfig();
    save();
}

void ConfigStore::setProductiveCategories(const std::vector<std::string> &categories)
{
    for (const auto &category : categories) {
        if (category.empty()) {
            throw ConfigError("Empty category in productive_categories");
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["productive_categories"] = categories;
    rebuildConfig();
    save();
}

void ConfigStore::addProject(const std::string &projectId, const nlohmann::json &metadata)
{
    if (projectId.empty()) {
        throw ConfigError("Project id must not be empty");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_doc["projects"].is_object()) {
        m_doc["projects"] = nlohmann::ordered_json::object();
    }
    m_doc["projects"][projectId] = nlohmann::ordered_json::parse(
        metadata.is_null() ? std::string("{}") : metadata.dump());
    rebuildConfig();
    save();
}

bool ConfigStore::removeProject(const std::string &projectId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_doc["projects"].is_object()) {
        return false;
    }
    const bool removed = m_doc["projects"].erase(projectId) > 0;
    if (removed) {
        rebuildConfig();
        save();
    }
    return removed;
}

void ConfigStore::setPassword(const std::string &password)
{
    if (password.empty()) {
        throw ConfigError("Password must not be empty");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["password_hash"] = hashPassword(password);
    rebuildConfig();
    save();
}

void ConfigStore::clearPassword()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_doc["password_hash"] = nullptr;
    rebuildConfig();
    save();
}

bool ConfigStore::checkPassword(const std::string &password) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_config.passwordHash.has_value()) {
        return true;
    }
    return hashPassword(password) == *m_config.passwordHash;
}

} // namespace timekeep
