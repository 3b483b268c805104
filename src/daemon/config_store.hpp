#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "daemon/classifier.hpp"

namespace timekeep {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ConfigStore owns tracker_config.json. Front ends read and write settings
// only through these calls. Every mutator validates its input, throws
// ConfigError on rejection and saves the whole document on success.
class ConfigStore {
public:
    // Loads path, writing defaults when it does not exist. Throws ConfigError
    // when the file exists but cannot be parsed.
    explicit ConfigStore(std::filesystem::path path);

    TrackerConfig config() const;
    Classifier classifier() const;
    nlohmann::ordered_json document() const;
    const std::filesystem::path &path() const { return m_path; }

    void setIdleThreshold(int seconds);
    void setTickPeriod(int seconds);
    void setBreakReminderInterval(int seconds);
    void setNotificationsEnabled(bool enabled);

    void setGoal(const std::string &category, double hours);
    void removeGoal(const std::string &category);

    // Appends, or replaces the category of an existing pattern in place.
    void addCustomRule(const std::string &pattern, const std::string &category);
    bool removeCustomRule(const std::string &pattern);

    void setExcludedApps(const std::vector<std::string> &patterns);
    void setFocusModeBlocked(const std::vector<std::string> &patterns);
    void setProductiveCategories(const std::vector<std::string> &categories);

    void addProject(const std::string &projectId, const nlohmann::json &metadata);
    bool removeProject(const std::string &projectId);

    void setPassword(const std::string &password);
    void clearPassword();
    bool checkPassword(const std::string &password) const;

    static nlohmann::ordered_json defaultDocument();

private:
    void load();
    void save();
    void rebuildConfig();

    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    nlohmann::ordered_json m_doc;
    TrackerConfig m_config;
};

} // namespace timekeep
