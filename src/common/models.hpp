#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace timekeep {

inline constexpr const char *kOtherCategory = "Other";
inline constexpr const char *kUnknownApp = "Unknown";
inline constexpr const char *kStreaksKey = "streaks";

// One category's accumulated time for one calendar day.
struct CategoryBucket {
    double totalSeconds = 0.0;
    std::map<std::string, double> apps;
    // Present only once the category has received project-tagged time.
    std::optional<std::map<std::string, double>> projects;

    bool operator==(const CategoryBucket &other) const
    {
        return totalSeconds == other.totalSeconds && apps == other.apps
            && projects == other.projects;
    }
};

// CategoryId -> bucket for one YYYY-MM-DD date key.
using DayRecord = std::map<std::string, CategoryBucket>;

// Date key -> day. Never contains the reserved "streaks" key.
using DayRange = std::map<std::string, DayRecord>;

struct StreakLedger {
    int current = 0;
    int longest = 0;
    std::optional<std::string> lastDate;

    bool operator==(const StreakLedger &other) const
    {
        return current == other.current && longest == other.longest
            && lastDate == other.lastDate;
    }
};

// Custom rules are (pattern, category) pairs; order is significant.
using CustomRules = std::vector<std::pair<std::string, std::string>>;

struct TrackerConfig {
    int idleThresholdSeconds = 300;
    int tickPeriodSeconds = 5;
    int breakReminderInterval = 3600;
    bool notificationsEnabled = true;
    std::map<std::string, double> goals;
    CustomRules customCategories;
    std::vector<std::string> excludedApps;
    std::vector<std::string> focusModeBlocked;
    std::vector<std::string> productiveCategories;
    nlohmann::json projects = nlohmann::json::object();
    std::optional<std::string> passwordHash;
};

struct ExportRow {
    std::string date;
    std::string category;
    std::string app;
    double hours = 0.0;
    std::string project;
};

struct CategoryProgress {
    std::string category;
    double hours = 0.0;
    double goalHours = 0.0;
    double progressPct = 0.0;
    bool met = false;
};

struct GoalReport {
    std::vector<CategoryProgress> categories;
    double totalSeconds = 0.0;
    double productiveSeconds = 0.0;
    double productivityScore = 0.0;
};

struct StreakOutcome {
    bool evaluated = false;
    bool goalsMet = false;
    bool newRecord = false;
    // Length of the streak that ended, 0 when nothing was broken.
    int brokenStreak = 0;
    StreakLedger ledger;
};

struct Reminder {
    ReminderKind kind;
    std::string key;
    std::string title;
    std::string message;
};

struct TrackerStatus {
    TrackerState state = TrackerState::Stopped;
    std::optional<std::string> currentApp;
    std::string currentCategory;
    std::optional<std::string> currentProject;
    bool focusMode = false;
    std::optional<std::chrono::system_clock::time_point> sessionStart;
    double currentAppSeconds = 0.0;
    int consecutiveProbeFailures = 0;
    bool degraded = false;
    bool persistFailing = false;
    std::set<std::string> unknownApps;
};

} // namespace timekeep
