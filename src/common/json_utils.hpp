#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace timekeep {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toStateString(TrackerState state)
{
    switch (state) {
    case TrackerState::Stopped:
        return "stopped";
    case TrackerState::RunningActive:
        return "running_active";
    case TrackerState::RunningIdle:
        return "running_idle";
    case TrackerState::Paused:
        return "paused";
    }
    return "stopped";
}

inline std::string toReminderKindString(ReminderKind kind)
{
    switch (kind) {
    case ReminderKind::GoalAchieved:
        return "goal_achieved";
    case ReminderKind::LimitWarning:
        return "limit_warning";
    case ReminderKind::BreakReminder:
        return "break_reminder";
    }
    return "goal_achieved";
}

// Thrown by the from_json overloads below when a document does not have the
// shape of an accounting document.
class MalformedDocument : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline std::map<std::string, double> secondsMapFromJson(const nlohmann::json &j,
                                                        const std::string &what)
{
    if (!j.is_object()) {
        throw MalformedDocument(what + " is not an object");
    }
    std::map<std::string, double> out;
    for (const auto &item : j.items()) {
        if (!item.value().is_number()) {
            throw MalformedDocument(what + "." + item.key() + " is not a number");
        }
        out[item.key()] = item.value().get<double>();
    }
    return out;
}

inline void to_json(nlohmann::json &j, const CategoryBucket &bucket)
{
    j = nlohmann::json{
        {"total_seconds", bucket.totalSeconds},
        {"apps", bucket.apps}
    };
    if (bucket.projects.has_value()) {
        j["projects"] = *bucket.projects;
    }
}

inline void from_json(const nlohmann::json &j, CategoryBucket &bucket)
{
    if (!j.is_object()) {
        throw MalformedDocument("category bucket is not an object");
    }
    const auto total = j.find("total_seconds");
    if (total == j.end() || !total->is_number()) {
        throw MalformedDocument("category bucket has no numeric total_seconds");
    }
    bucket.totalSeconds = total->get<double>();

    const auto apps = j.find("apps");
    bucket.apps = apps == j.end() ? std::map<std::string, double>{}
                                  : secondsMapFromJson(*apps, "apps");

    // Older documents wrote "projects": null for untagged buckets.
    const auto projects = j.find("projects");
    if (projects == j.end() || projects->is_null()) {
        bucket.projects.reset();
    } else {
        bucket.projects = secondsMapFromJson(*projects, "projects");
    }
}

inline void to_json(nlohmann::json &j, const StreakLedger &ledger)
{
    j = nlohmann::json{
        {"current", ledger.current},
        {"longest", ledger.longest},
        {"last_date", ledger.lastDate.has_value() ? nlohmann::json(*ledger.lastDate)
                                                  : nlohmann::json(nullptr)}
    };
}

inline void from_json(const nlohmann::json &j, StreakLedger &ledger)
{
    if (!j.is_object()) {
        throw MalformedDocument("streaks is not an object");
    }
    const auto count = [&j](const char *key) {
        const auto it = j.find(key);
        if (it == j.end()) {
            return 0;
        }
        if (!it->is_number_integer() || it->get<long long>() < 0
            || it->get<long long>() > std::numeric_limits<int>::max()) {
            throw MalformedDocument(std::string("streaks.") + key
                                    + " is not a non-negative integer");
        }
        return it->get<int>();
    };
    ledger.current = count("current");
    ledger.longest = count("longest");
    if (ledger.longest < ledger.current) {
        throw MalformedDocument("streaks.longest is shorter than streaks.current");
    }

    const auto lastDate = j.find("last_date");
    if (lastDate == j.end() || lastDate->is_null()) {
        ledger.lastDate.reset();
    } else if (lastDate->is_string()) {
        ledger.lastDate = lastDate->get<std::string>();
    } else {
        throw MalformedDocument("streaks.last_date is not a string");
    }
}

inline void to_json(nlohmann::json &j, const ExportRow &row)
{
    j = nlohmann::json{
        {"date", row.date},
        {"category", row.category},
        {"app", row.app},
        {"hours", row.hours},
        {"project", row.project}
    };
}

inline void to_json(nlohmann::json &j, const CategoryProgress &progress)
{
    j = nlohmann::json{
        {"category", progress.category},
        {"hours", progress.hours},
        {"goalHours", progress.goalHours},
        {"progressPct", progress.progressPct},
        {"met", progress.met}
    };
}

inline void to_json(nlohmann::json &j, const GoalReport &report)
{
    j = nlohmann::json{
        {"categories", report.categories},
        {"totalSeconds", report.totalSeconds},
        {"productiveSeconds", report.productiveSeconds},
        {"productivityScore", report.productivityScore}
    };
}

inline void to_json(nlohmann::json &j, const TrackerStatus &status)
{
    j = nlohmann::json{
        {"state", toStateString(status.state)},
        {"currentApp", status.currentApp.has_value() ? nlohmann::json(*status.currentApp)
                                                     : nlohmann::json(nullptr)},
        {"currentCategory", status.currentCategory},
        {"currentProject", status.currentProject.has_value()
                               ? nlohmann::json(*status.currentProject)
                               : nlohmann::json(nullptr)},
        {"focusMode", status.focusMode},
        {"sessionStart", status.sessionStart.has_value()
                             ? nlohmann::json(toIso8601Utc(*status.sessionStart))
                             : nlohmann::json(nullptr)},
        {"currentAppSeconds", status.currentAppSeconds},
        {"consecutiveProbeFailures", status.consecutiveProbeFailures},
        {"degraded", status.degraded},
        {"persistFailing", status.persistFailing},
        {"unknownApps", status.unknownApps}
    };
}

} // namespace timekeep
