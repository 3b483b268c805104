#include "daemon/reminder_engine.hpp"

#include <iomanip>
#include <sstream>

#include "common/date_keys.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/config_store.hpp"
#include "daemon/notifier.hpp"

namespace timekeep {

namespace {

constexpr const char *kLimitedCategory = "Entertainment";
constexpr double kLimitFactor = 1.5;

std::string formatHours(double hours)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << hours;
    return out.str();
}

std::string formatGoal(double hours)
{
    std::ostringstream out;
    out << hours;
    return out.str();
}

} // namespace

ReminderEngine::ReminderEngine(const AccountingStore &store,
                               const ConfigStore &config,
                               Notifier &notifier)
    : m_store(store)
    , m_config(config)
    , m_notifier(notifier)
{
}

void ReminderEngine::emit(std::vector<Reminder> &out, Reminder reminder)
{
    if (reminder.kind == ReminderKind::BreakReminder) {
        if (reminder.key == m_lastBreakKey) {
            return;
        }
        m_lastBreakKey = reminder.key;
    } else if (!m_sentKeys.insert(reminder.key).second) {
        return;
    }

    TKLOG_INFO(QStringLiteral("ReminderEngine"),
               QStringLiteral("emit"),
               QStringLiteral("reminder_sent"),
               QStringLiteral("threshold_reached"),
               QStringLiteral("notifier"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"kind", toReminderKindString(reminder.kind)},
                               {"key", reminder.key}}));

    m_notifier.notify(reminder.title, reminder.message);
    out.push_back(std::move(reminder));
}

std::size_t ReminderEngine::rememberedKeyCount() const
{
    return m_sentKeys.size() + (m_lastBreakKey.empty() ? 0 : 1);
}

std::vector<Reminder> ReminderEngine::evaluate(
    std::chrono::system_clock::time_point now,
    std::optional<std::chrono::system_clock::time_point> sessionStart)
{
    std::vector<Reminder> sent;
    const TrackerConfig config = m_config.config();
    const std::string today = dateKeyFor(now);
    if (today != m_keysDay) {
        m_sentKeys.clear();
        m_keysDay = today;
    }
    const DayRecord day = m_store.snapshotFor(today);

    for (const auto &[category, goalHours] : config.goals) {
        const auto bucket = day.find(category);
        if (bucket == day.end()) {
            continue;
        }
        const double hours = bucket->second.totalSeconds / 3600.0;

        if (hours >= goalHours) {
            emit(sent, {ReminderKind::GoalAchieved,
                        "goal_" + category + "_" + today,
                        "Goal Achieved!",
                        "You've hit your " + category + " goal of " + formatGoal(goalHours)
                            + "h today!"});
        }

        if (category == kLimitedCategory && hours > goalHours * kLimitFactor) {
            emit(sent, {ReminderKind::LimitWarning,
                        "warn_" + category + "_" + today,
                        "Limit Warning",
                        "You've spent " + formatHours(hours) + "h on " + category
                            + " today (limit: " + formatGoal(goalHours) + "h)"});
        }
    }

    if (sessionStart.has_value() && config.breakReminderInterval > 0) {
        const auto interval = std::chrono::seconds(config.breakReminderInterval);
        if (now - *sessionStart > interval) {
            const auto epochSeconds =
                std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
            const long long bucket = epochSeconds / config.breakReminderInterval;
            emit(sent, {ReminderKind::BreakReminder,
                        "break_" + std::to_string(bucket),
                        "Take a Break!",
                        "You've been working for "
                            + std::to_string(config.breakReminderInterval / 60)
                            + " minutes. Time for a break!"});
        }
    }

    return sent;
}

} // namespace timekeep
