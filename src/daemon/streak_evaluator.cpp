#include "daemon/streak_evaluator.hpp"

#include <algorithm>

#include "common/date_keys.hpp"
#include "common/logging.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/goal_evaluator.hpp"

namespace timekeep {

bool StreakEvaluator::goalsMet(const DayRecord &day, const TrackerConfig &config)
{
    for (const auto &[category, goalHours] : config.goals) {
        const bool productive = std::find(config.productiveCategories.begin(),
                                          config.productiveCategories.end(),
                                          category)
            != config.productiveCategories.end();
        if (!productive) {
            continue;
        }
        if (GoalEvaluator::categorySeconds(day, category) / 3600.0 < goalHours) {
            return false;
        }
    }
    return true;
}

StreakOutcome StreakEvaluator::updateStreaks(AccountingStore &store,
                                             const TrackerConfig &config,
                                             const std::string &today)
{
    StreakOutcome outcome;
    StreakLedger ledger = store.streaks();

    if (ledger.lastDate.has_value() && *ledger.lastDate == today) {
        outcome.ledger = ledger;
        return outcome;
    }

    const std::string yesterday = addDays(today, -1);
    const auto keys = store.dateKeys();
    const bool trackedYesterday = std::find(keys.begin(), keys.end(), yesterday) != keys.end();

    // A day with no tracking at all cannot have met its goals.
    outcome.evaluated = true;
    outcome.goalsMet = trackedYesterday && goalsMet(store.snapshotFor(yesterday), config);

    if (outcome.goalsMet) {
        // Yesterday's evaluation covered the day before yesterday, so the
        // streak is unbroken only if the ledger was last updated yesterday.
        if (ledger.lastDate.has_value() && *ledger.lastDate == yesterday) {
            ledger.current += 1;
        } else {
            ledger.current = 1;
        }
        if (ledger.current > ledger.longest) {
            ledger.longest = ledger.current;
            outcome.newRecord = true;
        }
    } else {
        outcome.brokenStreak = ledger.current;
        ledger.current = 0;
    }

    ledger.longest = std::max(ledger.longest, ledger.current);
    ledger.lastDate = today;
    store.setStreaks(ledger);
    outcome.ledger = ledger;

    TKLOG_INFO(QStringLiteral("StreakEvaluator"),
               QStringLiteral("updateStreaks"),
               QStringLiteral("streaks_updated"),
               QStringLiteral("daily_evaluation"),
               QStringLiteral("yesterday_goals"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"today", today},
                               {"goalsMet", outcome.goalsMet},
                               {"current", ledger.current},
                               {"longest", ledger.longest}}));
    return outcome;
}

} // namespace timekeep
