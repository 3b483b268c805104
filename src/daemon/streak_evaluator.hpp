#pragma once

#include <string>

#include "common/models.hpp"

namespace timekeep {

class AccountingStore;

// StreakEvaluator updates the streak ledger from yesterday's totals. The
// ledger's lastDate is the day the last evaluation ran, so running twice on
// the same day changes nothing. It only mutates the store in memory; the
// caller persists.
class StreakEvaluator
{
public:
    static StreakOutcome updateStreaks(AccountingStore &store,
                                       const TrackerConfig &config,
                                       const std::string &today);

    // True when every productive category with a goal reached it on day.
    static bool goalsMet(const DayRecord &day, const TrackerConfig &config);
};

} // namespace timekeep
