#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace timekeep {

class GoalEvaluator
{
public:
    // Progress per configured goal plus the day's productivity score. Goals
    // for categories with no data report 0 hours.
    static GoalReport evaluate(const DayRecord &day, const TrackerConfig &config);

    // productive_seconds / total_seconds * 100, or 0 for an empty day.
    static double productivityScore(const DayRecord &day,
                                    const std::vector<std::string> &productiveCategories);

    static double categorySeconds(const DayRecord &day, const std::string &category);
    static double totalSeconds(const DayRecord &day);
};

} // namespace timekeep
