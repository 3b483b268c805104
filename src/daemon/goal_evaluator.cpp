#include "daemon/goal_evaluator.hpp"

#include <algorithm>

namespace timekeep {

double GoalEvaluator::categorySeconds(const DayRecord &day, const std::string &category)
{
    const auto it = day.find(category);
    return it == day.end() ? 0.0 : it->second.totalSeconds;
}

double GoalEvaluator::totalSeconds(const DayRecord &day)
{
    double total = 0.0;
    for (const auto &entry : day) {
        total += entry.second.totalSeconds;
    }
    return total;
}

double GoalEvaluator::productivityScore(const DayRecord &day,
                                        const std::vector<std::string> &productiveCategories)
{
    const double total = totalSeconds(day);
    if (total <= 0.0) {
        return 0.0;
    }

    double productive = 0.0;
    for (const auto &category : productiveCategories) {
        productive += categorySeconds(day, category);
    }
    return productive / total * 100.0;
}

GoalReport GoalEvaluator::evaluate(const DayRecord &day, const TrackerConfig &config)
{
    GoalReport report;
    report.totalSeconds = totalSeconds(day);
    for (const auto &category : config.productiveCategories) {
        report.productiveSeconds += categorySeconds(day, category);
    }
    report.productivityScore = productivityScore(day, config.productiveCategories);

    for (const auto &[category, goalHours] : config.goals) {
        CategoryProgress progress;
        progress.category = category;
        progress.goalHours = goalHours;
        progress.hours = categorySeconds(day, category) / 3600.0;
        // Not capped at 100: going over the goal shows as more than 100%.
        progress.progressPct = goalHours > 0.0 ? progress.hours / goalHours * 100.0 : 0.0;
        progress.met = progress.hours >= goalHours;
        report.categories.push_back(progress);
    }

    std::sort(report.categories.begin(), report.categories.end(),
              [](const CategoryProgress &a, const CategoryProgress &b) {
                  return a.progressPct > b.progressPct;
              });
    return report;
}

} // namespace timekeep
