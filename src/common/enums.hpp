#pragma once

namespace timekeep {

enum class TrackerState {
    Stopped,
    RunningActive,
    RunningIdle,
    Paused
};

enum class ReminderKind {
    GoalAchieved,
    LimitWarning,
    BreakReminder
};

} // namespace timekeep
