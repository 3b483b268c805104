#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace timekeep {

class AccountingStore;
class ConfigStore;
class Notifier;

// ReminderEngine checks today's totals against the goal table and the
// session length against the break interval. Goal and limit reminders fire
// once per category per day; a break reminder fires once per interval.
class ReminderEngine {
public:
    ReminderEngine(const AccountingStore &store, const ConfigStore &config, Notifier &notifier);

    // Returns the reminders sent by this call.
    std::vector<Reminder> evaluate(
        std::chrono::system_clock::time_point now,
        std::optional<std::chrono::system_clock::time_point> sessionStart);

    // Dedup keys currently held: today's goal and limit keys plus the last break key.
    std::size_t rememberedKeyCount() const;

private:
    const AccountingStore &m_store;
    const ConfigStore &m_config;
    Notifier &m_notifier;

    // Keys of reminders sent on m_keysDay; dropped when the day changes.
    std::string m_keysDay;
    std::set<std::string> m_sentKeys;
    std::string m_lastBreakKey;

    void emit(std::vector<Reminder> &out, Reminder reminder);
};

} // namespace timekeep
