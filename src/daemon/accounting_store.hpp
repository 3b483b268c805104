#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace timekeep {

class ConfigStore;

// The accounting document exists but cannot be parsed. The file is left
// untouched; recovering it is an explicit user action.
class StoreLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class StoreWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// AccountingStore holds date -> category -> bucket totals plus the streak
// ledger, and persists them as one JSON document. All access goes through a
// single mutex, so a bucket's app total and category total are always seen
// updated together.
class AccountingStore {
public:
    AccountingStore(const ConfigStore &config, std::filesystem::path path);
    ~AccountingStore();

    AccountingStore(const AccountingStore &) = delete;
    AccountingStore &operator=(const AccountingStore &) = delete;

    // Adds elapsedSeconds to the app's bucket for dateKey (today when empty).
    // Returns false when the app matches an excluded pattern and nothing was
    // recorded. Throws std::invalid_argument for negative seconds.
    bool record(const std::string &appId,
                double elapsedSeconds,
                const std::optional<std::string> &projectId,
                const std::string &dateKey = {});

    // Backfills time into a caller-chosen category and persists immediately.
    // Throws std::invalid_argument on bad input without touching the store.
    void manualEntry(const std::string &appId,
                     const std::string &categoryId,
                     double minutes,
                     const std::optional<std::string> &projectId = std::nullopt,
                     const std::optional<std::string> &dateKey = std::nullopt);

    DayRecord snapshotFor(const std::string &dateKey) const;
    DayRange snapshotRange(const std::string &fromKey, const std::string &toKey) const;
    DayRange snapshotAll() const;
    std::vector<ExportRow> exportRange(const std::string &fromKey,
                                       const std::string &toKey) const;
    std::vector<std::string> dateKeys() const;

    StreakLedger streaks() const;
    void setStreaks(const StreakLedger &ledger);

    // Apps that classified as "Other" since this store was opened.
    std::set<std::string> unknownApps() const;

    // Writes the whole document through a temporary file and rename.
    // Throws StoreWriteError.
    void persist();

    // Explicit bulk clear: drops every day and resets the streak ledger.
    void clearAll();

    std::string serialize() const;
    const std::filesystem::path &path() const;

    static nlohmann::json toDocument(const DayRange &days, const StreakLedger &streaks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace timekeep
