#include "daemon/accounting_store.hpp"

#include <cmath>
#include <mutex>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QSaveFile>

#include "common/date_keys.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/classifier.hpp"
#include "daemon/config_store.hpp"

namespace timekeep {

namespace {

void addSeconds(CategoryBucket &bucket, const std::string &appId, double seconds,
                const std::optional<std::string> &projectId)
{
    bucket.apps[appId] += seconds;
    bucket.totalSeconds += seconds;
    if (projectId.has_value() && !projectId->empty()) {
        if (!bucket.projects.has_value()) {
            bucket.projects.emplace();
        }
        (*bucket.projects)[*projectId] += seconds;
    }
}

} // namespace

struct AccountingStore::Impl {
    const ConfigStore &config;
    std::filesystem::path path;
    mutable std::mutex mutex;
    DayRange days;
    StreakLedger streaks;
    std::set<std::string> unknownApps;

    Impl(const ConfigStore &configStore, std::filesystem::path dataPath)
        : config(configStore)
        , path(std::move(dataPath))
    {
    }

    void load();
    void persistLocked() const;
};

void AccountingStore::Impl::load()
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.exists()) {
        days.clear();
        streaks = StreakLedger{};
        return;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw StoreLoadError("Cannot read " + path.string() + ": "
                             + file.errorString().toStdString());
    }

    const auto doc = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        TKLOG_ERROR(QStringLiteral("AccountingStore"),
                    QStringLiteral("load"),
                    QStringLiteral("store_corrupt"),
                    QStringLiteral("startup"),
                    QStringLiteral("json_parse"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", path.string()}}));
        throw StoreLoadError(path.string() + " is not a valid tracking document");
    }

    DayRange loadedDays;
    StreakLedger loadedStreaks;
    try {
        for (const auto &item : doc.items()) {
            if (item.key() == kStreaksKey) {
                loadedStreaks = item.value().get<StreakLedger>();
                continue;
            }
            if (!isDateKey(item.key())) {
                throw MalformedDocument("unexpected top-level key '" + item.key() + "'");
            }
            if (!item.value().is_object()) {
                throw MalformedDocument("day " + item.key() + " is not an object");
            }
            DayRecord day;
            for (const auto &category : item.value().items()) {
                day[category.key()] = category.value().get<CategoryBucket>();
            }
            loadedDays[item.key()] = std::move(day);
        }
    } catch (const MalformedDocument &error) {
        throw StoreLoadError(path.string() + ": " + error.what());
    } catch (const nlohmann::json::exception &error) {
        throw StoreLoadError(path.string() + ": " + error.what());
    }

    days = std::move(loadedDays);
    streaks = loadedStreaks;
}

void AccountingStore::Impl::persistLocked() const
{
    QDir().mkpath(QString::fromStdString(path.parent_path().string()));

    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw StoreWriteError("Cannot open " + path.string() + " for writing: "
                              + file.errorString().toStdString());
    }

    const QByteArray data = QByteArray::fromStdString(
        toDocument(days, streaks).dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw StoreWriteError("Short write to " + path.string() + ": "
                              + file.errorString().toStdString());
    }
    if (!file.commit()) {
        throw StoreWriteError("Cannot replace " + path.string() + ": "
                              + file.errorString().toStdString());
    }
}

AccountingStore::AccountingStore(const ConfigStore &config, std::filesystem::path path)
    : impl(std::make_unique<Impl>(config, std::move(path)))
{
    impl->load();
}

AccountingStore::~AccountingStore() = default;

bool AccountingStore::record(const std::string &appId,
                             double elapsedSeconds,
                             const std::optional<std::string> &projectId,
                             const std::string &dateKey)
{
    if (!std::isfinite(elapsedSeconds) || elapsedSeconds < 0.0) {
        throw std::invalid_argument("elapsed seconds must be a non-negative number");
    }

    const TrackerConfig config = impl->config.config();
    if (matchesAnyPattern(appId, config.excludedApps)) {
        return false;
    }

    const std::string category = Classifier(config.customCategories).classify(appId);
    const std::string day = dateKey.empty() ? todayKey() : dateKey;

    std::lock_guard<std::mutex> lock(impl->mutex);
    if (category == kOtherCategory) {
        impl->unknownApps.insert(appId);
    }
    addSeconds(impl->days[day][category], appId, elapsedSeconds, projectId);
    return true;
}

void AccountingStore::manualEntry(const std::string &appId,
                                  const std::string &categoryId,
                                  double minutes,
                                  const std::optional<std::string> &projectId,
                                  const std::optional<std::string> &dateKey)
{
    if (appId.empty()) {
        throw std::invalid_argument("app name must not be empty");
    }
    if (categoryId.empty()) {
        throw std::invalid_argument("category must not be empty");
    }
    if (!std::isfinite(minutes) || minutes < 0.0) {
        throw std::invalid_argument("minutes must be a non-negative number");
    }
    if (dateKey.has_value() && !isDateKey(*dateKey)) {
        throw std::invalid_argument("date must be formatted YYYY-MM-DD");
    }

    const std::string day = dateKey.value_or(todayKey());

    std::lock_guard<std::mutex> lock(impl->mutex);
    addSeconds(impl->days[day][categoryId], appId, minutes * 60.0, projectId);
    impl->persistLocked();

    TKLOG_INFO(QStringLiteral("AccountingStore"),
               QStringLiteral("manualEntry"),
               QStringLiteral("manual_entry_recorded"),
               QStringLiteral("user_backfill"),
               QStringLiteral("direct_category"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"date", day},
                               {"category", categoryId},
                               {"minutes", minutes}}));
}

DayRecord AccountingStore::snapshotFor(const std::string &dateKey) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const auto it = impl->days.find(dateKey);
    if (it == impl->days.end()) {
        return {};
    }
    return it->second;
}

DayRange AccountingStore::snapshotRange(const std::string &fromKey,
                                        const std::string &toKey) const
{
    DayRange out;
    std::lock_guard<std::mutex> lock(impl->mutex);
    // Date keys sort lexicographically in calendar order.
    auto it = impl->days.lower_bound(fromKey);
    for (; it != impl->days.end() && it->first <= toKey; ++it) {
        out.insert(*it);
    }
    return out;
}

DayRange AccountingStore::snapshotAll() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->days;
}

std::vector<ExportRow> AccountingStore::exportRange(const std::string &fromKey,
                                                    const std::string &toKey) const
{
    std::vector<ExportRow> rows;
    for (const auto &[date, day] : snapshotRange(fromKey, toKey)) {
        for (const auto &[category, bucket] : day) {
            for (const auto &[app, seconds] : bucket.apps) {
                rows.push_back({date, category, app, seconds / 3600.0, {}});
            }
            if (!bucket.projects.has_value()) {
                continue;
            }
            for (const auto &[project, seconds] : *bucket.projects) {
                rows.push_back({date, category, {}, seconds / 3600.0, project});
            }
        }
    }
    return rows;
}

std::vector<std::string> AccountingStore::dateKeys() const
{
    std::vector<std::string> keys;
    std::lock_guard<std::mutex> lock(impl->mutex);
    keys.reserve(impl->days.size());
    for (const auto &entry : impl->days) {
        keys.push_back(entry.first);
    }
    return keys;
}

StreakLedger AccountingStore::streaks() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->streaks;
}

void AccountingStore::setStreaks(const StreakLedger &ledger)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->streaks = ledger;
}

std::set<std::string> AccountingStore::unknownApps() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->unknownApps;
}

void AccountingStore::persist()
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->persistLocked();
}

void AccountingStore::clearAll()
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->days.clear();
    impl->streaks = StreakLedger{};
    impl->unknownApps.clear();
    impl->persistLocked();

    qWarning() << "Timekeep: all tracking data cleared";
}

std::string AccountingStore::serialize() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return toDocument(impl->days, impl->streaks)
        .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

const std::filesystem::path &AccountingStore::path() const
{
    return impl->path;
}

nlohmann::json AccountingStore::toDocument(const DayRange &days, const StreakLedger &streaks)
{
    nlohmann::json doc = nlohmann::json::object();
    for (const auto &[date, day] : days) {
        nlohmann::json dayJson = nlohmann::json::object();
        for (const auto &[category, bucket] : day) {
            dayJson[category] = bucket;
        }
        doc[date] = std::move(dayJson);
    }
    doc[kStreaksKey] = streaks;
    return doc;
}

} // namespace timekeep
