#include "report/ReportCli.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <sstream>
#include <vector>

#include <QFile>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/date_keys.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "daemon/accounting_store.hpp"
#include "daemon/config_store.hpp"
#include "daemon/goal_evaluator.hpp"

namespace timekeep {

namespace {

constexpr int kInsightDays = 7;
constexpr int kTopApps = 5;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  timekeep-report today [--format markdown|json]\n"
        "  timekeep-report day --date YYYY-MM-DD [--format markdown|json]\n"
        "  timekeep-report week [--format markdown|json]\n"
        "  timekeep-report days [--count N]\n"
        "  timekeep-report insights [--format markdown|json]\n"
        "  timekeep-report export --from YYYY-MM-DD --to YYYY-MM-DD "
        "[--format csv|json|markdown] [--out PATH]\n"
        "  timekeep-report add --app NAME --category NAME --minutes N "
        "[--project ID] [--date YYYY-MM-DD]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args, const QString &fallback)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return fallback;
    }
    return value.toLower();
}

std::string hours(double seconds)
{
    return QString::number(seconds / 3600.0, 'f', 2).toStdString();
}

std::string percent(double value)
{
    return QString::number(value, 'f', 1).toStdString() + "%";
}

std::string csvField(const std::string &value)
{
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (const char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// Apps ordered by time, longest first.
std::vector<std::pair<std::string, double>> sortedApps(const std::map<std::string, double> &apps)
{
    std::vector<std::pair<std::string, double>> sorted(apps.begin(), apps.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto &a, const auto &b) { return a.second > b.second; });
    return sorted;
}

nlohmann::json dayToJson(const std::string &dateKey, const DayRecord &day, const TrackerConfig &config)
{
    nlohmann::json categories = nlohmann::json::object();
    for (const auto &[category, bucket] : day) {
        categories[category] = bucket;
    }
    return nlohmann::json{
        {"date", dateKey},
        {"categories", categories},
        {"goals", GoalEvaluator::evaluate(day, config)}
    };
}

void renderDayMarkdown(std::ostream &out,
                       const std::string &dateKey,
                       const DayRecord &day,
                       const TrackerConfig &config)
{
    const GoalReport report = GoalEvaluator::evaluate(day, config);

    out << "# Timekeep Day Report: " << dateKey << "\n\n";
    out << "Total: " << hours(report.totalSeconds) << " h\n";
    out << "Productivity score: " << percent(report.productivityScore) << "\n\n";

    out << "## Categories\n\n";
    if (day.empty()) {
        out << "No time recorded on this day.\n";
    }

    std::vector<std::pair<std::string, double>> categories;
    for (const auto &[category, bucket] : day) {
        categories.emplace_back(category, bucket.totalSeconds);
    }
    std::stable_sort(categories.begin(), categories.end(),
                     [](const auto &a, const auto &b) { return a.second > b.second; });

    for (const auto &[category, seconds] : categories) {
        const CategoryBucket &bucket = day.at(category);
        out << "- " << category << ": " << hours(seconds) << " h\n";
        for (const auto &[app, appSeconds] : sortedApps(bucket.apps)) {
            out << "  - " << app << ": " << hours(appSeconds) << " h\n";
        }
        if (bucket.projects.has_value()) {
            for (const auto &[project, projectSeconds] : sortedApps(*bucket.projects)) {
                out << "  - project " << project << ": " << hours(projectSeconds) << " h\n";
            }
        }
    }

    if (!report.categories.empty()) {
        out << "\n## Goals\n\n";
        for (const auto &progress : report.categories) {
            out << "- " << progress.category << ": "
                << QString::number(progress.hours, 'f', 2).toStdString() << " / "
                << QString::number(progress.goalHours, 'f', 2).toStdString() << " h ("
                << percent(progress.progressPct) << ")"
                << (progress.met ? " met" : "") << "\n";
        }
    }
}

bool writeTextFile(const QString &path, const std::string &text)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(text);
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

} // namespace

ReportCli::ReportCli()
    : ReportCli(std::cout, std::cerr)
{
}

ReportCli::ReportCli(std::ostream &out, std::ostream &err)
    : m_out(out)
    , m_err(err)
{
}

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    return run(args);
}

int ReportCli::run(const QStringList &args)
{
    // CLI entry: parse the subcommand and delegate to the report handler.
    if (args.size() < 2) {
        m_err << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    TKLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("today")) {
            return runDayReport(args, todayKey());
        }
        if (command == QStringLiteral("day")) {
            const QString date = getArgValue(args, QStringLiteral("--date"));
            if (date.isEmpty()) {
                m_err << usageText().toStdString();
                return 1;
            }
            if (!isDateKey(date.toStdString())) {
                m_err << "Invalid date, expected YYYY-MM-DD." << std::endl;
                return 1;
            }
            return runDayReport(args, date.toStdString());
        }
        if (command == QStringLiteral("week")) {
            return runWeekReport(args);
        }
        if (command == QStringLiteral("days")) {
            return runDaysReport(args);
        }
        if (command == QStringLiteral("insights")) {
            return runInsightsReport(args);
        }
        if (command == QStringLiteral("export")) {
            return runExportReport(args);
        }
        if (command == QStringLiteral("add")) {
            return runAddCommand(args);
        }
    } catch (const StoreLoadError &ex) {
        m_err << "Tracking data cannot be loaded: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        m_err << "Error: " << ex.what() << std::endl;
        return 1;
    }

    m_err << usageText().toStdString();
    return 1;
}

int ReportCli::runDayReport(const QStringList &args, const std::string &dateKey)
{
    const QString format = getFormat(args, QStringLiteral("markdown"));
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        m_err << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    ConfigStore config(configFilePath());
    AccountingStore store(config, dataFilePath());
    const DayRecord day = store.snapshotFor(dateKey);

    if (format == QStringLiteral("json")) {
        m_out << dayToJson(dateKey, day, config.config()).dump(2) << std::endl;
    } else {
        renderDayMarkdown(m_out, dateKey, day, config.config());
    }
    return 0;
}

int ReportCli::runWeekReport(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("markdown"));
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        m_err << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    ConfigStore config(configFilePath());
    AccountingStore store(config, dataFilePath());
    const std::string today = todayKey();
    const std::string monday = weekStartKey(today);
    const DayRange days = store.snapshotRange(monday, today);

    std::map<std::string, double> categoryTotals;
    double weekTotal = 0.0;
    for (const auto &[date, day] : days) {
        for (const auto &[category, bucket] : day) {
            categoryTotals[category] += bucket.totalSeconds;
            weekTotal += bucket.totalSeconds;
        }
    }

    if (format == QStringLiteral("json")) {
        nlohmann::json perDay = nlohmann::json::array();
        for (const auto &date : dateKeysBetween(monday, today)) {
            const auto it = days.find(date);
            const double total = it == days.end() ? 0.0 : GoalEvaluator::totalSeconds(it->second);
            perDay.push_back({{"date", date}, {"totalSeconds", total}});
        }
        nlohmann::json payload;
        payload["from"] = monday;
        payload["to"] = today;
        payload["totalSeconds"] = weekTotal;
        payload["categories"] = categoryTotals;
        payload["days"] = perDay;
        m_out << payload.dump(2) << std::endl;
        return 0;
    }

    m_out << "# Timekeep Week Report: " << monday << " -> " << today << "\n\n";
    m_out << "Total: " << hours(weekTotal) << " h\n\n";
    m_out << "## Days\n\n";
    for (const auto &date : dateKeysBetween(monday, today)) {
        const auto it = days.find(date);
        const double total = it == days.end() ? 0.0 : GoalEvaluator::totalSeconds(it->second);
        m_out << "- " << date << ": " << hours(total) << " h\n";
    }
    m_out << "\n## Categories\n\n";
    if (categoryTotals.empty()) {
        m_out << "No time recorded this week.\n";
    }
    for (const auto &[category, seconds] : sortedApps(categoryTotals)) {
        m_out << "- " << category << ": " << hours(seconds) << " h\n";
    }
    return 0;
}

int ReportCli::runDaysReport(const QStringList &args)
{
    int count = kInsightDays;
    const QString countValue = getArgValue(args, QStringLiteral("--count"));
    if (!countValue.isEmpty()) {
        bool ok = false;
        count = countValue.toInt(&ok);
        if (!ok || count <= 0) {
            m_err << "Invalid --count, expected a positive number." << std::endl;
            return 1;
        }
    }

    ConfigStore config(configFilePath());
    AccountingStore store(config, dataFilePath());
    const TrackerConfig settings = config.config();
    const std::vector<std::string> keys = store.dateKeys();

    m_out << "# Timekeep Tracked Days\n\n";
    if (keys.empty()) {
        m_out << "No tracked days yet.\n";
        return 0;
    }

    const std::size_t first = keys.size() > static_cast<std::size_t>(count)
        ? keys.size() - static_cast<std::size_t>(count)
        : 0;
    for (std::size_t i = keys.size(); i > first; --i) {
        const std::string &date = keys[i - 1];
        const DayRecord day = store.snapshotFor(date);
        m_out << "- " << date << ": " << hours(GoalEvaluator::totalSeconds(day)) << " h, "
              << percent(GoalEvaluator::productivityScore(day, settings.productiveCategories))
              << " productive\n";
    }
    return 0;
}

int ReportCli::runInsightsReport(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("markdown"));
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        m_err << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    ConfigStore config(configFilePath());
    AccountingStore store(config, dataFilePath());
    const TrackerConfig settings = config.config();
    const DayRange all = store.snapshotAll();

    std::vector<std::string> recent;
    for (auto it = all.rbegin(); it != all.rend() && recent.size() < static_cast<std::size_t>(kInsightDays); ++it) {
        recent.push_back(it->first);
    }

    double productiveSum = 0.0;
    double entertainmentSum = 0.0;
    double totalSum = 0.0;
    std::optional<std::pair<std::string, double>> bestDay;
    for (const auto &date : recent) {
        const DayRecord &day = all.at(date);
        double productive = 0.0;
        for (const auto &category : settings.productiveCategories) {
            productive += GoalEvaluator::categorySeconds(day, category);
        }
        productiveSum += productive;
        entertainmentSum += GoalEvaluator::categorySeconds(day, "Entertainment");
        totalSum += GoalEvaluator::totalSeconds(day);
        if (!bestDay.has_value() || productive > bestDay->second) {
            bestDay = std::make_pair(date, productive);
        }
    }

    std::map<std::string, double> appTotals;
    for (const auto &[date, day] : all) {
        for (const auto &[category, bucket] : day) {
            for (const auto &[app, seconds] : bucket.apps) {
                appTotals[app] += seconds;
            }
        }
    }
    auto topApps = sortedApps(appTotals);
    if (topApps.size() > static_cast<std::size_t>(kTopApps)) {
        topApps.resize(kTopApps);
    }

    const double dayCount = recent.empty() ? 1.0 : static_cast<double>(recent.size());

    if (format == QStringLiteral("json")) {
        nlohmann::json apps = nlohmann::json::array();
        for (const auto &[app, seconds] : topApps) {
            apps.push_back({{"app", app}, {"seconds", seconds}});
        }
        nlohmann::json payload;
        payload["daysConsidered"] = recent.size();
        payload["avgProductiveSeconds"] = productiveSum / dayCount;
        payload["avgEntertainmentSeconds"] = entertainmentSum / dayCount;
        payload["avgTotalSeconds"] = totalSum / dayCount;
        payload["mostProductiveDay"] = bestDay.has_value() ? nlohmann::json(bestDay->first)
                                                          : nlohmann::json(nullptr);
        payload["topApps"] = apps;
        m_out << payload.dump(2) << std::endl;
        return 0;
    }

    m_out << "# Timekeep Insights\n\n";
    if (recent.empty()) {
        m_out << "Not enough data yet.\n";
        return 0;
    }
    m_out << "Last " << recent.size() << " tracked days:\n\n";
    m_out << "- Average productive time: " << hours(productiveSum / dayCount) << " h/day\n";
    m_out << "- Average entertainment: " << hours(entertainmentSum / dayCount) << " h/day\n";
    m_out << "- Average total: " << hours(totalSum / dayCount) << " h/day\n";
    m_out << "- Most productive day: " << bestDay->first << " (" << hours(bestDay->second)
          << " h)\n";
    m_out << "\n## Top apps\n\n";
    int rank = 1;
    for (const auto &[app, seconds] : topApps) {
        m_out << rank++ << ". " << app << ": " << hours(seconds) << " h\n";
    }
    return 0;
}

int ReportCli::runExportReport(const QStringList &args)
{
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    if (fromValue.isEmpty() || toValue.isEmpty()) {
        m_err << usageText().toStdString();
        return 1;
    }
    const std::string from = fromValue.toStdString();
    const std::string to = toValue.toStdString();
    if (!isDateKey(from) || !isDateKey(to) || to < from) {
        m_err << "Invalid date range, expected YYYY-MM-DD with --from before --to." << std::endl;
        return 1;
    }

    const QString format = getFormat(args, QStringLiteral("csv"));
    if (format != QStringLiteral("csv") && format != QStringLiteral("json")
        && format != QStringLiteral("markdown")) {
        m_err << "Invalid format. Use csv, json or markdown." << std::endl;
        return 1;
    }

    ConfigStore config(configFilePath());
    AccountingStore store(config, dataFilePath());
    const std::vector<ExportRow> rows = store.exportRange(from, to);

    std::ostringstream text;
    if (format == QStringLiteral("json")) {
        text << nlohmann::json(rows).dump(2) << "\n";
    } else if (format == QStringLiteral("markdown")) {
        text << "# Timekeep Export: " << from << " -> " << to << "\n\n";
        text << "| Date | Category | App | Hours | Project |\n";
        text << "|------|----------|-----|-------|---------|\n";
        for (const auto &row : rows) {
            text << "| " << row.date << " | " << row.category << " | " << row.app << " | "
                 << QString::number(row.hours, 'f', 2).toStdString() << " | " << row.project
                 << " |\n";
        }
    } else {
        text << "date,category,app,hours,project\n";
        for (const auto &row : rows) {
            text << csvField(row.date) << "," << csvField(row.category) << ","
                 << csvField(row.app) << "," << QString::number(row.hours, 'f', 2).toStdString()
                 << "," << csvField(row.project) << "\n";
        }
    }

    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        m_out << text.str();
    } else if (!writeTextFile(outPath, text.str())) {
        m_err << "Failed to write " << outPath.toStdString() << std::endl;
        return 1;
    } else {
        m_out << "Exported " << rows.size() << " rows to " << outPath.toStdString() << "\n";
    }

    TKLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runExportReport"),
               QStringLiteral("report_export"),
               QStringLiteral("user_invocation"),
               QStringLiteral("json_document"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"rows", rows.size()}, {"format", format.toStdString()}}));
    return 0;
}

int ReportCli::runAddCommand(const QStringList &args)
{
    const QString app = getArgValue(args, QStringLiteral("--app"));
    const QString category = getArgValue(args, QStringLiteral("--category"));
    const QString minutesValue = getArgValue(args, QStringLiteral("--minutes"));
    if (app.isEmpty() || category.isEmpty() || minutesValue.isEmpty()) {
        m_err << usageText().toStdString();
        return 1;
    }
    bool ok = false;
    const double minutes = minutesValue.toDouble(&ok);
    if (!ok) {
        m_err << "Invalid --minutes, expected a number." << std::endl;
        return 1;
    }

    const QString project = getArgValue(args, QStringLiteral("--project"));
    const QString date = getArgValue(args, QStringLiteral("--date"));
    const std::optional<std::string> projectId =
        project.isEmpty() ? std::nullopt : std::optional<std::string>(project.toStdString());
    const std::optional<std::string> dateKey =
        date.isEmpty() ? std::nullopt : std::optional<std::string>(date.toStdString());

    if (isDaemonRunning()) {
        nlohmann::json params{
            {"app", app.toStdString()},
            {"category", category.toStdString()},
            {"minutes", minutes}
        };
        if (projectId.has_value()) {
            params["project"] = *projectId;
        }
        if (dateKey.has_value()) {
            params["date"] = *dateKey;
        }
        const auto response = sendDaemonRequest("record_manual", params);
        if (!response.has_value()) {
            m_err << "The daemon did not answer; nothing was recorded." << std::endl;
            return 1;
        }
        if (response->contains("error")) {
            m_err << "Error: " << (*response)["error"].get<std::string>() << std::endl;
            return 1;
        }
    } else {
        ConfigStore config(configFilePath());
        AccountingStore store(config, dataFilePath());
        try {
            store.manualEntry(app.toStdString(), category.toStdString(), minutes, projectId, dateKey);
        } catch (const std::invalid_argument &ex) {
            m_err << "Invalid entry: " << ex.what() << std::endl;
            return 1;
        }
    }

    m_out << "Added " << QString::number(minutes, 'f', 0).toStdString() << " min of "
          << app.toStdString() << " to " << category.toStdString() << " on "
          << dateKey.value_or(todayKey()) << "\n";
    return 0;
}

} // namespace timekeep
