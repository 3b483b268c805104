#pragma once

#include <iostream>
#include <string>

#include <QString>
#include <QStringList>

namespace timekeep {

class AccountingStore;
class ConfigStore;

class ReportCli
{
public:
    ReportCli();
    ReportCli(std::ostream &out, std::ostream &err);

    // CLI dispatcher for day/week reports, insights, export and manual entry.
    // returns exit code
    int run(int argc, char *argv[]);
    int run(const QStringList &args);

private:
    // Report subcommands load both documents read-only and render to m_out.
    int runDayReport(const QStringList &args, const std::string &dateKey);
    int runWeekReport(const QStringList &args);
    int runDaysReport(const QStringList &args);
    int runInsightsReport(const QStringList &args);
    int runExportReport(const QStringList &args);
    // Manual entry goes through the daemon when one is running.
    int runAddCommand(const QStringList &args);

    std::ostream &m_out;
    std::ostream &m_err;
};

} // namespace timekeep
