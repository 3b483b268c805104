#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <QDate>
#include <QDateTime>
#include <QString>

namespace timekeep {

// Date keys are local-calendar dates rendered as YYYY-MM-DD.

inline std::string toDateKey(const QDate &date)
{
    return date.toString(Qt::ISODate).toStdString();
}

inline std::string dateKeyFor(std::chrono::system_clock::time_point timestamp)
{
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            timestamp.time_since_epoch())
                            .count();
    const QDateTime local = QDateTime::fromMSecsSinceEpoch(millis).toLocalTime();
    return toDateKey(local.date());
}

inline std::string todayKey()
{
    return dateKeyFor(std::chrono::system_clock::now());
}

inline QDate parseDateKey(const std::string &key)
{
    if (key.size() != 10) {
        return {};
    }
    return QDate::fromString(QString::fromStdString(key), Qt::ISODate);
}

inline bool isDateKey(const std::string &key)
{
    return parseDateKey(key).isValid();
}

inline std::string addDays(const std::string &key, int days)
{
    const QDate date = parseDateKey(key);
    if (!date.isValid()) {
        return {};
    }
    return toDateKey(date.addDays(days));
}

// Monday of the week containing key.
inline std::string weekStartKey(const std::string &key)
{
    const QDate date = parseDateKey(key);
    if (!date.isValid()) {
        return {};
    }
    return toDateKey(date.addDays(1 - date.dayOfWeek()));
}

inline std::vector<std::string> dateKeysBetween(const std::string &from,
                                                const std::string &to)
{
    std::vector<std::string> keys;
    QDate day = parseDateKey(from);
    const QDate last = parseDateKey(to);
    if (!day.isValid() || !last.isValid()) {
        return keys;
    }
    while (day <= last) {
        keys.push_back(toDateKey(day));
        day = day.addDays(1);
    }
    return keys;
}

} // namespace timekeep
