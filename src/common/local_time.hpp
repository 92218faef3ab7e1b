#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QDate>
#include <QDateTime>
#include <QString>

#include "common/models.hpp"

namespace timetrack {

// Calendar helpers. Everything here works in local wall-clock time; day
// boundaries come from Qt so DST days are 23 or 25 hours long.

QDateTime toLocalDateTime(std::chrono::system_clock::time_point timestamp);
std::chrono::system_clock::time_point fromDateTime(const QDateTime &dateTime);

QDate localDate(std::chrono::system_clock::time_point timestamp);

// Local midnight at the start of the given date.
std::chrono::system_clock::time_point startOfDay(const QDate &date);

QDate mondayOf(const QDate &date);
bool isWeekend(const QDate &date);

// Local wall-clock instant, mostly for building fixtures and parsing input.
std::chrono::system_clock::time_point localTimePoint(const QDate &date,
                                                     int hour,
                                                     int minute,
                                                     int second = 0);

std::optional<QDate> parseIsoDate(const QString &value);

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp,
                            const QString &format = QStringLiteral("HH:mm"));

// "H:MM" for durations; signed variants always carry a leading + or -.
std::string formatDuration(Duration value);
std::string formatSignedDuration(Duration value);

} // namespace timetrack
