#include "common/local_time.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

#include <QTime>

namespace timetrack {

QDateTime toLocalDateTime(std::chrono::system_clock::time_point timestamp)
{
    const qint64 msecs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
    return QDateTime::fromMSecsSinceEpoch(msecs).toLocalTime();
}

std::chrono::system_clock::time_point fromDateTime(const QDateTime &dateTime)
{
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{dateTime.toMSecsSinceEpoch()}};
}

QDate localDate(std::chrono::system_clock::time_point timestamp)
{
    return toLocalDateTime(timestamp).date();
}

std::chrono::system_clock::time_point startOfDay(const QDate &date)
{
    return fromDateTime(date.startOfDay());
}

QDate mondayOf(const QDate &date)
{
    return date.addDays(1 - date.dayOfWeek());
}

bool isWeekend(const QDate &date)
{
    return date.dayOfWeek() == Qt::Saturday || date.dayOfWeek() == Qt::Sunday;
}

std::chrono::system_clock::time_point localTimePoint(const QDate &date,
                                                     int hour,
                                                     int minute,
                                                     int second)
{
    return fromDateTime(QDateTime(date, QTime(hour, minute, second)));
}

std::optional<QDate> parseIsoDate(const QString &value)
{
    const QDate date = QDate::fromString(value, Qt::ISODate);
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp,
                            const QString &format)
{
    return toLocalDateTime(timestamp).toString(format).toStdString();
}

std::string formatDuration(Duration value)
{
    const auto totalMinutes = std::chrono::duration_cast<std::chrono::minutes>(value).count();
    const long long magnitude = std::llabs(totalMinutes);

    std::ostringstream out;
    if (value.count() < 0) {
        out << "-";
    }
    out << magnitude / 60 << ":" << std::setw(2) << std::setfill('0') << magnitude % 60;
    return out.str();
}

std::string formatSignedDuration(Duration value)
{
    if (value.count() < 0) {
        return formatDuration(value);
    }
    return "+" + formatDuration(value);
}

} // namespace timetrack
