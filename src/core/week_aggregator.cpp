#include "core/week_aggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/local_time.hpp"
#include "common/logging.hpp"

namespace timetrack {

WeekAggregator::WeekAggregator(const EventLog &log, const TrackerConfig &config)
    : m_days(log)
    , m_config(config)
{
}

WeekReport WeekAggregator::compute(int weekOffset,
                                   std::chrono::system_clock::time_point now) const
{
    if (weekOffset > 0) {
        throw std::invalid_argument("week offset must not be positive, got "
                                    + std::to_string(weekOffset));
    }

    const QDate today = localDate(now);
    const QDate startOfWeek = mondayOf(today).addDays(7 * static_cast<qint64>(weekOffset));
    const QDate endOfWeek = std::min(today.addDays(1), startOfWeek.addDays(7));
    const Duration dailyQuota = m_config.dailyQuota();
    const int workDays = m_config.workDaysPerWeek;

    WeekReport report;
    report.startOfWeek = startOfWeek;
    report.endOfWeek = endOfWeek;
    report.dailyQuota = dailyQuota;
    int weekYear = 0;
    report.weekNumber = startOfWeek.weekNumber(&weekYear);
    report.weekYear = weekYear;

    Duration extraHours{0};
    for (QDate date = startOfWeek; date < endOfWeek; date = date.addDays(1)) {
        DayReport day;
        try {
            day = m_days.compute(date, now);
        } catch (const TimetrackError &e) {
            if (e.kind() != ErrorKind::NoArrivalForDate) {
                throw;
            }
            if (!isWeekend(date)) {
                WeekDayRow row;
                row.date = date;
                row.absent = true;
                report.rows.push_back(row);
            }
            continue;
        }

        WeekDayRow row;
        row.date = date;
        row.worked = day.totalWorked;
        row.delta = day.totalWorked - dailyQuota;
        row.currentlyPresent = day.currentlyPresent;
        report.rows.push_back(row);

        ++report.daysSoFar;
        report.weekTotal += day.totalWorked;
        extraHours += row.delta;
        report.currentlyPresent = day.currentlyPresent;
    }

    report.weekDelta = extraHours;

    if (report.daysSoFar < workDays) {
        report.expectedSoFar = dailyQuota * report.daysSoFar;
    }

    const bool stillWorking = report.daysSoFar == workDays && report.currentlyPresent;
    if (report.daysSoFar < workDays || stillWorking) {
        const Duration remaining = m_config.weeklyQuota() - report.weekTotal;
        report.remaining = remaining;
        if (report.daysSoFar < workDays - 1) {
            report.remainingPerDay = remaining / (workDays - report.daysSoFar);
        }
    }

    TTLOG_DEBUG(QStringLiteral("WeekAggregator"),
                QStringLiteral("compute"),
                QStringLiteral("week_aggregated"),
                QStringLiteral("report_request"),
                QStringLiteral("day_replay"),
                (nlohmann::json{{"start", toIsoDate(startOfWeek)},
                                {"offset", weekOffset},
                                {"days", report.daysSoFar},
                                {"total", durationJson(report.weekTotal)}}));
    return report;
}

} // namespace timetrack
