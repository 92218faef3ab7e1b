#include "core/day_aggregator.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/local_time.hpp"
#include "common/logging.hpp"

namespace timetrack {

namespace {

bool opensInterval(EventKind kind)
{
    return kind == EventKind::Arrive || kind == EventKind::BreakEnd;
}

bool closesInterval(EventKind kind)
{
    return kind == EventKind::BreakStart || kind == EventKind::Leave;
}

TimetrackError outOfPlace(const WorkEvent &event, bool intervalOpen)
{
    return TimetrackError(ErrorKind::InconsistentSequence,
                          "unexpected '" + toEventKindString(event.kind) + "' at "
                              + toIso8601Utc(event.timestamp)
                              + (intervalOpen ? " while working" : " while not working"),
                          event.kind);
}

} // namespace

DayAggregator::DayAggregator(const EventLog &log)
    : m_log(log)
{
}

DayReport DayAggregator::compute(const QDate &date,
                                 std::chrono::system_clock::time_point now) const
{
    const auto dayStart = startOfDay(date);
    const auto dayEnd = startOfDay(date.addDays(1));

    const auto arrival = m_log.firstEventInRange(EventKind::Arrive, dayStart, dayEnd);
    if (!arrival.has_value()) {
        throw TimetrackError::noArrivalForDate(date);
    }

    const auto events = m_log.eventsInRange(arrival->timestamp, dayEnd);

    // Events sharing the arrival's timestamp may sort ahead of it; the replay
    // starts at the arrival itself.
    auto it = std::find_if(events.begin(), events.end(), [&](const WorkEvent &event) {
        return event.kind == EventKind::Arrive && event.timestamp == arrival->timestamp;
    });
    if (it == events.end()) {
        throw TimetrackError(ErrorKind::InconsistentSequence,
                             "arrival at " + toIso8601Utc(arrival->timestamp)
                                 + " vanished from the log");
    }

    DayReport report;
    report.date = date;
    report.asOf = now;
    report.rows.push_back(*it);

    std::optional<WorkEvent> openStart = *it;
    for (++it; it != events.end(); ++it) {
        const WorkEvent &event = *it;
        if (!openStart.has_value()) {
            if (!opensInterval(event.kind)) {
                throw outOfPlace(event, false);
            }
            openStart = event;
        } else {
            if (!closesInterval(event.kind)) {
                throw outOfPlace(event, true);
            }
            WorkInterval interval;
            interval.start = *openStart;
            interval.end = event;
            interval.worked = std::chrono::duration_cast<Duration>(
                event.timestamp - openStart->timestamp);
            report.totalWorked += interval.worked;
            report.intervals.push_back(interval);
            openStart.reset();
        }
        report.rows.push_back(event);
    }

    if (openStart.has_value()) {
        WorkInterval interval;
        interval.start = *openStart;
        interval.worked = std::max(Duration{0},
                                   std::chrono::duration_cast<Duration>(
                                       now - openStart->timestamp));
        report.totalWorked += interval.worked;
        report.intervals.push_back(interval);
        report.currentlyPresent = true;
    }

    TTLOG_DEBUG(QStringLiteral("DayAggregator"),
                QStringLiteral("compute"),
                QStringLiteral("day_replayed"),
                QStringLiteral("report_request"),
                QStringLiteral("sqlite_query"),
                (nlohmann::json{{"date", toIsoDate(date)},
                                {"events", report.rows.size()},
                                {"present", report.currentlyPresent},
                                {"worked", durationJson(report.totalWorked)}}));
    return report;
}

} // namespace timetrack
