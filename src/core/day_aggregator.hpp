#pragma once

#include <chrono>

#include <QDate>

#include "common/models.hpp"
#include "store/event_log.hpp"

namespace timetrack {

// Replays one calendar day of the log into work intervals.
class DayAggregator
{
public:
    explicit DayAggregator(const EventLog &log);

    // Throws TimetrackError(NoArrivalForDate) if nothing started on date and
    // TimetrackError(InconsistentSequence) if the day's events do not
    // alternate between opening and closing kinds. An interval still open at
    // the end of the day runs until now.
    DayReport compute(const QDate &date, std::chrono::system_clock::time_point now) const;

private:
    const EventLog &m_log;
};

} // namespace timetrack
