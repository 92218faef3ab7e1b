#pragma once

#include <chrono>

#include "common/config.hpp"
#include "common/models.hpp"
#include "core/day_aggregator.hpp"
#include "store/event_log.hpp"

namespace timetrack {

/**
 * WeekAggregator runs the DayAggregator over Monday..Sunday of one week,
 * stopping after today, and compares the result with the configured quota.
 *
 * Days without an arrival are absent: weekdays get a blank row, weekend
 * days are left out, neither counts as a worked day. Any other failure of
 * the day replay propagates.
 */
class WeekAggregator
{
public:
    WeekAggregator(const EventLog &log, const TrackerConfig &config);

    // weekOffset 0 is the current week, -1 the previous one and so on.
    // Positive offsets throw std::invalid_argument.
    WeekReport compute(int weekOffset, std::chrono::system_clock::time_point now) const;

private:
    DayAggregator m_days;
    TrackerConfig m_config;
};

} // namespace timetrack
