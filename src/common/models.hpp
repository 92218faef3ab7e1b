#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <QDate>

#include "common/enums.hpp"

namespace timetrack {

using Duration = std::chrono::milliseconds;

struct WorkEvent {
    EventKind kind = EventKind::Arrive;
    std::chrono::system_clock::time_point timestamp;
};

// One continuous span of presence. An open interval ends at "now".
struct WorkInterval {
    WorkEvent start;
    std::optional<WorkEvent> end;
    Duration worked{0};

    bool isOpen() const
    {
        return !end.has_value();
    }
};

struct SuccessNotice {
    EventKind event = EventKind::Arrive;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::chrono::system_clock::time_point> priorTimestamp;
};

struct FailureNotice {
    ErrorKind errorKind = ErrorKind::Storage;
    std::optional<EventKind> currentState;
    std::string message;
};

struct DayReport {
    QDate date;
    std::chrono::system_clock::time_point asOf;
    std::vector<WorkEvent> rows;
    std::vector<WorkInterval> intervals;
    bool currentlyPresent = false;
    Duration totalWorked{0};
};

struct WeekDayRow {
    QDate date;
    bool absent = false;
    Duration worked{0};
    Duration delta{0};
    bool currentlyPresent = false;
};

struct WeekReport {
    int weekNumber = 0;
    int weekYear = 0;
    QDate startOfWeek;
    QDate endOfWeek;
    Duration dailyQuota{0};
    int daysSoFar = 0;
    bool currentlyPresent = false;
    std::vector<WeekDayRow> rows;
    Duration weekTotal{0};
    Duration weekDelta{0};
    std::optional<Duration> expectedSoFar;
    std::optional<Duration> remaining;
    std::optional<Duration> remainingPerDay;
};

struct TrackerStatus {
    std::optional<WorkEvent> lastEvent;
    std::size_t eventCount = 0;
    bool integrityOk = true;
};

} // namespace timetrack
