#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace timetrack {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Spellings match the values stored in the times table.
inline std::string toEventKindString(EventKind kind)
{
    switch (kind) {
    case EventKind::Arrive:
        return "arrive";
    case EventKind::BreakStart:
        return "break";
    case EventKind::BreakEnd:
        return "resume";
    case EventKind::Leave:
        return "leave";
    }
    return "arrive";
}

inline std::optional<EventKind> parseEventKindString(const std::string &value)
{
    if (value == "arrive") {
        return EventKind::Arrive;
    }
    if (value == "break") {
        return EventKind::BreakStart;
    }
    if (value == "resume") {
        return EventKind::BreakEnd;
    }
    if (value == "leave") {
        return EventKind::Leave;
    }
    return std::nullopt;
}

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::AlreadyPresent:
        return "already_present";
    case ErrorKind::NotWorking:
        return "not_working";
    case ErrorKind::NotBreaking:
        return "not_breaking";
    case ErrorKind::NoArrivalForDate:
        return "no_arrival_for_date";
    case ErrorKind::InconsistentSequence:
        return "inconsistent_sequence";
    case ErrorKind::DuplicateKey:
        return "duplicate_key";
    case ErrorKind::Storage:
        return "storage";
    }
    return "storage";
}

inline nlohmann::json durationJson(Duration value)
{
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(value).count();
    return nlohmann::json{
        {"seconds", seconds},
        {"hours", static_cast<double>(value.count()) / 3600000.0}
    };
}

inline nlohmann::json optionalDurationJson(const std::optional<Duration> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return durationJson(*value);
}

inline std::string toIsoDate(const QDate &date)
{
    return date.toString(Qt::ISODate).toStdString();
}

inline void to_json(nlohmann::json &j, const EventKind &kind)
{
    j = toEventKindString(kind);
}

inline void to_json(nlohmann::json &j, const ErrorKind &kind)
{
    j = toErrorKindString(kind);
}

inline void to_json(nlohmann::json &j, const WorkEvent &event)
{
    j = nlohmann::json{
        {"kind", event.kind},
        {"timestamp", toIso8601Utc(event.timestamp)}
    };
}

inline void to_json(nlohmann::json &j, const WorkInterval &interval)
{
    j = nlohmann::json{
        {"start", interval.start},
        {"end", interval.end.has_value() ? nlohmann::json(*interval.end) : nlohmann::json(nullptr)},
        {"open", interval.isOpen()},
        {"worked", durationJson(interval.worked)}
    };
}

inline void to_json(nlohmann::json &j, const SuccessNotice &notice)
{
    j = nlohmann::json{
        {"event", notice.event},
        {"timestamp", toIso8601Utc(notice.timestamp)},
        {"priorTimestamp", notice.priorTimestamp.has_value()
             ? nlohmann::json(toIso8601Utc(*notice.priorTimestamp))
             : nlohmann::json(nullptr)}
    };
}

inline void to_json(nlohmann::json &j, const FailureNotice &notice)
{
    j = nlohmann::json{
        {"errorKind", notice.errorKind},
        {"currentState", notice.currentState.has_value()
             ? nlohmann::json(*notice.currentState)
             : nlohmann::json(nullptr)},
        {"message", notice.message}
    };
}

inline void to_json(nlohmann::json &j, const DayReport &report)
{
    j = nlohmann::json{
        {"date", toIsoDate(report.date)},
        {"asOf", toIso8601Utc(report.asOf)},
        {"rows", report.rows},
        {"intervals", report.intervals},
        {"currentlyPresent", report.currentlyPresent},
        {"totalWorked", durationJson(report.totalWorked)}
    };
}

inline void to_json(nlohmann::json &j, const WeekDayRow &row)
{
    if (row.absent) {
        j = nlohmann::json{
            {"date", toIsoDate(row.date)},
            {"absent", true}
        };
        return;
    }
    j = nlohmann::json{
        {"date", toIsoDate(row.date)},
        {"absent", false},
        {"worked", durationJson(row.worked)},
        {"delta", durationJson(row.delta)},
        {"currentlyPresent", row.currentlyPresent}
    };
}

inline void to_json(nlohmann::json &j, const WeekReport &report)
{
    j = nlohmann::json{
        {"weekNumber", report.weekNumber},
        {"weekYear", report.weekYear},
        {"startOfWeek", toIsoDate(report.startOfWeek)},
        {"endOfWeek", toIsoDate(report.endOfWeek)},
        {"dailyQuota", durationJson(report.dailyQuota)},
        {"daysSoFar", report.daysSoFar},
        {"currentlyPresent", report.currentlyPresent},
        {"rows", report.rows},
        {"weekTotal", durationJson(report.weekTotal)},
        {"weekDelta", durationJson(report.weekDelta)},
        {"expectedSoFar", optionalDurationJson(report.expectedSoFar)},
        {"remaining", optionalDurationJson(report.remaining)},
        {"remainingPerDay", optionalDurationJson(report.remainingPerDay)}
    };
}

} // namespace timetrack
