#include "cli/report_sink.hpp"

#include <iomanip>
#include <ostream>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/local_time.hpp"

namespace timetrack {

namespace {

std::string eventLabel(EventKind kind)
{
    switch (kind) {
    case EventKind::Arrive:
        return "Arrived";
    case EventKind::BreakStart:
        return "Break";
    case EventKind::BreakEnd:
        return "Resumed";
    case EventKind::Leave:
        return "Left";
    }
    return "Unknown";
}

std::string dayLabel(const QDate &date)
{
    return date.toString(QStringLiteral("ddd yyyy-MM-dd")).toStdString();
}

} // namespace

TextReportSink::TextReportSink(std::ostream &out, std::ostream &err,
                               std::unique_ptr<MessageCatalog> messages)
    : m_out(out)
    , m_err(err)
    , m_messages(std::move(messages))
{
}

void TextReportSink::notifySuccess(const SuccessNotice &notice)
{
    m_out << m_messages->successMessage(notice) << "\n";
}

void TextReportSink::notifyFailure(const FailureNotice &notice)
{
    m_err << "Error: " << m_messages->failureMessage(notice) << "\n";
}

void TextReportSink::renderDay(const DayReport &report)
{
    m_out << "Day " << dayLabel(report.date) << "\n\n";
    for (const auto &row : report.rows) {
        m_out << "  " << formatLocalTime(row.timestamp) << "  "
              << eventLabel(row.kind) << "\n";
    }
    if (report.currentlyPresent) {
        m_out << "  " << formatLocalTime(report.asOf)
              << "  (still working)\n";
    }
    m_out << "\nWorked: " << formatDuration(report.totalWorked) << "\n";
}

void TextReportSink::renderWeek(const WeekReport &report)
{
    m_out << "Week " << report.weekNumber << " (" << toIsoDate(report.startOfWeek)
          << ")\n\n";
    for (const auto &row : report.rows) {
        m_out << "  " << dayLabel(row.date);
        if (row.absent) {
            m_out << "\n";
            continue;
        }
        m_out << "  " << std::setw(6) << formatDuration(row.worked)
              << "  " << std::setw(7) << formatSignedDuration(row.delta);
        if (row.currentlyPresent) {
            m_out << "  (still working)";
        }
        m_out << "\n";
    }

    m_out << "\n";
    if (report.expectedSoFar.has_value()) {
        m_out << "Expected so far: " << formatDuration(*report.expectedSoFar) << "\n";
    }
    m_out << "Week total:      " << formatDuration(report.weekTotal)
          << " (" << formatSignedDuration(report.weekDelta) << ")\n";
    if (report.remaining.has_value()) {
        m_out << "Remaining:       " << formatDuration(*report.remaining) << "\n";
    }
    if (report.remainingPerDay.has_value()) {
        m_out << "Per day left:    " << formatDuration(*report.remainingPerDay) << "\n";
    }
}

void TextReportSink::renderStatus(const TrackerStatus &status)
{
    if (status.lastEvent.has_value()) {
        m_out << "Last event: " << eventLabel(status.lastEvent->kind) << " at "
              << formatLocalTime(status.lastEvent->timestamp,
                                 QStringLiteral("yyyy-MM-dd HH:mm"))
              << "\n";
        m_out << "State:      " << describeState(status.lastEvent->kind) << "\n";
    } else {
        m_out << "No events recorded yet.\n";
    }
    m_out << "Events:     " << status.eventCount << "\n";
    m_out << "Database:   " << (status.integrityOk ? "ok" : "integrity check failed") << "\n";
}

JsonReportSink::JsonReportSink(std::ostream &out, std::ostream &err)
    : m_out(out)
    , m_err(err)
{
}

void JsonReportSink::notifySuccess(const SuccessNotice &notice)
{
    m_out << nlohmann::json(notice).dump(2) << std::endl;
}

void JsonReportSink::notifyFailure(const FailureNotice &notice)
{
    m_err << nlohmann::json{{"error", notice}}.dump(2) << std::endl;
}

void JsonReportSink::renderDay(const DayReport &report)
{
    m_out << nlohmann::json(report).dump(2) << std::endl;
}

void JsonReportSink::renderWeek(const WeekReport &report)
{
    m_out << nlohmann::json(report).dump(2) << std::endl;
}

void JsonReportSink::renderStatus(const TrackerStatus &status)
{
    nlohmann::json payload;
    payload["lastEvent"] = status.lastEvent.has_value()
        ? nlohmann::json(*status.lastEvent)
        : nlohmann::json(nullptr);
    payload["eventCount"] = status.eventCount;
    payload["integrityOk"] = status.integrityOk;
    m_out << payload.dump(2) << std::endl;
}

} // namespace timetrack
