#pragma once

#include <iosfwd>
#include <memory>

#include "cli/message_catalog.hpp"
#include "common/models.hpp"

namespace timetrack {

// Presentation side of the tracker. Sinks receive structured facts and
// decide on wording; nothing they do feeds back into control flow.
class ReportSink
{
public:
    virtual ~ReportSink() = default;

    virtual void notifySuccess(const SuccessNotice &notice) = 0;
    virtual void notifyFailure(const FailureNotice &notice) = 0;
    virtual void renderDay(const DayReport &report) = 0;
    virtual void renderWeek(const WeekReport &report) = 0;
    virtual void renderStatus(const TrackerStatus &status) = 0;
};

class TextReportSink : public ReportSink
{
public:
    TextReportSink(std::ostream &out, std::ostream &err,
                   std::unique_ptr<MessageCatalog> messages = std::make_unique<MessageCatalog>());

    void notifySuccess(const SuccessNotice &notice) override;
    void notifyFailure(const FailureNotice &notice) override;
    void renderDay(const DayReport &report) override;
    void renderWeek(const WeekReport &report) override;
    void renderStatus(const TrackerStatus &status) override;

private:
    std::ostream &m_out;
    std::ostream &m_err;
    std::unique_ptr<MessageCatalog> m_messages;
};

class JsonReportSink : public ReportSink
{
public:
    JsonReportSink(std::ostream &out, std::ostream &err);

    void notifySuccess(const SuccessNotice &notice) override;
    void notifyFailure(const FailureNotice &notice) override;
    void renderDay(const DayReport &report) override;
    void renderWeek(const WeekReport &report) override;
    void renderStatus(const TrackerStatus &status) override;

private:
    std::ostream &m_out;
    std::ostream &m_err;
};

} // namespace timetrack
