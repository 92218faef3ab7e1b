#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <QDate>

#include "common/enums.hpp"

namespace timetrack {

// Every failure the tracker reports carries one of the ErrorKind values.
// Rule violations also carry the state the log was in when they were raised.
class TimetrackError : public std::runtime_error
{
public:
    TimetrackError(ErrorKind kind, const std::string &message,
                   std::optional<EventKind> currentState = std::nullopt);

    ErrorKind kind() const noexcept
    {
        return m_kind;
    }

    const std::optional<EventKind> &currentState() const noexcept
    {
        return m_currentState;
    }

    // Rule violations and missing days are the user's doing; everything
    // else means the log itself cannot be trusted.
    bool isIntegrityFault() const noexcept;

    static TimetrackError noArrivalForDate(const QDate &date);

private:
    ErrorKind m_kind;
    std::optional<EventKind> m_currentState;
};

} // namespace timetrack
