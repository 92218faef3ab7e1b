#include "common/errors.hpp"

namespace timetrack {

TimetrackError::TimetrackError(ErrorKind kind, const std::string &message,
                               std::optional<EventKind> currentState)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_currentState(currentState)
{
}

bool TimetrackError::isIntegrityFault() const noexcept
{
    switch (m_kind) {
    case ErrorKind::AlreadyPresent:
    case ErrorKind::NotWorking:
    case ErrorKind::NotBreaking:
    case ErrorKind::NoArrivalForDate:
        return false;
    case ErrorKind::InconsistentSequence:
    case ErrorKind::DuplicateKey:
    case ErrorKind::Storage:
        return true;
    }
    return true;
}

TimetrackError TimetrackError::noArrivalForDate(const QDate &date)
{
    return TimetrackError(ErrorKind::NoArrivalForDate,
                          "no arrival recorded on "
                              + date.toString(Qt::ISODate).toStdString());
}

} // namespace timetrack
