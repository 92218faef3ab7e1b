#pragma once

#include <chrono>
#include <optional>

#include "common/models.hpp"
#include "store/event_log.hpp"

namespace timetrack {

// True if an event of kind next may follow an event of kind last (nullopt
// meaning an empty log).
bool isLegalTransition(std::optional<EventKind> last, EventKind next);

// The error raised when next is attempted from an illegal state.
ErrorKind rejectionFor(EventKind next);

/**
 * StateMachine validates and records one event per call. It holds no state
 * of its own: the current state is whatever the log's last event says, read
 * inside the same exclusive transaction that appends the new event.
 *
 *   (none|leave) --arrive--> arrive --break--> break --resume--> resume
 *   arrive|resume --leave--> leave
 */
class StateMachine
{
public:
    explicit StateMachine(EventLog &log);

    SuccessNotice startDay(std::chrono::system_clock::time_point now);
    SuccessNotice startBreak(std::chrono::system_clock::time_point now);
    SuccessNotice endBreak(std::chrono::system_clock::time_point now);
    SuccessNotice endDay(std::chrono::system_clock::time_point now);

    // Validates and appends next; throws TimetrackError on rejection.
    SuccessNotice apply(EventKind next, std::chrono::system_clock::time_point now);

    std::optional<EventKind> currentState() const;

private:
    EventLog &m_log;
};

} // namespace timetrack
