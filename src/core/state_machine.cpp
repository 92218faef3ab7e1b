#include "core/state_machine.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace timetrack {

namespace {

std::string stateDescription(std::optional<EventKind> state)
{
    return state.has_value() ? toEventKindString(*state) : std::string("none");
}

std::string rejectionMessage(ErrorKind kind, std::optional<EventKind> state)
{
    switch (kind) {
    case ErrorKind::AlreadyPresent:
        return "already at work (last event: " + stateDescription(state) + ")";
    case ErrorKind::NotWorking:
        return "not working (last event: " + stateDescription(state) + ")";
    case ErrorKind::NotBreaking:
        return "not on a break (last event: " + stateDescription(state) + ")";
    default:
        break;
    }
    return "illegal transition (last event: " + stateDescription(state) + ")";
}

} // namespace

bool isLegalTransition(std::optional<EventKind> last, EventKind next)
{
    switch (next) {
    case EventKind::Arrive:
        return !last.has_value() || *last == EventKind::Leave;
    case EventKind::BreakStart:
    case EventKind::Leave:
        return last.has_value()
            && (*last == EventKind::Arrive || *last == EventKind::BreakEnd);
    case EventKind::BreakEnd:
        return last.has_value() && *last == EventKind::BreakStart;
    }
    return false;
}

ErrorKind rejectionFor(EventKind next)
{
    switch (next) {
    case EventKind::Arrive:
        return ErrorKind::AlreadyPresent;
    case EventKind::BreakStart:
    case EventKind::Leave:
        return ErrorKind::NotWorking;
    case EventKind::BreakEnd:
        return ErrorKind::NotBreaking;
    }
    return ErrorKind::NotWorking;
}

StateMachine::StateMachine(EventLog &log)
    : m_log(log)
{
}

SuccessNotice StateMachine::startDay(std::chrono::system_clock::time_point now)
{
    return apply(EventKind::Arrive, now);
}

SuccessNotice StateMachine::startBreak(std::chrono::system_clock::time_point now)
{
    return apply(EventKind::BreakStart, now);
}

SuccessNotice StateMachine::endBreak(std::chrono::system_clock::time_point now)
{
    return apply(EventKind::BreakEnd, now);
}

SuccessNotice StateMachine::endDay(std::chrono::system_clock::time_point now)
{
    return apply(EventKind::Leave, now);
}

SuccessNotice StateMachine::apply(EventKind next, std::chrono::system_clock::time_point now)
{
    SuccessNotice notice;
    notice.event = next;
    notice.timestamp = now;

    m_log.runExclusive([&]() {
        const auto last = m_log.lastEvent();
        const std::optional<EventKind> lastKind = last.has_value()
            ? std::optional<EventKind>(last->kind)
            : std::nullopt;

        if (!isLegalTransition(lastKind, next)) {
            const ErrorKind kind = rejectionFor(next);
            TTLOG_INFO(QStringLiteral("StateMachine"),
                       QStringLiteral("apply"),
                       QStringLiteral("transition_rejected"),
                       QStringLiteral("illegal_state"),
                       QStringLiteral("last_event_query"),
                       (nlohmann::json{{"next", next},
                                       {"current", stateDescription(lastKind)},
                                       {"error", kind}}));
            throw TimetrackError(kind, rejectionMessage(kind, lastKind), lastKind);
        }

        if (last.has_value() && now < last->timestamp) {
            throw TimetrackError(ErrorKind::InconsistentSequence,
                                 "clock is behind the last recorded event ("
                                     + toIso8601Utc(last->timestamp) + ")",
                                 lastKind);
        }

        m_log.insert(next, now);
        if (last.has_value()) {
            notice.priorTimestamp = last->timestamp;
        }
    });

    TTLOG_INFO(QStringLiteral("StateMachine"),
               QStringLiteral("apply"),
               QStringLiteral("event_recorded"),
               QStringLiteral("user_invocation"),
               QStringLiteral("exclusive_transaction"),
               (nlohmann::json{{"event", next},
                               {"timestamp", toIso8601Utc(now)}}));
    return notice;
}

std::optional<EventKind> StateMachine::currentState() const
{
    const auto last = m_log.lastEvent();
    if (!last.has_value()) {
        return std::nullopt;
    }
    return last->kind;
}

} // namespace timetrack
