#include "cli/message_catalog.hpp"

#include "common/local_time.hpp"

namespace timetrack {

namespace {

const std::vector<std::string> kArrive = {
    "Good morning! Clocked in at {time}.",
    "Welcome back. Your day started at {time}.",
    "Arrival recorded at {time}. Have a productive day.",
};

const std::vector<std::string> kBreakStart = {
    "Enjoy your break! You worked {elapsed} since {since}.",
    "Break started at {time} after {elapsed} of work.",
    "Time for a pause. Tracking suspended at {time}.",
};

const std::vector<std::string> kBreakEnd = {
    "Welcome back from your {elapsed} break.",
    "Break over at {time}, it lasted {elapsed}.",
    "Tracking resumed at {time}.",
};

const std::vector<std::string> kLeave = {
    "See you tomorrow! Left at {time}.",
    "Day closed at {time}. Last stretch was {elapsed}.",
    "Departure recorded at {time}. Have a nice evening.",
};

const std::vector<std::string> kAlreadyPresent = {
    "You are already at work ({state}).",
    "You never left. Current state: {state}.",
};

const std::vector<std::string> kNotWorking = {
    "You are not working right now ({state}).",
    "Can't do that while not working. Current state: {state}.",
};

const std::vector<std::string> kNotBreaking = {
    "You are not on a break ({state}).",
    "There is no break to end. Current state: {state}.",
};

const std::vector<std::string> kVerbatim = {
    "{message}",
};

void replaceAll(std::string &text, const std::string &from, const std::string &to)
{
    std::string::size_type pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string describeState(const std::optional<EventKind> &state)
{
    if (!state.has_value()) {
        return "nothing recorded yet";
    }
    switch (*state) {
    case EventKind::Arrive:
        return "working since arrival";
    case EventKind::BreakStart:
        return "on a break";
    case EventKind::BreakEnd:
        return "working after a break";
    case EventKind::Leave:
        return "left for the day";
    }
    return "unknown";
}

MessageCatalog::MessageCatalog()
    : m_rng(std::random_device{}())
{
}

MessageCatalog::MessageCatalog(std::uint32_t seed)
    : m_rng(seed)
{
}

const std::vector<std::string> &MessageCatalog::successVariants(EventKind kind) const
{
    switch (kind) {
    case EventKind::Arrive:
        return kArrive;
    case EventKind::BreakStart:
        return kBreakStart;
    case EventKind::BreakEnd:
        return kBreakEnd;
    case EventKind::Leave:
        return kLeave;
    }
    return kArrive;
}

const std::vector<std::string> &MessageCatalog::failureVariants(ErrorKind kind) const
{
    switch (kind) {
    case ErrorKind::AlreadyPresent:
        return kAlreadyPresent;
    case ErrorKind::NotWorking:
        return kNotWorking;
    case ErrorKind::NotBreaking:
        return kNotBreaking;
    default:
        break;
    }
    return kVerbatim;
}

const std::string &MessageCatalog::pick(const std::vector<std::string> &variants)
{
    std::uniform_int_distribution<std::size_t> dist(0, variants.size() - 1);
    return variants[dist(m_rng)];
}

std::string MessageCatalog::successMessage(const SuccessNotice &notice)
{
    // Phrasings mentioning the prior event only make sense when there is one.
    std::vector<std::string> usable;
    for (const auto &variant : successVariants(notice.event)) {
        const bool needsPrior = variant.find("{since}") != std::string::npos
            || variant.find("{elapsed}") != std::string::npos;
        if (!needsPrior || notice.priorTimestamp.has_value()) {
            usable.push_back(variant);
        }
    }

    std::string text = pick(usable);
    replaceAll(text, "{time}", formatLocalTime(notice.timestamp));
    if (notice.priorTimestamp.has_value()) {
        const auto elapsed = std::chrono::duration_cast<Duration>(
            notice.timestamp - *notice.priorTimestamp);
        replaceAll(text, "{since}", formatLocalTime(*notice.priorTimestamp));
        replaceAll(text, "{elapsed}", formatDuration(elapsed));
    }
    return text;
}

std::string MessageCatalog::failureMessage(const FailureNotice &notice)
{
    std::string text = pick(failureVariants(notice.errorKind));
    replaceAll(text, "{state}", describeState(notice.currentState));
    replaceAll(text, "{message}", notice.message);
    return text;
}

} // namespace timetrack
