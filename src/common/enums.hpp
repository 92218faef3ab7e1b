#pragma once

namespace timetrack {

enum class EventKind {
    Arrive,
    BreakStart,
    BreakEnd,
    Leave
};

enum class ErrorKind {
    AlreadyPresent,
    NotWorking,
    NotBreaking,
    NoArrivalForDate,
    InconsistentSequence,
    DuplicateKey,
    Storage
};

} // namespace timetrack
