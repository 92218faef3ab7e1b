#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "common/models.hpp"

namespace timetrack {

// Ordered, append-only log of (kind, timestamp) events. Events are unique
// per (kind, timestamp); equal timestamps keep insertion order.
class EventLog {
public:
    virtual ~EventLog() = default;

    // Throws TimetrackError(DuplicateKey) if the pair is already recorded.
    virtual void insert(EventKind kind, std::chrono::system_clock::time_point timestamp) = 0;

    virtual std::optional<WorkEvent> lastEvent() const = 0;

    // [from, to), ascending.
    virtual std::vector<WorkEvent> eventsInRange(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;

    // Earliest event of the given kind in [from, to).
    virtual std::optional<WorkEvent> firstEventInRange(
        EventKind kind,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;

    virtual std::size_t eventCount() const = 0;

    // Runs work under an exclusive lock on the whole log. Commits when work
    // returns, rolls back and rethrows when it throws.
    virtual void runExclusive(const std::function<void()> &work) = 0;
};

} // namespace timetrack
