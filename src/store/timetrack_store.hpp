#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "store/event_log.hpp"

namespace timetrack {

// TimetrackStore is the SQLite access layer behind EventLog: a single
// times table keyed by (kind, ts), versioned through PRAGMA user_version.
class TimetrackStore : public EventLog {
public:
    static constexpr int kSchemaVersion = 1;

    // Opens (and creates if needed) the database at path, creating parent
    // directories. An empty path selects defaultDatabasePath().
    explicit TimetrackStore(const std::string &path = std::string());
    ~TimetrackStore() override;

    TimetrackStore(const TimetrackStore &) = delete;
    TimetrackStore &operator=(const TimetrackStore &) = delete;

    void insert(EventKind kind, std::chrono::system_clock::time_point timestamp) override;
    std::optional<WorkEvent> lastEvent() const override;
    std::vector<WorkEvent> eventsInRange(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;
    std::optional<WorkEvent> firstEventInRange(
        EventKind kind,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const override;
    std::size_t eventCount() const override;
    void runExclusive(const std::function<void()> &work) override;

    int schemaVersion() const;
    bool integrityCheck(std::string *message = nullptr) const;
    const std::string &path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace timetrack
