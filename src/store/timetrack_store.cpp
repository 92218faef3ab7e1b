#include "store/timetrack_store.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace timetrack {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kCreateTimesTable =
    "CREATE TABLE IF NOT EXISTS times ("
    "    kind TEXT NOT NULL CHECK ("
    "        kind IN ('arrive', 'break', 'resume', 'leave')),"
    "    ts INTEGER NOT NULL,"
    "    PRIMARY KEY (kind, ts)"
    ");";

constexpr const char *kCreateTimesIndex =
    "CREATE INDEX IF NOT EXISTS times_ts ON times (ts);";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw TimetrackError(ErrorKind::Storage,
                                 std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw TimetrackError(ErrorKind::Storage, message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

WorkEvent readEvent(sqlite3_stmt *stmt)
{
    const std::string kindText = columnText(stmt, 0);
    const auto kind = parseEventKindString(kindText);
    if (!kind.has_value()) {
        throw TimetrackError(ErrorKind::InconsistentSequence,
                             "unknown event kind in log: " + kindText);
    }

    WorkEvent event;
    event.kind = *kind;
    event.timestamp = fromEpochMillis(sqlite3_column_int64(stmt, 1));
    return event;
}

// Steps once; true on a row, false when the result set is exhausted.
bool stepRow(sqlite3 *db, sqlite3_stmt *stmt)
{
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw TimetrackError(ErrorKind::Storage,
                         std::string("sqlite query failed: ") + sqlite3_errmsg(db));
}

int readUserVersion(sqlite3 *db)
{
    Statement stmt(db, "PRAGMA user_version;");
    if (!stepRow(db, stmt.get())) {
        throw TimetrackError(ErrorKind::Storage, "failed to read schema version");
    }
    return sqlite3_column_int(stmt.get(), 0);
}

} // namespace

struct TimetrackStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
};

TimetrackStore::TimetrackStore(const std::string &path)
    : impl(std::make_unique<Impl>())
{
    impl->path = path.empty() ? defaultDatabasePath() : path;

    const std::filesystem::path dbPath(impl->path);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
        if (error) {
            throw TimetrackError(ErrorKind::Storage,
                                 "failed to create " + dbPath.parent_path().string()
                                     + ": " + error.message());
        }
    }

    if (sqlite3_open(impl->path.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw TimetrackError(ErrorKind::Storage,
                             "failed to open timetrack database " + impl->path + ": " + message);
    }
    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);

    try {
        const int version = readUserVersion(impl->db);
        if (version > kSchemaVersion) {
            throw TimetrackError(ErrorKind::Storage,
                                 "database schema version " + std::to_string(version)
                                     + " is newer than supported version "
                                     + std::to_string(kSchemaVersion));
        }
        if (version == 0) {
            execOrThrow(impl->db, "BEGIN EXCLUSIVE;");
            try {
                execOrThrow(impl->db, kCreateTimesTable);
                execOrThrow(impl->db, kCreateTimesIndex);
                execOrThrow(impl->db, "PRAGMA user_version = 1;");
                execOrThrow(impl->db, "COMMIT;");
            } catch (const TimetrackError &) {
                sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
                throw;
            }

            TTLOG_INFO(QStringLiteral("TimetrackStore"),
                       QStringLiteral("TimetrackStore"),
                       QStringLiteral("schema_created"),
                       QStringLiteral("empty_database"),
                       QStringLiteral("sqlite_exec"),
                       (nlohmann::json{{"path", impl->path},
                                       {"version", kSchemaVersion}}));
        }
        // Upgrades from version 1 onwards go here.
    } catch (const TimetrackError &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

TimetrackStore::~TimetrackStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

void TimetrackStore::insert(EventKind kind, std::chrono::system_clock::time_point timestamp)
{
    Statement stmt(impl->db, "INSERT INTO times (kind, ts) VALUES (?, ?);");
    bindText(stmt.get(), 1, toEventKindString(kind));
    sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(timestamp));

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT) {
        throw TimetrackError(ErrorKind::DuplicateKey,
                             "an event '" + toEventKindString(kind) + "' at "
                                 + toIso8601Utc(timestamp) + " is already recorded");
    }
    if (rc != SQLITE_DONE) {
        throw TimetrackError(ErrorKind::Storage,
                             std::string("failed to insert event: ") + sqlite3_errmsg(impl->db));
    }
}

std::optional<WorkEvent> TimetrackStore::lastEvent() const
{
    Statement stmt(impl->db,
                   "SELECT kind, ts FROM times ORDER BY ts DESC, rowid DESC LIMIT 1;");
    if (!stepRow(impl->db, stmt.get())) {
        return std::nullopt;
    }
    return readEvent(stmt.get());
}

std::vector<WorkEvent> TimetrackStore::eventsInRange(
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    Statement stmt(impl->db,
                   "SELECT kind, ts FROM times WHERE ts >= ? AND ts < ? "
                   "ORDER BY ts ASC, rowid ASC;");
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(from));
    sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(to));

    std::vector<WorkEvent> events;
    while (stepRow(impl->db, stmt.get())) {
        events.push_back(readEvent(stmt.get()));
    }
    return events;
}

std::optional<WorkEvent> TimetrackStore::firstEventInRange(
    EventKind kind,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) const
{
    Statement stmt(impl->db,
                   "SELECT kind, ts FROM times WHERE kind = ? AND ts >= ? AND ts < ? "
                   "ORDER BY ts ASC, rowid ASC LIMIT 1;");
    bindText(stmt.get(), 1, toEventKindString(kind));
    sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(from));
    sqlite3_bind_int64(stmt.get(), 3, toEpochMillis(to));

    if (!stepRow(impl->db, stmt.get())) {
        return std::nullopt;
    }
    return readEvent(stmt.get());
}

std::size_t TimetrackStore::eventCount() const
{
    Statement stmt(impl->db, "SELECT COUNT(*) FROM times;");
    if (!stepRow(impl->db, stmt.get())) {
        throw TimetrackError(ErrorKind::Storage, "failed to count events");
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

void TimetrackStore::runExclusive(const std::function<void()> &work)
{
    // Already inside a transaction: the outer scope owns commit/rollback.
    if (sqlite3_get_autocommit(impl->db) == 0) {
        work();
        return;
    }

    execOrThrow(impl->db, "BEGIN EXCLUSIVE;");
    try {
        work();
    } catch (const std::exception &) {
        sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    execOrThrow(impl->db, "COMMIT;");
}

int TimetrackStore::schemaVersion() const
{
    return readUserVersion(impl->db);
}

bool TimetrackStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (!stepRow(impl->db, stmt.get())) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

const std::string &TimetrackStore::path() const
{
    return impl->path;
}

} // namespace timetrack
