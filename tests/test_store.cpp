#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/local_time.hpp"
#include "store/timetrack_store.hpp"

using namespace std::chrono_literals;

class StoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testSchemaVersion();
    void testDefaultPathUnderHome();
    void testPersistence();
    void testDuplicateKey();
    void testLastEventOrdering();
    void testEqualTimestampsKeepInsertionOrder();
    void testRangeIsHalfOpen();
    void testFirstEventInRange();
    void testExclusiveRollback();
    void testNewerSchemaRejected();
    void testIntegrityCheck();
    void testLockedDatabaseIsStorageError();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::string dbPath() const;
    std::chrono::system_clock::time_point at(int hour, int minute) const;
};

void StoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string StoreTests::dbPath() const
{
    return (std::filesystem::path(m_tempDir.path().toStdString()) / "store" / "timetrack.db")
        .string();
}

void StoreTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

std::chrono::system_clock::time_point StoreTests::at(int hour, int minute) const
{
    return timetrack::localTimePoint(QDate(2024, 6, 3), hour, minute);
}

void StoreTests::testSchemaVersion()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    QCOMPARE(store.schemaVersion(), timetrack::TimetrackStore::kSchemaVersion);
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(0));
    QVERIFY(!store.lastEvent().has_value());
}

void StoreTests::testDefaultPathUnderHome()
{
    timetrack::TimetrackStore store;
    const std::filesystem::path expected = std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/timetrack/timetrack.db";
    QCOMPARE(QString::fromStdString(store.path()), QString::fromStdString(expected.string()));
    QVERIFY(std::filesystem::exists(expected));
}

void StoreTests::testPersistence()
{
    resetDb();

    {
        timetrack::TimetrackStore store(dbPath());
        store.insert(timetrack::EventKind::Arrive, at(8, 0));
        store.insert(timetrack::EventKind::Leave, at(17, 0));
    }

    {
        timetrack::TimetrackStore store(dbPath());
        QCOMPARE(store.eventCount(), static_cast<std::size_t>(2));
        const auto last = store.lastEvent();
        QVERIFY(last.has_value());
        QCOMPARE(last->kind, timetrack::EventKind::Leave);
        QVERIFY(last->timestamp == at(17, 0));
    }
}

void StoreTests::testDuplicateKey()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Arrive, at(8, 0));

    try {
        store.insert(timetrack::EventKind::Arrive, at(8, 0));
        QFAIL("duplicate (kind, timestamp) must be rejected");
    } catch (const timetrack::TimetrackError &e) {
        QCOMPARE(e.kind(), timetrack::ErrorKind::DuplicateKey);
        QVERIFY(e.isIntegrityFault());
    }
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(1));

    // Same instant, different kind is a different key.
    store.insert(timetrack::EventKind::Leave, at(8, 0));
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(2));
}

void StoreTests::testLastEventOrdering()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Leave, at(17, 0));
    store.insert(timetrack::EventKind::Arrive, at(8, 0));

    const auto last = store.lastEvent();
    QVERIFY(last.has_value());
    QCOMPARE(last->kind, timetrack::EventKind::Leave);

    const auto events = store.eventsInRange(at(0, 0), at(23, 59));
    QCOMPARE(events.size(), static_cast<size_t>(2));
    QCOMPARE(events.front().kind, timetrack::EventKind::Arrive);
}

void StoreTests::testEqualTimestampsKeepInsertionOrder()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Arrive, at(8, 0));
    store.insert(timetrack::EventKind::Leave, at(12, 0));
    store.insert(timetrack::EventKind::Arrive, at(12, 0));

    QCOMPARE(store.lastEvent()->kind, timetrack::EventKind::Arrive);

    const auto events = store.eventsInRange(at(12, 0), at(13, 0));
    QCOMPARE(events.size(), static_cast<size_t>(2));
    QCOMPARE(events[0].kind, timetrack::EventKind::Leave);
    QCOMPARE(events[1].kind, timetrack::EventKind::Arrive);
}

void StoreTests::testRangeIsHalfOpen()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Arrive, at(8, 0));
    store.insert(timetrack::EventKind::Leave, at(12, 0));

    QCOMPARE(store.eventsInRange(at(8, 0), at(12, 0)).size(), static_cast<size_t>(1));
    QCOMPARE(store.eventsInRange(at(8, 0), at(12, 0) + 1ms).size(), static_cast<size_t>(2));
    QVERIFY(store.eventsInRange(at(8, 0) + 1ms, at(12, 0)).empty());
}

void StoreTests::testFirstEventInRange()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Leave, at(1, 0));
    store.insert(timetrack::EventKind::Arrive, at(8, 0));
    store.insert(timetrack::EventKind::Leave, at(12, 0));
    store.insert(timetrack::EventKind::Arrive, at(13, 0));

    const auto arrival = store.firstEventInRange(timetrack::EventKind::Arrive, at(0, 0), at(23, 0));
    QVERIFY(arrival.has_value());
    QVERIFY(arrival->timestamp == at(8, 0));

    const auto later = store.firstEventInRange(timetrack::EventKind::Arrive, at(9, 0), at(23, 0));
    QVERIFY(later->timestamp == at(13, 0));

    QVERIFY(!store.firstEventInRange(timetrack::EventKind::BreakStart, at(0, 0), at(23, 0)));
}

void StoreTests::testExclusiveRollback()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Arrive, at(8, 0));

    bool thrown = false;
    try {
        store.runExclusive([&]() {
            store.insert(timetrack::EventKind::Leave, at(12, 0));
            throw std::runtime_error("abort");
        });
    } catch (const std::runtime_error &e) {
        thrown = QString::fromUtf8(e.what()) == QStringLiteral("abort");
    }
    QVERIFY(thrown);
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(1));

    store.runExclusive([&]() {
        store.insert(timetrack::EventKind::Leave, at(12, 0));
    });
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(2));
}

void StoreTests::testNewerSchemaRejected()
{
    resetDb();

    {
        timetrack::TimetrackStore store(dbPath());
    }

    sqlite3 *db = nullptr;
    QCOMPARE(sqlite3_open(dbPath().c_str(), &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, "PRAGMA user_version = 99;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    try {
        timetrack::TimetrackStore store(dbPath());
        QFAIL("a newer schema must not be opened");
    } catch (const timetrack::TimetrackError &e) {
        QCOMPARE(e.kind(), timetrack::ErrorKind::Storage);
    }
}

void StoreTests::testIntegrityCheck()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Arrive, at(8, 0));

    std::string message;
    QVERIFY(store.integrityCheck(&message));
    QCOMPARE(QString::fromStdString(message), QStringLiteral("ok"));
}

void StoreTests::testLockedDatabaseIsStorageError()
{
    resetDb();

    timetrack::TimetrackStore store(dbPath());
    store.insert(timetrack::EventKind::Arrive, at(8, 0));
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(1));

    sqlite3 *other = nullptr;
    QCOMPARE(sqlite3_open(dbPath().c_str(), &other), SQLITE_OK);
    QCOMPARE(sqlite3_exec(other, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    // A held lock must never read as an empty log.
    try {
        store.lastEvent();
        QFAIL("a locked database must not look empty");
    } catch (const timetrack::TimetrackError &e) {
        QCOMPARE(e.kind(), timetrack::ErrorKind::Storage);
        QVERIFY(e.isIntegrityFault());
    }

    try {
        store.firstEventInRange(timetrack::EventKind::Arrive, at(0, 0), at(23, 0));
        QFAIL("a locked database must not hide the arrival");
    } catch (const timetrack::TimetrackError &e) {
        QCOMPARE(e.kind(), timetrack::ErrorKind::Storage);
    }

    sqlite3_exec(other, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(other);

    const auto last = store.lastEvent();
    QVERIFY(last.has_value());
    QCOMPARE(last->kind, timetrack::EventKind::Arrive);
}

QTEST_MAIN(StoreTests)
#include "test_store.moc"
