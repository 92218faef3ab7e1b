#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli/TrackerCli.hpp"
#include "common/config.hpp"
#include "common/local_time.hpp"
#include "store/timetrack_store.hpp"

class TrackerCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testFullDayCycle();
    void testStatusJson();
    void testDayJson();
    void testWeekJson();
    void testUsageErrors();
    void testDayWithoutArrival();
    void testIntegrityFaultExitCode();
    void testUnknownCommandLeavesNoDatabase();
    void testUnexpectedExceptionExitCode();
    void testConfigPassedInIsUsed();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::chrono::system_clock::time_point m_now;
    timetrack::TrackerConfig m_config;
    bool m_clockFails = false;
    const QDate m_monday{2024, 6, 3};

    void resetDb();
    std::string dbPath() const;
    int runCli(const QStringList &args, std::string &out, std::string &err);
    int runAt(int hour, int minute, const QStringList &args, std::string &out, std::string &err);
    void recordStandardDay();
};

void TrackerCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("TIMETRACK_DB");
    qunsetenv("TIMETRACK_WEEK_HOURS");
    qunsetenv("TIMETRACK_WORK_DAYS");
}

void TrackerCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string TrackerCliTests::dbPath() const
{
    return (std::filesystem::path(m_tempDir.path().toStdString()) / "cli.db").string();
}

void TrackerCliTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

int TrackerCliTests::runCli(const QStringList &args, std::string &out, std::string &err)
{
    std::stringstream outBuffer;
    std::stringstream errBuffer;
    auto *oldBuf = std::cout.rdbuf(outBuffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(errBuffer.rdbuf());

    timetrack::TrackerCli cli(m_config);
    cli.setClock([this]() {
        if (m_clockFails) {
            throw std::runtime_error("clock unavailable");
        }
        return m_now;
    });

    QStringList fullArgs = args;
    fullArgs.insert(1, QStringLiteral("--db"));
    fullArgs.insert(2, QString::fromStdString(dbPath()));

    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : fullArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = outBuffer.str();
    err = errBuffer.str();
    return result;
}

int TrackerCliTests::runAt(int hour, int minute, const QStringList &args,
                           std::string &out, std::string &err)
{
    m_now = timetrack::localTimePoint(m_monday, hour, minute);
    return runCli(args, out, err);
}

void TrackerCliTests::recordStandardDay()
{
    std::string out;
    std::string err;
    QCOMPARE(runAt(8, 0, {"timetrack", "morning"}, out, err), 0);
    QCOMPARE(runAt(12, 0, {"timetrack", "break"}, out, err), 0);
    QCOMPARE(runAt(13, 0, {"timetrack", "continue"}, out, err), 0);
    QCOMPARE(runAt(17, 0, {"timetrack", "closing"}, out, err), 0);
}

void TrackerCliTests::testFullDayCycle()
{
    resetDb();

    std::string out;
    std::string err;
    QCOMPARE(runAt(8, 0, {"timetrack", "morning"}, out, err), 0);
    QVERIFY(QString::fromStdString(out).contains(QStringLiteral("08:00")));
    QVERIFY(err.empty());

    QCOMPARE(runAt(8, 5, {"timetrack", "arrive"}, out, err), 1);
    QVERIFY(out.empty());
    QVERIFY(QString::fromStdString(err).startsWith(QStringLiteral("Error: ")));

    QCOMPARE(runAt(9, 0, {"timetrack", "resume"}, out, err), 1);
    QCOMPARE(runAt(12, 0, {"timetrack", "break"}, out, err), 0);
    QCOMPARE(runAt(12, 10, {"timetrack", "closing"}, out, err), 1);
    QCOMPARE(runAt(13, 0, {"timetrack", "resume"}, out, err), 0);
    QCOMPARE(runAt(17, 0, {"timetrack", "leave"}, out, err), 0);
    QCOMPARE(runAt(17, 5, {"timetrack", "break"}, out, err), 1);

    timetrack::TimetrackStore store(dbPath());
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(4));
}

void TrackerCliTests::testStatusJson()
{
    resetDb();

    std::string out;
    std::string err;
    QCOMPARE(runAt(7, 0, {"timetrack", "status", "--format", "json"}, out, err), 0);
    auto parsed = nlohmann::json::parse(out);
    QVERIFY(parsed.at("lastEvent").is_null());
    QCOMPARE(parsed.at("eventCount").get<int>(), 0);

    recordStandardDay();

    QCOMPARE(runAt(18, 0, {"timetrack", "--format", "json", "status"}, out, err), 0);
    parsed = nlohmann::json::parse(out);
    QCOMPARE(QString::fromStdString(parsed.at("lastEvent").at("kind").get<std::string>()),
             QStringLiteral("leave"));
    QCOMPARE(parsed.at("eventCount").get<int>(), 4);
    QVERIFY(parsed.at("integrityOk").get<bool>());
}

void TrackerCliTests::testDayJson()
{
    resetDb();
    recordStandardDay();

    std::string out;
    std::string err;
    m_now = timetrack::localTimePoint(m_monday.addDays(1), 9, 0);
    QCOMPARE(runCli({"timetrack", "day", "--date", "2024-06-03", "--format", "json"}, out, err), 0);

    const auto parsed = nlohmann::json::parse(out);
    QCOMPARE(QString::fromStdString(parsed.at("date").get<std::string>()), QStringLiteral("2024-06-03"));
    QCOMPARE(parsed.at("totalWorked").at("hours").get<double>(), 8.0);
    QVERIFY(!parsed.at("currentlyPresent").get<bool>());
    QCOMPARE(parsed.at("rows").size(), static_cast<size_t>(4));

    QCOMPARE(runCli({"timetrack", "day", "--date", "03.06.2024"}, out, err), 1);
}

void TrackerCliTests::testWeekJson()
{
    resetDb();
    recordStandardDay();

    std::string out;
    std::string err;
    QCOMPARE(runAt(18, 0, {"timetrack", "week", "--format", "json"}, out, err), 0);

    const auto parsed = nlohmann::json::parse(out);
    QCOMPARE(parsed.at("weekNumber").get<int>(), 23);
    QCOMPARE(parsed.at("daysSoFar").get<int>(), 1);
    QCOMPARE(parsed.at("weekTotal").at("hours").get<double>(), 8.0);
    QCOMPARE(parsed.at("remaining").at("hours").get<double>(), 32.0);
    QCOMPARE(parsed.at("remainingPerDay").at("hours").get<double>(), 8.0);

    QCOMPARE(runAt(18, 0, {"timetrack", "week"}, out, err), 0);
    QVERIFY(QString::fromStdString(out).contains(QStringLiteral("Week 23")));
    QVERIFY(QString::fromStdString(out).contains(QStringLiteral("Remaining:       32:00")));

    QCOMPARE(runAt(18, 0, {"timetrack", "week", "--offset", "1"}, out, err), 1);
    QCOMPARE(runAt(18, 0, {"timetrack", "week", "--offset", "soon"}, out, err), 1);
}

void TrackerCliTests::testUsageErrors()
{
    resetDb();

    std::string out;
    std::string err;
    QCOMPARE(runAt(8, 0, {"timetrack"}, out, err), 1);
    QVERIFY(QString::fromStdString(err).contains(QStringLiteral("Usage:")));

    QCOMPARE(runAt(8, 0, {"timetrack", "dance"}, out, err), 1);
    QVERIFY(QString::fromStdString(err).contains(QStringLiteral("Unsupported action")));

    QCOMPARE(runAt(8, 0, {"timetrack", "morning", "--format", "xml"}, out, err), 1);

    timetrack::TimetrackStore store(dbPath());
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(0));
}

void TrackerCliTests::testDayWithoutArrival()
{
    resetDb();

    std::string out;
    std::string err;
    QCOMPARE(runAt(12, 0, {"timetrack", "day", "--format", "json"}, out, err), 1);
    QVERIFY(out.empty());
    const auto parsed = nlohmann::json::parse(err);
    QCOMPARE(QString::fromStdString(parsed.at("error").at("errorKind").get<std::string>()),
             QStringLiteral("no_arrival_for_date"));

    QCOMPARE(runAt(12, 0, {"timetrack", "day"}, out, err), 1);
    QVERIFY(QString::fromStdString(err).contains(QStringLiteral("2024-06-03")));
}

void TrackerCliTests::testIntegrityFaultExitCode()
{
    resetDb();

    {
        timetrack::TimetrackStore store(dbPath());
        store.insert(timetrack::EventKind::Arrive, timetrack::localTimePoint(m_monday, 8, 0));
        store.insert(timetrack::EventKind::BreakStart, timetrack::localTimePoint(m_monday, 10, 0));
        store.insert(timetrack::EventKind::Leave, timetrack::localTimePoint(m_monday, 12, 0));
    }

    std::string out;
    std::string err;
    QCOMPARE(runAt(18, 0, {"timetrack", "day", "--format", "json"}, out, err), 2);
    const auto parsed = nlohmann::json::parse(err);
    QCOMPARE(QString::fromStdString(parsed.at("error").at("errorKind").get<std::string>()),
             QStringLiteral("inconsistent_sequence"));

    QCOMPARE(runAt(18, 0, {"timetrack", "week"}, out, err), 2);
}

void TrackerCliTests::testUnknownCommandLeavesNoDatabase()
{
    resetDb();

    std::string out;
    std::string err;
    QCOMPARE(runAt(8, 0, {"timetrack", "dance"}, out, err), 1);
    QVERIFY(!std::filesystem::exists(dbPath()));

    QCOMPARE(runAt(8, 0, {"timetrack", "morning", "--format", "xml"}, out, err), 1);
    QVERIFY(!std::filesystem::exists(dbPath()));

    QCOMPARE(runAt(8, 0, {"timetrack", "morning"}, out, err), 0);
    QVERIFY(std::filesystem::exists(dbPath()));
}

void TrackerCliTests::testUnexpectedExceptionExitCode()
{
    resetDb();

    std::string out;
    std::string err;
    m_clockFails = true;
    const int code = runCli({"timetrack", "morning"}, out, err);
    m_clockFails = false;

    QCOMPARE(code, 2);
    QVERIFY(out.empty());
    QVERIFY(QString::fromStdString(err).contains(QStringLiteral("clock unavailable")));

    timetrack::TimetrackStore store(dbPath());
    QCOMPARE(store.eventCount(), static_cast<std::size_t>(0));
}

void TrackerCliTests::testConfigPassedInIsUsed()
{
    resetDb();
    recordStandardDay();

    m_config.weekHours = 35.0;
    std::string out;
    std::string err;
    const int code = runAt(18, 0, {"timetrack", "week", "--format", "json"}, out, err);
    m_config = timetrack::TrackerConfig();

    QCOMPARE(code, 0);
    const auto parsed = nlohmann::json::parse(out);
    QCOMPARE(parsed.at("dailyQuota").at("hours").get<double>(), 7.0);
    QCOMPARE(parsed.at("remaining").at("hours").get<double>(), 27.0);
}

QTEST_MAIN(TrackerCliTests)
#include "test_tracker_cli.moc"
