#include "cli/TrackerCli.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/local_time.hpp"
#include "common/logging.hpp"
#include "core/day_aggregator.hpp"
#include "core/state_machine.hpp"
#include "core/week_aggregator.hpp"

namespace timetrack {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitIntegrity = 2;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  timetrack [--db PATH] [--format text|json] [--trace] COMMAND\n"
        "\n"
        "Commands:\n"
        "  morning | arrive          start tracking for the day\n"
        "  break                     start a break\n"
        "  resume | continue         end the current break\n"
        "  closing | leave           end tracking for the day\n"
        "  day [--date YYYY-MM-DD]   hours worked on one day (default today)\n"
        "  week [--offset N]         hours worked this week, N <= 0 for past weeks\n"
        "  status                    last recorded event\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// Removes "key value" from args and returns value, or an empty string.
QString takeArgValue(QStringList &args, const QString &key)
{
    const QString value = getArgValue(args, key);
    if (!value.isEmpty()) {
        const int idx = args.indexOf(key);
        args.removeAt(idx + 1);
        args.removeAt(idx);
    }
    return value;
}

std::optional<EventKind> transitionFor(const QString &command)
{
    if (command == QStringLiteral("morning") || command == QStringLiteral("arrive")) {
        return EventKind::Arrive;
    }
    if (command == QStringLiteral("break")) {
        return EventKind::BreakStart;
    }
    if (command == QStringLiteral("resume") || command == QStringLiteral("continue")) {
        return EventKind::BreakEnd;
    }
    if (command == QStringLiteral("closing") || command == QStringLiteral("leave")) {
        return EventKind::Leave;
    }
    return std::nullopt;
}

std::unique_ptr<ReportSink> makeSink(const QString &format)
{
    if (format.isEmpty() || format == QStringLiteral("text")) {
        return std::make_unique<TextReportSink>(std::cout, std::cerr);
    }
    if (format == QStringLiteral("json")) {
        return std::make_unique<JsonReportSink>(std::cout, std::cerr);
    }
    return nullptr;
}

} // namespace

TrackerCli::TrackerCli(TrackerConfig config)
    : m_config(std::move(config))
    , m_clock([]() { return std::chrono::system_clock::now(); })
{
}

void TrackerCli::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

int TrackerCli::run(int argc, char *argv[])
{
    // CLI entry: strip global options, then delegate to the subcommand.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    args.removeAll(QStringLiteral("--trace"));

    const QString dbOverride = takeArgValue(args, QStringLiteral("--db"));
    const QString format = takeArgValue(args, QStringLiteral("--format")).toLower();

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const QString command = args.at(1);
    const auto transition = transitionFor(command);
    if (!transition.has_value() && command != QStringLiteral("day")
        && command != QStringLiteral("week") && command != QStringLiteral("status")) {
        std::cerr << "Unsupported action \"" << command.toStdString() << "\".\n"
                  << usageText().toStdString();
        return kExitUsage;
    }

    auto sink = makeSink(format);
    if (!sink) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsage;
    }

    TrackerConfig config = m_config;
    if (!dbOverride.isEmpty()) {
        config.databasePath = dbOverride.toStdString();
    }

    logging::CorrelationScope correlation(QUuid::createUuid().toString(QUuid::WithoutBraces));
    TTLOG_INFO(QStringLiteral("TrackerCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               (nlohmann::json{{"command", command.toStdString()},
                               {"format", format.isEmpty() ? "text" : format.toStdString()},
                               {"db", config.databasePath}}));

    try {
        TimetrackStore store(config.databasePath);

        if (transition.has_value()) {
            return runTransition(*transition, store, *sink);
        }
        if (command == QStringLiteral("day")) {
            return runDayReport(args, store, *sink);
        }
        if (command == QStringLiteral("week")) {
            return runWeekReport(args, store, config, *sink);
        }
        return runStatus(store, *sink);
    } catch (const TimetrackError &e) {
        FailureNotice notice;
        notice.errorKind = e.kind();
        notice.currentState = e.currentState();
        notice.message = e.what();
        sink->notifyFailure(notice);

        const int code = e.isIntegrityFault() ? kExitIntegrity : kExitUsage;
        const auto context = nlohmann::json{{"command", command.toStdString()},
                                            {"error", e.kind()},
                                            {"message", e.what()},
                                            {"exit", code}};
        if (e.isIntegrityFault()) {
            TTLOG_ERROR(QStringLiteral("TrackerCli"),
                        QStringLiteral("run"),
                        QStringLiteral("command_failed"),
                        QStringLiteral("integrity_fault"),
                        QStringLiteral("exception"),
                        context);
        } else {
            TTLOG_INFO(QStringLiteral("TrackerCli"),
                       QStringLiteral("run"),
                       QStringLiteral("command_rejected"),
                       QStringLiteral("user_error"),
                       QStringLiteral("exception"),
                       context);
        }
        return code;
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << "\n" << usageText().toStdString();
        return kExitUsage;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        TTLOG_ERROR(QStringLiteral("TrackerCli"),
                    QStringLiteral("run"),
                    QStringLiteral("command_failed"),
                    QStringLiteral("unexpected_exception"),
                    QStringLiteral("exception"),
                    (nlohmann::json{{"command", command.toStdString()},
                                    {"message", e.what()},
                                    {"exit", kExitIntegrity}}));
        return kExitIntegrity;
    }
}

int TrackerCli::runTransition(EventKind next, TimetrackStore &store, ReportSink &sink)
{
    StateMachine machine(store);
    const SuccessNotice notice = machine.apply(next, m_clock());
    sink.notifySuccess(notice);
    return kExitOk;
}

int TrackerCli::runDayReport(const QStringList &args, TimetrackStore &store, ReportSink &sink)
{
    const auto now = m_clock();
    QDate date = localDate(now);

    const QString dateValue = getArgValue(args, QStringLiteral("--date"));
    if (!dateValue.isEmpty()) {
        const auto parsed = parseIsoDate(dateValue);
        if (!parsed.has_value()) {
            throw std::invalid_argument("Invalid date, expected YYYY-MM-DD: "
                                        + dateValue.toStdString());
        }
        date = *parsed;
    }

    DayAggregator aggregator(store);
    const DayReport report = aggregator.compute(date, now);

    TTLOG_INFO(QStringLiteral("TrackerCli"),
               QStringLiteral("runDayReport"),
               QStringLiteral("report_day"),
               QStringLiteral("user_invocation"),
               QStringLiteral("sqlite_query"),
               (nlohmann::json{{"date", toIsoDate(date)},
                               {"events", report.rows.size()}}));
    sink.renderDay(report);
    return kExitOk;
}

int TrackerCli::runWeekReport(const QStringList &args, TimetrackStore &store,
                              const TrackerConfig &config, ReportSink &sink)
{
    int offset = 0;
    const QString offsetValue = getArgValue(args, QStringLiteral("--offset"));
    if (!offsetValue.isEmpty()) {
        bool ok = false;
        offset = offsetValue.toInt(&ok);
        if (!ok) {
            throw std::invalid_argument("Invalid week offset: " + offsetValue.toStdString());
        }
    }

    WeekAggregator aggregator(store, config);
    const WeekReport report = aggregator.compute(offset, m_clock());

    TTLOG_INFO(QStringLiteral("TrackerCli"),
               QStringLiteral("runWeekReport"),
               QStringLiteral("report_week"),
               QStringLiteral("user_invocation"),
               QStringLiteral("sqlite_query"),
               (nlohmann::json{{"offset", offset},
                               {"week", report.weekNumber},
                               {"days", report.daysSoFar}}));
    sink.renderWeek(report);
    return kExitOk;
}

int TrackerCli::runStatus(TimetrackStore &store, ReportSink &sink)
{
    TrackerStatus status;
    status.lastEvent = store.lastEvent();
    status.eventCount = store.eventCount();

    std::string integrityMessage;
    status.integrityOk = store.integrityCheck(&integrityMessage);
    if (!status.integrityOk) {
        TTLOG_WARN(QStringLiteral("TrackerCli"),
                   QStringLiteral("runStatus"),
                   QStringLiteral("integrity_check_failed"),
                   QStringLiteral("database_corrupt"),
                   QStringLiteral("pragma_integrity_check"),
                   (nlohmann::json{{"message", integrityMessage}}));
    }

    sink.renderStatus(status);
    return kExitOk;
}

} // namespace timetrack
