#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include <QString>
#include <QStringList>

#include "cli/report_sink.hpp"
#include "common/config.hpp"
#include "store/timetrack_store.hpp"

namespace timetrack {

class TrackerCli
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit TrackerCli(TrackerConfig config);

    // CLI dispatcher for the tracking verbs and reports.
    // returns exit code: 0 ok, 1 usage or rule violation, 2 integrity fault
    int run(int argc, char *argv[]);

    void setClock(Clock clock);

private:
    // Each subcommand opens the store, runs one core operation and hands the
    // outcome to the sink.
    int runTransition(EventKind next, TimetrackStore &store, ReportSink &sink);
    int runDayReport(const QStringList &args, TimetrackStore &store, ReportSink &sink);
    int runWeekReport(const QStringList &args, TimetrackStore &store,
                      const TrackerConfig &config, ReportSink &sink);
    int runStatus(TimetrackStore &store, ReportSink &sink);

    TrackerConfig m_config;
    Clock m_clock;
};

} // namespace timetrack
