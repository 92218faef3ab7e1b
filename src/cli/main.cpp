#include <QCoreApplication>

#include <vector>

#include "cli/TrackerCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("timetrack"));

    timetrack::TrackerConfig config = timetrack::loadConfig();
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    timetrack::logging::initLogging(QStringLiteral("timetrack"), config);
    TTLOG_DEBUG(QStringLiteral("main"),
                QStringLiteral("main"),
                QStringLiteral("cli_start"),
                QStringLiteral("user_invocation"),
                QStringLiteral("cli"),
                (nlohmann::json{{"args", filteredArgs.size()}}));

    // One command per invocation; TrackerCli owns parsing and exit codes.
    timetrack::TrackerCli cli(config);
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
