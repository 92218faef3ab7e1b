#include "common/config.hpp"

#include <cmath>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace timetrack {

namespace {

constexpr double kDefaultWeekHours = 40.0;
constexpr int kDefaultWorkDays = 5;

QString homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? QStringLiteral(".") : home;
}

void applyConfigFile(const QString &path, TrackerConfig &config)
{
    QFile file(path);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        TTLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("applyConfigFile"),
                   QStringLiteral("config_unreadable"),
                   QStringLiteral("open_failed"),
                   QStringLiteral("qfile"),
                   (nlohmann::json{{"path", path.toStdString()}}));
        return;
    }

    try {
        const auto j = nlohmann::json::parse(file.readAll().toStdString());
        config.weekHours = j.value("week_hours", config.weekHours);
        config.workDaysPerWeek = j.value("work_days_per_week", config.workDaysPerWeek);
        config.databasePath = j.value("database", config.databasePath);
        config.logDirectory = j.value("log_dir", config.logDirectory);
        config.traceEnabled = j.value("trace", config.traceEnabled);
    } catch (const nlohmann::json::exception &e) {
        TTLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("applyConfigFile"),
                   QStringLiteral("config_malformed"),
                   QStringLiteral("parse_error"),
                   QStringLiteral("nlohmann_json"),
                   (nlohmann::json{{"path", path.toStdString()}, {"error", e.what()}}));
    }
}

void applyEnvironment(TrackerConfig &config)
{
    bool ok = false;
    const QString weekHours = qEnvironmentVariable("TIMETRACK_WEEK_HOURS");
    if (!weekHours.isEmpty()) {
        const double value = weekHours.toDouble(&ok);
        config.weekHours = ok ? value : -1.0;
    }

    const QString workDays = qEnvironmentVariable("TIMETRACK_WORK_DAYS");
    if (!workDays.isEmpty()) {
        const int value = workDays.toInt(&ok);
        config.workDaysPerWeek = ok ? value : 0;
    }

    const QString db = qEnvironmentVariable("TIMETRACK_DB");
    if (!db.isEmpty()) {
        config.databasePath = db.toStdString();
    }

    if (qEnvironmentVariableIsSet("TIMETRACK_TRACE")) {
        config.traceEnabled = qEnvironmentVariableIntValue("TIMETRACK_TRACE") == 1;
    }
}

void validate(TrackerConfig &config)
{
    if (!std::isfinite(config.weekHours) || config.weekHours <= 0.0) {
        TTLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("validate"),
                   QStringLiteral("invalid_week_hours"),
                   QStringLiteral("out_of_range"),
                   QStringLiteral("fallback_default"),
                   (nlohmann::json{{"value", config.weekHours}}));
        config.weekHours = kDefaultWeekHours;
    }
    if (config.workDaysPerWeek < 1 || config.workDaysPerWeek > 7) {
        TTLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("validate"),
                   QStringLiteral("invalid_work_days"),
                   QStringLiteral("out_of_range"),
                   QStringLiteral("fallback_default"),
                   (nlohmann::json{{"value", config.workDaysPerWeek}}));
        config.workDaysPerWeek = kDefaultWorkDays;
    }
    if (config.databasePath.empty()) {
        config.databasePath = defaultDatabasePath();
    }
    if (config.logDirectory.empty()) {
        config.logDirectory = (defaultDataDir() + QStringLiteral("/logs")).toStdString();
    }
}

} // namespace

Duration TrackerConfig::weeklyQuota() const
{
    return Duration{std::llround(weekHours * 3600.0 * 1000.0)};
}

Duration TrackerConfig::dailyQuota() const
{
    return weeklyQuota() / workDaysPerWeek;
}

QString defaultDataDir()
{
    return homeDir() + QStringLiteral("/.local/share/timetrack");
}

QString defaultConfigPath()
{
    return homeDir() + QStringLiteral("/.config/timetrack/config.json");
}

std::string defaultDatabasePath()
{
    return (defaultDataDir() + QStringLiteral("/timetrack.db")).toStdString();
}

TrackerConfig loadConfig(const QString &configPath)
{
    TrackerConfig config;
    applyConfigFile(configPath, config);
    applyEnvironment(config);
    validate(config);
    return config;
}

} // namespace timetrack
