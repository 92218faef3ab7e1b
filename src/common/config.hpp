#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"

namespace timetrack {

struct TrackerConfig {
    double weekHours = 40.0;
    int workDaysPerWeek = 5;
    std::string databasePath;
    std::string logDirectory;
    bool traceEnabled = false;

    // weekHours spread evenly over the work days.
    Duration dailyQuota() const;
    Duration weeklyQuota() const;
};

QString defaultDataDir();
QString defaultConfigPath();
std::string defaultDatabasePath();

// Defaults, then the JSON config file, then TIMETRACK_* environment
// variables. Invalid values are logged and replaced by defaults.
TrackerConfig loadConfig(const QString &configPath = defaultConfigPath());

} // namespace timetrack
