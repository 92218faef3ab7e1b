#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>

namespace timetrack::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

// A command runs on one thread from start to exit, so plain globals do.
struct LogTarget {
    QString processName;
    QString directory;
    bool trace = false;
    bool initialized = false;
};

LogTarget g_target;
QString g_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString processName()
{
    if (!g_target.processName.isEmpty()) {
        return g_target.processName;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("timetrack");
}

QString logDirectory()
{
    if (g_target.initialized && !g_target.directory.isEmpty()) {
        return g_target.directory;
    }
    return defaultDataDir() + QStringLiteral("/logs");
}

const QString &who()
{
    static const QString value = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return value;
}

// Keeps <path> under kMaxLogSizeBytes by moving it to <path>.1.
void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }
    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void appendLine(const QString &path, const QByteArray &line)
{
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        // stdout belongs to reports.
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, const TrackerConfig &config)
{
    g_target.processName = processName;
    g_target.directory = QString::fromStdString(config.logDirectory);
    g_target.trace = config.traceEnabled;
    g_target.initialized = true;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(g_corrId)
{
    g_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    g_corrId = m_prev;
}

QString currentCorrelationId()
{
    return g_corrId;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_target.trace) {
        return;
    }

    const QString process = processName();
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"pid", static_cast<long long>(getpid())},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who().toStdString()},
        {"corr", g_corrId.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    const QString dir = logDirectory();
    QDir().mkpath(dir);
    appendLine(dir + QLatin1Char('/') + process + QStringLiteral(".log"), line);
    if (g_target.trace) {
        appendLine(dir + QLatin1Char('/') + process + QStringLiteral("-trace.log"), line);
    }
}

} // namespace timetrack::logging
