#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace timekeep::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
// foo.log.1 is the newest rotated file, foo.log.3 the oldest kept.
constexpr int kRotatedGenerations = 3;

struct LogState {
    std::mutex mutex;
    QString processName;
    QString sessionId;
    bool traceEnabled = false;
    LogLevel minimumLevel = LogLevel::Info;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

thread_local QString t_corrId;

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

// TIMEKEEP_LOG_LEVEL=debug|info|warn|error; anything else keeps the default.
LogLevel levelFromEnvironment(LogLevel fallback)
{
    const QString value = qEnvironmentVariable("TIMEKEEP_LOG_LEVEL").trimmed().toLower();
    if (value == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (value == QStringLiteral("info")) {
        return LogLevel::Info;
    }
    if (value == QStringLiteral("warn") || value == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (value == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    return fallback;
}

void rotate(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        const QString from = path + QStringLiteral(".%1").arg(generation);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

// Caller holds the state mutex.
void appendLine(const QString &path, const QByteArray &line)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    rotate(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line + '\n');
}

// The sampler thread is named; fall back to the native id elsewhere.
std::string threadLabel()
{
    const QThread *thread = QThread::currentThread();
    if (thread && !thread->objectName().isEmpty()) {
        return thread->objectName().toStdString();
    }
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
        .toStdString();
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.traceEnabled = traceEnabled;
    s.minimumLevel = levelFromEnvironment(traceEnabled ? LogLevel::Debug : LogLevel::Info);
    if (s.sessionId.isEmpty()) {
        s.sessionId = QUuid::createUuid().toString(QUuid::WithoutBraces).left(8);
    }
}

bool isTraceEnabled()
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.traceEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QStringLiteral(".") : home;
    return base + QStringLiteral("/.local/share/timekeep/logs");
}

QString defaultProcessName()
{
    {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("timekeep");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;

    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    const bool toMain = level >= s.minimumLevel;
    if (!toMain && !s.traceEnabled) {
        return;
    }

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"pid", static_cast<long long>(getpid())},
        {"session", s.sessionId.toStdString()},
        {"thread", threadLabel()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString base = logsDirPath() + QLatin1Char('/') + process;
    if (toMain) {
        appendLine(base + QStringLiteral(".log"), line);
    }
    // The trace file records every level while trace mode is on.
    if (s.traceEnabled) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace timekeep::logging
