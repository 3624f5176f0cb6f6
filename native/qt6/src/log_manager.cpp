#include "log_manager.h"
#include <QMutexLocker>
#include <QUuid>
#include <atomic>
#include <cstdio>

namespace {
std::atomic<LogManager*> s_handlerTarget{nullptr};
}

QString LogEntry::toString() const
{
    QString line = QString("[%1] [%2]").arg(timestamp.toString("hh:mm:ss.zzz"), LogManager::levelName(level));
    if (!source.isEmpty()) line += QString(" [%1]").arg(source);
    return line + ' ' + message;
}

LogManager::LogManager(int capacity, QObject* parent)
    : QObject(parent), m_capacity(capacity > 0 ? capacity : DEFAULT_CAPACITY)
{
}

LogManager::~LogManager() {
    LogManager* self = this;
    s_handlerTarget.compare_exchange_strong(self, nullptr);
    QMutexLocker locker(&m_mutex);
    flushPending(true);
}

QString LogManager::levelName(LogEntry::Level level)
{
    switch (level) {
        case LogEntry::Level::Debug: return "DEBUG";
        case LogEntry::Level::Info: return "INFO";
        case LogEntry::Level::Warn: return "WARN";
        case LogEntry::Level::Error: return "ERROR";
    }
    return "INFO";
}

LogEntry::Level LogManager::levelFromString(const QString& name, bool* ok)
{
    const QString upper = name.trimmed().toUpper();
    if (ok) *ok = true;
    if (upper == "DEBUG") return LogEntry::Level::Debug;
    if (upper == "INFO") return LogEntry::Level::Info;
    if (upper == "WARN" || upper == "WARNING") return LogEntry::Level::Warn;
    if (upper == "ERROR") return LogEntry::Level::Error;
    if (ok) *ok = false;
    return LogEntry::Level::Info;
}

void LogManager::addLog(const QString& message, LogEntry::Level level, const QString& source) {
    QString formatted;
    {
        QMutexLocker locker(&m_mutex);
        if (level < m_minLevel) return;

        LogEntry entry;
        entry.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        entry.timestamp = QDateTime::currentDateTime();
        entry.level = level;
        entry.message = message;
        entry.source = source;
        formatted = entry.toString();

        if (m_entries.size() >= m_capacity) {
            m_entries.removeFirst();
        }
        m_entries.append(entry);

        // Write-through to disk log with buffered flushing
        if (m_ts.device()) {
            m_ts << formatted << '\n';
            ++m_pendingLines;
            flushPending(level >= LogEntry::Level::Warn);
        }
    } // unlock before emitting so receivers may call back into the manager

    emit logAdded(formatted);
}

void LogManager::flushPending(bool force) {
    if (!m_ts.device()) {
        m_pendingLines = 0;
        return;
    }
    if (m_pendingLines > 0 && (force || m_pendingLines >= FLUSH_EVERY_LINES)) {
        m_ts.flush();
        m_pendingLines = 0;
    }
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
}

QList<LogEntry> LogManager::entries() const {
    QMutexLocker locker(&m_mutex);
    return m_entries;
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    QStringList out;
    out.reserve(m_entries.size());
    for (const LogEntry& e : m_entries) out.append(e.toString());
    return out;
}

int LogManager::size() const {
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

void LogManager::setMinimumLevel(LogEntry::Level level) {
    QMutexLocker locker(&m_mutex);
    m_minLevel = level;
}

LogEntry::Level LogManager::minimumLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_minLevel;
}

bool LogManager::openLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    flushPending(true);
    m_ts.setDevice(nullptr);
    if (m_file.isOpen()) m_file.close();
    if (path.isEmpty()) return true;

    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    return true;
}

void LogManager::installMessageHandler(LogManager* target) {
    s_handlerTarget.store(target);
    qInstallMessageHandler(target ? customMessageHandler : nullptr);
}

bool LogManager::echoesToStderr(LogEntry::Level level) {
    LogManager* target = s_handlerTarget.load();
    return !target || level >= target->minimumLevel();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    LogEntry::Level level = LogEntry::Level::Info;
    switch (type) {
        case QtDebugMsg:
            level = LogEntry::Level::Debug;
            break;
        case QtInfoMsg:
            level = LogEntry::Level::Info;
            break;
        case QtWarningMsg:
            level = LogEntry::Level::Warn;
            break;
        case QtCriticalMsg:
        case QtFatalMsg:
            level = LogEntry::Level::Error;
            break;
    }

    if (LogManager* target = s_handlerTarget.load()) {
        target->addLog(msg, level, QStringLiteral("qt"));
    }

    if (type != QtFatalMsg && !LogManager::echoesToStderr(level)) {
        return;
    }

    // Also output to stderr for debugging
    const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    fprintf(stderr, "[%s] [%s] %s\n",
            timestamp.toLocal8Bit().constData(),
            LogManager::levelName(level).toLocal8Bit().constData(),
            msg.toLocal8Bit().constData());
    fflush(stderr);

    if (type == QtFatalMsg) {
        abort();
    }
}
