#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>

struct LogEntry {
    enum class Level { Debug, Info, Warn, Error };

    QString id;
    QDateTime timestamp;
    Level level = Level::Info;
    QString message;
    QString source; // optional tag, e.g. "LinkEngine"

    QString toString() const;
};

/**
 * LogManager - bounded, append-only log sink.
 *
 * Keeps the newest `capacity` entries in memory and evicts the oldest one when
 * full. Not a singleton: every component that logs receives a LogManager*
 * (which may be null). Thread-safe.
 */
class LogManager : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_CAPACITY = 1000;

    explicit LogManager(int capacity = DEFAULT_CAPACITY, QObject* parent = nullptr);
    ~LogManager() override;

    void addLog(const QString& message, LogEntry::Level level = LogEntry::Level::Info,
                const QString& source = QString());
    void clear();

    QList<LogEntry> entries() const; // snapshot copy
    QStringList logs() const;
    int size() const;
    int capacity() const { return m_capacity; }

    void setMinimumLevel(LogEntry::Level level);
    LogEntry::Level minimumLevel() const;

    // Mirror every accepted entry to a file (appended). Empty path disables.
    bool openLogFile(const QString& path);

    static QString levelName(LogEntry::Level level);
    static LogEntry::Level levelFromString(const QString& name, bool* ok = nullptr);

    // Route qDebug/qInfo/qWarning/qCritical into `target` (null uninstalls).
    static void installMessageHandler(LogManager* target);
    // Messages below the installed manager's minimum level are not echoed to stderr.
    static bool echoesToStderr(LogEntry::Level level);

signals:
    void logAdded(const QString& formatted);

private:
    void flushPending(bool force);

    mutable QMutex m_mutex;
    QList<LogEntry> m_entries;
    const int m_capacity;
    LogEntry::Level m_minLevel = LogEntry::Level::Debug;
    QFile m_file;
    QTextStream m_ts;
    int m_pendingLines = 0;
    static constexpr int FLUSH_EVERY_LINES = 32;
};

// Custom message handler for qDebug/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
