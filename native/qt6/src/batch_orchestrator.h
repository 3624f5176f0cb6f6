#pragma once
#include <QObject>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QStringList>
#include <atomic>
#include <utility>

#include "conflict_resolver.h"
#include "fs_probe.h"

class LogManager;

struct FileError {
    QString path;
    QString error;
};

struct BatchResult {
    bool success = true;         // true iff no file failed
    QString message;             // "Processed X/Y files, Z failed"
    QStringList processedFiles;  // source paths, arbitrary order
    QList<FileError> failedFiles;

    int total() const { return processedFiles.size() + failedFiles.size(); }
    QJsonObject toJson() const;
};

struct BatchRequest {
    QStringList files;                 // source paths
    QString outputDir;
    QHash<QString, QString> renameMap; // source -> "anime/season/file.ext" ('/' separated)
    bool createSeasonFolders = false;
    QString seasonFolderTemplate = QStringLiteral("Season {season}");
    bool resolveConflicts = false;     // when false an existing target fails the file
    ConflictAction conflictAction = ConflictAction::Skip;
    int maxWorkers = 4;
    int maxPathLength = FsProbe::DEFAULT_MAX_PATH_LENGTH;
};

/**
 * BatchOrchestrator - links many files into the library in parallel.
 *
 * Every file is an independent task on a bounded thread pool; a failure is
 * recorded against that file only. run() blocks until every task is done.
 * fileFinished/progressChanged are emitted from worker threads.
 */
class BatchOrchestrator : public QObject {
    Q_OBJECT
public:
    explicit BatchOrchestrator(LogManager* log = nullptr, QObject* parent = nullptr);

    // Returns false only when the output directory cannot be created; nothing
    // is processed then. Per-file failures end up in result->failedFiles.
    bool run(const BatchRequest& request, BatchResult* result, QString* errorOut);

    // Destination of every file, computed without touching the filesystem.
    // Files without a usable name map to an empty string.
    QMap<QString, QString> previewTargets(const BatchRequest& request) const;

    // Relative destination ("anime/Season 1/file.mkv") for one source file.
    static QString relativeTargetFor(const BatchRequest& request, const QString& file, QString* errorOut);

    // Overrides the device check of the internal LinkEngine (tests).
    void setDeviceProbe(LinkEngine::DeviceProbe probe) { m_deviceProbe = std::move(probe); }

public slots:
    // Files whose task has not started yet fail with "Cancelled".
    void cancel();

signals:
    void batchStarted(int total);
    void fileFinished(const QString& path, bool success, const QString& error);
    void progressChanged(int current, int total);
    void batchFinished(bool success);

private:
    struct FileOutcome {
        QString path;
        bool ok = false;
        QString error;
    };

    FileOutcome processFile(const QString& file, const QString& outputDir, const BatchRequest& request,
                            const LinkEngine& engine, const ConflictResolver& resolver);

    LogManager* m_log = nullptr;
    LinkEngine::DeviceProbe m_deviceProbe;
    std::atomic_bool m_cancel{false};
};
