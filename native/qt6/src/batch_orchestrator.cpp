#include "batch_orchestrator.h"
#include "file_utils.h"
#include "log_manager.h"
#include "path_sanitizer.h"

#include <QtConcurrent>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QThreadPool>

namespace {
constexpr int kMaxWorkers = 64;
const QString kLogSource = QStringLiteral("BatchOrchestrator");
}

QJsonObject BatchResult::toJson() const
{
    QJsonArray failed;
    for (const FileError& e : failedFiles) {
        failed.append(QJsonObject{{"path", e.path}, {"error", e.error}});
    }
    return QJsonObject{
        {"success", success},
        {"message", message},
        {"processed_files", QJsonArray::fromStringList(processedFiles)},
        {"failed_files", failed},
    };
}

BatchOrchestrator::BatchOrchestrator(LogManager* log, QObject* parent)
    : QObject(parent), m_log(log)
{
}

void BatchOrchestrator::cancel()
{
    m_cancel.store(true);
}

QString BatchOrchestrator::relativeTargetFor(const BatchRequest& request, const QString& file, QString* errorOut)
{
    QStringList parts;
    const auto it = request.renameMap.constFind(file);
    if (it != request.renameMap.constEnd()) {
        parts = PathSanitizer::splitRelativeTarget(it.value());
    }
    if (parts.isEmpty()) {
        const QString fileName = QFileInfo(file).fileName();
        if (fileName.isEmpty()) {
            if (errorOut) *errorOut = QString("Invalid file name");
            return QString();
        }
        parts.append(PathSanitizer::sanitizeName(fileName));
    }

    // anime/season/file -> anime/<season folder>/file, anything else -> anime/file
    if (parts.size() >= 2) {
        const QString anime = parts.first();
        const QString fileName = parts.last();
        if (request.createSeasonFolders && parts.size() >= 3) {
            const uint season = PathSanitizer::extractSeasonNumber(parts.at(1));
            const QString folder = PathSanitizer::generateFolderName(request.seasonFolderTemplate, season);
            parts = QStringList{anime, folder, fileName};
        } else {
            parts = QStringList{anime, fileName};
        }
    }
    return parts.join(QLatin1Char('/'));
}

QMap<QString, QString> BatchOrchestrator::previewTargets(const BatchRequest& request) const
{
    QMap<QString, QString> result;
    const QString outputDir = PathSanitizer::sanitizePath(request.outputDir);
    for (const QString& file : request.files) {
        const QString rel = relativeTargetFor(request, file, nullptr);
        result.insert(file, rel.isEmpty() ? QString() : QDir(outputDir).filePath(rel));
    }
    return result;
}

BatchOrchestrator::FileOutcome BatchOrchestrator::processFile(const QString& file, const QString& outputDir,
                                                              const BatchRequest& request, const LinkEngine& engine,
                                                              const ConflictResolver& resolver)
{
    FileOutcome out;
    out.path = file;

    if (m_cancel.load()) {
        out.error = QString("Cancelled");
        return out;
    }

    QString err;
    const QString rel = relativeTargetFor(request, file, &err);
    if (rel.isEmpty()) {
        out.error = err;
        if (!m_log) qWarning() << "[BatchOrchestrator] invalid file name:" << file;
        return out;
    }
    const QString target = QDir(outputDir).filePath(rel);

    if (request.resolveConflicts) {
        const ConflictOutcome c = resolver.resolve(file, target, request.conflictAction);
        out.ok = c.isOk();
        if (!out.ok) out.error = c.message();
    } else {
        const LinkOutcome l = engine.link(file, target);
        out.ok = l.isSuccess();
        if (!out.ok) out.error = l.message();
    }

    // With a log manager the failure is recorded by the engine and in the batch summary
    if (!out.ok && !m_log) {
        qWarning() << "[BatchOrchestrator] file failed:" << file << "error:" << out.error;
    }
    return out;
}

bool BatchOrchestrator::run(const BatchRequest& request, BatchResult* result, QString* errorOut)
{
    m_cancel.store(false);
    const int total = request.files.size();

    if (m_log) {
        m_log->addLog(QString("Batch started: %1 file%2 to %3, season folders: %4, template: %5")
                          .arg(total).arg(total == 1 ? "" : "s")
                          .arg(request.outputDir, request.createSeasonFolders ? QString("on") : QString("off"), request.seasonFolderTemplate),
                      LogEntry::Level::Info, kLogSource);
    } else {
        qInfo() << "[BatchOrchestrator] Start" << total << "file(s) ->" << request.outputDir
                << "seasonFolders=" << request.createSeasonFolders << "template=" << request.seasonFolderTemplate;
    }

    const QString outputDir = PathSanitizer::sanitizePath(request.outputDir);
    if (!FileUtils::dirExists(outputDir)) {
        if (!QDir().mkpath(outputDir)) {
            const QString msg = QString("Failed to create output directory: %1").arg(outputDir);
            if (m_log) m_log->addLog(msg, LogEntry::Level::Error, kLogSource);
            else qWarning() << "[BatchOrchestrator]" << msg;
            if (errorOut) *errorOut = msg;
            return false;
        }
    }

    emit batchStarted(total);

    LinkEngine engine(m_log);
    engine.setMaxPathLength(request.maxPathLength);
    if (m_deviceProbe) engine.setDeviceProbe(m_deviceProbe);
    ConflictResolver resolver(engine);

    QThreadPool pool;
    pool.setMaxThreadCount(qBound(1, request.maxWorkers, kMaxWorkers));

    std::atomic_int done{0};
    auto task = [&](const QString& file) -> FileOutcome {
        FileOutcome o = processFile(file, outputDir, request, engine, resolver);
        emit fileFinished(o.path, o.ok, o.error);
        emit progressChanged(++done, total);
        return o;
    };
    const QList<FileOutcome> outcomes = total > 0
        ? QtConcurrent::blockingMapped<QList<FileOutcome>>(&pool, request.files, task)
        : QList<FileOutcome>();

    BatchResult res;
    for (const FileOutcome& o : outcomes) {
        if (o.ok) res.processedFiles.append(o.path);
        else res.failedFiles.append(FileError{o.path, o.error});
    }
    const int ok = res.processedFiles.size();
    const int failed = res.failedFiles.size();
    res.success = failed == 0;
    res.message = QString("Processed %1/%2 files, %3 failed").arg(ok).arg(total).arg(failed);

    if (!m_log) {
        qInfo() << "[BatchOrchestrator] Done: ok" << ok << "failed" << failed << "total" << total;
    } else {
        m_log->addLog(QString("Batch finished: %1 succeeded, %2 failed, %3 total").arg(ok).arg(failed).arg(total),
                      LogEntry::Level::Info, kLogSource);
        if (failed > 0) {
            m_log->addLog(QString("%1 file%2 failed in batch").arg(failed).arg(failed == 1 ? "" : "s"),
                          LogEntry::Level::Warn, kLogSource);
            for (const FileError& e : std::as_const(res.failedFiles)) {
                m_log->addLog(QString("File failed: %1 - %2").arg(e.path, e.error), LogEntry::Level::Error, kLogSource);
            }
        }
    }

    if (result) *result = res;
    emit batchFinished(res.success);
    return true;
}
