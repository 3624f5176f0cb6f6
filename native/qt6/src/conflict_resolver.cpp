#include "conflict_resolver.h"
#include "file_utils.h"
#include "log_manager.h"
#include "path_sanitizer.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

QString ConflictOutcome::message() const
{
    switch (kind) {
        case Kind::Linked: return link.message();
        case Kind::Skipped: return QString("Skipped existing file: %1").arg(targetPath);
        case Kind::UnsupportedStrategy: return QString("Unsupported conflict strategy: %1").arg(detail);
        case Kind::RemoveFailed: return QString("Failed to remove existing file: %1").arg(detail);
        case Kind::NoUniqueName: return QString("Could not generate a unique file name for %1").arg(targetPath);
        case Kind::LinkFailed: return link.message();
    }
    return QString();
}

ConflictResolver::ConflictResolver(const LinkEngine& engine) : m_engine(engine) {}

bool ConflictResolver::parseAction(const QString& name, ConflictAction* action)
{
    ConflictAction a;
    if (name == "skip") a = ConflictAction::Skip;
    else if (name == "overwrite") a = ConflictAction::Overwrite;
    else if (name == "rename") a = ConflictAction::Rename;
    else return false;
    if (action) *action = a;
    return true;
}

QString ConflictResolver::actionName(ConflictAction action)
{
    switch (action) {
        case ConflictAction::Skip: return "skip";
        case ConflictAction::Overwrite: return "overwrite";
        case ConflictAction::Rename: return "rename";
    }
    return "";
}

ConflictOutcome ConflictResolver::resolve(const QString& source, const QString& target, const QString& strategy) const
{
    ConflictAction action;
    if (!parseAction(strategy, &action)) {
        ConflictOutcome out;
        out.kind = ConflictOutcome::Kind::UnsupportedStrategy;
        out.targetPath = target;
        out.detail = strategy;
        if (LogManager* log = m_engine.logManager()) {
            log->addLog(out.message(), LogEntry::Level::Error, "ConflictResolver");
        }
        return out;
    }
    return resolve(source, target, action);
}

ConflictOutcome ConflictResolver::resolve(const QString& source, const QString& target, ConflictAction action) const
{
    LogManager* log = m_engine.logManager();
    const QString sanitized = PathSanitizer::sanitizePath(target);

    const bool conflict = FileUtils::pathExists(sanitized);
    // A missing source fails in the link engine before the existing target is touched
    if (!conflict || !QFileInfo::exists(source)) {
        return linkTo(source, sanitized, conflict);
    }

    switch (action) {
        case ConflictAction::Skip: {
            if (log) log->addLog(QString("Skipped existing file: %1").arg(sanitized), LogEntry::Level::Info, "ConflictResolver");
            else qInfo() << "[ConflictResolver] skipping existing file" << sanitized;
            ConflictOutcome out;
            out.kind = ConflictOutcome::Kind::Skipped;
            out.hadConflict = true;
            out.targetPath = sanitized;
            return out;
        }
        case ConflictAction::Overwrite: {
            if (log) log->addLog(QString("Overwriting existing file: %1").arg(sanitized), LogEntry::Level::Info, "ConflictResolver");
            else qInfo() << "[ConflictResolver] overwriting existing file" << sanitized;
            QFile existing(sanitized);
            if (!existing.remove()) {
                ConflictOutcome out;
                out.kind = ConflictOutcome::Kind::RemoveFailed;
                out.hadConflict = true;
                out.targetPath = sanitized;
                out.detail = QString("%1 (%2)").arg(sanitized, existing.errorString());
                if (log) log->addLog(out.message(), LogEntry::Level::Error, "ConflictResolver");
                return out;
            }
            return linkTo(source, sanitized, true);
        }
        case ConflictAction::Rename: {
            const QString renamed = uniqueRenameTarget(sanitized);
            if (renamed.isEmpty()) {
                ConflictOutcome out;
                out.kind = ConflictOutcome::Kind::NoUniqueName;
                out.hadConflict = true;
                out.targetPath = sanitized;
                if (log) log->addLog(out.message(), LogEntry::Level::Error, "ConflictResolver");
                return out;
            }
            if (log) log->addLog(QString("Renamed target: %1 -> %2").arg(sanitized, renamed), LogEntry::Level::Info, "ConflictResolver");
            else qInfo() << "[ConflictResolver] renaming target" << sanitized << "->" << renamed;
            return linkTo(source, renamed, true);
        }
    }
    return linkTo(source, sanitized, true);
}

QString ConflictResolver::uniqueRenameTarget(const QString& target)
{
    const QFileInfo fi(target);
    const QString fileName = fi.fileName();
    QString stem = fi.completeBaseName();
    QString ext = fi.suffix();
    if (stem.isEmpty()) {
        // ".hidden" has no extension, the whole name is the stem
        stem = fileName;
        ext.clear();
    }
    const QDir dir = fi.dir();

    for (int i = 1; i <= MAX_RENAME_ATTEMPTS; ++i) {
        const QString name = ext.isEmpty() ? QString("%1_%2").arg(stem, QString::number(i))
                                           : QString("%1_%2.%3").arg(stem, QString::number(i), ext);
        const QString candidate = dir.filePath(name);
        if (!FileUtils::pathExists(candidate)) return candidate;
    }
    return QString();
}

ConflictOutcome ConflictResolver::linkTo(const QString& source, const QString& target, bool hadConflict) const
{
    ConflictOutcome out;
    out.hadConflict = hadConflict;
    out.link = m_engine.link(source, target);
    out.targetPath = out.link.targetPath;
    out.kind = out.link.isSuccess() ? ConflictOutcome::Kind::Linked : ConflictOutcome::Kind::LinkFailed;
    return out;
}
