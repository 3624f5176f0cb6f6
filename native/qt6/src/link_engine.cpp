#include "link_engine.h"
#include "file_utils.h"
#include "log_manager.h"
#include "path_sanitizer.h"

#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <filesystem>
#include <system_error>
#include <utility>

namespace {

std::filesystem::path toFsPath(const QString& p)
{
#ifdef Q_OS_WIN
    return std::filesystem::path(p.toStdWString());
#else
    return std::filesystem::path(QFile::encodeName(p).toStdString());
#endif
}

QString errorText(const std::error_code& ec)
{
    return QString::fromLocal8Bit(ec.message().c_str());
}

// The link itself is unsupported for this path shape; a copy may still work.
bool linkUnsupported(const std::error_code& ec)
{
    return ec == std::errc::invalid_argument || ec == std::errc::illegal_byte_sequence;
}

} // namespace

QString LinkOutcome::kindName(Kind kind)
{
    switch (kind) {
        case Kind::Success: return "Success";
        case Kind::SourceNotFound: return "SourceNotFound";
        case Kind::TargetExists: return "TargetExists";
        case Kind::PermissionDenied: return "PermissionDenied";
        case Kind::DifferentFilesystems: return "DifferentFilesystems";
        case Kind::PathTooLong: return "PathTooLong";
        case Kind::IoError: return "IoError";
    }
    return "";
}

QString LinkOutcome::message() const
{
    switch (kind) {
        case Kind::Success:
            return copied ? QString("Copied (hardlink unsupported)") : QString("Hardlink created");
        case Kind::SourceNotFound:
            return QString("Source file does not exist");
        case Kind::TargetExists:
            return QString("Target file already exists");
        case Kind::PermissionDenied:
            return QString("Permission denied, cannot create hardlink");
        case Kind::DifferentFilesystems:
            return QString("Source and target are on different filesystems, cannot create hardlink");
        case Kind::PathTooLong:
            return detail.isEmpty() ? QString("Target path too long")
                                    : QString("Target path too long (%1 characters)").arg(detail);
        case Kind::IoError:
            return QString("I/O error: %1").arg(detail);
    }
    return QString();
}

LinkOutcome LinkOutcome::success(const QString& target, bool copied)
{
    LinkOutcome o;
    o.kind = Kind::Success;
    o.targetPath = target;
    o.copied = copied;
    return o;
}

LinkOutcome LinkOutcome::failure(Kind kind, const QString& target, const QString& detail)
{
    LinkOutcome o;
    o.kind = kind;
    o.targetPath = target;
    o.detail = detail;
    return o;
}

LinkEngine::LinkEngine(LogManager* log)
    : m_log(log), m_deviceProbe(&FsProbe::sameFilesystem), m_linkFunction(&LinkEngine::createHardLink)
{
}

void LinkEngine::setMaxPathLength(int maxLength)
{
    m_maxPathLength = maxLength > 0 ? maxLength : FsProbe::DEFAULT_MAX_PATH_LENGTH;
}

void LinkEngine::setDeviceProbe(DeviceProbe probe)
{
    m_deviceProbe = probe ? std::move(probe) : DeviceProbe(&FsProbe::sameFilesystem);
}

void LinkEngine::setLinkFunction(LinkFunction fn)
{
    m_linkFunction = fn ? std::move(fn) : LinkFunction(&LinkEngine::createHardLink);
}

std::error_code LinkEngine::createHardLink(const QString& source, const QString& target)
{
    std::error_code ec;
    std::filesystem::create_hard_link(toFsPath(source), toFsPath(target), ec);
    return ec;
}

LinkOutcome LinkEngine::link(const QString& source, const QString& target) const
{
    qDebug() << "[LinkEngine] link" << source << "->" << target;

    if (!QFileInfo::exists(source)) {
        return finish(source, LinkOutcome::failure(LinkOutcome::Kind::SourceNotFound, target));
    }

    const QString sanitized = PathSanitizer::sanitizePath(target);
    if (sanitized != target) {
        qDebug() << "[LinkEngine] sanitized target:" << sanitized;
    }
    return finish(source, linkSanitized(source, sanitized, true));
}

LinkOutcome LinkEngine::linkSanitized(const QString& source, const QString& target, bool mayShorten) const
{
    if (FileUtils::pathExists(target)) {
        return LinkOutcome::failure(LinkOutcome::Kind::TargetExists, target);
    }

    const QString parent = QFileInfo(target).absolutePath();
    if (!FileUtils::dirExists(parent)) {
        std::error_code ec;
        std::filesystem::create_directories(toFsPath(parent), ec);
        // Another worker may have created the same parent concurrently.
        if (ec && !FileUtils::dirExists(parent)) {
            return LinkOutcome::failure(LinkOutcome::Kind::IoError, target,
                                        QString("Failed to create directory %1: %2").arg(parent, errorText(ec)));
        }
    }

    if (!m_deviceProbe(source, parent)) {
        return LinkOutcome::failure(LinkOutcome::Kind::DifferentFilesystems, target);
    }

    if (!FsProbe::checkWritable(parent)) {
        return LinkOutcome::failure(LinkOutcome::Kind::PermissionDenied, target);
    }

    if (FsProbe::exceedsPathBudget(target, m_maxPathLength)) {
        const QString length = QString::number(target.size());
        if (!mayShorten) {
            return LinkOutcome::failure(LinkOutcome::Kind::PathTooLong, target, length);
        }
        const int room = m_maxPathLength - parent.size() - 1;
        const QString shortName = PathSanitizer::shortenFileName(QFileInfo(target).fileName(), room);
        if (shortName.isEmpty()) {
            return LinkOutcome::failure(LinkOutcome::Kind::PathTooLong, target, length);
        }
        const QString shortTarget = parent + QLatin1Char('/') + shortName;
        if (FsProbe::exceedsPathBudget(shortTarget, m_maxPathLength)) {
            return LinkOutcome::failure(LinkOutcome::Kind::PathTooLong, target, length);
        }
        qInfo() << "[LinkEngine] path too long (" << target.size() << "chars), retrying as" << shortTarget;
        return linkSanitized(source, shortTarget, false);
    }

    return createLinkWithFallback(source, target);
}

LinkOutcome LinkEngine::createLinkWithFallback(const QString& source, const QString& target) const
{
    const std::error_code ec = m_linkFunction(source, target);
    if (!ec) {
        return LinkOutcome::success(target);
    }

    // Lost a race with another task linking to the same target
    if (ec == std::errc::file_exists) {
        return LinkOutcome::failure(LinkOutcome::Kind::TargetExists, target);
    }

    if (!linkUnsupported(ec)) {
        return LinkOutcome::failure(LinkOutcome::Kind::IoError, target, errorText(ec));
    }

    if (m_log) {
        m_log->addLog(QString("Hardlink failed, falling back to copy: %1 (%2)").arg(target, errorText(ec)),
                      LogEntry::Level::Warn, "LinkEngine");
    } else {
        qWarning() << "[LinkEngine] hardlink rejected (" << errorText(ec) << "), copying instead:" << target;
    }
    QString copyError;
    if (!copyFileContents(source, target, &copyError)) {
        return LinkOutcome::failure(LinkOutcome::Kind::IoError, target, copyError);
    }
    return LinkOutcome::success(target, true);
}

LinkOutcome LinkEngine::finish(const QString& source, LinkOutcome outcome) const
{
    if (!m_log) return outcome;
    if (outcome.isSuccess()) {
        m_log->addLog(QString("%1: %2 -> %3").arg(outcome.message(), source, outcome.targetPath),
                      LogEntry::Level::Info, "LinkEngine");
    } else {
        m_log->addLog(QString("Hardlink failed: %1 -> %2, error: %3").arg(source, outcome.targetPath, outcome.message()),
                      LogEntry::Level::Error, "LinkEngine");
    }
    return outcome;
}

bool LinkEngine::copyFileContents(const QString& src, const QString& dst, QString* errorOut)
{
    QFile in(src); QFile out(dst);
    if (!in.open(QIODevice::ReadOnly)) { if (errorOut) *errorOut = QString("Failed to open %1: %2").arg(src, in.errorString()); return false; }
    if (!out.open(QIODevice::WriteOnly | QIODevice::NewOnly)) { if (errorOut) *errorOut = QString("Failed to write %1: %2").arg(dst, out.errorString()); return false; }
    QByteArray buf; buf.resize(4*1024*1024);
    while (!in.atEnd()) {
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) {
            if (errorOut) *errorOut = QString("Read error %1: %2").arg(src, in.errorString());
            out.close(); out.remove();
            return false;
        }
        if (r == 0) break;
        const qint64 w = out.write(buf.constData(), r);
        if (w != r) {
            if (errorOut) *errorOut = QString("Write error %1: %2").arg(dst, out.errorString());
            out.close(); out.remove();
            return false;
        }
    }
    if (!out.flush()) {
        if (errorOut) *errorOut = QString("Write error %1: %2").arg(dst, out.errorString());
        out.close(); out.remove();
        return false;
    }
    out.close(); in.close();
    return true;
}
