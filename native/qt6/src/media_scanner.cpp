#include "media_scanner.h"
#include "file_utils.h"
#include "log_manager.h"

#include <QDebug>
#include <QDirIterator>
#include <QFileInfo>

MediaScanner::MediaScanner(LogManager* log, QObject* parent)
    : QObject(parent), m_log(log)
{
}

bool MediaScanner::isMediaFile(const QString& path)
{
    const QString suffix = QFileInfo(path).suffix();
    return FileUtils::isVideoExtension(suffix) || FileUtils::isSubtitleExtension(suffix);
}

MediaFileInfo MediaScanner::describe(const QString& path)
{
    QFileInfo fi(path);
    MediaFileInfo info;
    info.path = fi.absoluteFilePath();
    info.name = fi.fileName();
    info.size = fi.size();
    info.extension = fi.suffix().toLower();
    info.isVideo = FileUtils::isVideoExtension(info.extension);
    info.isSubtitle = FileUtils::isSubtitleExtension(info.extension);
    return info;
}

QList<MediaFileInfo> MediaScanner::scanDirectory(const QString& dirPath)
{
    QList<MediaFileInfo> result;
    if (!FileUtils::dirExists(dirPath)) {
        if (m_log) m_log->addLog(QString("Scan failed, not a directory: %1").arg(dirPath), LogEntry::Level::Error, "MediaScanner");
        else qWarning() << "[MediaScanner] not a directory:" << dirPath;
        return result;
    }

    QDirIterator it(dirPath, QDir::Files, QDirIterator::Subdirectories | QDirIterator::FollowSymlinks);
    while (it.hasNext()) {
        const QString fp = it.next();
        if (!isMediaFile(fp)) continue;
        result.append(describe(fp));
        if (result.size() % 100 == 0) emit progressChanged(result.size());
    }
    emit progressChanged(result.size());

    if (m_log) m_log->addLog(QString("Scanned %1: %2 media files").arg(dirPath).arg(result.size()), LogEntry::Level::Info, "MediaScanner");
    else qInfo() << "[MediaScanner] Scanned" << dirPath << "found" << result.size() << "media file(s)";
    return result;
}

bool MediaScanner::fileInfo(const QString& filePath, MediaFileInfo* info, QString* errorOut)
{
    QFileInfo fi(filePath);
    if (!fi.exists()) {
        if (errorOut) *errorOut = QString("File does not exist: %1").arg(filePath);
        return false;
    }
    if (!fi.isFile()) {
        if (errorOut) *errorOut = QString("Not a file: %1").arg(filePath);
        return false;
    }
    if (!isMediaFile(filePath)) {
        if (errorOut) *errorOut = QString("Unsupported file type: %1").arg(fi.suffix());
        return false;
    }
    if (info) *info = describe(filePath);
    return true;
}
