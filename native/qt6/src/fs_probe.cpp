#include "fs_probe.h"
#include "file_utils.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryFile>

#ifdef Q_OS_UNIX
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#endif

namespace FsProbe {

#ifdef Q_OS_WIN
static QString drivePrefix(const QString& path)
{
    const QString abs = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    if (abs.startsWith(QLatin1String("//"))) {
        const int s1 = abs.indexOf(QLatin1Char('/'), 2);
        const int s2 = s1 < 0 ? -1 : abs.indexOf(QLatin1Char('/'), s1 + 1);
        return (s2 < 0 ? abs : abs.left(s2)).toLower();
    }
    return abs.left(2).toUpper();
}
#endif

bool sameFilesystem(const QString& source, const QString& targetDir)
{
#if defined(Q_OS_UNIX)
    struct stat srcStat;
    struct stat dstStat;
    const QByteArray src = QFile::encodeName(source);
    const QByteArray dst = QFile::encodeName(FileUtils::nearestExistingAncestor(targetDir));
    if (::stat(src.constData(), &srcStat) != 0 || ::stat(dst.constData(), &dstStat) != 0) {
        return true;
    }
    return srcStat.st_dev == dstStat.st_dev;
#elif defined(Q_OS_WIN)
    return drivePrefix(source) == drivePrefix(targetDir);
#else
    Q_UNUSED(source);
    Q_UNUSED(targetDir);
    return true;
#endif
}

bool checkWritable(const QString& targetDir)
{
    if (!FileUtils::dirExists(targetDir)) return true;
#ifdef Q_OS_UNIX
    struct stat st;
    if (::stat(QFile::encodeName(targetDir).constData(), &st) != 0) return true;
    return (st.st_mode & S_IWUSR) != 0;
#else
    return QFileInfo(targetDir).isWritable();
#endif
}

bool exceedsPathBudget(const QString& path, int maxLength)
{
    return path.size() > maxLength;
}

bool filesystemInfo(const QString& path, QMap<QString, QString>* info, QString* errorOut)
{
    QFileInfo fi(path);
    if (!fi.exists()) {
        if (errorOut) *errorOut = QString("Path does not exist: %1").arg(path);
        return false;
    }
    if (!info) return true;

    info->insert("is_dir", fi.isDir() ? "true" : "false");
    info->insert("is_file", fi.isFile() ? "true" : "false");
    info->insert("size", QString::number(fi.size()));

    const QDateTime modified = fi.lastModified();
    if (modified.isValid()) info->insert("modified", QString::number(modified.toSecsSinceEpoch()));
    const QDateTime created = fi.birthTime();
    if (created.isValid()) info->insert("created", QString::number(created.toSecsSinceEpoch()));

#ifdef Q_OS_UNIX
    struct stat st;
    if (::stat(QFile::encodeName(path).constData(), &st) != 0) {
        if (errorOut) *errorOut = QString("Failed to read metadata for %1: %2").arg(path, QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }
    info->insert("device_id", QString::number(static_cast<qulonglong>(st.st_dev)));
    info->insert("inode", QString::number(static_cast<qulonglong>(st.st_ino)));
    info->insert("permissions", QString::number(static_cast<uint>(st.st_mode), 8));
#elif defined(Q_OS_WIN)
    info->insert("drive", drivePrefix(path));
#endif
    return true;
}

bool checkHardlinkCapability(const QString& sourceDir, const QString& targetDir, QString* errorOut)
{
    if (!FileUtils::pathExists(sourceDir)) {
        if (errorOut) *errorOut = QString("Source directory does not exist: %1").arg(sourceDir);
        return false;
    }
    if (!FileUtils::dirExists(targetDir) && !QDir().mkpath(targetDir)) {
        if (errorOut) *errorOut = QString("Cannot create target directory: %1").arg(targetDir);
        return false;
    }
    if (!sameFilesystem(sourceDir, targetDir)) {
        if (errorOut) *errorOut = QString("Source and target are on different filesystems, hardlinks are not possible");
        return false;
    }
    if (!checkWritable(targetDir)) {
        if (errorOut) *errorOut = QString("Target directory is not writable: %1").arg(targetDir);
        return false;
    }
    return true;
}

bool validateOutputDirectory(const QString& path, QString* errorOut)
{
    if (!FileUtils::dirExists(path) && !QDir().mkpath(path)) {
        if (errorOut) *errorOut = QString("Cannot create output directory: %1").arg(path);
        return false;
    }
    QTemporaryFile probe(QDir(path).filePath(".write_test_XXXXXX"));
    if (!probe.open() || probe.write("test", 4) != 4) {
        if (errorOut) *errorOut = QString("Output directory is not writable: %1 (%2)").arg(path, probe.errorString());
        return false;
    }
    return true;
}

} // namespace FsProbe
