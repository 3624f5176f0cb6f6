#pragma once

#include <QString>
#include <QFileInfo>
#include <QDir>

/**
 * FileUtils - Standardized file existence and media type helpers
 *
 * All existence checks in the link pipeline go through these helpers so a
 * broken symlink, a directory and a regular file are told apart the same way
 * everywhere.
 */
namespace FileUtils {

/**
 * Check if a directory exists at the given path.
 */
inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Check if anything occupies the path (file, directory, or a dangling symlink).
 * Dangling symlinks count because creating a link over one fails with EEXIST.
 */
inline bool pathExists(const QString& path)
{
    QFileInfo fi(path);
    return fi.exists() || fi.isSymLink();
}

inline bool isVideoExtension(const QString& suffix)
{
    const QString s = suffix.toLower();
    return s == "mkv" || s == "mp4" || s == "avi" || s == "mov";
}

inline bool isSubtitleExtension(const QString& suffix)
{
    const QString s = suffix.toLower();
    return s == "ass" || s == "srt" || s == "vtt";
}

// Nearest ancestor of `path` (or `path` itself) that exists on disk.
inline QString nearestExistingAncestor(const QString& path)
{
    QString cur = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    while (!cur.isEmpty() && !QFileInfo::exists(cur)) {
        const QString parent = QFileInfo(cur).absolutePath();
        if (parent == cur) break;
        cur = parent;
    }
    return cur;
}

} // namespace FileUtils
