#pragma once
#include <QString>
#include <QMap>

// Read-only filesystem checks used before creating a hardlink.
namespace FsProbe {

// Legacy MAX_PATH; applied on every host OS so layouts stay portable.
constexpr int DEFAULT_MAX_PATH_LENGTH = 260;

// Whether a hardlink from `source` into `targetDir` can work. Compares the
// device of `source` with that of the nearest existing ancestor of `targetDir`
// (POSIX), or the drive prefixes (Windows). Returns true whenever the check
// cannot be performed.
bool sameFilesystem(const QString& source, const QString& targetDir);

// Owner write bit of an existing directory. A missing directory is writable
// (it will be created).
bool checkWritable(const QString& targetDir);

bool exceedsPathBudget(const QString& path, int maxLength = DEFAULT_MAX_PATH_LENGTH);

// Key/value description of `path`: is_dir, is_file, size, modified, created,
// plus device_id/inode/permissions on POSIX or drive on Windows.
bool filesystemInfo(const QString& path, QMap<QString, QString>* info, QString* errorOut);

// Pre-check for a whole import: source exists, target directory exists (it is
// created when missing), both on one filesystem, target writable.
bool checkHardlinkCapability(const QString& sourceDir, const QString& targetDir, QString* errorOut);

// Creates `path` if needed and proves it writable by writing a probe file.
bool validateOutputDirectory(const QString& path, QString* errorOut);

} // namespace FsProbe
