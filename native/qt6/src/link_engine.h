#pragma once
#include <QString>
#include <functional>
#include <system_error>

#include "fs_probe.h"

class LogManager;

struct LinkOutcome {
    enum class Kind {
        Success,
        SourceNotFound,
        TargetExists,
        PermissionDenied,
        DifferentFilesystems,
        PathTooLong,
        IoError
    };

    Kind kind = Kind::Success;
    QString targetPath;  // final destination (sanitized, possibly shortened)
    QString detail;      // underlying cause for IoError, length for PathTooLong
    bool copied = false; // hardlink was not possible, bytes were copied instead

    bool isSuccess() const { return kind == Kind::Success; }
    QString message() const;

    static QString kindName(Kind kind);
    static LinkOutcome success(const QString& target, bool copied = false);
    static LinkOutcome failure(Kind kind, const QString& target, const QString& detail = QString());
};

/**
 * LinkEngine - creates one hardlink into the library tree.
 *
 * Steps, each ending in a distinct LinkOutcome on failure:
 *  1. source must exist
 *  2. target is rewritten through PathSanitizer::sanitizePath
 *  3. target must not exist
 *  4. parent directories are created ("already exists" is fine)
 *  5. source and target parent must share a device
 *  6. target parent must be writable
 *  7. over-long paths get one shortening pass on the file name
 *  8. hardlink, falling back to a byte copy when the OS rejects the link
 *     itself as invalid for this path
 *
 * link() is const and safe to call from several threads at once.
 */
class LinkEngine {
public:
    using DeviceProbe = std::function<bool(const QString& source, const QString& targetDir)>;
    using LinkFunction = std::function<std::error_code(const QString& source, const QString& target)>;

    explicit LinkEngine(LogManager* log = nullptr);

    void setMaxPathLength(int maxLength);
    int maxPathLength() const { return m_maxPathLength; }

    // Replaces FsProbe::sameFilesystem (tests use this to simulate other devices).
    void setDeviceProbe(DeviceProbe probe);
    // Replaces the hardlink system call; an empty function restores it.
    void setLinkFunction(LinkFunction fn);

    LogManager* logManager() const { return m_log; }

    LinkOutcome link(const QString& source, const QString& target) const;

    static std::error_code createHardLink(const QString& source, const QString& target);

    // Byte-for-byte copy in 4 MiB chunks; removes the partial file on failure.
    static bool copyFileContents(const QString& src, const QString& dst, QString* errorOut);

private:
    LinkOutcome linkSanitized(const QString& source, const QString& target, bool mayShorten) const;
    LinkOutcome createLinkWithFallback(const QString& source, const QString& target) const;
    LinkOutcome finish(const QString& source, LinkOutcome outcome) const;

    LogManager* m_log = nullptr;
    int m_maxPathLength = FsProbe::DEFAULT_MAX_PATH_LENGTH;
    DeviceProbe m_deviceProbe;
    LinkFunction m_linkFunction;
};
