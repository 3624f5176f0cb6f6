#pragma once
#include <QObject>
#include <QList>
#include <QString>

class LogManager;

struct MediaFileInfo {
    QString path;
    QString name;
    qint64 size = 0;
    QString extension; // lower case, no dot
    bool isVideo = false;
    bool isSubtitle = false;
};

class MediaScanner : public QObject {
    Q_OBJECT
public:
    explicit MediaScanner(LogManager* log = nullptr, QObject* parent = nullptr);

    // Recursive scan (symlinks followed) for videos and subtitles.
    QList<MediaFileInfo> scanDirectory(const QString& dirPath);

    // Single file; fails for missing paths, directories and other file types.
    static bool fileInfo(const QString& filePath, MediaFileInfo* info, QString* errorOut);

    static bool isMediaFile(const QString& path);

signals:
    void progressChanged(int found);

private:
    static MediaFileInfo describe(const QString& path);

    LogManager* m_log = nullptr;
};
