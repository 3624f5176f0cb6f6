#pragma once
#include <QString>

class QSettings;

// User preferences, persisted with QSettings.
struct AppConfig {
    QString outputDirectory;
    QString namingTemplate = QStringLiteral("{title_romaji} - S{season}E{episode:02}");
    QString seasonFolderTemplate = QStringLiteral("Season {season}");
    bool createSeasonFolders = true;
    QString conflictStrategy; // "", "skip", "overwrite" or "rename"
    int concurrentLimit = 4;
    int maxPathLength = 260;
    QString logLevel = QStringLiteral("info");
    int logCapacity = 1000;
    QString logFile;

    static AppConfig defaults();

    // Missing or invalid keys keep their default value.
    static AppConfig load(QSettings& settings);
    void save(QSettings& settings) const;
};
