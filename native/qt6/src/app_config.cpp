#include "app_config.h"
#include "conflict_resolver.h"
#include "log_manager.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

AppConfig AppConfig::defaults()
{
    AppConfig c;
    QString base = QStandardPaths::writableLocation(QStandardPaths::MoviesLocation);
    if (base.isEmpty()) base = QDir::homePath();
    c.outputDirectory = QDir(base).filePath("AnimeLibrary");
    return c;
}

AppConfig AppConfig::load(QSettings& s)
{
    AppConfig c = defaults();

    s.beginGroup("library");
    c.outputDirectory = s.value("outputDirectory", c.outputDirectory).toString();
    c.namingTemplate = s.value("namingTemplate", c.namingTemplate).toString();
    c.seasonFolderTemplate = s.value("seasonFolderTemplate", c.seasonFolderTemplate).toString();
    c.createSeasonFolders = s.value("createSeasonFolders", c.createSeasonFolders).toBool();
    const QString strategy = s.value("conflictStrategy", c.conflictStrategy).toString().trimmed();
    if (strategy.isEmpty() || ConflictResolver::parseAction(strategy, nullptr)) {
        c.conflictStrategy = strategy;
    } else {
        qWarning() << "[AppConfig] ignoring unknown conflict strategy" << strategy;
    }
    s.endGroup();

    bool ok = false;
    s.beginGroup("processing");
    const int limit = s.value("concurrentLimit", c.concurrentLimit).toInt(&ok);
    if (ok && limit > 0) c.concurrentLimit = limit;
    s.endGroup();

    s.beginGroup("paths");
    const int maxLen = s.value("maxPathLength", c.maxPathLength).toInt(&ok);
    if (ok && maxLen > 0) c.maxPathLength = maxLen;
    s.endGroup();

    s.beginGroup("log");
    const QString level = s.value("level", c.logLevel).toString();
    LogManager::levelFromString(level, &ok);
    if (ok) c.logLevel = level.trimmed().toLower();
    const int capacity = s.value("capacity", c.logCapacity).toInt(&ok);
    if (ok && capacity > 0) c.logCapacity = capacity;
    c.logFile = s.value("file", c.logFile).toString();
    s.endGroup();

    if (c.seasonFolderTemplate.trimmed().isEmpty()) {
        c.seasonFolderTemplate = defaults().seasonFolderTemplate;
    }
    return c;
}

void AppConfig::save(QSettings& s) const
{
    s.beginGroup("library");
    s.setValue("outputDirectory", outputDirectory);
    s.setValue("namingTemplate", namingTemplate);
    s.setValue("seasonFolderTemplate", seasonFolderTemplate);
    s.setValue("createSeasonFolders", createSeasonFolders);
    s.setValue("conflictStrategy", conflictStrategy);
    s.endGroup();

    s.beginGroup("processing");
    s.setValue("concurrentLimit", concurrentLimit);
    s.endGroup();

    s.beginGroup("paths");
    s.setValue("maxPathLength", maxPathLength);
    s.endGroup();

    s.beginGroup("log");
    s.setValue("level", logLevel);
    s.setValue("capacity", logCapacity);
    s.setValue("file", logFile);
    s.endGroup();

    s.sync();
}
