#include <QtTest>
#include <QTemporaryDir>
#include <QSettings>
#include <QDir>
#include "../src/app_config.h"

class TestAppConfig : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testLoadEmptyFileGivesDefaults();
    void testSaveAndLoad();
    void testInvalidValuesFallBack();
};

void TestAppConfig::testDefaults()
{
    const AppConfig c = AppConfig::defaults();
    QVERIFY(c.outputDirectory.endsWith("AnimeLibrary"));
    QCOMPARE(c.seasonFolderTemplate, QString("Season {season}"));
    QCOMPARE(c.namingTemplate, QString("{title_romaji} - S{season}E{episode:02}"));
    QVERIFY(c.createSeasonFolders);
    QVERIFY(c.conflictStrategy.isEmpty());
    QCOMPARE(c.concurrentLimit, 4);
    QCOMPARE(c.maxPathLength, 260);
    QCOMPARE(c.logLevel, QString("info"));
    QCOMPARE(c.logCapacity, 1000);
    QVERIFY(c.logFile.isEmpty());
}

void TestAppConfig::testLoadEmptyFileGivesDefaults()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    QSettings s(QDir(tmp.path()).filePath("empty.ini"), QSettings::IniFormat);
    const AppConfig c = AppConfig::load(s);
    const AppConfig d = AppConfig::defaults();
    QCOMPARE(c.outputDirectory, d.outputDirectory);
    QCOMPARE(c.concurrentLimit, d.concurrentLimit);
    QCOMPARE(c.seasonFolderTemplate, d.seasonFolderTemplate);
}

void TestAppConfig::testSaveAndLoad()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = QDir(tmp.path()).filePath("medialinker.ini");

    AppConfig c = AppConfig::defaults();
    c.outputDirectory = "/srv/anime";
    c.seasonFolderTemplate = "S{season:02}";
    c.createSeasonFolders = false;
    c.conflictStrategy = "rename";
    c.concurrentLimit = 12;
    c.maxPathLength = 4096;
    c.logLevel = "debug";
    c.logFile = "/var/log/medialinker.log";
    {
        QSettings s(path, QSettings::IniFormat);
        c.save(s);
    }

    QSettings s(path, QSettings::IniFormat);
    const AppConfig loaded = AppConfig::load(s);
    QCOMPARE(loaded.outputDirectory, QString("/srv/anime"));
    QCOMPARE(loaded.seasonFolderTemplate, QString("S{season:02}"));
    QVERIFY(!loaded.createSeasonFolders);
    QCOMPARE(loaded.conflictStrategy, QString("rename"));
    QCOMPARE(loaded.concurrentLimit, 12);
    QCOMPARE(loaded.maxPathLength, 4096);
    QCOMPARE(loaded.logLevel, QString("debug"));
    QCOMPARE(loaded.logFile, QString("/var/log/medialinker.log"));
}

void TestAppConfig::testInvalidValuesFallBack()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = QDir(tmp.path()).filePath("bad.ini");
    {
        QSettings s(path, QSettings::IniFormat);
        s.setValue("library/conflictStrategy", "merge");
        s.setValue("library/seasonFolderTemplate", "  ");
        s.setValue("processing/concurrentLimit", "many");
        s.setValue("paths/maxPathLength", -5);
        s.setValue("log/level", "loud");
        s.setValue("log/capacity", 0);
        s.sync();
    }

    QSettings s(path, QSettings::IniFormat);
    const AppConfig c = AppConfig::load(s);
    const AppConfig d = AppConfig::defaults();
    QVERIFY(c.conflictStrategy.isEmpty());
    QCOMPARE(c.seasonFolderTemplate, d.seasonFolderTemplate);
    QCOMPARE(c.concurrentLimit, d.concurrentLimit);
    QCOMPARE(c.maxPathLength, d.maxPathLength);
    QCOMPARE(c.logLevel, d.logLevel);
    QCOMPARE(c.logCapacity, d.logCapacity);
}

QTEST_GUILESS_MAIN(TestAppConfig)
#include "test_app_config.moc"
