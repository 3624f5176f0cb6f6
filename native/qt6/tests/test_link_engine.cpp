#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include "../src/link_engine.h"
#include "../src/log_manager.h"

#ifdef Q_OS_UNIX
#include <sys/stat.h>
#endif

class TestLinkEngine : public QObject {
    Q_OBJECT
private slots:
    void testLinkCreatesHardlink();
    void testCreatesParentDirectories();
    void testSourceNotFound();
    void testTargetExists();
    void testDifferentFilesystems();
    void testPermissionDenied();
    void testDirectoryCreationFails();
    void testTargetIsSanitized();
    void testLongPathIsShortened();
    void testPathTooLong();
    void testOutcomeMessages();
    void testLogsOutcome();
    void testCopyFileContents();
    void testCopyFallbackWhenLinkRejected();
    void testOtherLinkErrorsAreNotCopied();
    void testLinkRaceReportsTargetExists();
    void testHandlerDoesNotDuplicateEvents();
};

static void writeFile(const QString& path, const QByteArray& data)
{
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(data);
}

static QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

#ifdef Q_OS_UNIX
static bool sameInode(const QString& a, const QString& b)
{
    struct stat sa;
    struct stat sb;
    if (::stat(QFile::encodeName(a).constData(), &sa) != 0) return false;
    if (::stat(QFile::encodeName(b).constData(), &sb) != 0) return false;
    return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}
#endif

void TestLinkEngine::testLinkCreatesHardlink()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("ep01.mkv");
    writeFile(src, "episode one");
    const QString dst = QDir(tmp.path()).filePath("library/ep01.mkv");

    LinkEngine engine;
    const LinkOutcome out = engine.link(src, dst);
    QVERIFY2(out.isSuccess(), qPrintable(out.message()));
    QCOMPARE(out.targetPath, dst);
    QVERIFY(!out.copied);
    QCOMPARE(readFile(dst), QByteArray("episode one"));
#ifdef Q_OS_UNIX
    QVERIFY(sameInode(src, dst));
#endif
}

void TestLinkEngine::testCreatesParentDirectories()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("ep.mkv");
    writeFile(src, "x");
    const QString dst = QDir(tmp.path()).filePath("lib/Show/Season 1/ep.mkv");

    LinkEngine engine;
    QVERIFY(engine.link(src, dst).isSuccess());
    QVERIFY(QFileInfo(QDir(tmp.path()).filePath("lib/Show/Season 1")).isDir());
}

void TestLinkEngine::testSourceNotFound()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString dst = QDir(tmp.path()).filePath("lib/ep.mkv");

    LinkEngine engine;
    const LinkOutcome out = engine.link(QDir(tmp.path()).filePath("missing.mkv"), dst);
    QCOMPARE(out.kind, LinkOutcome::Kind::SourceNotFound);
    QCOMPARE(out.message(), QString("Source file does not exist"));
    // Nothing was created
    QVERIFY(!QFileInfo::exists(QDir(tmp.path()).filePath("lib")));
}

void TestLinkEngine::testTargetExists()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    const QString dst = QDir(tmp.path()).filePath("b.mkv");
    writeFile(src, "new");
    writeFile(dst, "old");

    LinkEngine engine;
    const LinkOutcome out = engine.link(src, dst);
    QCOMPARE(out.kind, LinkOutcome::Kind::TargetExists);
    QCOMPARE(out.message(), QString("Target file already exists"));
    QCOMPARE(readFile(dst), QByteArray("old"));
}

void TestLinkEngine::testDifferentFilesystems()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");
    const QString dst = QDir(tmp.path()).filePath("other/a.mkv");

    LinkEngine engine;
    engine.setDeviceProbe([](const QString&, const QString&) { return false; });
    const LinkOutcome out = engine.link(src, dst);
    QCOMPARE(out.kind, LinkOutcome::Kind::DifferentFilesystems);
    QVERIFY(out.message().contains("different filesystems"));
    QVERIFY(!QFileInfo::exists(dst));

    // Resetting restores the real probe
    engine.setDeviceProbe(LinkEngine::DeviceProbe());
    QVERIFY(engine.link(src, dst).isSuccess());
}

void TestLinkEngine::testPermissionDenied()
{
#ifndef Q_OS_UNIX
    QSKIP("owner write bit check is POSIX only");
#else
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");
    const QString ro = QDir(tmp.path()).filePath("ro");
    QVERIFY(QDir().mkpath(ro));
    QVERIFY(QFile::setPermissions(ro, QFile::ReadOwner | QFile::ExeOwner | QFile::ReadGroup | QFile::ExeGroup
                                          | QFile::ReadOther | QFile::ExeOther));

    LinkEngine engine;
    const LinkOutcome out = engine.link(src, QDir(ro).filePath("a.mkv"));
    QCOMPARE(out.kind, LinkOutcome::Kind::PermissionDenied);
    QCOMPARE(out.message(), QString("Permission denied, cannot create hardlink"));

    QFile::setPermissions(ro, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
#endif
}

void TestLinkEngine::testDirectoryCreationFails()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");
    const QString blocker = QDir(tmp.path()).filePath("blocker");
    writeFile(blocker, "not a directory");

    LinkEngine engine;
    const LinkOutcome out = engine.link(src, QDir(blocker).filePath("sub/a.mkv"));
    QCOMPARE(out.kind, LinkOutcome::Kind::IoError);
    QVERIFY(out.message().startsWith("I/O error: Failed to create directory"));
}

void TestLinkEngine::testTargetIsSanitized()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");

    LinkEngine engine;
    const LinkOutcome out = engine.link(src, QDir(tmp.path()).filePath("Show: Part?/ep*1.mkv"));
    QVERIFY2(out.isSuccess(), qPrintable(out.message()));
    QCOMPARE(out.targetPath, QDir(tmp.path()).filePath("Show_ Part_/ep_1.mkv"));
    QVERIFY(QFileInfo::exists(out.targetPath));
}

void TestLinkEngine::testLongPathIsShortened()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");
    const QString dir = QDir(tmp.path()).filePath("lib");
    const QString dst = dir + "/" + QString(120, QLatin1Char('n')) + ".mkv";

    LinkEngine engine;
    const int budget = dir.size() + 1 + 40;
    engine.setMaxPathLength(budget);
    const LinkOutcome out = engine.link(src, dst);
    QVERIFY2(out.isSuccess(), qPrintable(out.message()));
    QVERIFY(out.targetPath.size() <= budget);
    QVERIFY(out.targetPath.endsWith(".mkv"));
    QVERIFY(out.targetPath.startsWith(dir + "/nnnn"));
    QVERIFY(QFileInfo::exists(out.targetPath));
}

void TestLinkEngine::testPathTooLong()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");
    const QString dst = QDir(tmp.path()).filePath("lib/episode.mkv");

    // Not even the parent directory fits
    LinkEngine engine;
    engine.setMaxPathLength(QDir(tmp.path()).filePath("lib").size());
    const LinkOutcome out = engine.link(src, dst);
    QCOMPARE(out.kind, LinkOutcome::Kind::PathTooLong);
    QCOMPARE(out.message(), QString("Target path too long (%1 characters)").arg(dst.size()));
    QVERIFY(!QFileInfo::exists(dst));
}

void TestLinkEngine::testOutcomeMessages()
{
    QCOMPARE(LinkOutcome::failure(LinkOutcome::Kind::IoError, "t", "disk full").message(), QString("I/O error: disk full"));
    QCOMPARE(LinkOutcome::kindName(LinkOutcome::Kind::DifferentFilesystems), QString("DifferentFilesystems"));
    QVERIFY(LinkOutcome::success("t").isSuccess());
    QVERIFY(LinkOutcome::success("t", true).copied);
}

void TestLinkEngine::testLogsOutcome()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");

    LogManager log;
    LinkEngine engine(&log);
    QVERIFY(engine.link(src, QDir(tmp.path()).filePath("lib/a.mkv")).isSuccess());
    QVERIFY(!engine.link(src, QDir(tmp.path()).filePath("lib/a.mkv")).isSuccess());

    const QList<LogEntry> entries = log.entries();
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries.at(0).level, LogEntry::Level::Info);
    QCOMPARE(entries.at(0).source, QString("LinkEngine"));
    QCOMPARE(entries.at(1).level, LogEntry::Level::Error);
    QVERIFY(entries.at(1).message.contains("Target file already exists"));
}

void TestLinkEngine::testCopyFileContents()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.bin");
    QByteArray payload(5 * 1024 * 1024 + 17, 'z');
    writeFile(src, payload);
    const QString dst = QDir(tmp.path()).filePath("b.bin");

    QString err;
    QVERIFY2(LinkEngine::copyFileContents(src, dst, &err), qPrintable(err));
    QCOMPARE(readFile(dst), payload);

    // Refuses to replace an existing file
    QVERIFY(!LinkEngine::copyFileContents(src, dst, &err));
    QVERIFY(!LinkEngine::copyFileContents(QDir(tmp.path()).filePath("missing"), QDir(tmp.path()).filePath("c.bin"), &err));
    QVERIFY(!QFileInfo::exists(QDir(tmp.path()).filePath("c.bin")));
}

void TestLinkEngine::testCopyFallbackWhenLinkRejected()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    const QByteArray payload("episode payload");
    writeFile(src, payload);
    const QString dst = QDir(tmp.path()).filePath("lib/a.mkv");

    LogManager log;
    LinkEngine engine(&log);
    engine.setLinkFunction([](const QString&, const QString&) {
        return std::make_error_code(std::errc::invalid_argument);
    });
    const LinkOutcome out = engine.link(src, dst);
    QVERIFY2(out.isSuccess(), qPrintable(out.message()));
    QVERIFY(out.copied);
    QCOMPARE(out.message(), QString("Copied (hardlink unsupported)"));
    QCOMPARE(readFile(dst), payload);
#ifdef Q_OS_UNIX
    QVERIFY(!sameInode(src, dst));
#endif

    bool warned = false;
    for (const LogEntry& e : log.entries()) {
        if (e.level == LogEntry::Level::Warn && e.message.contains("falling back to copy")) warned = true;
    }
    QVERIFY(warned);

    // Empty function restores the real link call
    engine.setLinkFunction(LinkEngine::LinkFunction());
    const QString linked = QDir(tmp.path()).filePath("lib/b.mkv");
    const LinkOutcome real = engine.link(src, linked);
    QVERIFY(real.isSuccess());
    QVERIFY(!real.copied);
#ifdef Q_OS_UNIX
    QVERIFY(sameInode(src, linked));
#endif
}

void TestLinkEngine::testOtherLinkErrorsAreNotCopied()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");
    const QString dst = QDir(tmp.path()).filePath("lib/a.mkv");

    LinkEngine engine;
    engine.setLinkFunction([](const QString&, const QString&) {
        return std::make_error_code(std::errc::permission_denied);
    });
    const LinkOutcome out = engine.link(src, dst);
    QCOMPARE(out.kind, LinkOutcome::Kind::IoError);
    QVERIFY(!out.copied);
    QVERIFY(!out.detail.isEmpty());
    QVERIFY(!QFileInfo::exists(dst));
}

void TestLinkEngine::testLinkRaceReportsTargetExists()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");
    const QString dst = QDir(tmp.path()).filePath("lib/a.mkv");

    // Another writer creates the target between the existence check and the link
    LinkEngine engine;
    engine.setLinkFunction([](const QString&, const QString& target) {
        QFile f(target);
        if (f.open(QIODevice::WriteOnly)) f.write("other");
        return std::make_error_code(std::errc::file_exists);
    });
    const LinkOutcome out = engine.link(src, dst);
    QCOMPARE(out.kind, LinkOutcome::Kind::TargetExists);
    QCOMPARE(out.message(), QString("Target file already exists"));
    QCOMPARE(readFile(dst), QByteArray("other"));
}

void TestLinkEngine::testHandlerDoesNotDuplicateEvents()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = QDir(tmp.path()).filePath("a.mkv");
    writeFile(src, "x");

    LogManager log;
    log.setMinimumLevel(LogEntry::Level::Info);
    LogManager::installMessageHandler(&log);
    LinkEngine engine(&log);
    engine.setLinkFunction([](const QString&, const QString&) {
        return std::make_error_code(std::errc::invalid_argument);
    });
    const LinkOutcome out = engine.link(src, QDir(tmp.path()).filePath("lib/a.mkv"));
    LogManager::installMessageHandler(nullptr);

    QVERIFY(out.isSuccess());
    const QList<LogEntry> entries = log.entries();
    // Fallback warning and outcome, nothing echoed back through the Qt handler
    QCOMPARE(entries.size(), 2);
    for (const LogEntry& e : entries) QCOMPARE(e.source, QString("LinkEngine"));
}

QTEST_APPLESS_MAIN(TestLinkEngine)
#include "test_link_engine.moc"
