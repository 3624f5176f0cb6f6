#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QTextStream>
#include <memory>

#include "app_config.h"
#include "batch_orchestrator.h"
#include "conflict_resolver.h"
#include "fs_probe.h"
#include "link_engine.h"
#include "log_manager.h"
#include "media_scanner.h"
#include "naming_template.h"
#include "path_sanitizer.h"

namespace {

enum ExitCode { ExitOk = 0, ExitFailed = 1, ExitUsage = 2 };

int usageError(const QString& message)
{
    QTextStream err(stderr);
    err << "medialinker: " << message << "\n"
        << "Try 'medialinker --help' for more information.\n";
    return ExitUsage;
}

void printJson(const QJsonObject& obj)
{
    QTextStream out(stdout);
    out << QJsonDocument(obj).toJson(QJsonDocument::Indented);
}

QString conflictKindName(ConflictOutcome::Kind kind)
{
    switch (kind) {
        case ConflictOutcome::Kind::Linked: return "Linked";
        case ConflictOutcome::Kind::Skipped: return "Skipped";
        case ConflictOutcome::Kind::UnsupportedStrategy: return "UnsupportedStrategy";
        case ConflictOutcome::Kind::RemoveFailed: return "RemoveFailed";
        case ConflictOutcome::Kind::NoUniqueName: return "NoUniqueName";
        case ConflictOutcome::Kind::LinkFailed: return "LinkFailed";
    }
    return QString();
}

QJsonObject mediaJson(const MediaFileInfo& m)
{
    return QJsonObject{
        {"path", m.path},
        {"name", m.name},
        {"size", m.size},
        {"extension", m.extension},
        {"is_video", m.isVideo},
        {"is_subtitle", m.isSubtitle},
    };
}

// Rename map file: a JSON object of source path -> "anime/season/file.ext".
bool loadRenameMap(const QString& path, QHash<QString, QString>* map, QString* errorOut)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        *errorOut = QString("Cannot open rename map %1: %2").arg(path, f.errorString());
        return false;
    }
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        *errorOut = QString("Invalid rename map %1: %2").arg(path, perr.errorString());
        return false;
    }
    const QJsonObject obj = doc.object();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!it.value().isString()) {
            *errorOut = QString("Rename map entry for %1 is not a string").arg(it.key());
            return false;
        }
        map->insert(it.key(), it.value().toString());
    }
    return true;
}

struct CommandContext {
    QCommandLineParser& parser;
    const QStringList& rawArgs;
    const AppConfig& config;
    LogManager* log;
};

// Re-parses with the command's own positional arguments and options.
bool reparse(CommandContext& ctx, QString* errorOut)
{
    const bool ok = ctx.parser.parse(ctx.rawArgs);
    // --help after a command shows that command's arguments and options
    if (ctx.parser.isSet("help")) ctx.parser.showHelp(ExitOk);
    if (!ok) {
        *errorOut = ctx.parser.errorText();
        return false;
    }
    return true;
}

int cmdLink(CommandContext& ctx)
{
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument("link", "Create one hardlink.");
    ctx.parser.addPositionalArgument("source", "Existing source file.");
    ctx.parser.addPositionalArgument("target", "Destination path.");
    QString err;
    if (!reparse(ctx, &err)) return usageError(err);
    const QStringList args = ctx.parser.positionalArguments();
    if (args.size() != 3) return usageError("link expects <source> <target>");

    LinkEngine engine(ctx.log);
    engine.setMaxPathLength(ctx.config.maxPathLength);
    const LinkOutcome out = engine.link(args.at(1), args.at(2));
    printJson(QJsonObject{
        {"success", out.isSuccess()},
        {"kind", LinkOutcome::kindName(out.kind)},
        {"message", out.message()},
        {"target", out.targetPath},
        {"copied", out.copied},
    });
    return out.isSuccess() ? ExitOk : ExitFailed;
}

int cmdResolve(CommandContext& ctx)
{
    QCommandLineOption strategyOpt({"s", "strategy"}, "skip, overwrite or rename.", "strategy");
    ctx.parser.addOption(strategyOpt);
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument("resolve", "Link a file, resolving an existing target.");
    ctx.parser.addPositionalArgument("source", "Existing source file.");
    ctx.parser.addPositionalArgument("target", "Destination path.");
    QString err;
    if (!reparse(ctx, &err)) return usageError(err);
    const QStringList args = ctx.parser.positionalArguments();
    if (args.size() != 3) return usageError("resolve expects <source> <target>");

    const QString strategy = ctx.parser.isSet(strategyOpt) ? ctx.parser.value(strategyOpt)
                                                           : ctx.config.conflictStrategy;
    if (strategy.isEmpty()) return usageError("resolve needs --strategy (no default conflict strategy configured)");

    LinkEngine engine(ctx.log);
    engine.setMaxPathLength(ctx.config.maxPathLength);
    ConflictResolver resolver(engine);
    const ConflictOutcome out = resolver.resolve(args.at(1), args.at(2), strategy);
    printJson(QJsonObject{
        {"success", out.isOk()},
        {"kind", conflictKindName(out.kind)},
        {"conflict", out.hadConflict},
        {"message", out.message()},
        {"target", out.targetPath},
    });
    return out.isOk() ? ExitOk : ExitFailed;
}

// Shared by batch and preview.
bool buildBatchRequest(CommandContext& ctx, const QString& command, BatchRequest* request, QString* errorOut)
{
    QCommandLineOption outputOpt({"o", "output"}, "Library root (default from config).", "dir");
    QCommandLineOption mapOpt({"m", "rename-map"}, "JSON file mapping source -> anime/season/file.", "file");
    QCommandLineOption seasonOpt("season-folders", "Group files into season folders.");
    QCommandLineOption noSeasonOpt("no-season-folders", "Do not create season folders.");
    QCommandLineOption templateOpt("season-template", "Season folder template, e.g. \"Season {season:02}\".", "template");
    QCommandLineOption conflictOpt("conflict", "Existing targets: skip, overwrite or rename.", "strategy");
    QCommandLineOption workersOpt({"j", "workers"}, "Concurrent link tasks.", "n");
    ctx.parser.addOptions({outputOpt, mapOpt, seasonOpt, noSeasonOpt, templateOpt, conflictOpt, workersOpt});
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument(command, "Link many files into the library.");
    ctx.parser.addPositionalArgument("files", "Source files.", "<files...>");
    if (!reparse(ctx, errorOut)) return false;

    QStringList args = ctx.parser.positionalArguments();
    args.removeFirst();
    if (args.isEmpty()) {
        *errorOut = QString("%1 expects at least one file").arg(command);
        return false;
    }

    const AppConfig& cfg = ctx.config;
    request->files = args;
    request->outputDir = ctx.parser.isSet(outputOpt) ? ctx.parser.value(outputOpt) : cfg.outputDirectory;
    request->createSeasonFolders = cfg.createSeasonFolders;
    if (ctx.parser.isSet(seasonOpt)) request->createSeasonFolders = true;
    if (ctx.parser.isSet(noSeasonOpt)) request->createSeasonFolders = false;
    request->seasonFolderTemplate = ctx.parser.isSet(templateOpt) ? ctx.parser.value(templateOpt)
                                                                  : cfg.seasonFolderTemplate;
    request->maxWorkers = cfg.concurrentLimit;
    request->maxPathLength = cfg.maxPathLength;

    if (ctx.parser.isSet(workersOpt)) {
        bool ok = false;
        const int n = ctx.parser.value(workersOpt).toInt(&ok);
        if (!ok || n <= 0) {
            *errorOut = QString("Invalid worker count: %1").arg(ctx.parser.value(workersOpt));
            return false;
        }
        request->maxWorkers = n;
    }

    const QString strategy = ctx.parser.isSet(conflictOpt) ? ctx.parser.value(conflictOpt) : cfg.conflictStrategy;
    if (!strategy.isEmpty()) {
        if (!ConflictResolver::parseAction(strategy, &request->conflictAction)) {
            *errorOut = QString("Unsupported conflict strategy: %1").arg(strategy);
            return false;
        }
        request->resolveConflicts = true;
    }

    if (ctx.parser.isSet(mapOpt) && !loadRenameMap(ctx.parser.value(mapOpt), &request->renameMap, errorOut)) {
        return false;
    }
    return true;
}

int cmdBatch(CommandContext& ctx)
{
    BatchRequest request;
    QString err;
    if (!buildBatchRequest(ctx, "batch", &request, &err)) return usageError(err);

    BatchOrchestrator orchestrator(ctx.log);
    QObject::connect(&orchestrator, &BatchOrchestrator::progressChanged, [](int current, int total) {
        QTextStream(stderr) << "\r" << current << "/" << total << (current == total ? "\n" : "");
    }, Qt::DirectConnection);

    BatchResult result;
    if (!orchestrator.run(request, &result, &err)) {
        printJson(QJsonObject{{"success", false}, {"message", err}});
        return ExitFailed;
    }
    printJson(result.toJson());
    return result.success ? ExitOk : ExitFailed;
}

int cmdPreview(CommandContext& ctx)
{
    BatchRequest request;
    QString err;
    if (!buildBatchRequest(ctx, "preview", &request, &err)) return usageError(err);

    BatchOrchestrator orchestrator(ctx.log);
    const QMap<QString, QString> targets = orchestrator.previewTargets(request);
    QJsonArray items;
    for (auto it = targets.constBegin(); it != targets.constEnd(); ++it) {
        items.append(QJsonObject{{"source", it.key()}, {"target", it.value()}});
    }
    printJson(QJsonObject{{"success", true}, {"files", items}});
    return ExitOk;
}

int cmdScan(CommandContext& ctx)
{
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument("scan", "List video and subtitle files.");
    ctx.parser.addPositionalArgument("dir", "Directory to scan recursively.");
    QString err;
    if (!reparse(ctx, &err)) return usageError(err);
    const QStringList args = ctx.parser.positionalArguments();
    if (args.size() != 2) return usageError("scan expects <dir>");

    if (!QFileInfo(args.at(1)).isDir()) {
        printJson(QJsonObject{{"success", false}, {"message", QString("Not a directory: %1").arg(args.at(1))}});
        return ExitFailed;
    }
    MediaScanner scanner(ctx.log);
    QJsonArray files;
    for (const MediaFileInfo& m : scanner.scanDirectory(args.at(1))) {
        files.append(mediaJson(m));
    }
    printJson(QJsonObject{{"success", true}, {"files", files}});
    return ExitOk;
}

int cmdSanitize(CommandContext& ctx)
{
    QCommandLineOption pathOpt("path", "Treat the input as a whole path.");
    QCommandLineOption seasonOpt("season", "Print the season number found in the input.");
    ctx.parser.addOptions({pathOpt, seasonOpt});
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument("sanitize", "Print the filesystem-safe form of a name.");
    ctx.parser.addPositionalArgument("name", "File name, or path with --path.");
    QString err;
    if (!reparse(ctx, &err)) return usageError(err);
    const QStringList args = ctx.parser.positionalArguments();
    if (args.size() != 2) return usageError("sanitize expects <name>");

    const QString input = args.at(1);
    QJsonObject obj{
        {"success", true},
        {"input", input},
        {"output", ctx.parser.isSet(pathOpt) ? PathSanitizer::sanitizePath(input) : PathSanitizer::sanitizeName(input)},
    };
    if (ctx.parser.isSet(seasonOpt)) obj.insert("season", int(PathSanitizer::extractSeasonNumber(input)));
    printJson(obj);
    return ExitOk;
}

int cmdCheck(CommandContext& ctx)
{
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument("check", "Check that hardlinks from source to target can work.");
    ctx.parser.addPositionalArgument("source", "Source directory (omit to only validate the target).", "[source]");
    ctx.parser.addPositionalArgument("target", "Library directory.");
    QString err;
    if (!reparse(ctx, &err)) return usageError(err);
    const QStringList args = ctx.parser.positionalArguments();
    if (args.size() != 2 && args.size() != 3) return usageError("check expects [source] <target>");

    bool ok = false;
    if (args.size() == 2) {
        ok = FsProbe::validateOutputDirectory(args.at(1), &err);
    } else {
        ok = FsProbe::checkHardlinkCapability(args.at(1), args.at(2), &err);
    }
    printJson(QJsonObject{{"success", ok}, {"message", ok ? QString("OK") : err}});
    return ok ? ExitOk : ExitFailed;
}

int cmdInfo(CommandContext& ctx)
{
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument("info", "Describe a path.");
    ctx.parser.addPositionalArgument("path", "File or directory.");
    QString err;
    if (!reparse(ctx, &err)) return usageError(err);
    const QStringList args = ctx.parser.positionalArguments();
    if (args.size() != 2) return usageError("info expects <path>");

    QMap<QString, QString> info;
    if (!FsProbe::filesystemInfo(args.at(1), &info, &err)) {
        printJson(QJsonObject{{"success", false}, {"message", err}});
        return ExitFailed;
    }
    QJsonObject fs;
    for (auto it = info.constBegin(); it != info.constEnd(); ++it) fs.insert(it.key(), it.value());
    QJsonObject obj{{"success", true}, {"filesystem", fs}};
    MediaFileInfo media;
    if (MediaScanner::fileInfo(args.at(1), &media, nullptr)) obj.insert("media", mediaJson(media));
    printJson(obj);
    return ExitOk;
}

int cmdName(CommandContext& ctx)
{
    QCommandLineOption templateOpt({"t", "template"}, "Naming template (default from config).", "template");
    QCommandLineOption groupOpt("group", "Release group.", "group");
    QCommandLineOption yearOpt("year", "Release year.", "year");
    QCommandLineOption seasonOpt("season", "Season number.", "n", "1");
    ctx.parser.addOptions({templateOpt, groupOpt, yearOpt, seasonOpt});
    ctx.parser.clearPositionalArguments();
    ctx.parser.addPositionalArgument("name", "Preview an episode file name.");
    ctx.parser.addPositionalArgument("title", "Series title.");
    ctx.parser.addPositionalArgument("episode", "Episode number.");
    QString err;
    if (!reparse(ctx, &err)) return usageError(err);
    const QStringList args = ctx.parser.positionalArguments();
    if (args.size() != 3) return usageError("name expects <title> <episode>");

    bool ok = false;
    const int episode = args.at(2).toInt(&ok);
    if (!ok || episode < 0) return usageError(QString("Invalid episode number: %1").arg(args.at(2)));
    int year = 0;
    if (ctx.parser.isSet(yearOpt)) {
        year = ctx.parser.value(yearOpt).toInt(&ok);
        if (!ok) return usageError(QString("Invalid year: %1").arg(ctx.parser.value(yearOpt)));
    }
    const int season = ctx.parser.value(seasonOpt).toInt(&ok);
    if (!ok || season < 0) return usageError(QString("Invalid season: %1").arg(ctx.parser.value(seasonOpt)));

    const QString pattern = ctx.parser.isSet(templateOpt) ? ctx.parser.value(templateOpt) : ctx.config.namingTemplate;
    const QString name = NamingTemplate::preview(pattern, args.at(1), episode, ctx.parser.value(groupOpt), year, season);
    printJson(QJsonObject{{"success", true}, {"name", name}, {"sanitized", PathSanitizer::sanitizeName(name)}});
    return ExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QSettings
    QCoreApplication::setOrganizationName("MediaLinker");
    QCoreApplication::setApplicationName("MediaLinker");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Organize anime episodes into a library tree with hardlinks.");
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();
    QCommandLineOption configOpt({"c", "config"}, "INI file to read settings from.", "file");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Log debug messages.");
    parser.addOption(configOpt);
    parser.addOption(verboseOpt);
    parser.addPositionalArgument("command", "link, resolve, batch, preview, scan, sanitize, check, info or name.");

    // First pass only finds the command; unknown options belong to it.
    const QStringList rawArgs = QCoreApplication::arguments();
    parser.parse(rawArgs);
    const QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString() : positional.first();

    if (command.isEmpty()) {
        if (parser.isSet(versionOpt)) parser.showVersion();
        if (parser.isSet(helpOpt)) parser.showHelp(ExitOk);
        if (!parser.unknownOptionNames().isEmpty()) {
            return usageError(QString("Unknown option '%1'").arg(parser.unknownOptionNames().first()));
        }
        return usageError("missing command");
    }

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOpt)) {
        const QString path = parser.value(configOpt);
        if (!QFileInfo::exists(path)) return usageError(QString("Config file not found: %1").arg(path));
        settings = std::make_unique<QSettings>(path, QSettings::IniFormat);
    } else {
        settings = std::make_unique<QSettings>();
    }
    const AppConfig config = AppConfig::load(*settings);

    LogManager log(config.logCapacity);
    log.setMinimumLevel(parser.isSet(verboseOpt) ? LogEntry::Level::Debug
                                                 : LogManager::levelFromString(config.logLevel));
    if (!config.logFile.isEmpty() && !log.openLogFile(config.logFile)) {
        qWarning() << "[MAIN] cannot open log file" << config.logFile;
    }
    LogManager::installMessageHandler(&log);
    log.addLog(QString("Command: %1").arg(command), LogEntry::Level::Debug, "main");

    CommandContext ctx{parser, rawArgs, config, &log};
    int rc = ExitUsage;
    if (command == "link") rc = cmdLink(ctx);
    else if (command == "resolve") rc = cmdResolve(ctx);
    else if (command == "batch") rc = cmdBatch(ctx);
    else if (command == "preview") rc = cmdPreview(ctx);
    else if (command == "scan") rc = cmdScan(ctx);
    else if (command == "sanitize") rc = cmdSanitize(ctx);
    else if (command == "check") rc = cmdCheck(ctx);
    else if (command == "info") rc = cmdInfo(ctx);
    else if (command == "name") rc = cmdName(ctx);
    else rc = usageError(QString("unknown command '%1'").arg(command));

    LogManager::installMessageHandler(nullptr);
    return rc;
}
