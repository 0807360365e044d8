#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QTextStream>

namespace Cli {

namespace {

struct CommandEntry {
    Command command;
    const char* word;
    const char* summary;
    int (*handler)(const QCommandLineParser&);
};

// Order is the order of the help listing
const CommandEntry kCommands[] = {
    { Command::Replay,     "replay",     "Replay an operation log into a snapshot",    &handleReplay },
    { Command::Query,      "query",      "List strokes hit by a rectangle",            &handleQuery },
    { Command::Partitions, "partitions", "List index regions intersecting a rectangle", &handlePartitions },
    { Command::Info,       "info",       "Summarize a snapshot",                       &handleInfo },
};

const CommandEntry* findEntry(Command cmd)
{
    for (const auto& entry : kCommands) {
        if (entry.command == cmd) {
            return &entry;
        }
    }
    return nullptr;
}

void addSnapshotArgument(QCommandLineParser& parser)
{
    parser.addPositionalArgument(QStringLiteral("snapshot"),
                                 QCoreApplication::translate("CLI", "Snapshot file written by replay"),
                                 QStringLiteral("<snapshot>"));
}

void addRectOption(QCommandLineParser& parser, const QString& description)
{
    parser.addOption(QCommandLineOption(QStringLiteral("rect"), description, QStringLiteral("x,y,w,h")));
}

} // namespace

// =============================================================================
// Command Lookup
// =============================================================================

Command parseCommand(const QStringList& arguments)
{
    if (arguments.size() < 2) {
        return Command::None;
    }

    const QString word = arguments.at(1);
    for (const auto& entry : kCommands) {
        if (word == QLatin1String(entry.word)) {
            return entry.command;
        }
    }

    if (word == QLatin1String("--help") || word == QLatin1String("-h") || word == QLatin1String("help")) {
        return Command::Help;
    }
    if (word == QLatin1String("--version") || word == QLatin1String("-v")) {
        return Command::Version;
    }
    return Command::None;
}

QString commandName(Command cmd)
{
    if (cmd == Command::Help) {
        return QStringLiteral("help");
    }
    if (cmd == Command::Version) {
        return QStringLiteral("version");
    }
    const CommandEntry* entry = findEntry(cmd);
    return entry ? QString::fromLatin1(entry->word) : QString();
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "SpeedyInk - replicated ink document tools"));
    parser.addHelpOption();
    parser.addVersionOption();

    if (!findEntry(cmd)) {
        return;
    }

    parser.addOptions({
        QCommandLineOption(QStringLiteral("config"),
                           QCoreApplication::translate("CLI", "INI file with canvas, index and eraser settings"),
                           QStringLiteral("ini")),
        QCommandLineOption(QStringLiteral("verbose"),
                           QCoreApplication::translate("CLI", "Show detailed output")),
        QCommandLineOption(QStringLiteral("json"),
                           QCoreApplication::translate("CLI", "Print the result as one JSON object")),
    });

    switch (cmd) {
        case Command::Replay:
            parser.addPositionalArgument(QStringLiteral("log"),
                                         QCoreApplication::translate("CLI", "Operation log, one JSON operation per line"),
                                         QStringLiteral("<log>"));
            parser.addOption(QCommandLineOption({QStringLiteral("o"), QStringLiteral("output")},
                                                QCoreApplication::translate("CLI", "Snapshot file to write"),
                                                QStringLiteral("snapshot")));
            parser.addOption(QCommandLineOption(QStringLiteral("replicas"),
                                                QCoreApplication::translate("CLI", "Replicas to replay into (default: 1)"),
                                                QStringLiteral("count"), QStringLiteral("1")));
            break;

        case Command::Query:
            addSnapshotArgument(parser);
            addRectOption(parser, QCoreApplication::translate("CLI", "Hit-test rectangle"));
            parser.addOption(QCommandLineOption(QStringLiteral("include-erased"),
                                                QCoreApplication::translate("CLI", "Also report erased strokes")));
            break;

        case Command::Partitions:
            addSnapshotArgument(parser);
            addRectOption(parser, QCoreApplication::translate("CLI", "Viewport (default: whole canvas)"));
            break;

        case Command::Info:
            addSnapshotArgument(parser);
            break;

        default:
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (findEntry(cmd)) {
        out << "Usage: speedyink " << commandName(cmd) << " [options]\n\n" << parser.helpText();
        return;
    }

    out << "Usage: speedyink <command> [options]\n\n"
        << QCoreApplication::translate("CLI",
               "Replicated ink stroke document with a quad-partitioned point index.") << "\n\n"
        << "Commands:\n";
    for (const auto& entry : kCommands) {
        out << "  " << QString::fromLatin1(entry.word).leftJustified(14)
            << QCoreApplication::translate("CLI", entry.summary) << "\n";
    }
    out << "\n"
        << QCoreApplication::translate("CLI",
               "Every command accepts --config <ini>, --verbose and --json.\n"
               "\n"
               "Examples:\n"
               "  speedyink replay session.jsonl -o session.json --replicas 3\n"
               "  speedyink query session.json --rect 100,100,32,20\n"
               "  speedyink partitions session.json --rect 0,0,1000,1000 --json\n"
               "\n"
               "Exit codes: 0 ok, 1 lines skipped, 2 nothing usable or replicas diverged,\n"
               "3 invalid arguments, 4 file error.\n"
               "\n"
               "Run 'speedyink <command> --help' for the options of one command.\n");
}

void showVersion()
{
    QTextStream(stdout) << "SpeedyInk " << QCoreApplication::applicationVersion() << "\n";
}

// =============================================================================
// Entry Point
// =============================================================================

int run(const QCoreApplication& app)
{
    Q_UNUSED(app)

    const QStringList arguments = QCoreApplication::arguments();
    const Command cmd = parseCommand(arguments);

    switch (cmd) {
        case Command::Version:
            showVersion();
            return ExitCode::Success;
        case Command::Help:
        case Command::None: {
            QCommandLineParser parser;
            setupParser(parser, cmd);
            showHelp(parser, cmd);
            return cmd == Command::Help ? ExitCode::Success : ExitCode::InvalidArgs;
        }
        default:
            break;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // Drop the command word; QCommandLineParser has no notion of subcommands
    QStringList commandArgs = arguments;
    commandArgs.removeAt(1);

    if (!parser.parse(commandArgs)) {
        QTextStream(stderr) << QCoreApplication::translate("CLI", "Error: ") << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    return findEntry(cmd)->handler(parser);
}

} // namespace Cli
