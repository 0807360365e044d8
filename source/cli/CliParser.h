#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line front end of the speedyink tool.
 *
 * The first argument selects a command; the remaining arguments are parsed
 * with a QCommandLineParser configured for that command:
 * - replay: sequence a newline-delimited JSON operation log into replicas
 *           and write the resulting snapshot
 * - query: strokes hit by a rectangle
 * - partitions: index leaf regions intersecting a rectangle
 * - info: snapshot statistics
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

enum class Command {
    None,           ///< No or unknown command word
    Help,
    Version,
    Replay,
    Query,
    Partitions,
    Info
};

/**
 * @brief How handlers print their results.
 */
enum class OutputMode {
    Simple,         ///< One item per line
    Verbose,        ///< Item details and summary lines
    Json            ///< A single indented JSON object on stdout
};

/**
 * @brief Process exit codes.
 */
namespace ExitCode {
    constexpr int Success = 0;
    constexpr int PartialFailure = 1; ///< Some log lines were skipped
    constexpr int TotalFailure = 2;   ///< Nothing usable in the input, or replicas diverged
    constexpr int InvalidArgs = 3;
    constexpr int IoError = 4;        ///< Snapshot, log or config file unreadable/unwritable
}

/**
 * @brief Map the command word (arguments[1]) to a Command.
 * @param arguments Full argument list including the program name.
 */
Command parseCommand(const QStringList& arguments);

/**
 * @brief Command word for @p cmd, empty for Command::None.
 */
QString commandName(Command cmd);

/**
 * @brief Register the options and positional arguments of @p cmd.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Print general usage, or the option list of a single command.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

void showVersion();

/**
 * @brief Parse QCoreApplication::arguments() and run the selected command.
 * @return Exit code (see ExitCode namespace)
 */
int run(const QCoreApplication& app);

} // namespace Cli

#endif // CLIPARSER_H
