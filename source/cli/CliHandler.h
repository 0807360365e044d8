#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the speedyink tool.
 *
 * Each handler reads its options from the parsed command line, loads or
 * builds an InkDocument, and reports results on stdout (text or JSON).
 * Diagnostics go to stderr.
 */

#include "CliParser.h"
#include "../geometry/Rectangle.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the replay command.
 *
 * Reads one JSON operation per line, sequences every operation through a
 * LocalSequencer into --replicas fresh documents, checks that all replicas
 * converged to the same snapshot, and writes it to --output.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleReplay(const QCommandLineParser& parser);

/**
 * @brief Handle the query command: list strokes hit by --rect.
 */
int handleQuery(const QCommandLineParser& parser);

/**
 * @brief Handle the partitions command: list index leaf regions inside --rect.
 */
int handlePartitions(const QCommandLineParser& parser);

/**
 * @brief Handle the info command: stroke, point and index statistics.
 */
int handleInfo(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 *
 * Priority: --json > --verbose > Simple
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Parse "x,y,width,height".
 * @param text The option value.
 * @param rect Receives the rectangle on success.
 * @return False if the text is malformed or width/height are not positive.
 */
bool parseRect(const QString& text, Rectangle* rect);

} // namespace Cli

#endif // CLIHANDLER_H
