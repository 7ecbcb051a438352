#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the Quire CLI.
 *
 * - chapters: Open a book and list its chapter titles
 * - read: Open a reading session and print chapters from the position
 * - listen: Open a reading session and speak from the position
 *
 * read and listen go through a ReadingSession, so they restore and save the
 * same reading position a front end would.
 */

#include "CliParser.h"

#include <QCommandLineParser>
#include <memory>

class SettingsPositionStore;

namespace Cli {

/**
 * @brief Handle the chapters command.
 * @return Exit code (see ExitCode namespace)
 */
int handleChapters(const QCommandLineParser& parser);

/**
 * @brief Handle the read command.
 *
 * Prints --count chapters starting at --chapter, or at the saved position.
 * Stops early at the end of the book.
 */
int handleRead(const QCommandLineParser& parser);

/**
 * @brief Handle the listen command.
 *
 * Speaks until the book ends, --lines is reached, or Ctrl+C.
 */
int handleListen(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 *
 * Priority: --json > --verbose > Simple
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Position store from --settings, or the application settings.
 */
std::unique_ptr<SettingsPositionStore> openPositionStore(const QCommandLineParser& parser);

/**
 * @brief Parse a positive integer option.
 * @return The value, 0 if unset, -1 if invalid.
 */
int positiveIntOption(const QCommandLineParser& parser, const QString& name);

} // namespace Cli

#endif // CLIHANDLER_H
