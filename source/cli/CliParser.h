#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for Quire.
 *
 * Quire runs headless. The first argument selects the command:
 * - chapters: List the chapters of a book
 * - read: Print chapter text from the saved (or a given) position
 * - listen: Read the book aloud from the saved (or a given) position
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No or unknown command
    Help,           ///< Show help message
    Version,        ///< Show version information
    Chapters,       ///< List chapters
    Read,           ///< Print chapter text
    Listen          ///< Speak the book
};

/**
 * @brief Output mode for CLI results.
 */
enum class OutputMode {
    Simple,         ///< Plain text (default)
    Verbose,        ///< Chapter/line positions with the text
    Json            ///< One JSON object per line, for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;          ///< Command completed
    constexpr int PlaybackFailure = 1;  ///< Playback stopped on an unreadable chapter
    constexpr int OpenFailure = 2;      ///< Book could not be opened
    constexpr int InvalidArgs = 3;      ///< Bad command line arguments
    constexpr int Cancelled = 5;        ///< Interrupted (Ctrl+C)
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Parse the command from argv[1].
 * @return The detected command, or Command::None
 */
Command parseCommand(int argc, char* argv[]);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser with the options of @p cmd.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show general help (Command::None/Help) or command help.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Parse arguments, run the requested command.
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
