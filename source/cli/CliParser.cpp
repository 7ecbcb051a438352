#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

#ifndef QUIRE_VERSION
#define QUIRE_VERSION "0.0.0"
#endif

namespace Cli {

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    if (std::strcmp(arg1, "chapters") == 0) {
        return Command::Chapters;
    }
    if (std::strcmp(arg1, "read") == 0) {
        return Command::Read;
    }
    if (std::strcmp(arg1, "listen") == 0) {
        return Command::Listen;
    }

    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0
        || std::strcmp(arg1, "help") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addCommonOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument(
        QStringLiteral("book"),
        QCoreApplication::translate("CLI", "EPUB archive or stream file (.json)"),
        QStringLiteral("<book>"));

    parser.addOption(QCommandLineOption(
        QStringLiteral("type"),
        QCoreApplication::translate("CLI", "Book MIME type, e.g. application/epub+zip"),
        QStringLiteral("mime")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show positions and details")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output results as JSON")));
}

static void addPositionOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        {QStringLiteral("c"), QStringLiteral("chapter")},
        QCoreApplication::translate("CLI", "Start at chapter N (1-based) instead of the saved position"),
        QStringLiteral("N")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("settings"),
        QCoreApplication::translate("CLI", "Keep reading positions in this INI file"),
        QStringLiteral("path")));
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "Quire - e-book reading and read-aloud engine"));

    parser.addHelpOption();
    parser.addVersionOption();

    switch (cmd) {
        case Command::Chapters:
            addCommonOptions(parser);
            break;

        case Command::Read:
            addCommonOptions(parser);
            addPositionOptions(parser);

            parser.addOption(QCommandLineOption(
                {QStringLiteral("n"), QStringLiteral("count")},
                QCoreApplication::translate("CLI", "Number of chapters to print (default: 1)"),
                QStringLiteral("N"),
                QStringLiteral("1")));
            break;

        case Command::Listen:
            addCommonOptions(parser);
            addPositionOptions(parser);

            parser.addOption(QCommandLineOption(
                QStringLiteral("wpm"),
                QCoreApplication::translate("CLI", "Speaking rate in words per minute (default: 180)"),
                QStringLiteral("N"),
                QStringLiteral("180")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("line-ms"),
                QCoreApplication::translate("CLI", "Fixed time per line in milliseconds"),
                QStringLiteral("ms")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("lines"),
                QCoreApplication::translate("CLI", "Stop after N lines"),
                QStringLiteral("N")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("language"),
                QCoreApplication::translate("CLI", "Speech language, e.g. en_US"),
                QStringLiteral("locale")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("voice"),
                QCoreApplication::translate("CLI", "Speech voice name"),
                QStringLiteral("name")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("no-notify"),
                QCoreApplication::translate("CLI", "Don't show a desktop notification")));
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

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: quire <command> [options] <book>\n"
            "\n"
            "Quire - e-book reading and read-aloud engine.\n"
            "Reads EPUB archives and downloaded web novels (stream .json files).\n"
            "\n"
            "COMMANDS:\n"
            "  chapters        List the chapters of a book\n"
            "  read            Print chapter text from the saved position\n"
            "  listen          Read the book aloud from the saved position\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "EXAMPLES:\n"
            "  quire chapters ~/Books/novel.epub\n"
            "  quire read ~/Books/novel.epub --chapter 3 --count 2\n"
            "  quire listen ~/Novels/story.json --wpm 200\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Success\n"
            "  1   Playback stopped on an unreadable chapter\n"
            "  2   Book could not be opened\n"
            "  3   Invalid arguments\n"
            "  5   Cancelled (Ctrl+C)\n"
            "\n"
            "Run 'quire <command> --help' for command-specific options.\n");
    } else if (cmd == Command::Listen) {
        out << QCoreApplication::translate("CLI",
            "Usage: quire listen [OPTIONS] <book>\n"
            "\n"
            "Read the book aloud, line by line, from the saved position.\n"
            "The position is saved as playback advances. Press Ctrl+C to stop.\n"
            "\n"
            "POSITION OPTIONS:\n"
            "  -c, --chapter <N>       Start at chapter N (1-based)\n"
            "  --settings <path>       Keep positions in this INI file\n"
            "\n"
            "SPEECH OPTIONS:\n"
            "  --wpm <N>               Words per minute (default: 180)\n"
            "  --line-ms <ms>          Fixed time per line, overrides --wpm\n"
            "  --lines <N>             Stop after N lines\n"
            "  --language <locale>     Speech language, e.g. en_US\n"
            "  --voice <name>          Speech voice\n"
            "  --no-notify             Don't show a desktop notification\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --type <mime>           Book type (application/epub+zip forces EPUB)\n"
            "  --verbose               Show chapter and line positions\n"
            "  --json                  Output lines as JSON\n"
            "  -h, --help              Show this help\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "Quire " << QUIRE_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    installSignalHandlers();

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
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

    switch (cmd) {
        case Command::Chapters:
            return handleChapters(parser);
        case Command::Read:
            return handleRead(parser);
        case Command::Listen:
            return handleListen(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
