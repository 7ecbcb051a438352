#include "CliHandler.h"
#include "CliOutput.h"
#include "CliSignal.h"
#include "../book/Book.h"
#include "../core/ChapterCache.h"
#include "../core/ReadingSession.h"
#include "../platform/PlaybackNotifier.h"
#include "../store/PositionStore.h"
#include "../tts/ConsoleSpeechBackend.h"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

std::unique_ptr<SettingsPositionStore> openPositionStore(const QCommandLineParser& parser)
{
    const QString path = parser.value(QStringLiteral("settings"));
    if (path.isEmpty()) {
        return std::make_unique<SettingsPositionStore>();
    }
    return std::make_unique<SettingsPositionStore>(
        QDir::cleanPath(QDir::current().absoluteFilePath(path)));
}

int positiveIntOption(const QCommandLineParser& parser, const QString& name)
{
    if (!parser.isSet(name)) {
        return 0;
    }
    bool ok = false;
    int value = parser.value(name).toInt(&ok);
    return (ok && value > 0) ? value : -1;
}

static QString bookPath(const QCommandLineParser& parser, ConsoleOutput& output)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        output.reportError(QCoreApplication::translate("CLI",
            "No book specified. Use 'quire <command> --help' for usage."));
        return QString();
    }
    if (positional.size() > 1) {
        output.reportWarning(QCoreApplication::translate("CLI",
            "Only one book can be opened, ignoring %1 extra argument(s).")
            .arg(positional.size() - 1));
    }
    return QDir::cleanPath(QDir::current().absoluteFilePath(positional.first()));
}

/**
 * Seek to --chapter if given. Returns false (after reporting) on a bad value.
 */
static bool applyChapterOption(const QCommandLineParser& parser, ReadingSession& session,
                               ConsoleOutput& output)
{
    const int chapter = positiveIntOption(parser, QStringLiteral("chapter"));
    if (chapter == 0) {
        return true;
    }
    if (chapter < 0 || !session.seekToChapter(chapter - 1)) {
        output.reportError(QCoreApplication::translate("CLI",
            "Invalid chapter '%1'. The book has %2 chapters.")
            .arg(parser.value(QStringLiteral("chapter")))
            .arg(session.book()->size()));
        return false;
    }
    return true;
}

// =============================================================================
// Chapters Handler
// =============================================================================

int handleChapters(const QCommandLineParser& parser)
{
    ConsoleOutput output(getOutputMode(parser));

    const QString path = bookPath(parser, output);
    if (path.isEmpty()) {
        return ExitCode::InvalidArgs;
    }

    BookOpenResult opened = Book::open(path, parser.value(QStringLiteral("type")));
    if (!opened.isValid()) {
        output.reportError(opened.message);
        return ExitCode::OpenFailure;
    }

    QStringList titles;
    QStringList hints;
    for (int i = 0; i < opened.book->size(); ++i) {
        titles << opened.book->chapterTitle(i);
        hints << opened.book->loadingHint(i);
    }

    output.reportChapters(opened.book->title(), titles, hints);
    return ExitCode::Success;
}

// =============================================================================
// Read Handler
// =============================================================================

int handleRead(const QCommandLineParser& parser)
{
    ConsoleOutput output(getOutputMode(parser));

    const QString path = bookPath(parser, output);
    if (path.isEmpty()) {
        return ExitCode::InvalidArgs;
    }

    const int count = positiveIntOption(parser, QStringLiteral("count"));
    if (count < 0) {
        output.reportError(QCoreApplication::translate("CLI",
            "--count must be a positive number."));
        return ExitCode::InvalidArgs;
    }

    std::unique_ptr<SettingsPositionStore> store = openPositionStore(parser);
    ConsoleSpeechBackend backend(false);
    ReadingSession session(store.get(), &backend);

    if (!session.init(path, parser.value(QStringLiteral("type")))) {
        output.reportError(session.errorMessage());
        return ExitCode::OpenFailure;
    }

    if (!applyChapterOption(parser, session, output)) {
        return ExitCode::InvalidArgs;
    }

    ChapterCache* cache = session.cache();
    const int first = cache->currentIndex();
    const int chapters = qMax(1, count);

    for (int index = first; index < first + chapters; ++index) {
        if (wasCancelled()) {
            return ExitCode::Cancelled;
        }

        // Usually already in the initial window; also expands growing books
        cache->loadChapter(index, false, false);

        std::optional<ChapterState> state = cache->state(index);
        if (!state) {
            break;
        }
        if (state->isFailure() && state->message == ChapterCache::NO_MORE_CHAPTERS) {
            output.reportWarning(QCoreApplication::translate("CLI", "Reached the end of the book."));
            break;
        }

        output.reportChapter(index, cache->chapterTitles().value(index), *state);
    }

    return ExitCode::Success;
}

// =============================================================================
// Listen Handler
// =============================================================================

int handleListen(const QCommandLineParser& parser)
{
    OutputMode mode = getOutputMode(parser);
    ConsoleOutput output(mode);

    const QString path = bookPath(parser, output);
    if (path.isEmpty()) {
        return ExitCode::InvalidArgs;
    }

    const int wpm = positiveIntOption(parser, QStringLiteral("wpm"));
    const int lineMs = positiveIntOption(parser, QStringLiteral("line-ms"));
    const int maxLines = positiveIntOption(parser, QStringLiteral("lines"));
    if (wpm < 0 || lineMs < 0 || maxLines < 0) {
        output.reportError(QCoreApplication::translate("CLI",
            "--wpm, --line-ms and --lines take positive numbers."));
        return ExitCode::InvalidArgs;
    }

    std::unique_ptr<SettingsPositionStore> store = openPositionStore(parser);

    // In plain mode the backend prints what it speaks
    ConsoleSpeechBackend backend(mode == OutputMode::Simple,
                                 wpm > 0 ? wpm : ConsoleSpeechBackend::DEFAULT_WORDS_PER_MINUTE);
    if (lineMs > 0) {
        backend.setFixedLineDuration(lineMs);
    }

    std::unique_ptr<SystemPlaybackNotifier> notifier;
    if (!parser.isSet(QStringLiteral("no-notify"))) {
        notifier = std::make_unique<SystemPlaybackNotifier>();
    }

    ReadingSession session(store.get(), &backend, notifier.get());
    if (!session.init(path, parser.value(QStringLiteral("type")))) {
        output.reportError(session.errorMessage());
        return ExitCode::OpenFailure;
    }

    if (!applyChapterOption(parser, session, output)) {
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("language"))) {
        session.tts()->setLanguage(QLocale(parser.value(QStringLiteral("language"))));
    }
    if (parser.isSet(QStringLiteral("voice"))) {
        session.tts()->setVoice(parser.value(QStringLiteral("voice")));
    }

    ListenSummary summary;
    QMutex summaryMutex;
    TtsSequencer* tts = session.tts();

    // Runs on the playback thread, before the line is handed to the backend
    QObject::connect(tts, &TtsSequencer::currentLineChanged, tts,
        [&](const SpeechLine& line) {
            QMutexLocker lock(&summaryMutex);
            if (maxLines > 0 && summary.linesSpoken >= maxLines) {
                tts->stop();
                return;
            }
            ++summary.linesSpoken;
            summary.lastChapter = line.chapterIndex;
            summary.lastCharOffset = line.startChar;
            output.reportLine(line);
        }, Qt::DirectConnection);

    QObject::connect(tts, &TtsSequencer::playbackError, tts,
        [&](const QString& message) {
            QMutexLocker lock(&summaryMutex);
            summary.error = message;
        }, Qt::DirectConnection);

    QElapsedTimer timer;
    timer.start();

    QFuture<void> playback = session.startTts();
    if (tts->status() == TtsStatus::Stopped) {
        output.reportError(QCoreApplication::translate("CLI", "Playback could not be started."));
        return ExitCode::PlaybackFailure;
    }

    while (!playback.isFinished()) {
        if (wasCancelled() && tts->status() != TtsStatus::Stopped) {
            summary.cancelled = true;
            tts->stop();
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
        QThread::msleep(20);
    }
    QCoreApplication::processEvents();

    summary.elapsedMs = timer.elapsed();
    session.dispose();

    QMutexLocker lock(&summaryMutex);
    // Running off the last chapter is the normal way for a book to end
    const bool reachedEnd = (summary.error == ChapterCache::NO_MORE_CHAPTERS);
    if (!summary.error.isEmpty() && !reachedEnd) {
        output.reportError(summary.error);
    }
    const ListenSummary result = summary;
    lock.unlock();

    output.reportListenSummary(result);

    if (result.cancelled) {
        return ExitCode::Cancelled;
    }
    if (!result.error.isEmpty() && !reachedEnd) {
        return ExitCode::PlaybackFailure;
    }
    return ExitCode::Success;
}

} // namespace Cli
