// ============================================================================
// Quire - Main Entry Point
// ============================================================================

#include <QCoreApplication>
#include <QMetaType>
#include <QTest>

#include "cli/CliParser.h"
#include "core/ChapterState.h"
#include "tts/TtsSequencer.h"

// Test includes
#include "book/StreamBookTests.h"
#include "core/ChapterCacheTests.h"
#include "core/ReadingSessionTests.h"
#include "store/ReaderPreferencesTests.h"
#include "text/TextPipelineTests.h"
#include "tts/TtsSequencerTests.h"

#ifndef QUIRE_VERSION
#define QUIRE_VERSION "0.0.0"
#endif

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "text") {
        success = TextPipelineTests::runAllTests();
    } else if (testType == "stream") {
        success = StreamBookTests::runAllTests();
    } else if (testType == "cache") {
        return QTest::qExec(new ChapterCacheTests());
    } else if (testType == "tts") {
        return QTest::qExec(new TtsSequencerTests());
    } else if (testType == "session") {
        return QTest::qExec(new ReadingSessionTests());
    } else if (testType == "preferences") {
        return QTest::qExec(new ReaderPreferencesTests());
    } else {
        qWarning() << "Unknown test suite:" << testType;
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("Quire");
    app.setApplicationName("Reader");
    app.setApplicationVersion(QUIRE_VERSION);

    // Queued connections carry these across threads
    qRegisterMetaType<ChapterWindow>();
    qRegisterMetaType<SpeechLine>();
    qRegisterMetaType<TtsStatus>();

    if (argc >= 2) {
        QString arg = QString::fromLocal8Bit(argv[1]);
        if (arg.startsWith("--test-")) {
            return runTests(arg.mid(7));
        }
    }

    return Cli::run(app, argc, argv);
}
