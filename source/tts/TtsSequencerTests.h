#ifndef TTSSEQUENCERTESTS_H
#define TTSSEQUENCERTESTS_H

#include <QMutex>
#include <QMutexLocker>
#include <QObject>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>
#include <functional>

#include "TtsSequencer.h"
#include "ConsoleSpeechBackend.h"
#include "../book/TestBook.h"
#include "../core/ChapterCache.h"
#include "../platform/PlaybackNotifier.h"
#include "../store/PositionStore.h"
#include "../text/TextPipeline.h"

/**
 * @brief PlaybackNotifier that records every call.
 */
class RecordingNotifier : public PlaybackNotifier {
public:
    struct Entry {
        QString bookTitle;
        QString chapterTitle;
        int coverSize = 0;
        TtsStatus status = TtsStatus::Stopped;
    };

    void notify(const QString& bookTitle, const QString& chapterTitle,
                const QByteArray& cover, TtsStatus status) override
    {
        QMutexLocker lock(&m_mutex);
        m_entries.append({bookTitle, chapterTitle, static_cast<int>(cover.size()), status});
    }

    void dismiss() override {}

    QVector<Entry> entries() const
    {
        QMutexLocker lock(&m_mutex);
        return m_entries;
    }

private:
    mutable QMutex m_mutex;
    QVector<Entry> m_entries;
};

/**
 * @brief Book, cache, backend, store and sequencer wired together.
 *
 * Every published line is recorded as (chapter, line). The optional
 * onLine hook runs on the playback thread before the line is spoken.
 */
class PlaybackRig {
public:
    explicit PlaybackRig(const QStringList& chapters)
        : book("Rig Book", chapters)
        , cache(&book, &pipeline)
        , backend(false)
        , store(dir.filePath("quire.ini"))
        , tts(&book, &cache, &backend, &store, &notifier)
    {
        backend.setFixedLineDuration(20);
        QObject::connect(&tts, &TtsSequencer::currentLineChanged, &tts,
            [this](const SpeechLine& line) {
                int count = 0;
                {
                    QMutexLocker lock(&mutex);
                    published.append({line.chapterIndex, line.index});
                    count = static_cast<int>(published.size());
                }
                if (onLine) {
                    onLine(line, count);
                }
            }, Qt::DirectConnection);
        QObject::connect(&tts, &TtsSequencer::playbackError, &tts,
            [this](const QString& message) {
                QMutexLocker lock(&mutex);
                errors.append(message);
            }, Qt::DirectConnection);
        QObject::connect(&tts, &TtsSequencer::currentLineCleared, &tts,
            [this]() {
                QMutexLocker lock(&mutex);
                ++cleared;
            }, Qt::DirectConnection);
    }

    QVector<QPair<int, int>> lines() const
    {
        QMutexLocker lock(&mutex);
        return published;
    }

    QStringList errorMessages() const
    {
        QMutexLocker lock(&mutex);
        return errors;
    }

    int clearedCount() const
    {
        QMutexLocker lock(&mutex);
        return cleared;
    }

private:
    // Declared before the sequencer so they outlive its playback thread
    mutable QMutex mutex;
    QVector<QPair<int, int>> published;
    QStringList errors;
    int cleared = 0;

public:
    std::function<void(const SpeechLine&, int)> onLine;

    QTemporaryDir dir;
    TextPipeline pipeline;
    TestBook book;
    ChapterCache cache;
    ConsoleSpeechBackend backend;
    SettingsPositionStore store;
    RecordingNotifier notifier;
    TtsSequencer tts;
};

/**
 * Unit tests for TtsSequencer.
 * Run with: quire --test-tts
 */
class TtsSequencerTests : public QObject {
    Q_OBJECT

private:
    static QString sentences(int count, const QString& prefix = QStringLiteral("Line"))
    {
        QStringList parts;
        for (int i = 0; i < count; ++i) {
            parts << QStringLiteral("%1 %2 is here.").arg(prefix).arg(i);
        }
        return parts.join(' ');
    }

    using Line = QPair<int, int>;

private slots:
    void initTestCase() {
        qRegisterMetaType<TtsStatus>();
        qRegisterMetaType<SpeechLine>();
    }

    void testCommandsRejectedWhenStopped() {
        PlaybackRig rig({sentences(3)});

        QCOMPARE(rig.tts.status(), TtsStatus::Stopped);
        QVERIFY(!rig.tts.pause());
        QVERIFY(!rig.tts.resume());
        QVERIFY(!rig.tts.stop());
        QVERIFY(!rig.tts.next());
        QVERIFY(!rig.tts.previous());
        QVERIFY(!rig.tts.togglePause());
    }

    void testStartNeedsPositionAndBackend() {
        PlaybackRig rig({sentences(3)});
        rig.cache.loadWindow(0, false);

        // No start position yet
        rig.tts.start();
        QCOMPARE(rig.tts.status(), TtsStatus::Stopped);

        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));
        rig.backend.setInitialized(false);
        rig.tts.start();
        QCOMPARE(rig.tts.status(), TtsStatus::Stopped);
        QCOMPARE(rig.backend.registerCount(), 0);
    }

    void testStatusTransitions() {
        PlaybackRig rig({sentences(3)});
        rig.backend.setFixedLineDuration(5000);
        rig.cache.loadWindow(0, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));

        QSignalSpy statusSpy(&rig.tts, &TtsSequencer::statusChanged);

        QFuture<void> loop = rig.tts.start();
        QCOMPARE(rig.tts.status(), TtsStatus::Running);
        QVERIFY(rig.tts.isRunning());

        // A second start returns the running loop
        rig.tts.start();
        QVERIFY(rig.tts.pause());
        QVERIFY(!rig.tts.pause());
        QVERIFY(!rig.tts.next());
        QVERIFY(rig.tts.resume());
        QVERIFY(!rig.tts.resume());

        QVERIFY(rig.tts.togglePause());
        QCOMPARE(rig.tts.status(), TtsStatus::Paused);
        QVERIFY(rig.tts.togglePause());
        QCOMPARE(rig.tts.status(), TtsStatus::Running);

        // Not initialized: everything is rejected
        rig.backend.setInitialized(false);
        QVERIFY(!rig.tts.pause());
        QVERIFY(!rig.tts.next());
        QVERIFY(!rig.tts.stop());
        rig.backend.setInitialized(true);

        QVERIFY(rig.tts.stop());
        QVERIFY(!rig.tts.stop());
        loop.waitForFinished();
        rig.tts.waitForFinished();

        QCOMPARE(rig.tts.status(), TtsStatus::Stopped);
        QCOMPARE(rig.backend.registerCount(), 1);
        QCOMPARE(rig.backend.unregisterCount(), 1);

        QList<TtsStatus> seen;
        for (const QList<QVariant>& args : statusSpy) {
            seen << args.at(0).value<TtsStatus>();
        }
        QCOMPARE(seen, QList<TtsStatus>({TtsStatus::Running, TtsStatus::Paused, TtsStatus::Running,
                                         TtsStatus::Paused, TtsStatus::Running, TtsStatus::Stopped}));
    }

    void testDoubleNextSkipsTwoLines() {
        PlaybackRig rig({sentences(8)});
        rig.cache.loadWindow(0, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));

        rig.onLine = [&rig](const SpeechLine& line, int count) {
            if (count == 3) {
                // Both land before the line is spoken
                rig.tts.next();
                rig.tts.next();
            }
            if (line.index >= 5) {
                rig.tts.stop();
            }
        };

        rig.tts.start();
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{0, 0}, {0, 1}, {0, 2}, {0, 4}, {0, 5}}));
        QCOMPARE(rig.tts.pendingSkip(), 0);
    }

    void testPauseReplaysSameLine() {
        PlaybackRig rig({sentences(8)});
        rig.cache.loadWindow(0, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));

        rig.onLine = [&rig](const SpeechLine& line, int count) {
            if (count == 3) {
                rig.tts.pause();
            }
            if (line.index >= 4) {
                rig.tts.stop();
            }
        };

        rig.tts.start();
        QTRY_COMPARE(rig.tts.status(), TtsStatus::Paused);

        // Five poll cycles
        QTest::qWait(5 * TtsSequencer::POLL_INTERVAL_MS);
        QCOMPARE(rig.lines().size(), 3);
        QCOMPARE(rig.notifier.entries().size(), 1);

        QVERIFY(rig.tts.resume());
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{0, 0}, {0, 1}, {0, 2}, {0, 2}, {0, 3}, {0, 4}}));
        QCOMPARE(rig.tts.pendingSkip(), 0);

        // Chapter entry, refresh after the pause, final stop
        QVector<RecordingNotifier::Entry> entries = rig.notifier.entries();
        QCOMPARE(entries.size(), 3);
        QCOMPARE(entries[1].status, TtsStatus::Running);
        QCOMPARE(entries[1].chapterTitle, QString("Chapter 1"));
        QCOMPARE(entries[2].status, TtsStatus::Stopped);
        QVERIFY(entries[2].chapterTitle.isEmpty());
    }

    void testStartsAtSavedCharOffset() {
        PlaybackRig rig({sentences(6)});
        rig.cache.loadWindow(0, false);

        const QVector<SpeechLine> lines = rig.cache.speechLines(0);
        QCOMPARE(lines.size(), 6);

        // Inside line 2: resume from the next line start
        rig.tts.setStartPosition(ScrollIndex(0, 0, lines[2].startChar + 1));
        rig.onLine = [&rig](const SpeechLine&, int) { rig.tts.stop(); };

        rig.tts.start();
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{0, 3}}));
    }

    void testCrossesChaptersAndStopsAtEnd() {
        PlaybackRig rig({sentences(2, "First"), sentences(2, "Second")});
        rig.book.setCover(QByteArray("cover"));
        rig.cache.setCurrentIndex(0);
        rig.cache.loadWindow(0, false);
        rig.cache.loadWindow(1, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));

        rig.tts.start();
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{0, 0}, {0, 1}, {1, 0}, {1, 1}}));
        QCOMPARE(rig.errorMessages(), QStringList({ChapterCache::NO_MORE_CHAPTERS}));
        QCOMPARE(rig.tts.status(), TtsStatus::Stopped);
        QVERIFY(!rig.tts.currentLine().has_value());
        QCOMPARE(rig.clearedCount(), 1);
        QVERIFY(!rig.backend.isRegistered());

        // Position follows the last line handed to the backend
        const QVector<SpeechLine> first = rig.cache.speechLines(0);
        const QVector<SpeechLine> second = rig.cache.speechLines(1);
        QCOMPARE(rig.backend.spokenLines(),
                 QStringList({first[0].text, first[1].text, second[0].text, second[1].text}));
        QCOMPARE(rig.store.chapterIndex("Rig Book", -1), 1);
        QCOMPARE(rig.store.charOffset("Rig Book", -1), second[1].startChar);

        // Cover fetched once, sent with every notification
        QCOMPARE(rig.book.coverCount(), 1);
        QVector<RecordingNotifier::Entry> entries = rig.notifier.entries();
        QCOMPARE(entries.size(), 3);
        QCOMPARE(entries[0].chapterTitle, QString("Chapter 1"));
        QCOMPARE(entries[1].chapterTitle, QString("Chapter 2"));
        QCOMPARE(entries[2].status, TtsStatus::Stopped);
        QCOMPARE(entries[2].coverSize, 5);
        QCOMPARE(entries[2].bookTitle, QString("Rig Book"));
    }

    void testPreviousWrapsIntoEarlierChapter() {
        PlaybackRig rig({sentences(2, "First"), sentences(2, "Second")});
        rig.cache.loadWindow(1, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));

        rig.onLine = [&rig](const SpeechLine&, int count) {
            if (count == 3) {
                rig.tts.previous();
            }
        };

        rig.tts.start();
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{0, 0}, {0, 1}, {1, 0}, {0, 1}, {1, 0}, {1, 1}}));
    }

    void testSkipsUnloadedStartChapter() {
        PlaybackRig rig({sentences(2, "First"), sentences(2, "Second")});
        rig.cache.loadChapter(1, false, false);
        rig.cache.loadChapter(2, false, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));

        rig.tts.start();
        rig.tts.waitForFinished();

        QVERIFY(!rig.lines().isEmpty());
        QCOMPARE(rig.lines().first(), Line(1, 0));
    }

    void testWaitsForQueuedAndLoadingChapters() {
        PlaybackRig rig({sentences(2, "Zero"), sentences(2, "One"),
                         sentences(2, "Two"), sentences(2, "Three")});
        rig.cache.loadChapter(1, false, false);
        rig.book.setFetchDelay(150);

        // Loads 0, then 2, then 3: chapter 2 sits in the queue behind the
        // slow chapter 0 when playback of chapter 1 is already done
        rig.cache.requestWindow(1);
        QVERIFY(rig.cache.isPending(2));
        QVERIFY(!rig.cache.state(2).has_value());

        rig.tts.setStartPosition(ScrollIndex(1, 0, 0));
        rig.tts.start();
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{1, 0}, {1, 1}, {2, 0}, {2, 1}, {3, 0}, {3, 1}}));
        QCOMPARE(rig.errorMessages(), QStringList({ChapterCache::NO_MORE_CHAPTERS}));
        QCOMPARE(rig.tts.status(), TtsStatus::Stopped);
        rig.cache.waitForIdle();
    }

    void testFailedChapterEndsPlayback() {
        PlaybackRig rig({sentences(1, "First"), sentences(1, "Second")});
        rig.book.setFailure(1, ErrorKind::ParseError);
        rig.cache.loadWindow(0, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));

        rig.tts.start();
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{0, 0}}));
        QCOMPARE(rig.errorMessages(), QStringList({QString("Malformed chapter")}));
        QCOMPARE(rig.tts.status(), TtsStatus::Stopped);
        QCOMPARE(rig.backend.unregisterCount(), 1);
    }

    void testRestartAfterStop() {
        PlaybackRig rig({sentences(4)});
        rig.cache.loadWindow(0, false);
        rig.tts.setStartPosition(ScrollIndex(0, 0, 0));
        rig.onLine = [&rig](const SpeechLine&, int) { rig.tts.stop(); };

        rig.tts.start();
        rig.tts.waitForFinished();
        rig.tts.start();
        rig.tts.waitForFinished();

        QCOMPARE(rig.lines(), QVector<Line>({{0, 0}, {0, 0}}));
        QCOMPARE(rig.backend.registerCount(), 2);
        QCOMPARE(rig.backend.unregisterCount(), 2);
    }
};

#endif // TTSSEQUENCERTESTS_H
