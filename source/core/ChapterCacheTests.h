#ifndef CHAPTERCACHETESTS_H
#define CHAPTERCACHETESTS_H

#include <QObject>
#include <QSignalSpy>
#include <QTest>

#include "ChapterCache.h"
#include "../book/TestBook.h"
#include "../text/TextPipeline.h"

/**
 * Unit tests for ChapterCache.
 * Run with: quire --test-cache
 */
class ChapterCacheTests : public QObject {
    Q_OBJECT

private:
    static QStringList chapters(int count)
    {
        QStringList list;
        for (int i = 0; i < count; ++i) {
            list << QStringLiteral("<p>Chapter %1 opens.</p><p>It ends here.</p>").arg(i + 1);
        }
        return list;
    }

    TextPipeline m_pipeline;

private slots:
    void initTestCase() {
        qRegisterMetaType<ChapterWindow>();
    }

    // Two requests for the same window fetch every chapter once
    void testDuplicateRequestsFetchOnce() {
        TestBook book("Dedup", chapters(5));
        book.setFetchDelay(50);
        ChapterCache cache(&book, &m_pipeline);

        cache.requestWindow(1);
        cache.requestWindow(1);
        // Racing direct load on this thread is skipped too
        cache.loadChapter(1, false, false);
        cache.waitForIdle();

        QCOMPARE(book.fetchCount(0), 1);
        QCOMPARE(book.fetchCount(1), 1);
        QCOMPARE(book.fetchCount(2), 1);
        QCOMPARE(book.fetchCount(3), 1);
        QCOMPARE(book.fetchCount(4), 0);

        for (int i = 0; i <= 3; ++i) {
            QVERIFY(cache.wasRequested(i));
            QVERIFY(!cache.isLoading(i));
            QVERIFY(cache.state(i)->isSuccess());
        }
    }

    void testQueuedChaptersArePending() {
        TestBook book("Queue", chapters(4));
        book.setFetchDelay(100);
        ChapterCache cache(&book, &m_pipeline);

        // Window 0..3; the loader is still fetching chapter 0
        cache.requestWindow(1);
        QVERIFY(cache.isPending(3));
        QVERIFY(!cache.state(3).has_value());
        QVERIFY(!cache.isPending(-1));
        QVERIFY(!cache.isPending(4));

        cache.waitForIdle();
        for (int i = 0; i <= 3; ++i) {
            QVERIFY(!cache.isPending(i));
            QVERIFY(cache.state(i)->isSuccess());
        }

        // Past the end: pending until the load settles, then failed or absent
        cache.requestWindow(5);
        QVERIFY(cache.isPending(6));
        cache.waitForIdle();
        QCOMPARE(cache.state(4)->message, ChapterCache::NO_MORE_CHAPTERS);
        for (int i = 4; i <= 7; ++i) {
            QVERIFY(!cache.isPending(i));
        }
        QVERIFY(!cache.state(5).has_value());
        QVERIFY(!cache.state(7).has_value());
    }

    void testLoadedChapterNotRefetched() {
        TestBook book("Reload", chapters(3));
        ChapterCache cache(&book, &m_pipeline);

        cache.loadChapter(0, false, false);
        cache.loadChapter(0, false, false);
        QCOMPARE(book.fetchCount(0), 1);

        cache.loadChapter(0, true, false);
        QCOMPARE(book.fetchCount(0), 2);

        cache.reloadChapter(1);
        cache.waitForIdle();
        QCOMPARE(book.fetchCount(1), 1);
        QVERIFY(cache.state(1)->isSuccess());
    }

    void testFailureStaysInItsSlot() {
        TestBook book("Failures", chapters(4));
        book.setFailure(1, ErrorKind::NetworkError);
        book.setFailure(2, ErrorKind::ParseError);
        ChapterCache cache(&book, &m_pipeline);

        cache.loadWindow(1, false);

        QVERIFY(cache.state(0)->isSuccess());
        QVERIFY(cache.state(1)->isFailure());
        QVERIFY(cache.state(1)->retryable);
        QVERIFY(cache.state(2)->isFailure());
        QVERIFY(!cache.state(2)->retryable);
        QVERIFY(cache.state(3)->isSuccess());

        // A reload replaces the failure once the source recovers
        book.clearFailure(1);
        cache.loadChapter(1, true, false);
        QVERIFY(cache.state(1)->isSuccess());
    }

    // Three chapters, no continuation link
    void testNoMoreChaptersAtEnd() {
        TestBook book("Short", chapters(3));
        ChapterCache cache(&book, &m_pipeline);

        cache.setCurrentIndex(2);
        cache.loadWindow(2, false);
        cache.loadWindow(5, false);

        std::optional<ChapterState> end = cache.state(3);
        QVERIFY(end.has_value());
        QVERIFY(end->isFailure());
        QVERIFY(!end->retryable);
        QCOMPARE(end->message, ChapterCache::NO_MORE_CHAPTERS);

        QVERIFY(!cache.state(4).has_value());
        QVERIFY(!cache.state(5).has_value());
        QVERIFY(!cache.isLoading(4));

        // Tried once at size 3, never again
        QCOMPARE(cache.expandedSizes(), QSet<int>({3}));
        QCOMPARE(book.expandCount(), 1);
        QCOMPARE(book.size(), 3);
    }

    // Three chapters, each new part links to the next one
    void testExpansionReachesRequestedIndex() {
        QStringList initial = chapters(2);
        initial << QStringLiteral("<p>Part three.</p>") + TestBook::nextLink();
        TestBook book("Serial", initial);
        book.setPendingExpansions({
            QStringLiteral("<p>Part four.</p>") + TestBook::nextLink(),
            QStringLiteral("<p>Part five.</p>") + TestBook::nextLink(),
            QStringLiteral("<p>Part six, the last one.</p>")
        });
        ChapterCache cache(&book, &m_pipeline);
        QSignalSpy titlesSpy(&cache, &ChapterCache::chapterTitlesChanged);

        cache.loadWindow(5, false);

        QCOMPARE(book.size(), 6);
        QVERIFY(cache.state(4)->isSuccess());
        QVERIFY(cache.state(5)->isSuccess());
        QCOMPARE(cache.state(6)->message, ChapterCache::NO_MORE_CHAPTERS);
        QVERIFY(!cache.state(7).has_value());

        QCOMPARE(cache.expandedSizes(), QSet<int>({3, 4, 5, 6}));
        QCOMPARE(cache.chapterTitles().size(), 6);
        QVERIFY(titlesSpy.count() >= 1);

        // Growth stopped at 6: asking again does not retry
        const int expansions = book.expandCount();
        cache.loadChapter(8, false, false);
        QCOMPARE(book.expandCount(), expansions);
    }

    void testWindowPublishedOnlyInRange() {
        TestBook book("Window", chapters(10));
        ChapterCache cache(&book, &m_pipeline);
        cache.setCurrentIndex(0);

        QSignalSpy windowSpy(&cache, &ChapterCache::windowChanged);
        QSignalSpy stateSpy(&cache, &ChapterCache::chapterStateChanged);

        cache.loadChapter(1, false, true);
        // loading, loading with hint, success
        QCOMPARE(windowSpy.count(), 3);
        QCOMPARE(stateSpy.count(), 3);

        windowSpy.clear();
        cache.loadChapter(6, false, true);
        QCOMPARE(windowSpy.count(), 0);
        QVERIFY(cache.state(6)->isSuccess());
        QVERIFY(!cache.isInWindow(6));
        QVERIFY(cache.isInWindow(-1));
        QVERIFY(cache.isInWindow(2));
        QVERIFY(!cache.isInWindow(3));
    }

    void testVisibleWindowContents() {
        TestBook book("Contents", chapters(3));
        book.setFailure(2, ErrorKind::NetworkError);
        ChapterCache cache(&book, &m_pipeline);

        cache.setCurrentIndex(0);
        cache.loadWindow(0, false);

        QSignalSpy windowSpy(&cache, &ChapterCache::windowChanged);
        ChapterWindow window = cache.computeVisibleWindow(true);
        QCOMPARE(windowSpy.count(), 1);
        QVERIFY(window.seekToDesired);

        // start, 2 paragraphs, start, 2 paragraphs, start, failure
        QCOMPARE(window.items.size(), 8);
        QCOMPARE(window.items[0].kind, WindowItem::Kind::ChapterStart);
        QCOMPARE(window.items[0].text, QString("Chapter 1"));
        QCOMPARE(window.items[1].kind, WindowItem::Kind::Text);
        QCOMPARE(window.items[1].text, QString("Chapter 1 opens."));
        QCOMPARE(window.items[2].span.innerIndex, 1);
        QCOMPARE(window.items[3].chapterIndex, 1);
        QCOMPARE(window.items[6].kind, WindowItem::Kind::ChapterStart);
        QCOMPARE(window.items[7].kind, WindowItem::Kind::Failed);
        QVERIFY(window.items[7].canReload);
        QCOMPARE(window.items[7].text, QString("Timeout"));
    }

    void testPaddingGrowsToCap() {
        TestBook book("Padding", chapters(3));
        ChapterCache cache(&book, &m_pipeline);

        QCOMPARE(cache.paddingTop(), ChapterCache::DEFAULT_PADDING_TOP);

        cache.onVisibleRange(3, 7);
        QCOMPARE(cache.paddingTop(), 5);

        cache.onVisibleRange(3, 4);
        QCOMPARE(cache.paddingTop(), 5);

        cache.onVisibleRange(0, 40);
        QCOMPARE(cache.paddingTop(), ChapterCache::MAX_PADDING);
        QCOMPARE(cache.paddingBottom(), ChapterCache::DEFAULT_PADDING_BOTTOM);
    }

    void testCharOffsetLookup() {
        TestBook book("Offsets", {QStringLiteral("First paragraph.\n\nSecond paragraph.")});
        ChapterCache cache(&book, &m_pipeline);

        QVERIFY(!cache.innerIndexForChar(0, 0).has_value());

        cache.loadChapter(0, false, false);
        QCOMPARE(cache.innerIndexForChar(0, 0).value(), 0);
        QCOMPARE(cache.innerIndexForChar(0, 5).value(), 1);
        QVERIFY(!cache.innerIndexForChar(0, 500).has_value());

        QVector<SpeechLine> lines = cache.speechLines(0);
        QCOMPARE(lines.size(), 2);
        QCOMPARE(lines[1].text, QString("Second paragraph."));
        QCOMPARE(lines[1].startChar, 18);
    }
};

#endif // CHAPTERCACHETESTS_H
