#pragma once

// ============================================================================
// StreamBookTests - Unit tests for stream books and the file fetcher
// ============================================================================
// Tests:
// - Stream JSON parsing (metadata, chapter list, malformed and empty input)
// - "Next" link discovery and naming of discovered chapters
// - tryExpand() growth
// - FileChapterFetcher path resolution and chapter cache
// ============================================================================

#include "StreamBook.h"
#include "ChapterFetcher.h"
#include <QDebug>
#include <QFile>
#include <QTemporaryDir>
#include <QUrl>

namespace StreamBookTests {

inline bool writeFile(const QString& path, const QByteArray& data)
{
    QFile file(path);
    return file.open(QIODevice::WriteOnly) && file.write(data) == data.size();
}

/**
 * @brief Metadata and chapter list are read; entries without a url skipped.
 */
inline bool testFromJson()
{
    qDebug() << "=== Test: Stream fromJson ===";

    bool success = true;

    const QByteArray json =
        "{\"meta\":{\"name\":\"Sky Road\",\"apiName\":\"RoyalRoad\"},"
        "\"data\":[{\"name\":\"Prologue\",\"url\":\"c/0.html\"},"
        "{\"name\":\"Broken\"},"
        "{\"name\":\"One\",\"url\":\"c/1.html\"}],"
        "\"poster\":\"cover.jpg\"}";

    BookOpenResult result = StreamBook::fromJson(json, nullptr);
    if (!result.isValid()) {
        qDebug() << "FAIL: Valid stream rejected:" << result.message;
        return false;
    }

    Book* book = result.book.get();
    if (book->title() != QStringLiteral("Sky Road") || book->size() != 2) {
        qDebug() << "FAIL: Got" << book->title() << "with" << book->size() << "chapters";
        success = false;
    }
    if (book->chapterTitle(1) != QStringLiteral("One") || book->loadingHint(0) != QStringLiteral("c/0.html")) {
        qDebug() << "FAIL: Chapter entries mismatch";
        success = false;
    }
    if (!book->chapterTitle(9).isEmpty()) {
        qDebug() << "FAIL: Out of range title should be empty";
        success = false;
    }
    if (static_cast<StreamBook*>(book)->apiName() != QStringLiteral("RoyalRoad")) {
        qDebug() << "FAIL: apiName mismatch";
        success = false;
    }

    // No fetcher: chapters cannot be loaded but may be retried
    ChapterFetchResult fetched = book->fetchChapterText(0, false);
    if (fetched.ok || !fetched.isRetryable()) {
        qDebug() << "FAIL: Fetch without fetcher should fail retryably";
        success = false;
    }
    fetched = book->fetchChapterText(5, false);
    if (fetched.ok || fetched.errorKind != ErrorKind::NotFound || fetched.isRetryable()) {
        qDebug() << "FAIL: Missing chapter should be NotFound";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Stream fromJson";
    }
    return success;
}

/**
 * @brief Malformed and empty streams are rejected with the right kind.
 */
inline bool testFromJsonErrors()
{
    qDebug() << "=== Test: Stream fromJson Errors ===";

    bool success = true;

    BookOpenResult broken = StreamBook::fromJson("[1, 2", nullptr);
    if (broken.isValid() || broken.errorKind != ErrorKind::ParseError) {
        qDebug() << "FAIL: Malformed JSON should be a ParseError";
        success = false;
    }

    BookOpenResult empty = StreamBook::fromJson("{\"meta\":{\"name\":\"Nothing\"},\"data\":[]}", nullptr);
    if (empty.isValid() || empty.errorKind != ErrorKind::EmptySource) {
        qDebug() << "FAIL: Empty chapter list should be EmptySource";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Stream fromJson Errors";
    }
    return success;
}

/**
 * @brief Only links reading "next" (in any decoration) continue the book.
 *
 * Text inside nested markup of the link is not part of its own text.
 */
inline bool testFindNextLink()
{
    qDebug() << "=== Test: Find Next Link ===";

    struct Case {
        QString html;
        QString expected;
    };
    const QVector<Case> cases = {
        {QStringLiteral("<p>End.</p><a href=\"ch2.html\">Next</a>"), QStringLiteral("ch2.html")},
        {QStringLiteral("<a class=\"btn\" href='part-3.html'><span>[ Next Chapter ]</span></a>"),
         QStringLiteral("part-3.html")},
        {QStringLiteral("<a href=\"toc.html\">Contents</a> | <a href=\"np.html\">next part</a>"),
         QStringLiteral("np.html")},
        {QStringLiteral("<a href=\"prev.html\">Previous</a> <a href=\"idx.html\">Index</a>"), QString()},
        {QStringLiteral("<a href=\"x.html\">Next time on the show</a>"), QString()},
        {QStringLiteral("<p><a href=/c/2>Next</a></p>"), QStringLiteral("/c/2")},
        {QStringLiteral("<a href='c/6.html'>Next <b>chapter 6</b></a>"), QStringLiteral("c/6.html")},
        {QStringLiteral("<a href='c/7.html'><b>Next</b> &raquo;</a>"), QStringLiteral("c/7.html")},
        {QStringLiteral("No links at all."), QString()},
    };

    bool success = true;
    for (const Case& c : cases) {
        const QString found = StreamBook::findNextLink(c.html);
        if (found != c.expected) {
            qDebug() << "FAIL: findNextLink(" << c.html << ") =" << found << "expected" << c.expected;
            success = false;
        }
    }

    if (success) {
        qDebug() << "PASS: Find Next Link";
    }
    return success;
}

inline bool testNameFromUrl()
{
    qDebug() << "=== Test: Name From Url ===";

    bool success = true;

    if (StreamBook::nameFromUrl(QStringLiteral("https://example.com/story/chapter_12-part-2.html"))
        != QStringLiteral("chapter 12 part 2")) {
        qDebug() << "FAIL: Last path segment not used";
        success = false;
    }
    if (StreamBook::nameFromUrl(QStringLiteral("https://example.com/")) != QStringLiteral("Next")
        || StreamBook::nameFromUrl(QString()) != QStringLiteral("Next")) {
        qDebug() << "FAIL: Empty path should fall back to Next";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Name From Url";
    }
    return success;
}

/**
 * @brief tryExpand() appends exactly one chapter per discovered link.
 */
inline bool testTryExpand()
{
    qDebug() << "=== Test: Try Expand ===";

    bool success = true;

    StreamBook book(QStringLiteral("Serial"), QString(),
                    {{QStringLiteral("Part 1"), QStringLiteral("p1.html")}},
                    QString(), nullptr);

    if (book.tryExpand(QStringLiteral("<p>The end.</p>"))) {
        qDebug() << "FAIL: Expanded without a link";
        success = false;
    }
    if (!book.tryExpand(QStringLiteral("<a href=\"parts/part-2.html\">Next</a>"))) {
        qDebug() << "FAIL: Did not expand on a Next link";
        success = false;
    }
    if (book.size() != 2 || book.chapterTitle(1) != QStringLiteral("part 2")
        || book.loadingHint(1) != QStringLiteral("parts/part-2.html")) {
        qDebug() << "FAIL: Expanded chapter is" << book.chapterTitle(1) << book.loadingHint(1);
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Try Expand";
    }
    return success;
}

/**
 * @brief Relative, absolute and file:// urls resolve; chapters are cached.
 */
inline bool testFileFetcher()
{
    qDebug() << "=== Test: File Fetcher ===";

    QTemporaryDir dir;
    if (!dir.isValid() || !writeFile(dir.filePath("one.html"), "<p>Original</p>")
        || !writeFile(dir.filePath("cover.png"), "PNGDATA")) {
        qDebug() << "FAIL: Could not prepare files";
        return false;
    }

    bool success = true;
    FileChapterFetcher fetcher(dir.path(), dir.filePath("cache"));

    if (fetcher.resolve(QStringLiteral("one.html")) != dir.filePath("one.html")
        || fetcher.resolve(QUrl::fromLocalFile(dir.filePath("one.html")).toString()) != dir.filePath("one.html")
        || fetcher.resolve(dir.filePath("one.html")) != dir.filePath("one.html")) {
        qDebug() << "FAIL: resolve() mismatch";
        success = false;
    }

    const QString cachePath = fetcher.cachePath(QStringLiteral("A/B: C"), 0);
    if (!cachePath.endsWith(QStringLiteral("/A_B_ C/0.html"))) {
        qDebug() << "FAIL: Unsafe book name in cache path:" << cachePath;
        success = false;
    }

    ChapterFetchResult first = fetcher.fetch(QStringLiteral("A/B: C"), 0, QStringLiteral("one.html"), false);
    if (!first.ok || first.text != QStringLiteral("<p>Original</p>") || !QFile::exists(cachePath)) {
        qDebug() << "FAIL: First fetch should read the file and cache it";
        success = false;
    }

    writeFile(dir.filePath("one.html"), "<p>Changed</p>");
    ChapterFetchResult cached = fetcher.fetch(QStringLiteral("A/B: C"), 0, QStringLiteral("one.html"), false);
    ChapterFetchResult reloaded = fetcher.fetch(QStringLiteral("A/B: C"), 0, QStringLiteral("one.html"), true);
    if (cached.text != QStringLiteral("<p>Original</p>") || reloaded.text != QStringLiteral("<p>Changed</p>")) {
        qDebug() << "FAIL: Cache or reload mismatch:" << cached.text << reloaded.text;
        success = false;
    }

    ChapterFetchResult missing = fetcher.fetch(QStringLiteral("A/B: C"), 1, QStringLiteral("gone.html"), false);
    if (missing.ok || !missing.isRetryable()) {
        qDebug() << "FAIL: Missing chapter file should fail retryably";
        success = false;
    }

    if (fetcher.fetchBytes(QStringLiteral("cover.png")) != QByteArray("PNGDATA")
        || !fetcher.fetchBytes(QStringLiteral("nope.png")).isEmpty()) {
        qDebug() << "FAIL: fetchBytes() mismatch";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: File Fetcher";
    }
    return success;
}

/**
 * @brief Run all StreamBook tests.
 * @return true if all tests pass
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running StreamBook Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testFromJson();
    qDebug() << "";

    allPass &= testFromJsonErrors();
    qDebug() << "";

    allPass &= testFindNextLink();
    qDebug() << "";

    allPass &= testNameFromUrl();
    qDebug() << "";

    allPass &= testTryExpand();
    qDebug() << "";

    allPass &= testFileFetcher();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace StreamBookTests
