#pragma once

// ============================================================================
// StreamBook - Serialized web novel
// ============================================================================
// A stream file is the JSON snapshot of a novel's chapter list:
//
//   {
//     "meta":   { "name": "My Novel", "apiName": "RoyalRoad" },
//     "data":   [ { "name": "Chapter 1", "url": "chapters/1.html" }, ... ],
//     "poster": "cover.jpg"
//   }
//
// Chapters are fetched through a ChapterFetcher. The chapter list can grow
// while reading: serials posted as linked parts carry a "Next" link at the
// end of each chapter, and tryExpand() follows it.
// ============================================================================

#include "Book.h"
#include "ChapterFetcher.h"

#include <QMutex>
#include <QVector>

/**
 * @brief One entry of the stream's chapter list.
 */
struct StreamChapter {
    QString name;
    QString url;
};

/**
 * @brief Book implementation over a serialized chapter list.
 */
class StreamBook : public Book {
public:
    StreamBook(const QString& name, const QString& apiName,
               const QVector<StreamChapter>& chapters, const QString& posterUrl,
               std::unique_ptr<ChapterFetcher> fetcher);

    /**
     * @brief Parse a stream file.
     * @param json File contents.
     * @param fetcher Fetcher used for chapters and poster.
     * @return The book, or ParseError/EmptySource on failure.
     */
    static BookOpenResult fromJson(const QByteArray& json,
                                   std::unique_ptr<ChapterFetcher> fetcher);

    int size() const override;
    QString title() const override;
    QString chapterTitle(int index) const override;
    QString loadingHint(int index) const override;
    bool canReload() const override { return true; }

    ChapterFetchResult fetchChapterText(int index, bool forceReload) override;
    bool tryExpand(const QString& lastChapterText) override;
    QByteArray coverImageBytes() override;

    QString apiName() const { return m_apiName; }

    /**
     * @brief Find the "next" continuation link in chapter HTML.
     * @return The link target, or empty string if none.
     */
    static QString findNextLink(const QString& html);

    /**
     * @brief Derive a chapter name from a continuation URL.
     * @return Last path segment in readable form, "Next" if nothing usable.
     */
    static QString nameFromUrl(const QString& url);

private:
    StreamChapter chapterAt(int index) const;

    QString m_name;
    QString m_apiName;
    QString m_posterUrl;
    std::unique_ptr<ChapterFetcher> m_fetcher;

    // Guards m_chapters: expansion appends while loaders read URLs
    mutable QMutex m_chaptersMutex;
    QVector<StreamChapter> m_chapters;
};
