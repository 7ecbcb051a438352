#pragma once

// ============================================================================
// EpubBook - MuPDF implementation of Book for local EPUB archives
// ============================================================================
// MuPDF opens EPUB natively (it parses the container, OPF and XHTML and lays
// the book out into pages). A chapter is a top-level table-of-contents entry;
// its text is the structured text of the pages it spans.
//
// EPUB books are static: canReload() is false and tryExpand() never grows
// the book.
// ============================================================================

#include "Book.h"

#include <QMutex>
#include <QPair>
#include <QVector>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_document;
struct fz_outline;

/**
 * @brief Chapter boundaries derived from the EPUB outline.
 */
struct EpubChapter {
    QString title;
    int firstPage = 0;      ///< First laid-out page (0-based)
    int endPage = 0;        ///< One past the last page
};

/**
 * @brief Book implementation using MuPDF.
 */
class EpubBook : public Book {
public:
    /**
     * @brief Open the EPUB at @p epubPath.
     *
     * Check isValid() after construction to verify the archive loaded.
     */
    explicit EpubBook(const QString& epubPath);

    ~EpubBook() override;

    // Disable copy (MuPDF context is not copyable)
    EpubBook(const EpubBook&) = delete;
    EpubBook& operator=(const EpubBook&) = delete;

    bool isValid() const;
    QString filePath() const { return m_path; }

    int size() const override;
    QString title() const override;
    QString chapterTitle(int index) const override;
    QString loadingHint(int index) const override;
    bool canReload() const override { return false; }

    ChapterFetchResult fetchChapterText(int index, bool forceReload) override;
    bool tryExpand(const QString& lastChapterText) override;
    QByteArray coverImageBytes() override;

    /**
     * @brief Build chapter ranges from outline start pages.
     * @param starts (title, first page) pairs in outline order.
     * @param pageCount Total laid-out pages.
     *
     * Entries pointing backwards (anchors inside an earlier chapter) are
     * dropped. Without any entry every page becomes a chapter.
     */
    static QVector<EpubChapter> buildChapters(const QVector<QPair<QString, int>>& starts,
                                              int pageCount);

private:
    QString pageText(int pageIndex) const;
    QString metadata(const char* key) const;
    QVector<QPair<QString, int>> outlineStarts(fz_outline* outline) const;

    fz_context* m_ctx = nullptr;        ///< MuPDF context (owns all allocations)
    fz_document* m_doc = nullptr;       ///< The loaded EPUB document
    QString m_path;
    QString m_title;
    int m_pageCount = 0;
    QVector<EpubChapter> m_chapters;

    // MuPDF contexts are single threaded; loaders run on a pool
    mutable QMutex m_docMutex;
};
