#pragma once

// ============================================================================
// ChapterFetcher - Retrieval of remote chapter HTML
// ============================================================================
// StreamBook does not know how chapters travel over the wire. It asks a
// ChapterFetcher, which may hit the network or a local download cache.
//
// FileChapterFetcher is the implementation used by the command line: chapter
// URLs are local paths or file:// URLs (a downloaded novel), and fetched
// chapters are mirrored into a per-book cache directory.
// ============================================================================

#include "Book.h"

#include <QString>
#include <QByteArray>

/**
 * @brief Abstract fetcher for chapter content and poster images.
 */
class ChapterFetcher {
public:
    virtual ~ChapterFetcher() = default;

    /**
     * @brief Fetch chapter HTML.
     * @param bookName Book name, used to scope caches.
     * @param index Chapter index.
     * @param url Chapter URL as stored in the stream file.
     * @param reload Bypass the cache.
     */
    virtual ChapterFetchResult fetch(const QString& bookName, int index,
                                     const QString& url, bool reload) = 0;

    /**
     * @brief Fetch raw bytes (used for the poster).
     * @return Empty array on failure.
     */
    virtual QByteArray fetchBytes(const QString& url) = 0;
};

/**
 * @brief ChapterFetcher over the local filesystem.
 */
class FileChapterFetcher : public ChapterFetcher {
public:
    /**
     * @param baseDir Directory relative URLs are resolved against.
     * @param cacheDir Cache root. Empty disables caching.
     */
    FileChapterFetcher(const QString& baseDir, const QString& cacheDir);

    ChapterFetchResult fetch(const QString& bookName, int index,
                             const QString& url, bool reload) override;
    QByteArray fetchBytes(const QString& url) override;

    /**
     * @brief Map a chapter URL to a local path.
     */
    QString resolve(const QString& url) const;

    QString cachePath(const QString& bookName, int index) const;

private:
    QString m_baseDir;
    QString m_cacheDir;
};
