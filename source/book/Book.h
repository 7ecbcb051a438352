#pragma once

// ============================================================================
// Book - Abstract interface for a readable book source
// ============================================================================
// Quire reads two kinds of books through this one interface:
// - StreamBook: a serialized web novel whose chapters are fetched on demand
//   and which can grow while reading (a "next" link in the last chapter)
// - EpubBook: a local EPUB archive opened through MuPDF
//
// Design: Uses simple value structs for results instead of exceptions, so a
// chapter failure is just data that the ChapterCache stores in the chapter's
// slot.
// ============================================================================

#include <QByteArray>
#include <QString>
#include <memory>

/**
 * @brief Error taxonomy shared by book sources and the reading session.
 */
enum class ErrorKind {
    None,            ///< No error
    NotFound,        ///< Missing input (file, intent data, chapter file)
    EmptySource,     ///< Book parsed but has no chapters
    NetworkError,    ///< Transient fetch failure, can be retried
    ParseError,      ///< Malformed content, retrying will not help
    NoMoreChapters,  ///< Reading ran past the last chapter
    NotInitialized   ///< Speech backend not ready
};

/**
 * @brief Result of fetching the text of one chapter.
 */
struct ChapterFetchResult {
    bool ok = false;
    QString text;                       ///< Chapter HTML (or plain text)
    ErrorKind errorKind = ErrorKind::None;
    QString message;                    ///< Human readable error

    /// @brief Only network failures offer a retry affordance.
    bool isRetryable() const { return errorKind == ErrorKind::NetworkError; }

    static ChapterFetchResult success(const QString& text) {
        ChapterFetchResult r;
        r.ok = true;
        r.text = text;
        return r;
    }

    static ChapterFetchResult failure(ErrorKind kind, const QString& message) {
        ChapterFetchResult r;
        r.errorKind = kind;
        r.message = message;
        return r;
    }
};

class Book;

/**
 * @brief Result of opening a book file.
 */
struct BookOpenResult {
    std::unique_ptr<Book> book;         ///< Null on failure
    ErrorKind errorKind = ErrorKind::None;
    QString message;

    bool isValid() const { return book != nullptr; }
};

/**
 * @brief Abstract interface for book sources.
 *
 * Implementations must allow fetchChapterText() to be called from worker
 * threads while the owning thread reads size() and titles. tryExpand() is
 * only ever called with the ChapterCache expansion lock held.
 */
class Book {
public:
    virtual ~Book() = default;

    // ===== Metadata =====

    /**
     * @brief Number of chapters currently known.
     *
     * Never shrinks. May grow after a successful tryExpand().
     */
    virtual int size() const = 0;

    /**
     * @brief Book title. Also the key under which the reading position is saved.
     */
    virtual QString title() const = 0;

    /**
     * @brief Title of chapter @p index (0-based).
     */
    virtual QString chapterTitle(int index) const = 0;

    /**
     * @brief Loading hint shown while chapter @p index is fetched.
     * @return Source URL for remote books, empty string when not applicable.
     */
    virtual QString loadingHint(int index) const = 0;

    /**
     * @brief Whether reloading a chapter can produce different content.
     */
    virtual bool canReload() const = 0;

    // ===== Content =====

    /**
     * @brief Fetch the raw text of a chapter.
     * @param index 0-based chapter index, must be < size().
     * @param forceReload Bypass any local cache.
     *
     * May block on I/O. Called without any engine lock held.
     */
    virtual ChapterFetchResult fetchChapterText(int index, bool forceReload) = 0;

    /**
     * @brief Discover one more chapter from the content of the last chapter.
     * @param lastChapterText Text of the current last chapter.
     * @return True if a chapter was appended.
     */
    virtual bool tryExpand(const QString& lastChapterText) = 0;

    /**
     * @brief Encoded cover image (PNG/JPEG), empty if none.
     */
    virtual QByteArray coverImageBytes() = 0;

    // ===== Factory =====

    /**
     * @brief Open a book file.
     * @param path Path to an .epub archive or a serialized stream (.json).
     * @param mimeType Optional type, "application/epub+zip" forces EPUB.
     */
    static BookOpenResult open(const QString& path, const QString& mimeType = QString());
};
