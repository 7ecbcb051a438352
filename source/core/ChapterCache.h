#pragma once

// ============================================================================
// ChapterCache - Sliding window of loaded chapters around the reading position
// ============================================================================
// Keeps chapters [currentIndex - paddingBottom, currentIndex + paddingTop]
// loaded and rendered, and publishes the ordered display list for that range.
//
// Design:
// - At most one in-flight load per chapter index (the loading set)
// - Chapters scheduled by requestWindow() stay pending until their load has
//   stored a state, so a queued chapter is never mistaken for an absent one
// - Loads run on a private thread pool; the fetch itself runs with no lock
//   held so one slow chapter never blocks the rest of the cache
// - Books that grow while reading are expanded lazily when a load runs past
//   the last known chapter, at most once per observed book size
// - The window is republished after a state change only when the changed
//   chapter is inside the current window
// ============================================================================

#include "ChapterState.h"

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <QThreadPool>
#include <optional>

class Book;
class TextPipeline;

class ChapterCache : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_PADDING_BOTTOM = 1;
    static constexpr int DEFAULT_PADDING_TOP = 2;
    static constexpr int MAX_PADDING = 10;

    /// Failure text stored one past the last chapter
    static const QString NO_MORE_CHAPTERS;

    /**
     * @brief Create a cache over @p book.
     * @param book Book to load from. Must outlive the cache.
     * @param pipeline Render pipeline. Must outlive the cache.
     */
    ChapterCache(Book* book, const TextPipeline* pipeline, QObject* parent = nullptr);
    ~ChapterCache() override;

    // ===== Loading =====

    /**
     * @brief Schedule loading of the window around @p index.
     *
     * Returns immediately. Nothing is scheduled if every chapter of the
     * window was requested before.
     */
    void requestWindow(int index);

    /**
     * @brief Load the window around @p index on the calling thread.
     * @param notify Republish the window after each state change.
     */
    void loadWindow(int index, bool notify);

    /**
     * @brief Load one chapter on the calling thread.
     * @param index Chapter index. Negative indices are ignored.
     * @param reload Re-fetch even if a state is already present.
     * @param notify Republish the window after each state change.
     *
     * No-op if the chapter is already loading, or already present and
     * @p reload is false.
     */
    void loadChapter(int index, bool reload = false, bool notify = true);

    /**
     * @brief Re-fetch a chapter in the background, then republish the window.
     */
    void reloadChapter(int index);

    /**
     * @brief Block until all scheduled loads have finished.
     */
    void waitForIdle();

    // ===== Window =====

    /**
     * @brief Assemble and publish the display list for the current window.
     * @param seekToDesired Forwarded to the viewer with the list.
     * @return The published window.
     */
    ChapterWindow computeVisibleWindow(bool seekToDesired);

    /**
     * @brief Grow the top padding to cover the chapters the viewer has resident.
     *
     * Never shrinks, capped at MAX_PADDING.
     */
    void onVisibleRange(int firstIndex, int lastIndex);

    void setCurrentIndex(int index);
    int currentIndex() const;
    int paddingBottom() const;
    int paddingTop() const;

    /**
     * @brief Whether @p index lies in the current window.
     */
    bool isInWindow(int index) const;

    // ===== State =====

    /**
     * @brief State of a chapter slot, or nullopt if never requested/cleared.
     */
    std::optional<ChapterState> state(int index) const;

    bool isLoading(int index) const;
    bool wasRequested(int index) const;

    /**
     * @brief Scheduled by requestWindow() but not yet stored a state.
     *
     * Check this before state(): a load stores its state before it stops
     * being pending.
     */
    bool isPending(int index) const;

    /**
     * @brief Book sizes at which expansion has been attempted.
     */
    QSet<int> expandedSizes() const;

    /**
     * @brief Inner (paragraph) index of the first span at or after @p charOffset.
     * @return nullopt if the chapter is not loaded or no span qualifies.
     */
    std::optional<int> innerIndexForChar(int index, int charOffset) const;

    /**
     * @brief Speech lines of a loaded chapter, empty if not loaded.
     */
    QVector<SpeechLine> speechLines(int index) const;

    /**
     * @brief Cached chapter titles (grows with the book).
     */
    QStringList chapterTitles() const;

    /**
     * @brief Append titles of chapters discovered since the last refresh.
     */
    void refreshChapterTitles();

signals:
    /**
     * @brief The display list changed.
     */
    void windowChanged(const ChapterWindow& window);

    /**
     * @brief The title list grew.
     */
    void chapterTitlesChanged(const QStringList& titles);

    /**
     * @brief A chapter slot changed state (emitted for every index).
     */
    void chapterStateChanged(int index);

private:
    /**
     * @brief Grow the book until @p index is in range or growth stops.
     */
    void expandTo(int index);

    std::shared_ptr<const ChapterPayload> buildPayload(int index, const QString& text);

    void notifyChapterUpdate(int index, bool notify);

    // Callers hold m_stateMutex
    bool isInWindowLocked(int index) const;
    ChapterWindow buildWindowLocked(bool seekToDesired) const;

    Book* m_book = nullptr;
    const TextPipeline* m_pipeline = nullptr;

    // State table and index sets
    mutable QMutex m_stateMutex;
    QHash<int, ChapterState> m_states;
    QSet<int> m_requested;
    QSet<int> m_loading;
    QSet<int> m_pending;
    QSet<int> m_hasExpanded;
    QStringList m_chapterTitles;
    int m_currentIndex = NO_INDEX;
    int m_paddingBottom = DEFAULT_PADDING_BOTTOM;
    int m_paddingTop = DEFAULT_PADDING_TOP;

    // Serializes book growth without blocking unrelated loads
    QMutex m_expandMutex;

    // The render step is not assumed to be reentrant
    QMutex m_renderMutex;

    QThreadPool m_pool;

    static constexpr int NO_INDEX = -0x7fffffff;
};
