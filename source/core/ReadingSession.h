#pragma once

// ============================================================================
// ReadingSession - One open book with its cache, playback and position
// ============================================================================
// Owns the Book, the TextPipeline, the ChapterCache and the TtsSequencer for
// as long as a book is open. The position store, speech backend and
// notification sink are borrowed and must outlive the session.
//
// Lifecycle:
//   init(path) / init(book)  -> loadStatusChanged(Loading ... Success|Failure)
//   ... reading, scrolling, playback ...
//   dispose()                -> stops playback, joins workers, releases backend
//
// Methods are meant to be called from one (the owning) thread. Chapter loads
// and playback run on worker threads and report back through signals.
// ============================================================================

#include "ChapterState.h"
#include "../text/TextPipeline.h"
#include "../tts/TtsSequencer.h"

#include <QFuture>
#include <QObject>
#include <QStringList>
#include <memory>
#include <optional>

class Book;
class ChapterCache;
class PlaybackNotifier;
class PositionStore;
class ReaderPreferences;
class SpeechBackend;

class ReadingSession : public QObject {
    Q_OBJECT

public:
    enum class LoadStatus {
        Idle,
        Loading,
        Success,
        Failure
    };
    Q_ENUM(LoadStatus)

    ReadingSession(PositionStore* store, SpeechBackend* backend,
                   PlaybackNotifier* notifier = nullptr, QObject* parent = nullptr);
    ~ReadingSession() override;

    // ===== Lifecycle =====

    /**
     * @brief Open the book at @p path and show the saved position.
     * @param mimeType "application/epub+zip" forces EPUB, otherwise by suffix.
     * @return False if the book could not be opened (see errorMessage()).
     */
    bool init(const QString& path, const QString& mimeType = QString());

    /**
     * @brief Same as init(path) with an already constructed book.
     */
    bool init(std::unique_ptr<Book> book);

    /**
     * @brief Stop playback, wait for workers and release the speech backend.
     *
     * Safe to call more than once. The session cannot be reused afterwards.
     */
    void dispose();

    bool isOpen() const { return m_book != nullptr; }
    LoadStatus loadStatus() const { return m_loadStatus; }
    QString errorMessage() const { return m_errorMessage; }

    // ===== Navigation =====

    /**
     * @brief Jump to the start of chapter @p index.
     *
     * Stops playback. Out-of-range indices are ignored.
     * @return False if ignored.
     */
    bool seekToChapter(int index);

    /**
     * @brief Make @p index the current position and seek the viewer to it.
     */
    void scrollToDesired(const ScrollIndex& index);

    /**
     * @brief Report what the viewer has resident and visible.
     */
    void onScroll(const ScrollVisibility& visibility);

    /**
     * @brief Re-fetch chapter @p index in the background.
     */
    void reloadChapter(int index);
    void reloadChapter();

    /**
     * @brief Paragraph index of @p charOffset in a loaded chapter.
     */
    std::optional<int> innerCharToIndex(int index, int charOffset) const;

    std::optional<ScrollIndex> desiredIndex() const { return m_desiredIndex; }
    std::optional<ScrollIndex> desiredTtsIndex() const { return m_desiredTtsIndex; }

    // ===== Playback =====

    /**
     * @brief Start reading aloud from the TTS start position.
     *
     * The start position is the first fully visible line under the reading
     * line reported by onScroll(), or the current position.
     */
    QFuture<void> startTts();

    // ===== Components =====

    Book* book() const { return m_book.get(); }
    ChapterCache* cache() const { return m_cache.get(); }
    TtsSequencer* tts() const { return m_tts.get(); }
    ReaderPreferences* preferences() const { return m_preferences.get(); }
    PositionStore* store() const { return m_store; }

signals:
    void loadStatusChanged(ReadingSession::LoadStatus status, const QString& message);
    void titleChanged(const QString& title);
    void chapterTitleChanged(const QString& title);
    void chapterTitlesChanged(const QStringList& titles);
    void windowChanged(const ChapterWindow& window);

    void ttsStatusChanged(TtsStatus status);
    void ttsLineChanged(const SpeechLine& line);
    void ttsLineCleared();
    void ttsError(const QString& message);

private:
    /**
     * @brief Set the current position, persist it, publish the chapter title.
     */
    void changeIndex(const ScrollIndex& index);

    void setLoadStatus(LoadStatus status, const QString& message = QString());

    /**
     * @brief Drop the open book and its workers, keeping the backend.
     */
    void closeBook();

    PositionStore* m_store = nullptr;
    SpeechBackend* m_backend = nullptr;
    PlaybackNotifier* m_notifier = nullptr;

    TextPipeline m_pipeline;
    std::unique_ptr<ReaderPreferences> m_preferences;

    // Destroyed in reverse: playback, cache, then the book they point to
    std::unique_ptr<Book> m_book;
    std::unique_ptr<ChapterCache> m_cache;
    std::unique_ptr<TtsSequencer> m_tts;

    LoadStatus m_loadStatus = LoadStatus::Idle;
    QString m_errorMessage;
    std::optional<ScrollIndex> m_desiredIndex;
    std::optional<ScrollIndex> m_desiredTtsIndex;
    bool m_released = false;
};
