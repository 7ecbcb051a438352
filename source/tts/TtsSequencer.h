#pragma once

// ============================================================================
// TtsSequencer - Sequential speech playback over the chapter cache
// ============================================================================
// State machine:
//
//   Stopped --start()--> Running <--pause()/resume()--> Paused
//   Running/Paused --stop()--> Stopped
//
// start() is the only call that spawns the playback loop. The loop runs on a
// private single-thread pool and holds the playback mutex for its lifetime,
// taken with tryLock so a second loop never runs alongside the first.
//
// Commands only mutate the atomic status and the pending skip counter; the
// loop observes them at its next check.
// ============================================================================

#include "SpeechBackend.h"
#include "../core/ChapterState.h"

#include <QFuture>
#include <QMutex>
#include <QObject>
#include <QThreadPool>
#include <atomic>
#include <optional>

class Book;
class ChapterCache;
class PlaybackNotifier;
class PositionStore;

class TtsSequencer : public QObject {
    Q_OBJECT

public:
    /// Poll interval while paused or waiting for a chapter to load
    static constexpr int POLL_INTERVAL_MS = 100;

    /// Error shown when the playback chapter has never been requested
    static const QString NULL_DATA_ERROR;

    /**
     * @param book, cache, backend, store Must outlive the sequencer.
     * @param notifier Optional, may be null.
     */
    TtsSequencer(Book* book, ChapterCache* cache, SpeechBackend* backend,
                 PositionStore* store, PlaybackNotifier* notifier,
                 QObject* parent = nullptr);
    ~TtsSequencer() override;

    // ===== Lifecycle =====

    /**
     * @brief Position playback starts from (chapter and char offset).
     */
    void setStartPosition(const std::optional<ScrollIndex>& position);
    std::optional<ScrollIndex> startPosition() const;

    /**
     * @brief Stopped -> Running, spawning the playback loop.
     * @return Handle of the loop. If playback is not stopped, the handle of
     *         the running loop. An empty future if there is no start position.
     */
    QFuture<void> start();

    /**
     * @brief Block until the current loop (if any) has exited.
     */
    void waitForFinished();

    /**
     * @brief Stop playback and wait for the loop, whatever the backend state.
     *
     * For teardown and seeking. Unlike stop() this is never rejected, so a
     * backend that died mid-playback cannot keep the loop alive.
     */
    void shutdown();

    TtsStatus status() const { return m_status.load(); }
    bool isRunning() const { return m_status.load() == TtsStatus::Running; }
    int pendingSkip() const { return m_pendingSkip.load(); }

    /**
     * @brief Line currently being spoken, nullopt when idle.
     */
    std::optional<SpeechLine> currentLine() const;

    // ===== Commands =====
    // Each returns false when rejected for the current status or when the
    // backend is not initialized.

    bool pause();
    bool resume();
    bool stop();
    bool next();
    bool previous();

    /**
     * @brief Running <-> Paused.
     */
    bool togglePause();

    void setLanguage(const QLocale& locale);
    void setVoice(const QString& voice);

signals:
    void statusChanged(TtsStatus status);
    void currentLineChanged(const SpeechLine& line);
    void currentLineCleared();

    /**
     * @brief The loop stopped on a chapter it could not read.
     */
    void playbackError(const QString& message);

private:
    void runLoop(int generation);

    /**
     * @brief Whether the loop for @p generation should exit.
     */
    bool isStopped(int generation) const;

    void setStatus(TtsStatus status);
    void publishLine(const std::optional<SpeechLine>& line);
    void notifyPlayer(int chapterIndex, TtsStatus status);

    /**
     * @brief Wait for @p speech, cutting it short on stop, pause or skip.
     */
    void waitForSpeech(QFuture<void>& speech, int generation);

    Book* m_book = nullptr;
    ChapterCache* m_cache = nullptr;
    SpeechBackend* m_backend = nullptr;
    PositionStore* m_store = nullptr;
    PlaybackNotifier* m_notifier = nullptr;

    std::atomic<TtsStatus> m_status{TtsStatus::Stopped};
    std::atomic<int> m_pendingSkip{0};
    std::atomic<int> m_generation{0};

    mutable QMutex m_dataMutex;
    std::optional<ScrollIndex> m_startPosition;
    std::optional<SpeechLine> m_currentLine;
    QByteArray m_cover;
    bool m_coverLoaded = false;

    QMutex m_playbackMutex;
    QThreadPool m_pool;
    QFuture<void> m_loop;
};

Q_DECLARE_METATYPE(SpeechLine)
