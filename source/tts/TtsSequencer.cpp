// ============================================================================
// TtsSequencer - Implementation
// ============================================================================

#include "TtsSequencer.h"
#include "../book/Book.h"
#include "../core/ChapterCache.h"
#include "../platform/PlaybackNotifier.h"
#include "../store/PositionStore.h"

#include <QDebug>
#include <QMutexLocker>
#include <QThread>
#include <QtConcurrent/QtConcurrent>
#include <mutex>

const QString TtsSequencer::NULL_DATA_ERROR = QStringLiteral("Got null data");

// ============================================================================
// Constructor / Destructor
// ============================================================================

TtsSequencer::TtsSequencer(Book* book, ChapterCache* cache, SpeechBackend* backend,
                           PositionStore* store, PlaybackNotifier* notifier,
                           QObject* parent)
    : QObject(parent)
    , m_book(book)
    , m_cache(cache)
    , m_backend(backend)
    , m_store(store)
    , m_notifier(notifier)
{
    m_pool.setObjectName(QStringLiteral("TtsPlaybackPool"));
    m_pool.setMaxThreadCount(1);
}

TtsSequencer::~TtsSequencer()
{
    m_status.store(TtsStatus::Stopped);
    m_generation.fetch_add(1);
    m_pool.waitForDone();
}

void TtsSequencer::shutdown()
{
    // The generation bump also ends a loop that is between status checks
    m_generation.fetch_add(1);
    setStatus(TtsStatus::Stopped);
    m_pool.waitForDone();
}

// ============================================================================
// Lifecycle
// ============================================================================

void TtsSequencer::setStartPosition(const std::optional<ScrollIndex>& position)
{
    QMutexLocker lock(&m_dataMutex);
    m_startPosition = position;
}

std::optional<ScrollIndex> TtsSequencer::startPosition() const
{
    QMutexLocker lock(&m_dataMutex);
    return m_startPosition;
}

std::optional<SpeechLine> TtsSequencer::currentLine() const
{
    QMutexLocker lock(&m_dataMutex);
    return m_currentLine;
}

QFuture<void> TtsSequencer::start()
{
    if (!m_backend->isInitialized()) {
        qWarning() << "TtsSequencer: Speech backend not initialized";
        return QFuture<void>();
    }
    if (!startPosition()) {
        qWarning() << "TtsSequencer: No start position";
        return QFuture<void>();
    }

    TtsStatus expected = TtsStatus::Stopped;
    if (!m_status.compare_exchange_strong(expected, TtsStatus::Running)) {
        return m_loop;
    }
    emit statusChanged(TtsStatus::Running);

    m_pendingSkip.store(0);
    const int generation = m_generation.fetch_add(1) + 1;
    m_loop = QtConcurrent::run(&m_pool, [this, generation]() {
        runLoop(generation);
    });
    return m_loop;
}

void TtsSequencer::waitForFinished()
{
    m_pool.waitForDone();
}

bool TtsSequencer::isStopped(int generation) const
{
    return m_generation.load() != generation || m_status.load() == TtsStatus::Stopped;
}

void TtsSequencer::setStatus(TtsStatus status)
{
    if (m_status.exchange(status) != status) {
        emit statusChanged(status);
    }
}

// ============================================================================
// Commands
// ============================================================================

bool TtsSequencer::pause()
{
    if (m_status.load() != TtsStatus::Running || !m_backend->isInitialized()) {
        return false;
    }
    TtsStatus expected = TtsStatus::Running;
    if (!m_status.compare_exchange_strong(expected, TtsStatus::Paused)) {
        return false;
    }
    emit statusChanged(TtsStatus::Paused);
    return true;
}

bool TtsSequencer::resume()
{
    if (m_status.load() != TtsStatus::Paused || !m_backend->isInitialized()) {
        return false;
    }
    TtsStatus expected = TtsStatus::Paused;
    if (!m_status.compare_exchange_strong(expected, TtsStatus::Running)) {
        return false;
    }
    emit statusChanged(TtsStatus::Running);
    return true;
}

bool TtsSequencer::stop()
{
    if (m_status.load() == TtsStatus::Stopped || !m_backend->isInitialized()) {
        return false;
    }
    setStatus(TtsStatus::Stopped);
    return true;
}

bool TtsSequencer::next()
{
    if (m_status.load() != TtsStatus::Running || !m_backend->isInitialized()) {
        return false;
    }
    m_pendingSkip.fetch_add(1);
    return true;
}

bool TtsSequencer::previous()
{
    if (m_status.load() != TtsStatus::Running || !m_backend->isInitialized()) {
        return false;
    }
    m_pendingSkip.fetch_sub(1);
    return true;
}

bool TtsSequencer::togglePause()
{
    switch (m_status.load()) {
        case TtsStatus::Running: return pause();
        case TtsStatus::Paused:  return resume();
        case TtsStatus::Stopped: return false;
    }
    return false;
}

void TtsSequencer::setLanguage(const QLocale& locale)
{
    m_backend->setLanguage(locale);
}

void TtsSequencer::setVoice(const QString& voice)
{
    m_backend->setVoice(voice);
}

// ============================================================================
// Playback loop
// ============================================================================

void TtsSequencer::publishLine(const std::optional<SpeechLine>& line)
{
    {
        QMutexLocker lock(&m_dataMutex);
        m_currentLine = line;
    }
    if (line) {
        emit currentLineChanged(*line);
    } else {
        emit currentLineCleared();
    }
}

void TtsSequencer::notifyPlayer(int chapterIndex, TtsStatus status)
{
    if (!m_notifier) {
        return;
    }

    QByteArray cover;
    {
        QMutexLocker lock(&m_dataMutex);
        if (!m_coverLoaded) {
            m_coverLoaded = true;
            lock.unlock();
            QByteArray bytes = m_book->coverImageBytes();
            lock.relock();
            m_cover = bytes;
        }
        cover = m_cover;
    }

    const QString chapterTitle = (chapterIndex >= 0) ? m_cache->chapterTitles().value(chapterIndex) : QString();
    m_notifier->notify(m_book->title(), chapterTitle, cover, status);
}

void TtsSequencer::waitForSpeech(QFuture<void>& speech, int generation)
{
    while (!speech.isFinished()) {
        if (m_status.load() != TtsStatus::Running || m_pendingSkip.load() != 0
            || m_generation.load() != generation) {
            m_backend->stopSpeaking();
            break;
        }
        QThread::msleep(10);
    }
    speech.waitForFinished();
}

void TtsSequencer::runLoop(int generation)
{
    std::unique_lock<QMutex> playback(m_playbackMutex, std::try_to_lock);
    if (!playback.owns_lock()) {
        qDebug() << "TtsSequencer: Playback loop already active";
        return;
    }

    const std::optional<ScrollIndex> start = startPosition();
    if (!start) {
        return;
    }

    m_backend->registerPlayback();

    const QString bookTitle = m_book->title();
    int index = start->index;
    int innerIndex = 0;

    std::optional<ChapterState> first = m_cache->state(index);
    if (first && first->isSuccess()) {
        const QVector<SpeechLine>& lines = first->payload->speechLines;
        for (int i = 0; i < lines.size(); ++i) {
            if (lines[i].startChar >= start->charOffset) {
                innerIndex = i;
                break;
            }
        }
    } else {
        // Nothing to resume from here, continue with the next chapter
        ++index;
    }

    while (!isStopped(generation)) {
        // Pending first: a queued load stores its state before leaving the set
        const bool pending = m_cache->isPending(index);
        std::optional<ChapterState> state = m_cache->state(index);
        if (!state && pending) {
            QThread::msleep(POLL_INTERVAL_MS);
            continue;
        }
        if (!state) {
            qWarning() << "TtsSequencer: Chapter" << index << "was never requested";
            emit playbackError(NULL_DATA_ERROR);
            break;
        }
        if (state->isFailure()) {
            qWarning() << "TtsSequencer: Chapter" << index << "failed:" << state->message;
            emit playbackError(state->message);
            break;
        }
        if (state->isLoading()) {
            QThread::msleep(POLL_INTERVAL_MS);
            continue;
        }

        const QVector<SpeechLine> lines = state->payload->speechLines;
        const int lineCount = static_cast<int>(lines.size());

        notifyPlayer(index, m_status.load());

        // Stepping back across a chapter boundary leaves a negative index
        if (innerIndex < 0) {
            innerIndex += lineCount;
        }
        innerIndex = qBound(0, innerIndex, qMax(0, lineCount - 1));

        m_cache->requestWindow(index);

        while (innerIndex >= 0 && innerIndex < lineCount) {
            if (isStopped(generation)) {
                break;
            }

            const SpeechLine& line = lines[innerIndex];
            std::optional<SpeechLine> nextLine;
            if (innerIndex + 1 < lineCount) {
                nextLine = lines[innerIndex + 1];
            }

            m_store->savePosition(bookTitle, index, line.startChar);
            publishLine(line);

            // A listener may stop playback on the published line
            if (isStopped(generation)) {
                break;
            }

            QFuture<void> speech = m_backend->speak(line, nextLine);
            waitForSpeech(speech, generation);

            int pausedPolls = 0;
            while (m_status.load() == TtsStatus::Paused && m_generation.load() == generation) {
                ++pausedPolls;
                QThread::msleep(POLL_INTERVAL_MS);
            }

            // After a pause the same line is read again
            if (pausedPolls > 0) {
                notifyPlayer(index, m_status.load());
                m_pendingSkip.store(0);
                continue;
            }

            const int skip = m_pendingSkip.exchange(0);
            innerIndex += (skip != 0) ? skip : 1;
        }

        if (isStopped(generation)) {
            break;
        }

        if (innerIndex >= lineCount) {
            ++index;
            innerIndex = 0;
        } else if (index > 0) {
            // innerIndex stays negative and wraps once the lines are known
            --index;
        } else {
            innerIndex = 0;
        }
    }

    if (m_generation.load() == generation) {
        setStatus(TtsStatus::Stopped);
    }

    notifyPlayer(-1, TtsStatus::Stopped);
    m_backend->unregisterPlayback();
    publishLine(std::nullopt);
}
