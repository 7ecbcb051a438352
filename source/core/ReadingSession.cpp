// ============================================================================
// ReadingSession - Implementation
// ============================================================================

#include "ReadingSession.h"
#include "ChapterCache.h"
#include "../book/Book.h"
#include "../store/PositionStore.h"
#include "../store/ReaderPreferences.h"
#include "../tts/SpeechBackend.h"

#include <QDebug>

// ============================================================================
// Constructor / Destructor
// ============================================================================

ReadingSession::ReadingSession(PositionStore* store, SpeechBackend* backend,
                               PlaybackNotifier* notifier, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_backend(backend)
    , m_notifier(notifier)
    , m_preferences(std::make_unique<ReaderPreferences>(store))
{
    qRegisterMetaType<ChapterWindow>();
    qRegisterMetaType<SpeechLine>();
    qRegisterMetaType<TtsStatus>();
}

ReadingSession::~ReadingSession()
{
    dispose();
}

// ============================================================================
// Lifecycle
// ============================================================================

void ReadingSession::setLoadStatus(LoadStatus status, const QString& message)
{
    m_loadStatus = status;
    if (status == LoadStatus::Failure) {
        m_errorMessage = message;
    }
    emit loadStatusChanged(status, message);
}

bool ReadingSession::init(const QString& path, const QString& mimeType)
{
    setLoadStatus(LoadStatus::Loading);

    BookOpenResult opened = Book::open(path, mimeType);
    if (!opened.isValid()) {
        qWarning() << "ReadingSession: Cannot open" << path << "-" << opened.message;
        setLoadStatus(LoadStatus::Failure, opened.message);
        return false;
    }
    return init(std::move(opened.book));
}

bool ReadingSession::init(std::unique_ptr<Book> book)
{
    if (m_released) {
        qWarning() << "ReadingSession: init() after dispose()";
        setLoadStatus(LoadStatus::Failure, tr("Session was disposed"));
        return false;
    }
    if (!book) {
        setLoadStatus(LoadStatus::Failure, tr("No book specified"));
        return false;
    }
    if (book->size() <= 0) {
        setLoadStatus(LoadStatus::Failure, tr("Empty book, failed to parse %1").arg(book->title()));
        return false;
    }

    closeBook();
    if (m_loadStatus != LoadStatus::Loading) {
        setLoadStatus(LoadStatus::Loading);
    }

    m_book = std::move(book);
    m_cache = std::make_unique<ChapterCache>(m_book.get(), &m_pipeline);
    m_tts = std::make_unique<TtsSequencer>(m_book.get(), m_cache.get(), m_backend,
                                           m_store, m_notifier);

    connect(m_cache.get(), &ChapterCache::windowChanged, this, &ReadingSession::windowChanged);
    connect(m_cache.get(), &ChapterCache::chapterTitlesChanged, this, &ReadingSession::chapterTitlesChanged);
    connect(m_tts.get(), &TtsSequencer::statusChanged, this, &ReadingSession::ttsStatusChanged);
    connect(m_tts.get(), &TtsSequencer::currentLineChanged, this, &ReadingSession::ttsLineChanged);
    connect(m_tts.get(), &TtsSequencer::currentLineCleared, this, &ReadingSession::ttsLineCleared);
    connect(m_tts.get(), &TtsSequencer::playbackError, this, &ReadingSession::ttsError);

    const QString title = m_book->title();
    emit titleChanged(title);
    emit chapterTitlesChanged(m_cache->chapterTitles());

    // The saved chapter may lie beyond the known size if the book grew
    const int loadedChapter = qMax(m_store->chapterIndex(title, 0), 0);
    if (loadedChapter < m_book->size()) {
        setLoadStatus(LoadStatus::Loading, m_book->loadingHint(loadedChapter));
    }

    m_cache->setCurrentIndex(loadedChapter);
    m_cache->loadWindow(loadedChapter, false);

    const int charOffset = m_store->charOffset(title, 0);
    const int innerIndex = innerCharToIndex(loadedChapter, charOffset).value_or(0);

    changeIndex(ScrollIndex(loadedChapter, innerIndex, charOffset));

    // One publication for the whole initial window
    m_cache->computeVisibleWindow(true);

    qDebug() << "ReadingSession: Opened" << title << "at chapter" << loadedChapter
             << "of" << m_book->size();
    setLoadStatus(LoadStatus::Success);
    return true;
}

void ReadingSession::closeBook()
{
    if (m_tts) {
        m_tts->shutdown();
    }
    if (m_cache) {
        m_cache->waitForIdle();
    }

    m_tts.reset();
    m_cache.reset();
    m_book.reset();
    m_desiredIndex.reset();
    m_desiredTtsIndex.reset();
}

void ReadingSession::dispose()
{
    closeBook();

    if (!m_released) {
        m_released = true;
        if (m_backend) {
            m_backend->release();
        }
    }
}

// ============================================================================
// Navigation
// ============================================================================

void ReadingSession::changeIndex(const ScrollIndex& index)
{
    const QStringList titles = m_cache->chapterTitles();
    if (index.index >= 0 && index.index < titles.size()) {
        emit chapterTitleChanged(titles[index.index]);
    }

    m_desiredIndex = index;
    m_cache->setCurrentIndex(index.index);
    m_store->savePosition(m_book->title(), index.index, index.charOffset);
}

bool ReadingSession::seekToChapter(int index)
{
    if (!m_book || index < 0 || index >= m_book->size()) {
        return false;
    }

    // The loop must not save its own position after ours
    m_tts->shutdown();

    setLoadStatus(LoadStatus::Loading);

    m_cache->loadWindow(index, false);

    m_store->savePosition(m_book->title(), index, 0);

    m_desiredIndex = ScrollIndex(index, 0, 0);
    m_cache->setCurrentIndex(index);
    m_desiredTtsIndex = ScrollIndex(index, 0, 0);

    m_cache->computeVisibleWindow(true);

    emit chapterTitleChanged(m_cache->chapterTitles().value(index));
    setLoadStatus(LoadStatus::Success);
    return true;
}

void ReadingSession::scrollToDesired(const ScrollIndex& index)
{
    if (!m_book) {
        return;
    }
    changeIndex(index);
    m_cache->computeVisibleWindow(true);
}

void ReadingSession::onScroll(const ScrollVisibility& visibility)
{
    if (!m_book) {
        return;
    }

    m_cache->onVisibleRange(visibility.firstInMemory.index, visibility.lastInMemory.index);

    const int current = m_cache->currentIndex();

    const ScrollIndex save = visibility.firstFullyVisible.value_or(visibility.firstInMemory);
    m_desiredTtsIndex = visibility.firstFullyVisibleUnderLine;
    changeIndex(save);

    if (current != save.index) {
        m_cache->computeVisibleWindow(false);
    }

    m_cache->requestWindow(visibility.firstInMemory.index);
    m_cache->requestWindow(visibility.lastInMemory.index);
}

void ReadingSession::reloadChapter(int index)
{
    if (m_cache) {
        m_cache->reloadChapter(index);
    }
}

void ReadingSession::reloadChapter()
{
    if (m_cache) {
        m_cache->reloadChapter(m_cache->currentIndex());
    }
}

std::optional<int> ReadingSession::innerCharToIndex(int index, int charOffset) const
{
    if (!m_cache) {
        return std::nullopt;
    }
    return m_cache->innerIndexForChar(index, charOffset);
}

// ============================================================================
// Playback
// ============================================================================

QFuture<void> ReadingSession::startTts()
{
    if (!m_tts) {
        return QFuture<void>();
    }

    if (m_tts->status() == TtsStatus::Stopped) {
        m_tts->setStartPosition(m_desiredTtsIndex ? m_desiredTtsIndex : m_desiredIndex);
    }
    return m_tts->start();
}
