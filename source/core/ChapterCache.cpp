// ============================================================================
// ChapterCache - Implementation
// ============================================================================

#include "ChapterCache.h"
#include "../book/Book.h"
#include "../text/TextPipeline.h"

#include <QDebug>
#include <QMutexLocker>

const QString ChapterCache::NO_MORE_CHAPTERS = QStringLiteral("No more chapters");

// ============================================================================
// Constructor / Destructor
// ============================================================================

ChapterCache::ChapterCache(Book* book, const TextPipeline* pipeline, QObject* parent)
    : QObject(parent)
    , m_book(book)
    , m_pipeline(pipeline)
{
    m_pool.setObjectName(QStringLiteral("ChapterLoaderPool"));
    refreshChapterTitles();
}

ChapterCache::~ChapterCache()
{
    // Loaders emit through this object; let them finish first
    m_pool.waitForDone();
}

// ============================================================================
// Loading
// ============================================================================

void ChapterCache::requestWindow(int index)
{
    bool alreadyRequested = true;
    {
        QMutexLocker lock(&m_stateMutex);
        for (int idx = index - m_paddingBottom; idx <= index + m_paddingTop; ++idx) {
            if (!m_requested.contains(idx)) {
                alreadyRequested = false;
                m_requested.insert(idx);
                if (idx >= 0) {
                    m_pending.insert(idx);
                }
            }
        }
    }

    if (alreadyRequested) {
        return;
    }

    m_pool.start([this, index]() {
        loadWindow(index, true);
    });
}

void ChapterCache::loadWindow(int index, bool notify)
{
    int first = 0;
    int last = 0;
    {
        QMutexLocker lock(&m_stateMutex);
        first = index - m_paddingBottom;
        last = index + m_paddingTop;
        for (int idx = first; idx <= last; ++idx) {
            m_requested.insert(idx);
        }
    }

    for (int idx = first; idx <= last; ++idx) {
        loadChapter(idx, false, notify);

        QMutexLocker lock(&m_stateMutex);
        m_pending.remove(idx);
    }
}

void ChapterCache::loadChapter(int index, bool reload, bool notify)
{
    if (index < 0 || !m_book) {
        return;
    }

    // Claim the slot, or return early if someone else has it
    {
        QMutexLocker lock(&m_stateMutex);
        if (m_loading.contains(index)) {
            return;
        }
        if (!reload && m_states.contains(index)) {
            return;
        }
        m_loading.insert(index);
        m_states.insert(index, ChapterState::loading());
    }
    notifyChapterUpdate(index, notify);

    expandTo(index);

    // Still out of range: exactly one "no more chapters" marker at the end
    const int size = m_book->size();
    if (index >= size) {
        {
            QMutexLocker lock(&m_stateMutex);
            if (index == size) {
                m_states.insert(index, ChapterState::failure(false, NO_MORE_CHAPTERS));
            } else {
                m_states.remove(index);
            }
            m_loading.remove(index);
        }
        notifyChapterUpdate(index, notify);
        return;
    }

    {
        QMutexLocker lock(&m_stateMutex);
        m_states.insert(index, ChapterState::loading(m_book->loadingHint(index)));
    }
    notifyChapterUpdate(index, notify);

    // May block on I/O; no lock held
    ChapterFetchResult fetched = m_book->fetchChapterText(index, reload);

    ChapterState result = fetched.ok
        ? ChapterState::success(buildPayload(index, fetched.text))
        : ChapterState::failure(fetched.isRetryable(), fetched.message);

    if (!fetched.ok) {
        qWarning() << "ChapterCache: Chapter" << index << "failed:" << fetched.message;
    }

    {
        QMutexLocker lock(&m_stateMutex);
        m_states.insert(index, result);
        m_loading.remove(index);
    }
    notifyChapterUpdate(index, notify);
}

void ChapterCache::expandTo(int index)
{
    QMutexLocker expandLock(&m_expandMutex);

    const int preSize = m_book->size();
    while (index >= m_book->size()) {
        const int size = m_book->size();

        // Once per distinct size, so a source that stops growing is not retried
        {
            QMutexLocker lock(&m_stateMutex);
            if (m_hasExpanded.contains(size)) {
                break;
            }
            m_hasExpanded.insert(size);
        }

        if (size <= 0) {
            break;
        }

        // The last chapter is normally cached by now
        ChapterFetchResult last = m_book->fetchChapterText(size - 1, false);
        if (!last.ok) {
            qWarning() << "ChapterCache: Cannot expand past chapter" << size - 1
                       << "-" << last.message;
            continue;
        }
        if (!m_book->tryExpand(last.text)) {
            qDebug() << "ChapterCache: No continuation found after chapter" << size - 1;
        }
    }

    if (preSize != m_book->size()) {
        refreshChapterTitles();
    }
}

void ChapterCache::reloadChapter(int index)
{
    m_pool.start([this, index]() {
        loadChapter(index, true, false);
        computeVisibleWindow(false);
    });
}

void ChapterCache::waitForIdle()
{
    m_pool.waitForDone();
}

std::shared_ptr<const ChapterPayload> ChapterCache::buildPayload(int index, const QString& text)
{
    auto payload = std::make_shared<ChapterPayload>();
    payload->rawText = m_pipeline->normalize(text);
    payload->title = m_book->chapterTitle(index);

    RenderedText rendered;
    {
        QMutexLocker lock(&m_renderMutex);
        rendered = m_pipeline->render(payload->rawText);
    }

    payload->spans = m_pipeline->toDisplaySpans(rendered, index);
    payload->speechLines = m_pipeline->toSpeechLines(rendered, index);
    return payload;
}

// ============================================================================
// Window
// ============================================================================

void ChapterCache::notifyChapterUpdate(int index, bool notify)
{
    emit chapterStateChanged(index);

    if (!notify) {
        return;
    }

    ChapterWindow window;
    {
        QMutexLocker lock(&m_stateMutex);
        if (!isInWindowLocked(index)) {
            return;
        }
        window = buildWindowLocked(false);
    }
    emit windowChanged(window);
}

bool ChapterCache::isInWindowLocked(int index) const
{
    if (m_currentIndex == NO_INDEX) {
        return false;
    }
    return m_currentIndex - m_paddingBottom <= index && index <= m_currentIndex + m_paddingTop;
}

ChapterWindow ChapterCache::buildWindowLocked(bool seekToDesired) const
{
    ChapterWindow window;
    window.seekToDesired = seekToDesired;

    if (m_currentIndex == NO_INDEX) {
        return window;
    }

    for (int idx = m_currentIndex - m_paddingBottom; idx <= m_currentIndex + m_paddingTop; ++idx) {
        if (idx >= 0 && idx < m_chapterTitles.size()) {
            WindowItem start;
            start.kind = WindowItem::Kind::ChapterStart;
            start.chapterIndex = idx;
            start.text = m_chapterTitles[idx];
            window.items.append(start);
        }

        auto it = m_states.constFind(idx);
        if (it == m_states.constEnd()) {
            continue;
        }

        const ChapterState& state = it.value();
        switch (state.status) {
            case ChapterState::Status::Loading: {
                WindowItem item;
                item.kind = WindowItem::Kind::Loading;
                item.chapterIndex = idx;
                item.text = state.loadingHint;
                window.items.append(item);
                break;
            }
            case ChapterState::Status::Success:
                for (const DisplaySpan& span : state.payload->spans) {
                    WindowItem item;
                    item.kind = WindowItem::Kind::Text;
                    item.chapterIndex = idx;
                    item.text = span.text;
                    item.span = span;
                    window.items.append(item);
                }
                break;
            case ChapterState::Status::Failure: {
                WindowItem item;
                item.kind = WindowItem::Kind::Failed;
                item.chapterIndex = idx;
                item.text = state.message;
                item.canReload = state.retryable;
                window.items.append(item);
                break;
            }
        }
    }
    return window;
}

ChapterWindow ChapterCache::computeVisibleWindow(bool seekToDesired)
{
    ChapterWindow window;
    {
        QMutexLocker lock(&m_stateMutex);
        window = buildWindowLocked(seekToDesired);
    }
    emit windowChanged(window);
    return window;
}

void ChapterCache::onVisibleRange(int firstIndex, int lastIndex)
{
    QMutexLocker lock(&m_stateMutex);
    m_paddingTop = qMin(MAX_PADDING, qMax(m_paddingTop, (lastIndex - firstIndex) + 1));
}

void ChapterCache::setCurrentIndex(int index)
{
    QMutexLocker lock(&m_stateMutex);
    m_currentIndex = index;
}

int ChapterCache::currentIndex() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_currentIndex;
}

int ChapterCache::paddingBottom() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_paddingBottom;
}

int ChapterCache::paddingTop() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_paddingTop;
}

bool ChapterCache::isInWindow(int index) const
{
    QMutexLocker lock(&m_stateMutex);
    return isInWindowLocked(index);
}

// ============================================================================
// State
// ============================================================================

std::optional<ChapterState> ChapterCache::state(int index) const
{
    QMutexLocker lock(&m_stateMutex);
    auto it = m_states.constFind(index);
    if (it == m_states.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool ChapterCache::isLoading(int index) const
{
    QMutexLocker lock(&m_stateMutex);
    return m_loading.contains(index);
}

bool ChapterCache::wasRequested(int index) const
{
    QMutexLocker lock(&m_stateMutex);
    return m_requested.contains(index);
}

bool ChapterCache::isPending(int index) const
{
    QMutexLocker lock(&m_stateMutex);
    return m_pending.contains(index);
}

QSet<int> ChapterCache::expandedSizes() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_hasExpanded;
}

std::optional<int> ChapterCache::innerIndexForChar(int index, int charOffset) const
{
    std::shared_ptr<const ChapterPayload> payload;
    {
        QMutexLocker lock(&m_stateMutex);
        auto it = m_states.constFind(index);
        if (it == m_states.constEnd() || !it.value().isSuccess()) {
            return std::nullopt;
        }
        payload = it.value().payload;
    }

    for (const DisplaySpan& span : payload->spans) {
        if (span.start >= charOffset) {
            return span.innerIndex;
        }
    }
    return std::nullopt;
}

QVector<SpeechLine> ChapterCache::speechLines(int index) const
{
    QMutexLocker lock(&m_stateMutex);
    auto it = m_states.constFind(index);
    if (it == m_states.constEnd() || !it.value().isSuccess()) {
        return {};
    }
    return it.value().payload->speechLines;
}

QStringList ChapterCache::chapterTitles() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_chapterTitles;
}

void ChapterCache::refreshChapterTitles()
{
    if (!m_book) {
        return;
    }

    int known = 0;
    {
        QMutexLocker lock(&m_stateMutex);
        known = static_cast<int>(m_chapterTitles.size());
    }

    QStringList added;
    const int size = m_book->size();
    for (int idx = known; idx < size; ++idx) {
        added.append(m_book->chapterTitle(idx));
    }
    if (added.isEmpty()) {
        return;
    }

    QStringList titles;
    {
        QMutexLocker lock(&m_stateMutex);
        // Only the expansion path and the constructor append, both serialized
        m_chapterTitles.append(added);
        titles = m_chapterTitles;
    }
    emit chapterTitlesChanged(titles);
}
