#pragma once

// ============================================================================
// TestBook - In-memory Book for unit tests
// ============================================================================
// Chapters are plain strings. Individual chapters can be made to fail, and a
// chapter whose text contains a "Next" link lets the book grow by one
// chapter per tryExpand(), like a serial posted in parts.
// ============================================================================

#include "Book.h"

#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include <QThread>
#include <atomic>

class TestBook : public Book {
public:
    explicit TestBook(const QString& title, const QStringList& chapters = QStringList())
        : m_title(title)
        , m_chapters(chapters)
    {
    }

    int size() const override
    {
        QMutexLocker lock(&m_mutex);
        return static_cast<int>(m_chapters.size());
    }

    QString title() const override { return m_title; }

    QString chapterTitle(int index) const override
    {
        return QStringLiteral("Chapter %1").arg(index + 1);
    }

    QString loadingHint(int index) const override
    {
        return QStringLiteral("mem://%1/%2").arg(m_title).arg(index);
    }

    bool canReload() const override { return true; }

    ChapterFetchResult fetchChapterText(int index, bool forceReload) override
    {
        Q_UNUSED(forceReload)
        m_fetchCount.fetch_add(1);

        int delay = m_fetchDelayMs.load();
        if (delay > 0) {
            QThread::msleep(delay);
        }

        QMutexLocker lock(&m_mutex);
        m_fetchesPerIndex[index] += 1;
        if (index < 0 || index >= m_chapters.size()) {
            return ChapterFetchResult::failure(ErrorKind::NotFound,
                QStringLiteral("Chapter %1 does not exist").arg(index + 1));
        }
        if (m_failures.contains(index)) {
            const ErrorKind kind = m_failures.value(index);
            return ChapterFetchResult::failure(kind,
                kind == ErrorKind::NetworkError ? QStringLiteral("Timeout")
                                                : QStringLiteral("Malformed chapter"));
        }
        return ChapterFetchResult::success(m_chapters[index]);
    }

    bool tryExpand(const QString& lastChapterText) override
    {
        m_expandCount.fetch_add(1);
        if (!lastChapterText.contains(QStringLiteral(">Next<"))) {
            return false;
        }

        QMutexLocker lock(&m_mutex);
        if (m_pendingExpansions.isEmpty()) {
            return false;
        }
        m_chapters.append(m_pendingExpansions.takeFirst());
        return true;
    }

    QByteArray coverImageBytes() override
    {
        m_coverCount.fetch_add(1);
        return m_cover;
    }

    // ===== Test controls =====

    void setFailure(int index, ErrorKind kind)
    {
        QMutexLocker lock(&m_mutex);
        m_failures.insert(index, kind);
    }

    void clearFailure(int index)
    {
        QMutexLocker lock(&m_mutex);
        m_failures.remove(index);
    }

    /// Chapters tryExpand() appends, one per call
    void setPendingExpansions(const QStringList& chapters)
    {
        QMutexLocker lock(&m_mutex);
        m_pendingExpansions = chapters;
    }

    void setFetchDelay(int ms) { m_fetchDelayMs.store(ms); }
    void setCover(const QByteArray& cover) { m_cover = cover; }

    int fetchCount() const { return m_fetchCount.load(); }
    int expandCount() const { return m_expandCount.load(); }
    int coverCount() const { return m_coverCount.load(); }

    int fetchCount(int index) const
    {
        QMutexLocker lock(&m_mutex);
        return m_fetchesPerIndex.value(index);
    }

    static QString nextLink() { return QStringLiteral("<a href=\"part-next.html\">Next</a>"); }

private:
    QString m_title;
    QByteArray m_cover;

    mutable QMutex m_mutex;
    QStringList m_chapters;
    QStringList m_pendingExpansions;
    QHash<int, ErrorKind> m_failures;
    QHash<int, int> m_fetchesPerIndex;

    std::atomic<int> m_fetchDelayMs{0};
    std::atomic<int> m_fetchCount{0};
    std::atomic<int> m_expandCount{0};
    std::atomic<int> m_coverCount{0};
};
