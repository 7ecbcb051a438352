// ============================================================================
// StreamBook - Implementation
// ============================================================================

#include "StreamBook.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QTextBlock>
#include <QTextDocument>
#include <QTextFragment>
#include <QUrl>

StreamBook::StreamBook(const QString& name, const QString& apiName,
                       const QVector<StreamChapter>& chapters, const QString& posterUrl,
                       std::unique_ptr<ChapterFetcher> fetcher)
    : m_name(name)
    , m_apiName(apiName)
    , m_posterUrl(posterUrl)
    , m_fetcher(std::move(fetcher))
    , m_chapters(chapters)
{
}

// ============================================================================
// Parsing
// ============================================================================

BookOpenResult StreamBook::fromJson(const QByteArray& json,
                                    std::unique_ptr<ChapterFetcher> fetcher)
{
    BookOpenResult result;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "StreamBook: JSON parse error:" << parseError.errorString();
        result.errorKind = ErrorKind::ParseError;
        result.message = QStringLiteral("Failed to parse stream: %1").arg(parseError.errorString());
        return result;
    }

    QJsonObject root = doc.object();
    QJsonObject meta = root.value(QStringLiteral("meta")).toObject();

    QVector<StreamChapter> chapters;
    const QJsonArray data = root.value(QStringLiteral("data")).toArray();
    chapters.reserve(data.size());
    for (const QJsonValue& value : data) {
        QJsonObject obj = value.toObject();
        StreamChapter chapter;
        chapter.name = obj.value(QStringLiteral("name")).toString();
        chapter.url = obj.value(QStringLiteral("url")).toString();
        if (chapter.url.isEmpty()) {
            qWarning() << "StreamBook: Skipping chapter without url:" << chapter.name;
            continue;
        }
        chapters.append(chapter);
    }

    if (chapters.isEmpty()) {
        result.errorKind = ErrorKind::EmptySource;
        result.message = QStringLiteral("Empty book, failed to parse stream");
        return result;
    }

    result.book = std::make_unique<StreamBook>(
        meta.value(QStringLiteral("name")).toString(),
        meta.value(QStringLiteral("apiName")).toString(),
        chapters,
        root.value(QStringLiteral("poster")).toString(),
        std::move(fetcher));
    return result;
}

// ============================================================================
// Metadata
// ============================================================================

int StreamBook::size() const
{
    QMutexLocker lock(&m_chaptersMutex);
    return static_cast<int>(m_chapters.size());
}

QString StreamBook::title() const
{
    return m_name;
}

StreamChapter StreamBook::chapterAt(int index) const
{
    QMutexLocker lock(&m_chaptersMutex);
    if (index < 0 || index >= m_chapters.size()) {
        return StreamChapter();
    }
    return m_chapters[index];
}

QString StreamBook::chapterTitle(int index) const
{
    return chapterAt(index).name;
}

QString StreamBook::loadingHint(int index) const
{
    return chapterAt(index).url;
}

// ============================================================================
// Content
// ============================================================================

ChapterFetchResult StreamBook::fetchChapterText(int index, bool forceReload)
{
    StreamChapter chapter = chapterAt(index);
    if (chapter.url.isEmpty()) {
        return ChapterFetchResult::failure(ErrorKind::NotFound,
            QStringLiteral("Chapter %1 does not exist").arg(index + 1));
    }
    if (!m_fetcher) {
        return ChapterFetchResult::failure(ErrorKind::NetworkError,
            QStringLiteral("Invalid context"));
    }
    return m_fetcher->fetch(m_name, index, chapter.url, forceReload);
}

static bool isNextText(QString text)
{
    static const QRegularExpression decoration(QStringLiteral("[\\[\\]().,|{}<>]"));
    text.remove(decoration);
    text = text.trimmed();

    return text.compare(QLatin1String("next"), Qt::CaseInsensitive) == 0
        || text.compare(QLatin1String("next chapter"), Qt::CaseInsensitive) == 0
        || text.compare(QLatin1String("next part"), Qt::CaseInsensitive) == 0;
}

QString StreamBook::findNextLink(const QString& html)
{
    QTextDocument document;
    document.setHtml(html);

    // Nested markup inside a link starts a new text run, so each run is
    // checked on its own, like the element's own text
    for (QTextBlock block = document.begin(); block.isValid(); block = block.next()) {
        for (QTextBlock::iterator it = block.begin(); !it.atEnd(); ++it) {
            const QTextFragment fragment = it.fragment();
            if (!fragment.isValid()) {
                continue;
            }
            const QTextCharFormat format = fragment.charFormat();
            if (!format.isAnchor() || format.anchorHref().isEmpty()) {
                continue;
            }
            if (isNextText(fragment.text())) {
                return format.anchorHref();
            }
        }
    }
    return QString();
}

QString StreamBook::nameFromUrl(const QString& url)
{
    QString path = QUrl(url).path();
    const QStringList segments = path.split('/', Qt::SkipEmptyParts);
    if (segments.isEmpty()) {
        return QStringLiteral("Next");
    }

    QString name = segments.last();
    int dot = name.lastIndexOf('.');
    if (dot > 0) {
        name.truncate(dot);
    }
    name.replace('_', ' ');
    name.replace('-', ' ');
    name = name.simplified();

    return name.isEmpty() ? QStringLiteral("Next") : name;
}

bool StreamBook::tryExpand(const QString& lastChapterText)
{
    const QString href = findNextLink(lastChapterText);
    if (href.isEmpty()) {
        return false;
    }

    StreamChapter chapter;
    chapter.name = nameFromUrl(href);
    chapter.url = href;

    QMutexLocker lock(&m_chaptersMutex);
    m_chapters.append(chapter);
    qDebug() << "StreamBook: Expanded" << m_name << "to" << m_chapters.size() << "chapters";
    return true;
}

QByteArray StreamBook::coverImageBytes()
{
    if (m_posterUrl.isEmpty() || !m_fetcher) {
        return QByteArray();
    }
    return m_fetcher->fetchBytes(m_posterUrl);
}
