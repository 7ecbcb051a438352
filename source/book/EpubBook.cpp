// ============================================================================
// EpubBook - MuPDF implementation of Book
// ============================================================================

#include "EpubBook.h"

#include <mupdf/fitz.h>

#include <QBuffer>
#include <QDebug>
#include <QFileInfo>
#include <QImage>
#include <QMutexLocker>

#include <cstring>

// Layout box for reflowable documents, in points
static const float LAYOUT_WIDTH = 450.0f;
static const float LAYOUT_HEIGHT = 600.0f;
static const float LAYOUT_EM = 12.0f;

// ============================================================================
// Construction / Destruction
// ============================================================================

EpubBook::EpubBook(const QString& epubPath)
    : m_path(epubPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "EpubBook: Failed to create MuPDF context";
        return;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "EpubBook: Failed to register document handlers";
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return;
    }

    QByteArray pathUtf8 = epubPath.toUtf8();
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
        fz_layout_document(m_ctx, m_doc, LAYOUT_WIDTH, LAYOUT_HEIGHT, LAYOUT_EM);
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "EpubBook: Failed to open" << epubPath
                   << "-" << fz_caught_message(m_ctx);
        m_pageCount = 0;
        return;
    }

    fz_outline* ol = nullptr;
    fz_try(m_ctx) {
        ol = fz_load_outline(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "EpubBook: No usable table of contents in" << epubPath;
        ol = nullptr;
    }

    m_chapters = buildChapters(outlineStarts(ol), m_pageCount);
    if (ol) {
        fz_drop_outline(m_ctx, ol);
    }

    m_title = metadata(FZ_META_INFO_TITLE);
    if (m_title.isEmpty()) {
        m_title = QFileInfo(epubPath).completeBaseName();
    }

    qDebug() << "EpubBook: Loaded" << epubPath << "with" << m_chapters.size()
             << "chapters over" << m_pageCount << "pages";
}

EpubBook::~EpubBook()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

bool EpubBook::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0;
}

// ============================================================================
// Outline
// ============================================================================

QVector<QPair<QString, int>> EpubBook::outlineStarts(fz_outline* ol) const
{
    QVector<QPair<QString, int>> starts;

    // Top level only: nested entries are sections inside a chapter
    while (ol) {
        int page = -1;
        fz_try(m_ctx) {
            page = fz_page_number_from_location(m_ctx, m_doc, ol->page);
        }
        fz_catch(m_ctx) {
            page = -1;
        }
        if (page >= 0) {
            starts.append({QString::fromUtf8(ol->title ? ol->title : ""), page});
        }
        ol = ol->next;
    }
    return starts;
}

QVector<EpubChapter> EpubBook::buildChapters(const QVector<QPair<QString, int>>& starts,
                                             int pageCount)
{
    QVector<EpubChapter> chapters;
    if (pageCount <= 0) {
        return chapters;
    }

    for (const auto& start : starts) {
        if (start.second >= pageCount) {
            continue;
        }
        if (!chapters.isEmpty() && start.second <= chapters.last().firstPage) {
            continue;
        }
        EpubChapter chapter;
        chapter.title = start.first.trimmed();
        chapter.firstPage = start.second;
        chapters.append(chapter);
    }

    if (chapters.isEmpty()) {
        for (int page = 0; page < pageCount; ++page) {
            EpubChapter chapter;
            chapter.firstPage = page;
            chapters.append(chapter);
        }
    } else if (chapters.first().firstPage > 0) {
        // Front matter before the first entry (cover, title page)
        chapters.first().firstPage = 0;
    }

    for (int i = 0; i < chapters.size(); ++i) {
        chapters[i].endPage = (i + 1 < chapters.size()) ? chapters[i + 1].firstPage : pageCount;
        if (chapters[i].title.isEmpty()) {
            chapters[i].title = QStringLiteral("Chapter %1").arg(i + 1);
        }
    }
    return chapters;
}

// ============================================================================
// Metadata
// ============================================================================

QString EpubBook::metadata(const char* key) const
{
    if (!isValid()) return QString();

    char buf[256] = {0};
    fz_try(m_ctx) {
        fz_lookup_metadata(m_ctx, m_doc, key, buf, sizeof(buf));
    }
    fz_catch(m_ctx) {
        return QString();
    }

    return QString::fromUtf8(buf);
}

int EpubBook::size() const
{
    return static_cast<int>(m_chapters.size());
}

QString EpubBook::title() const
{
    return m_title;
}

QString EpubBook::chapterTitle(int index) const
{
    if (index < 0 || index >= m_chapters.size()) {
        return QStringLiteral("Chapter %1").arg(index + 1);
    }
    return m_chapters[index].title;
}

QString EpubBook::loadingHint(int /*index*/) const
{
    return QString();
}

// ============================================================================
// Content
// ============================================================================

QString EpubBook::pageText(int pageIndex) const
{
    QString text;
    fz_page* page = nullptr;
    fz_stext_page* textPage = nullptr;

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        fz_stext_options opts = {0};
        textPage = fz_new_stext_page_from_page(m_ctx, page, &opts);

        // One paragraph per text block; wrapped lines are joined back
        for (fz_stext_block* block = textPage->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) continue;

            QString paragraph;
            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                if (!paragraph.isEmpty()) {
                    if (paragraph.endsWith('-')) {
                        paragraph.chop(1);
                    } else if (!paragraph.endsWith(' ')) {
                        paragraph += ' ';
                    }
                }
                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    char32_t codepoint = static_cast<char32_t>(ch->c);
                    paragraph += QString::fromUcs4(&codepoint, 1);
                }
            }

            if (!paragraph.trimmed().isEmpty()) {
                text += paragraph;
                text += QStringLiteral("\n\n");
            }
        }
    }
    fz_always(m_ctx) {
        if (textPage) fz_drop_stext_page(m_ctx, textPage);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "EpubBook: Text extraction failed for page" << pageIndex;
        return QString();
    }

    return text;
}

ChapterFetchResult EpubBook::fetchChapterText(int index, bool /*forceReload*/)
{
    if (!isValid()) {
        return ChapterFetchResult::failure(ErrorKind::NotFound,
            QStringLiteral("Book is not open"));
    }
    if (index < 0 || index >= m_chapters.size()) {
        return ChapterFetchResult::failure(ErrorKind::NotFound,
            QStringLiteral("Chapter %1 does not exist").arg(index + 1));
    }

    QMutexLocker lock(&m_docMutex);

    const EpubChapter& chapter = m_chapters[index];
    QString text;
    for (int page = chapter.firstPage; page < chapter.endPage; ++page) {
        text += pageText(page);
    }

    if (text.trimmed().isEmpty() && chapter.endPage > chapter.firstPage + 1) {
        return ChapterFetchResult::failure(ErrorKind::ParseError,
            QStringLiteral("No text in %1").arg(chapter.title));
    }
    return ChapterFetchResult::success(text);
}

bool EpubBook::tryExpand(const QString& /*lastChapterText*/)
{
    return false;
}

QByteArray EpubBook::coverImageBytes()
{
    if (!isValid()) {
        return QByteArray();
    }

    QMutexLocker lock(&m_docMutex);

    // The cover is the first laid-out page
    fz_page* page = nullptr;
    fz_pixmap* pix = nullptr;
    QImage image;

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, 0);

        fz_matrix ctm = fz_scale(1.0f, 1.0f);
        fz_rect bounds = fz_bound_page(m_ctx, page);
        fz_irect bbox = fz_round_rect(fz_transform_rect(bounds, ctm));

        pix = fz_new_pixmap_with_bbox(m_ctx, fz_device_bgr(m_ctx), bbox, nullptr, 1);
        fz_clear_pixmap_with_value(m_ctx, pix, 255);

        fz_device* dev = fz_new_draw_device(m_ctx, ctm, pix);
        fz_run_page(m_ctx, page, dev, fz_identity, nullptr);
        fz_close_device(m_ctx, dev);
        fz_drop_device(m_ctx, dev);

        int width = fz_pixmap_width(m_ctx, pix);
        int height = fz_pixmap_height(m_ctx, pix);
        int stride = fz_pixmap_stride(m_ctx, pix);
        unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        image = QImage(width, height, QImage::Format_ARGB32);
        for (int y = 0; y < height; ++y) {
            memcpy(image.scanLine(y), samples + y * stride, width * 4);
        }
    }
    fz_always(m_ctx) {
        if (pix) fz_drop_pixmap(m_ctx, pix);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "EpubBook: Cover render failed for" << m_path;
        return QByteArray();
    }

    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        qWarning() << "EpubBook: Failed to encode cover for" << m_path;
        return QByteArray();
    }
    return png;
}
