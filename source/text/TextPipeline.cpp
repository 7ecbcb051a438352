// ============================================================================
// TextPipeline - Implementation
// ============================================================================

#include "TextPipeline.h"

#include <QRegularExpression>
#include <QStringList>
#include <QTextBlock>
#include <QTextDocument>

// ============================================================================
// Helpers
// ============================================================================

static bool isSentenceEnd(QChar c)
{
    switch (c.unicode()) {
        case '.':
        case '!':
        case '?':
        case 0x2026:    // …
        case 0x3002:    // 。
        case 0xFF01:    // ！
        case 0xFF1F:    // ？
            return true;
        default:
            return false;
    }
}

static bool isWideSentenceEnd(QChar c)
{
    return c.unicode() == 0x3002 || c.unicode() == 0xFF01 || c.unicode() == 0xFF1F;
}

static bool isClosingMark(QChar c)
{
    switch (c.unicode()) {
        case '"':
        case '\'':
        case ')':
        case ']':
        case 0x00BB:    // »
        case 0x2019:    // ’
        case 0x201D:    // ”
        case 0x300D:    // 」
        case 0x300F:    // 』
            return true;
        default:
            return false;
    }
}

// ============================================================================
// Pipeline
// ============================================================================

// Collapse runs of spaces, trim every line, keep at most one blank line
static QString cleanWhitespace(QString s)
{
    static const QRegularExpression spaces(QStringLiteral("[ \\t\\f\\v]+"));
    static const QRegularExpression blankLines(QStringLiteral("\\n{3,}"));

    s.replace(QChar::Nbsp, ' ');
    s.replace(spaces, QStringLiteral(" "));

    QStringList lines = s.split('\n');
    for (QString& line : lines) {
        line = line.trimmed();
    }
    s = lines.join('\n');
    s.replace(blankLines, QStringLiteral("\n\n"));

    return s.trimmed();
}

QString TextPipeline::normalize(const QString& html) const
{
    QString s = html;
    s.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    s.replace('\r', '\n');

    if (!Qt::mightBeRichText(s)) {
        return cleanWhitespace(s);
    }

    QTextDocument document;
    document.setHtml(s);

    // One paragraph per non-empty block; <br> arrives as a line separator
    QStringList paragraphs;
    for (QTextBlock block = document.begin(); block.isValid(); block = block.next()) {
        QString text = block.text();
        text.replace(QChar::LineSeparator, '\n');
        text.remove(QChar::ObjectReplacementCharacter);
        text = cleanWhitespace(text);
        if (!text.isEmpty()) {
            paragraphs.append(text);
        }
    }
    return paragraphs.join(QStringLiteral("\n\n"));
}

RenderedText TextPipeline::render(const QString& text) const
{
    RenderedText rendered;
    rendered.text = text;

    const int len = static_cast<int>(text.size());
    int pos = 0;
    while (pos < len) {
        int brk = text.indexOf(QStringLiteral("\n\n"), pos);
        int start = pos;
        int end = (brk < 0) ? len : brk;

        while (start < end && text[start].isSpace()) ++start;
        while (end > start && text[end - 1].isSpace()) --end;
        if (end > start) {
            rendered.paragraphs.append({start, end});
        }

        if (brk < 0) break;
        pos = brk + 2;
    }
    return rendered;
}

QVector<DisplaySpan> TextPipeline::toDisplaySpans(const RenderedText& rendered, int chapterIndex) const
{
    QVector<DisplaySpan> spans;
    spans.reserve(rendered.paragraphs.size());

    for (const auto& range : rendered.paragraphs) {
        DisplaySpan span;
        span.chapterIndex = chapterIndex;
        span.innerIndex = static_cast<int>(spans.size());
        span.start = range.first;
        span.end = range.second;
        span.text = rendered.text.mid(range.first, range.second - range.first);
        spans.append(span);
    }
    return spans;
}

QVector<SpeechLine> TextPipeline::toSpeechLines(const RenderedText& rendered, int chapterIndex) const
{
    QVector<SpeechLine> lines;
    const QString& text = rendered.text;

    auto emitLine = [&](int start, int end) {
        while (start < end && text[start].isSpace()) ++start;
        while (end > start && text[end - 1].isSpace()) --end;
        if (end <= start) return;

        SpeechLine line;
        line.text = text.mid(start, end - start);
        line.startChar = start;
        line.endChar = end;
        line.index = static_cast<int>(lines.size());
        line.chapterIndex = chapterIndex;
        lines.append(line);
    };

    for (const auto& range : rendered.paragraphs) {
        const int paragraphEnd = range.second;
        int segmentStart = range.first;

        for (int i = range.first; i < paragraphEnd; ++i) {
            const QChar c = text[i];

            if (c == '\n') {
                emitLine(segmentStart, i);
                segmentStart = i + 1;
                continue;
            }
            if (!isSentenceEnd(c)) {
                continue;
            }

            int j = i + 1;
            while (j < paragraphEnd && isSentenceEnd(text[j])) ++j;
            while (j < paragraphEnd && isClosingMark(text[j])) ++j;

            // "3.5" or "e.g.x" are not sentence ends; CJK needs no space
            if (j >= paragraphEnd || text[j].isSpace() || isWideSentenceEnd(c)) {
                emitLine(segmentStart, j);
                segmentStart = j;
                i = j - 1;
            }
        }
        emitLine(segmentStart, paragraphEnd);
    }
    return lines;
}
