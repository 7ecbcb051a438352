#pragma once

// ============================================================================
// TextPipeline - Chapter HTML to display spans and speech lines
// ============================================================================
// Every loaded chapter goes through four steps:
//
//   normalize(html)          -> plain text with paragraph breaks
//   render(text)             -> RenderedText (text + paragraph ranges)
//   toDisplaySpans(...)      -> one DisplaySpan per paragraph
//   toSpeechLines(...)       -> sentence-sized SpeechLines for TTS
//
// Character offsets in spans and lines index into the normalized text, so a
// saved "char offset" maps back to both a paragraph and a speech line.
//
// The methods are virtual so a front end with a richer renderer can replace
// any step. The default implementation is stateless and thread-safe.
// ============================================================================

#include <QPair>
#include <QString>
#include <QVector>

/**
 * @brief A paragraph of rendered chapter text.
 */
struct DisplaySpan {
    int chapterIndex = -1;
    int innerIndex = 0;     ///< Paragraph number within the chapter
    int start = 0;          ///< First char in the chapter's raw text
    int end = 0;            ///< One past the last char
    QString text;
};

/**
 * @brief The atomic unit of speech playback and position tracking.
 */
struct SpeechLine {
    QString text;
    int startChar = 0;      ///< First char in the chapter's raw text
    int endChar = 0;        ///< One past the last char
    int index = 0;          ///< Stable position within the chapter's lines
    int chapterIndex = -1;

    bool operator==(const SpeechLine& other) const {
        return chapterIndex == other.chapterIndex && index == other.index
            && startChar == other.startChar && text == other.text;
    }
    bool operator!=(const SpeechLine& other) const { return !(*this == other); }
};

/**
 * @brief Normalized text split into paragraphs.
 */
struct RenderedText {
    QString text;
    QVector<QPair<int, int>> paragraphs;    ///< [start, end) ranges into text
};

class TextPipeline {
public:
    virtual ~TextPipeline() = default;

    /**
     * @brief Reduce chapter HTML to plain text.
     *
     * The markup is loaded into a QTextDocument; every text block becomes a
     * paragraph and <br> a line break. Plain text input passes through with
     * whitespace cleaned.
     */
    virtual QString normalize(const QString& html) const;

    /**
     * @brief Split normalized text into paragraphs.
     */
    virtual RenderedText render(const QString& text) const;

    virtual QVector<DisplaySpan> toDisplaySpans(const RenderedText& rendered, int chapterIndex) const;

    /**
     * @brief Segment into speech lines at sentence ends and line breaks.
     *
     * Whitespace-only segments are dropped; line indices stay contiguous.
     */
    virtual QVector<SpeechLine> toSpeechLines(const RenderedText& rendered, int chapterIndex) const;
};
