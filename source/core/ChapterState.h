#pragma once

// ============================================================================
// ChapterState - Per-chapter load state and reading window types
// ============================================================================
// The ChapterCache keeps one ChapterState per requested chapter index:
//
//   absent  -> Loading(hint) -> Success(payload)
//                            -> Failure(retryable, message)
//
// Payloads are immutable once produced and shared between the cache, the
// TTS sequencer and whatever displays the window.
// ============================================================================

#include "../text/TextPipeline.h"

#include <QMetaType>
#include <QString>
#include <QVector>
#include <memory>
#include <optional>

/**
 * @brief Fully loaded and rendered chapter.
 */
struct ChapterPayload {
    QVector<DisplaySpan> spans;         ///< Rendered paragraphs for display
    QString rawText;                    ///< Normalized chapter text
    QString title;                      ///< Chapter title at load time
    QVector<SpeechLine> speechLines;    ///< TTS lines, offsets into rawText
};

/**
 * @brief Load state of one chapter slot.
 */
struct ChapterState {
    enum class Status {
        Loading,
        Success,
        Failure
    };

    Status status = Status::Loading;
    QString loadingHint;                            ///< Loading: source shown to the user
    std::shared_ptr<const ChapterPayload> payload;  ///< Success only
    bool retryable = false;                         ///< Failure only
    QString message;                                ///< Failure only

    bool isLoading() const { return status == Status::Loading; }
    bool isSuccess() const { return status == Status::Success; }
    bool isFailure() const { return status == Status::Failure; }

    static ChapterState loading(const QString& hint = QString()) {
        ChapterState s;
        s.status = Status::Loading;
        s.loadingHint = hint;
        return s;
    }

    static ChapterState success(std::shared_ptr<const ChapterPayload> payload) {
        ChapterState s;
        s.status = Status::Success;
        s.payload = std::move(payload);
        return s;
    }

    static ChapterState failure(bool retryable, const QString& message) {
        ChapterState s;
        s.status = Status::Failure;
        s.retryable = retryable;
        s.message = message;
        return s;
    }
};

// ============================================================================
// Reading window
// ============================================================================

/**
 * @brief One entry of the ordered display list.
 */
struct WindowItem {
    enum class Kind {
        ChapterStart,   ///< Title marker before a chapter
        Loading,        ///< Placeholder while the chapter loads
        Text,           ///< A rendered paragraph
        Failed          ///< Failure marker, optionally reloadable
    };

    Kind kind = Kind::Text;
    int chapterIndex = -1;
    QString text;           ///< Title, loading hint, paragraph text or failure reason
    DisplaySpan span;       ///< Text only
    bool canReload = false; ///< Failed only
};

/**
 * @brief A published window of chapters around the reading position.
 */
struct ChapterWindow {
    QVector<WindowItem> items;
    bool seekToDesired = false;     ///< Viewer should jump to the desired position
};

Q_DECLARE_METATYPE(ChapterWindow)

// ============================================================================
// Reading position
// ============================================================================

/**
 * @brief A position inside the book as reported by the viewer.
 */
struct ScrollIndex {
    int index = 0;          ///< Chapter index
    int innerIndex = 0;     ///< Paragraph within the chapter
    int charOffset = 0;     ///< Char offset into the chapter's raw text

    ScrollIndex() = default;
    ScrollIndex(int i, int inner, int ch) : index(i), innerIndex(inner), charOffset(ch) {}
};

/**
 * @brief What the viewer currently has resident and visible.
 */
struct ScrollVisibility {
    ScrollIndex firstInMemory;
    ScrollIndex lastInMemory;
    std::optional<ScrollIndex> firstFullyVisible;
    std::optional<ScrollIndex> firstFullyVisibleUnderLine;
};
