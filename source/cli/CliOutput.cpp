#include "CliOutput.h"

#include <QCoreApplication>
#include <QMutexLocker>

/**
 * @file CliOutput.cpp
 * @brief Implementation of the console reporter.
 *
 * @see CliOutput.h for API documentation
 */

namespace Cli {

ConsoleOutput::ConsoleOutput(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Chapters
// =============================================================================

void ConsoleOutput::reportChapters(const QString& bookTitle, const QStringList& titles,
                                   const QStringList& hints)
{
    QMutexLocker lock(&m_outMutex);

    if (m_mode == OutputMode::Json) {
        // {"type":"book","title":"...","chapters":12}
        // {"type":"chapter","index":0,"title":"...","source":"..."}
        m_out << "{\"type\":\"book\",\"title\":\"" << jsonEscape(bookTitle) << "\""
              << ",\"chapters\":" << titles.size() << "}\n";
        for (int i = 0; i < titles.size(); ++i) {
            m_out << "{\"type\":\"chapter\",\"index\":" << i
                  << ",\"title\":\"" << jsonEscape(titles[i]) << "\"";
            if (i < hints.size() && !hints[i].isEmpty()) {
                m_out << ",\"source\":\"" << jsonEscape(hints[i]) << "\"";
            }
            m_out << "}\n";
        }
        m_out.flush();
        return;
    }

    m_out << bookTitle << "\n";
    const int width = QString::number(titles.size()).size();
    for (int i = 0; i < titles.size(); ++i) {
        m_out << QStringLiteral("  %1. %2").arg(i + 1, width).arg(titles[i]);
        if (m_mode == OutputMode::Verbose && i < hints.size() && !hints[i].isEmpty()) {
            m_out << "  <" << hints[i] << ">";
        }
        m_out << "\n";
    }
    m_out << QCoreApplication::translate("CLI", "%n chapter(s)", nullptr, static_cast<int>(titles.size()))
          << "\n";
    m_out.flush();
}

void ConsoleOutput::reportChapter(int index, const QString& title, const ChapterState& state)
{
    QMutexLocker lock(&m_outMutex);

    if (m_mode == OutputMode::Json) {
        m_out << "{\"type\":\"chapter\",\"index\":" << index
              << ",\"title\":\"" << jsonEscape(title) << "\"";
        if (state.isSuccess()) {
            m_out << ",\"status\":\"success\",\"paragraphs\":[";
            for (int i = 0; i < state.payload->spans.size(); ++i) {
                if (i > 0) m_out << ",";
                m_out << "\"" << jsonEscape(state.payload->spans[i].text) << "\"";
            }
            m_out << "]";
        } else if (state.isFailure()) {
            m_out << ",\"status\":\"error\",\"message\":\"" << jsonEscape(state.message) << "\""
                  << ",\"retryable\":" << (state.retryable ? "true" : "false");
        } else {
            m_out << ",\"status\":\"loading\"";
        }
        m_out << "}\n";
        m_out.flush();
        return;
    }

    m_out << "== " << title << " ==\n";
    if (m_mode == OutputMode::Verbose) {
        m_out << QCoreApplication::translate("CLI", "(chapter %1)").arg(index + 1) << "\n";
    }
    m_out << "\n";

    if (state.isSuccess()) {
        for (const DisplaySpan& span : state.payload->spans) {
            if (m_mode == OutputMode::Verbose) {
                m_out << QStringLiteral("[%1@%2] ").arg(span.innerIndex).arg(span.start);
            }
            m_out << span.text << "\n\n";
        }
    } else if (state.isFailure()) {
        m_out << QCoreApplication::translate("CLI", "Failed to load: ") << state.message;
        if (state.retryable) {
            m_out << QCoreApplication::translate("CLI", " (can be retried)");
        }
        m_out << "\n\n";
    } else {
        m_out << QCoreApplication::translate("CLI", "Loading...") << "\n\n";
    }
    m_out.flush();
}

// =============================================================================
// Listening
// =============================================================================

void ConsoleOutput::reportLine(const SpeechLine& line)
{
    QMutexLocker lock(&m_outMutex);

    switch (m_mode) {
        case OutputMode::Simple:
            break;
        case OutputMode::Verbose:
            m_out << QStringLiteral("[%1:%2] ").arg(line.chapterIndex + 1).arg(line.index + 1)
                  << line.text << "\n";
            m_out.flush();
            break;
        case OutputMode::Json:
            m_out << "{\"type\":\"line\",\"chapter\":" << line.chapterIndex
                  << ",\"index\":" << line.index
                  << ",\"start\":" << line.startChar
                  << ",\"text\":\"" << jsonEscape(line.text) << "\"}\n";
            m_out.flush();
            break;
    }
}

void ConsoleOutput::reportListenSummary(const ListenSummary& summary)
{
    QMutexLocker lock(&m_outMutex);

    if (m_mode == OutputMode::Json) {
        m_out << "{\"type\":\"summary\""
              << ",\"lines\":" << summary.linesSpoken
              << ",\"chapter\":" << summary.lastChapter
              << ",\"char\":" << summary.lastCharOffset
              << ",\"elapsed_ms\":" << summary.elapsedMs
              << ",\"cancelled\":" << (summary.cancelled ? "true" : "false");
        if (!summary.error.isEmpty()) {
            m_out << ",\"error\":\"" << jsonEscape(summary.error) << "\"";
        }
        m_out << "}\n";
        m_out.flush();
        return;
    }

    m_out << "\n";
    m_out << QCoreApplication::translate("CLI", "=== Summary ===\n");
    m_out << QCoreApplication::translate("CLI", "Lines:    ") << summary.linesSpoken << "\n";
    if (summary.lastChapter >= 0) {
        m_out << QCoreApplication::translate("CLI", "Stopped:  chapter %1, char %2")
                     .arg(summary.lastChapter + 1).arg(summary.lastCharOffset) << "\n";
    }
    m_out << QCoreApplication::translate("CLI", "Time:     ")
          << formatDuration(summary.elapsedMs) << "\n";
    m_out.flush();
}

// =============================================================================
// Error/Warning Reporting
// =============================================================================

void ConsoleOutput::reportError(const QString& message)
{
    QMutexLocker lock(&m_outMutex);

    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"error\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    }
    m_err.flush();
}

void ConsoleOutput::reportWarning(const QString& message)
{
    QMutexLocker lock(&m_outMutex);

    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"warning\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    }
    m_err.flush();
}

// =============================================================================
// Utility Functions
// =============================================================================

QString ConsoleOutput::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    qint64 minutes = ms / (60 * 1000);
    qint64 seconds = (ms % (60 * 1000)) / 1000;
    return QStringLiteral("%1m %2s").arg(minutes).arg(seconds);
}

QString ConsoleOutput::jsonEscape(const QString& str)
{
    QString result;
    result.reserve(str.size() + 10);

    for (const QChar& c : str) {
        switch (c.unicode()) {
            case '"':  result += QStringLiteral("\\\""); break;
            case '\\': result += QStringLiteral("\\\\"); break;
            case '\n': result += QStringLiteral("\\n"); break;
            case '\r': result += QStringLiteral("\\r"); break;
            case '\t': result += QStringLiteral("\\t"); break;
            default:
                if (c.unicode() < 32) {
                    result += QStringLiteral("\\u%1").arg(static_cast<uint>(c.unicode()), 4, 16, QLatin1Char('0'));
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

} // namespace Cli
