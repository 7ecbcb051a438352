#ifndef CLIOUTPUT_H
#define CLIOUTPUT_H

/**
 * @file CliOutput.h
 * @brief Console reporter for CLI results.
 *
 * Formats chapter lists, chapter text, spoken lines and summaries for the
 * terminal. Three output modes:
 * - Simple: Plain text (`  3. Chapter Three`)
 * - Verbose: Positions and loading details
 * - JSON: One object per line (`{"type":"line",...}`)
 */

#include "CliParser.h"
#include "../core/ChapterState.h"

#include <QMutex>
#include <QStringList>
#include <QTextStream>

namespace Cli {

/**
 * @brief Result of a listen command.
 */
struct ListenSummary {
    int linesSpoken = 0;
    int lastChapter = -1;       ///< Chapter of the last spoken line
    int lastCharOffset = 0;     ///< Start char of the last spoken line
    qint64 elapsedMs = 0;
    bool cancelled = false;
    QString error;              ///< Why playback stopped, if it failed
};

class ConsoleOutput {
public:
    explicit ConsoleOutput(OutputMode mode = OutputMode::Simple);

    OutputMode mode() const { return m_mode; }

    /**
     * @brief List the chapters of a book.
     * @param hints Per-chapter loading hint (source URL), may be shorter.
     */
    void reportChapters(const QString& bookTitle, const QStringList& titles,
                        const QStringList& hints);

    /**
     * @brief Print one chapter: its title, then text or failure.
     */
    void reportChapter(int index, const QString& title, const ChapterState& state);

    /**
     * @brief Report a line as it starts being spoken.
     *
     * Called from the playback thread. Simple mode prints nothing; the
     * speech backend echoes the text itself.
     */
    void reportLine(const SpeechLine& line);

    void reportListenSummary(const ListenSummary& summary);

    void reportError(const QString& message);
    void reportWarning(const QString& message);

    // Format duration for display (e.g., "1.5 s" or "125 ms")
    static QString formatDuration(qint64 ms);

    // Escape string for JSON output
    static QString jsonEscape(const QString& str);

private:
    OutputMode m_mode;
    QMutex m_outMutex;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
};

} // namespace Cli

#endif // CLIOUTPUT_H
