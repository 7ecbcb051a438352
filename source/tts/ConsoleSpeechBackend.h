#pragma once

// ============================================================================
// ConsoleSpeechBackend - SpeechBackend that prints lines instead of talking
// ============================================================================
// Each line is written to stdout (when echo is on) and "spoken" for as long as
// reading it aloud would take at the configured words-per-minute rate. A fixed
// per-line duration overrides the rate.
// ============================================================================

#include "SpeechBackend.h"

#include <QMutex>
#include <QStringList>
#include <QThreadPool>
#include <atomic>

class ConsoleSpeechBackend : public SpeechBackend {
public:
    static constexpr int DEFAULT_WORDS_PER_MINUTE = 180;

    explicit ConsoleSpeechBackend(bool echo = true, int wordsPerMinute = DEFAULT_WORDS_PER_MINUTE);
    ~ConsoleSpeechBackend() override;

    bool isInitialized() const override { return m_initialized.load(); }

    QFuture<void> speak(const SpeechLine& line, const std::optional<SpeechLine>& next) override;
    void stopSpeaking() override;

    void setLanguage(const QLocale& locale) override;
    void setVoice(const QString& voice) override;

    void registerPlayback() override;
    void unregisterPlayback() override;

    void release() override;

    /**
     * @brief Use @p ms per line regardless of length. Negative restores the rate.
     */
    void setFixedLineDuration(int ms) { m_fixedLineMs.store(ms); }

    void setInitialized(bool initialized) { m_initialized.store(initialized); }

    /**
     * @brief Time needed to say @p text at the current rate.
     */
    int durationFor(const QString& text) const;

    // ===== Inspection =====

    QStringList spokenLines() const;
    int registerCount() const { return m_registerCount.load(); }
    int unregisterCount() const { return m_unregisterCount.load(); }
    bool isRegistered() const { return m_registered.load(); }
    QLocale language() const;
    QString voice() const;

private:
    bool m_echo = true;
    int m_wordsPerMinute = DEFAULT_WORDS_PER_MINUTE;

    std::atomic<bool> m_initialized{true};
    std::atomic<bool> m_registered{false};
    std::atomic<bool> m_interrupt{false};
    std::atomic<int> m_fixedLineMs{-1};
    std::atomic<int> m_registerCount{0};
    std::atomic<int> m_unregisterCount{0};

    mutable QMutex m_mutex;
    QStringList m_spoken;
    QLocale m_language;
    QString m_voice;

    QThreadPool m_pool;
};
