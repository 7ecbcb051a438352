#pragma once

// ============================================================================
// SpeechBackend - Abstract text-to-speech engine
// ============================================================================
// The TtsSequencer hands one SpeechLine at a time to the backend and waits on
// the returned future. stopSpeaking() must make a pending future finish soon.
//
// registerPlayback()/unregisterPlayback() bracket one playback loop (audio
// focus, media session); release() frees the engine for good.
// ============================================================================

#include "../text/TextPipeline.h"

#include <QFuture>
#include <QLocale>
#include <QMetaType>
#include <QString>
#include <optional>

/**
 * @brief Playback status shared by the sequencer and notification sinks.
 */
enum class TtsStatus {
    Stopped,
    Running,
    Paused
};

Q_DECLARE_METATYPE(TtsStatus)

class SpeechBackend {
public:
    virtual ~SpeechBackend() = default;

    /**
     * @brief Whether the engine can accept commands.
     */
    virtual bool isInitialized() const = 0;

    /**
     * @brief Start speaking @p line.
     * @param next Following line, for prefetch. nullopt at chapter end.
     * @return Future that finishes when the line was spoken or stopped.
     */
    virtual QFuture<void> speak(const SpeechLine& line, const std::optional<SpeechLine>& next) = 0;

    /**
     * @brief Cut the current utterance short.
     */
    virtual void stopSpeaking() = 0;

    virtual void setLanguage(const QLocale& locale) = 0;
    virtual void setVoice(const QString& voice) = 0;

    virtual void registerPlayback() = 0;
    virtual void unregisterPlayback() = 0;

    virtual void release() = 0;
};
