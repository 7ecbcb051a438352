#ifndef PLAYBACKNOTIFIER_H
#define PLAYBACKNOTIFIER_H

/**
 * @file PlaybackNotifier.h
 * @brief Notification sink for speech playback.
 *
 * The TtsSequencer reports what it is reading (book, chapter, cover, status)
 * through this interface each time it enters a chapter, after a resume, and
 * once with TtsStatus::Stopped and an empty chapter title when playback ends.
 *
 * SystemPlaybackNotifier shows a single, continuously replaced desktop
 * notification. On Linux it talks to org.freedesktop.Notifications over
 * DBus; elsewhere it only logs.
 */

#include "../tts/SpeechBackend.h"

#include <QByteArray>
#include <QMutex>
#include <QString>

class PlaybackNotifier {
public:
    virtual ~PlaybackNotifier() = default;

    /**
     * @brief Show or update the playback notification.
     * @param bookTitle Book being read
     * @param chapterTitle Current chapter, empty once stopped
     * @param cover Encoded cover image, may be empty
     * @param status Playback status to display
     */
    virtual void notify(const QString& bookTitle, const QString& chapterTitle,
                        const QByteArray& cover, TtsStatus status) = 0;

    /**
     * @brief Remove the notification, if any.
     */
    virtual void dismiss() = 0;
};

/**
 * @brief Desktop notification for the current playback.
 */
class SystemPlaybackNotifier : public PlaybackNotifier {
public:
    SystemPlaybackNotifier();
    ~SystemPlaybackNotifier() override;

    void notify(const QString& bookTitle, const QString& chapterTitle,
                const QByteArray& cover, TtsStatus status) override;

    void dismiss() override;

    static QString statusText(TtsStatus status);

private:
    /**
     * @brief Write the cover to a temp file once per book.
     * @return Path usable as an image-path hint, or empty.
     */
    QString coverPath(const QString& bookTitle, const QByteArray& cover);

    bool m_available = false;

    QMutex m_mutex;
    uint m_notificationId = 0;  ///< replaces_id for the next update
    QString m_coverBook;
    QString m_coverFile;
};

#endif // PLAYBACKNOTIFIER_H
