#pragma once

// ============================================================================
// ReaderPreferences - Named reader display/behavior preferences
// ============================================================================
// Each preference is read from the PositionStore once and then served from
// memory. Writes go through this object, update the cache, persist, and emit
// the matching <name>Changed signal. resetValue() removes the key and reverts
// to the default.
// ============================================================================

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QVariant>

class PositionStore;

class ReaderPreferences : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_TEXT_SIZE = 14;
    static constexpr int DEFAULT_TEXT_COLOR = static_cast<int>(0xFFCCCCCC);
    static constexpr int DEFAULT_BACKGROUND_COLOR = static_cast<int>(0xFF121212);

    /**
     * @param store Backing store. Must outlive this object.
     */
    explicit ReaderPreferences(PositionStore* store, QObject* parent = nullptr);

    bool scrollWithVolume() const;
    void setScrollWithVolume(bool enabled);

    bool ttsLock() const;
    void setTtsLock(bool enabled);

    QString textFont() const;
    void setTextFont(const QString& font);

    int textSize() const;
    void setTextSize(int size);

    int orientation() const;
    void setOrientation(int orientation);

    int textColor() const;
    void setTextColor(int argb);

    int backgroundColor() const;
    void setBackgroundColor(int argb);

    bool showBattery() const;
    void setShowBattery(bool show);

    bool showTime() const;
    void setShowTime(bool show);

    bool screenAwake() const;
    void setScreenAwake(bool awake);

    /**
     * @brief Remove a stored preference so it reads as its default again.
     * @param key One of the key constants below. Unknown keys are ignored.
     */
    void resetValue(const QString& key);

    /**
     * @brief Default for @p key, invalid QVariant for unknown keys.
     */
    static QVariant defaultValue(const QString& key);

    static const QString SCOPE;
    static const QString SCROLL_WITH_VOLUME;
    static const QString TTS_LOCK;
    static const QString TEXT_FONT;
    static const QString TEXT_SIZE;
    static const QString ORIENTATION;
    static const QString TEXT_COLOR;
    static const QString BACKGROUND_COLOR;
    static const QString SHOW_BATTERY;
    static const QString SHOW_TIME;
    static const QString SCREEN_AWAKE;

signals:
    void scrollWithVolumeChanged(bool enabled);
    void ttsLockChanged(bool enabled);
    void textFontChanged(const QString& font);
    void textSizeChanged(int size);
    void orientationChanged(int orientation);
    void textColorChanged(int argb);
    void backgroundColorChanged(int argb);
    void showBatteryChanged(bool show);
    void showTimeChanged(bool show);
    void screenAwakeChanged(bool awake);

private:
    QVariant cached(const QString& key) const;

    /**
     * @brief Update cache and store. Returns false if the value is unchanged.
     */
    bool write(const QString& key, const QVariant& value);

    void emitChanged(const QString& key);

    PositionStore* m_store = nullptr;

    mutable QMutex m_cacheMutex;
    mutable QHash<QString, QVariant> m_cache;
};
