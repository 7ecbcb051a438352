#include "ReaderPreferences.h"
#include "PositionStore.h"

#include <QDebug>
#include <QMutexLocker>

const QString ReaderPreferences::SCOPE = QStringLiteral("reader");
const QString ReaderPreferences::SCROLL_WITH_VOLUME = QStringLiteral("scrollWithVolume");
const QString ReaderPreferences::TTS_LOCK = QStringLiteral("ttsLock");
const QString ReaderPreferences::TEXT_FONT = QStringLiteral("textFont");
const QString ReaderPreferences::TEXT_SIZE = QStringLiteral("textSize");
const QString ReaderPreferences::ORIENTATION = QStringLiteral("orientation");
const QString ReaderPreferences::TEXT_COLOR = QStringLiteral("textColor");
const QString ReaderPreferences::BACKGROUND_COLOR = QStringLiteral("backgroundColor");
const QString ReaderPreferences::SHOW_BATTERY = QStringLiteral("showBattery");
const QString ReaderPreferences::SHOW_TIME = QStringLiteral("showTime");
const QString ReaderPreferences::SCREEN_AWAKE = QStringLiteral("screenAwake");

ReaderPreferences::ReaderPreferences(PositionStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
}

QVariant ReaderPreferences::defaultValue(const QString& key)
{
    static const QHash<QString, QVariant> defaults = {
        {SCROLL_WITH_VOLUME, true},
        {TTS_LOCK, true},
        {TEXT_FONT, QString()},
        {TEXT_SIZE, DEFAULT_TEXT_SIZE},
        {ORIENTATION, 0},
        {TEXT_COLOR, DEFAULT_TEXT_COLOR},
        {BACKGROUND_COLOR, DEFAULT_BACKGROUND_COLOR},
        {SHOW_BATTERY, true},
        {SHOW_TIME, true},
        {SCREEN_AWAKE, true},
    };
    return defaults.value(key);
}

// ============================================================================
// Cache
// ============================================================================

QVariant ReaderPreferences::cached(const QString& key) const
{
    QMutexLocker lock(&m_cacheMutex);
    auto it = m_cache.constFind(key);
    if (it != m_cache.constEnd()) {
        return it.value();
    }

    const QVariant fallback = defaultValue(key);
    QVariant v = m_store ? m_store->value(SCOPE, key) : QVariant();
    // INI files hand everything back as strings
    if (!v.isValid() || (fallback.isValid() && !v.convert(fallback.metaType()))) {
        v = fallback;
    }
    m_cache.insert(key, v);
    return v;
}

bool ReaderPreferences::write(const QString& key, const QVariant& value)
{
    if (cached(key) == value) {
        return false;
    }

    {
        QMutexLocker lock(&m_cacheMutex);
        m_cache.insert(key, value);
    }
    if (m_store) {
        m_store->setValue(SCOPE, key, value);
    }
    return true;
}

void ReaderPreferences::resetValue(const QString& key)
{
    const QVariant fallback = defaultValue(key);
    if (!fallback.isValid()) {
        qWarning() << "ReaderPreferences: Unknown preference" << key;
        return;
    }

    const bool changed = cached(key) != fallback;
    {
        QMutexLocker lock(&m_cacheMutex);
        m_cache.insert(key, fallback);
    }
    if (m_store) {
        m_store->remove(SCOPE, key);
    }
    if (changed) {
        emitChanged(key);
    }
}

void ReaderPreferences::emitChanged(const QString& key)
{
    if (key == SCROLL_WITH_VOLUME) emit scrollWithVolumeChanged(scrollWithVolume());
    else if (key == TTS_LOCK) emit ttsLockChanged(ttsLock());
    else if (key == TEXT_FONT) emit textFontChanged(textFont());
    else if (key == TEXT_SIZE) emit textSizeChanged(textSize());
    else if (key == ORIENTATION) emit orientationChanged(orientation());
    else if (key == TEXT_COLOR) emit textColorChanged(textColor());
    else if (key == BACKGROUND_COLOR) emit backgroundColorChanged(backgroundColor());
    else if (key == SHOW_BATTERY) emit showBatteryChanged(showBattery());
    else if (key == SHOW_TIME) emit showTimeChanged(showTime());
    else if (key == SCREEN_AWAKE) emit screenAwakeChanged(screenAwake());
}

// ============================================================================
// Accessors
// ============================================================================

bool ReaderPreferences::scrollWithVolume() const { return cached(SCROLL_WITH_VOLUME).toBool(); }
void ReaderPreferences::setScrollWithVolume(bool enabled)
{
    if (write(SCROLL_WITH_VOLUME, enabled)) emit scrollWithVolumeChanged(enabled);
}

bool ReaderPreferences::ttsLock() const { return cached(TTS_LOCK).toBool(); }
void ReaderPreferences::setTtsLock(bool enabled)
{
    if (write(TTS_LOCK, enabled)) emit ttsLockChanged(enabled);
}

QString ReaderPreferences::textFont() const { return cached(TEXT_FONT).toString(); }
void ReaderPreferences::setTextFont(const QString& font)
{
    if (write(TEXT_FONT, font)) emit textFontChanged(font);
}

int ReaderPreferences::textSize() const { return cached(TEXT_SIZE).toInt(); }
void ReaderPreferences::setTextSize(int size)
{
    if (write(TEXT_SIZE, size)) emit textSizeChanged(size);
}

int ReaderPreferences::orientation() const { return cached(ORIENTATION).toInt(); }
void ReaderPreferences::setOrientation(int orientation)
{
    if (write(ORIENTATION, orientation)) emit orientationChanged(orientation);
}

int ReaderPreferences::textColor() const { return cached(TEXT_COLOR).toInt(); }
void ReaderPreferences::setTextColor(int argb)
{
    if (write(TEXT_COLOR, argb)) emit textColorChanged(argb);
}

int ReaderPreferences::backgroundColor() const { return cached(BACKGROUND_COLOR).toInt(); }
void ReaderPreferences::setBackgroundColor(int argb)
{
    if (write(BACKGROUND_COLOR, argb)) emit backgroundColorChanged(argb);
}

bool ReaderPreferences::showBattery() const { return cached(SHOW_BATTERY).toBool(); }
void ReaderPreferences::setShowBattery(bool show)
{
    if (write(SHOW_BATTERY, show)) emit showBatteryChanged(show);
}

bool ReaderPreferences::showTime() const { return cached(SHOW_TIME).toBool(); }
void ReaderPreferences::setShowTime(bool show)
{
    if (write(SHOW_TIME, show)) emit showTimeChanged(show);
}

bool ReaderPreferences::screenAwake() const { return cached(SCREEN_AWAKE).toBool(); }
void ReaderPreferences::setScreenAwake(bool awake)
{
    if (write(SCREEN_AWAKE, awake)) emit screenAwakeChanged(awake);
}
