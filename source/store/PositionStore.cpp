#include "PositionStore.h"

#include <QMutexLocker>
#include <QDebug>
#include <QSettings>

// ============================================================================
// PositionStore
// ============================================================================

QString PositionStore::positionScope(const QString& bookTitle)
{
    return QStringLiteral("position/") + bookTitle;
}

int PositionStore::chapterIndex(const QString& bookTitle, int fallback) const
{
    QVariant v = value(positionScope(bookTitle), QLatin1String(CHAPTER_INDEX_KEY));
    bool ok = false;
    int index = v.toInt(&ok);
    return (v.isValid() && ok) ? index : fallback;
}

int PositionStore::charOffset(const QString& bookTitle, int fallback) const
{
    QVariant v = value(positionScope(bookTitle), QLatin1String(CHAR_OFFSET_KEY));
    bool ok = false;
    int offset = v.toInt(&ok);
    return (v.isValid() && ok) ? offset : fallback;
}

void PositionStore::savePosition(const QString& bookTitle, int chapterIndex, int charOffset)
{
    const QString scope = positionScope(bookTitle);
    setValue(scope, QLatin1String(CHAPTER_INDEX_KEY), chapterIndex);
    setValue(scope, QLatin1String(CHAR_OFFSET_KEY), charOffset);
}

// ============================================================================
// SettingsPositionStore
// ============================================================================

SettingsPositionStore::SettingsPositionStore()
    : m_settings(std::make_unique<QSettings>())
{
}

SettingsPositionStore::SettingsPositionStore(const QString& iniPath)
    : m_settings(std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
{
}

SettingsPositionStore::~SettingsPositionStore()
{
    sync();
}

QString SettingsPositionStore::fullKey(const QString& scope, const QString& key)
{
    // Slashes in a book title would open extra groups
    QString safeScope = scope;
    if (safeScope.startsWith(QStringLiteral("position/"))) {
        QString title = safeScope.mid(9);
        title.replace('/', '_');
        title.replace('\\', '_');
        safeScope = QStringLiteral("position/") + title;
    }
    return safeScope + '/' + key;
}

QVariant SettingsPositionStore::value(const QString& scope, const QString& key) const
{
    QMutexLocker lock(&m_mutex);
    return m_settings->value(fullKey(scope, key));
}

void SettingsPositionStore::setValue(const QString& scope, const QString& key, const QVariant& value)
{
    QMutexLocker lock(&m_mutex);
    m_settings->setValue(fullKey(scope, key), value);
}

void SettingsPositionStore::remove(const QString& scope, const QString& key)
{
    QMutexLocker lock(&m_mutex);
    m_settings->remove(fullKey(scope, key));
}

void SettingsPositionStore::sync()
{
    QMutexLocker lock(&m_mutex);
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "SettingsPositionStore: Failed to write" << m_settings->fileName();
    }
}
