#pragma once

// ============================================================================
// PositionStore - Persisted key/value store for reading position and prefs
// ============================================================================
// Keys are scoped: a reading position lives under the book title, reader
// preferences under a fixed scope. The layout on disk is
//
//   position/<bookTitle>/chapterIndex   int
//   position/<bookTitle>/charOffset     int
//   reader/<key>                        bool/int/string
//
// Implementations must be callable from the TTS loop thread.
// ============================================================================

#include <QMutex>
#include <QString>
#include <QVariant>
#include <memory>

class QSettings;

class PositionStore {
public:
    virtual ~PositionStore() = default;

    /**
     * @brief Read a value.
     * @return Invalid QVariant if the key was never written.
     */
    virtual QVariant value(const QString& scope, const QString& key) const = 0;

    virtual void setValue(const QString& scope, const QString& key, const QVariant& value) = 0;

    virtual void remove(const QString& scope, const QString& key) = 0;

    // ===== Reading position =====

    static constexpr const char* CHAPTER_INDEX_KEY = "chapterIndex";
    static constexpr const char* CHAR_OFFSET_KEY = "charOffset";

    /**
     * @brief Saved chapter index for @p bookTitle, or @p fallback.
     */
    int chapterIndex(const QString& bookTitle, int fallback = 0) const;

    /**
     * @brief Saved char offset within the saved chapter, or @p fallback.
     */
    int charOffset(const QString& bookTitle, int fallback = 0) const;

    /**
     * @brief Persist both position entries for @p bookTitle.
     */
    void savePosition(const QString& bookTitle, int chapterIndex, int charOffset);

    static QString positionScope(const QString& bookTitle);
};

/**
 * @brief PositionStore over QSettings.
 *
 * The default constructor uses the application's QSettings (organization and
 * application names set on the QCoreApplication). Tests pass an INI file.
 */
class SettingsPositionStore : public PositionStore {
public:
    SettingsPositionStore();
    explicit SettingsPositionStore(const QString& iniPath);
    ~SettingsPositionStore() override;

    QVariant value(const QString& scope, const QString& key) const override;
    void setValue(const QString& scope, const QString& key, const QVariant& value) override;
    void remove(const QString& scope, const QString& key) override;

    /**
     * @brief Write pending changes to disk.
     */
    void sync();

private:
    static QString fullKey(const QString& scope, const QString& key);

    // QSettings is reentrant, not thread-safe
    mutable QMutex m_mutex;
    std::unique_ptr<QSettings> m_settings;
};
