// ============================================================================
// FileChapterFetcher - Implementation
// ============================================================================

#include "ChapterFetcher.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QUrl>

FileChapterFetcher::FileChapterFetcher(const QString& baseDir, const QString& cacheDir)
    : m_baseDir(baseDir)
    , m_cacheDir(cacheDir)
{
}

QString FileChapterFetcher::resolve(const QString& url) const
{
    if (url.startsWith(QStringLiteral("file:"))) {
        return QUrl(url).toLocalFile();
    }
    if (QDir::isAbsolutePath(url)) {
        return url;
    }
    return QDir(m_baseDir).filePath(url);
}

QString FileChapterFetcher::cachePath(const QString& bookName, int index) const
{
    if (m_cacheDir.isEmpty()) {
        return QString();
    }

    // Book names come from stream metadata and may contain path separators
    static const QRegularExpression unsafe(QStringLiteral("[^A-Za-z0-9_. -]"));
    QString folder = bookName;
    folder.replace(unsafe, QStringLiteral("_"));
    if (folder.isEmpty()) {
        folder = QStringLiteral("untitled");
    }

    return QDir(m_cacheDir).filePath(folder + "/" + QString::number(index) + ".html");
}

ChapterFetchResult FileChapterFetcher::fetch(const QString& bookName, int index,
                                             const QString& url, bool reload)
{
    const QString cached = cachePath(bookName, index);

    if (!reload && !cached.isEmpty()) {
        QFile cacheFile(cached);
        if (cacheFile.open(QIODevice::ReadOnly)) {
            return ChapterFetchResult::success(QString::fromUtf8(cacheFile.readAll()));
        }
    }

    const QString path = resolve(url);
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FileChapterFetcher: Cannot read" << path;
        return ChapterFetchResult::failure(ErrorKind::NetworkError,
            QStringLiteral("Error loading chapter"));
    }
    const QByteArray html = file.readAll();

    if (!cached.isEmpty()) {
        QDir().mkpath(QFileInfo(cached).absolutePath());
        QSaveFile out(cached);
        if (!out.open(QIODevice::WriteOnly) || out.write(html) != html.size() || !out.commit()) {
            // A cache miss next time is harmless
            qWarning() << "FileChapterFetcher: Failed to cache chapter" << index << "to" << cached;
        }
    }

    return ChapterFetchResult::success(QString::fromUtf8(html));
}

QByteArray FileChapterFetcher::fetchBytes(const QString& url)
{
    QFile file(resolve(url));
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FileChapterFetcher: Cannot read" << file.fileName();
        return QByteArray();
    }
    return file.readAll();
}
