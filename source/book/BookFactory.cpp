// ============================================================================
// BookFactory - Book creation by file type
// ============================================================================
// Selects the Book implementation for a file:
//   - "application/epub+zip" or *.epub: EpubBook (MuPDF)
//   - anything else: StreamBook (serialized chapter list)
//
// Stream chapters are read with a FileChapterFetcher rooted at the stream
// file's directory and cached under the application's cache location.
// ============================================================================

#include "Book.h"
#include "EpubBook.h"
#include "StreamBook.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

static const char* EPUB_MIME_TYPE = "application/epub+zip";

BookOpenResult Book::open(const QString& path, const QString& mimeType)
{
    BookOpenResult result;

    if (path.isEmpty()) {
        result.errorKind = ErrorKind::NotFound;
        result.message = QStringLiteral("No book specified");
        return result;
    }

    QFileInfo info(path);
    if (!info.exists() || !info.isReadable()) {
        result.errorKind = ErrorKind::NotFound;
        result.message = QStringLiteral("Empty data: cannot read %1").arg(path);
        return result;
    }

    const bool isEpub = (mimeType == QLatin1String(EPUB_MIME_TYPE))
        || (mimeType.isEmpty() && info.suffix().compare(QLatin1String("epub"), Qt::CaseInsensitive) == 0);
    const QString typeName = mimeType.isEmpty()
        ? (isEpub ? QString::fromLatin1(EPUB_MIME_TYPE) : QStringLiteral("application/json"))
        : mimeType;

    if (isEpub) {
        auto epub = std::make_unique<EpubBook>(path);
        if (!epub->isValid() || epub->size() <= 0) {
            result.errorKind = ErrorKind::EmptySource;
            result.message = QStringLiteral("Empty book, failed to parse %1").arg(typeName);
            return result;
        }
        result.book = std::move(epub);
        return result;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Book::open: Cannot read" << path;
        result.errorKind = ErrorKind::NotFound;
        result.message = QStringLiteral("Empty data: cannot read %1").arg(path);
        return result;
    }

    QString cacheDir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    if (!cacheDir.isEmpty()) {
        cacheDir += QStringLiteral("/chapters");
    }

    auto fetcher = std::make_unique<FileChapterFetcher>(info.absolutePath(), cacheDir);
    result = StreamBook::fromJson(file.readAll(), std::move(fetcher));
    if (result.errorKind == ErrorKind::EmptySource) {
        result.message = QStringLiteral("Empty book, failed to parse %1").arg(typeName);
    }
    return result;
}
