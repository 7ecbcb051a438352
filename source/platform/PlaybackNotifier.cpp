#include "PlaybackNotifier.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <QStandardPaths>

#ifdef Q_OS_LINUX
#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusReply>
#endif

static const char* NOTIFY_SERVICE = "org.freedesktop.Notifications";
static const char* NOTIFY_PATH = "/org/freedesktop/Notifications";
static const char* NOTIFY_INTERFACE = "org.freedesktop.Notifications";

// ============================================================================
// Constructor / Destructor
// ============================================================================

SystemPlaybackNotifier::SystemPlaybackNotifier()
{
#ifdef Q_OS_LINUX
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qDebug() << "SystemPlaybackNotifier: DBus session bus not available";
        return;
    }

    QDBusInterface iface(NOTIFY_SERVICE, NOTIFY_PATH, NOTIFY_INTERFACE, bus);
    if (!iface.isValid()) {
        qDebug() << "SystemPlaybackNotifier: org.freedesktop.Notifications not available";
        return;
    }

    m_available = true;
    qDebug() << "SystemPlaybackNotifier: DBus notifications initialized";
#else
    qDebug() << "SystemPlaybackNotifier: Platform notifications not implemented, logging only";
#endif
}

SystemPlaybackNotifier::~SystemPlaybackNotifier()
{
    if (!m_coverFile.isEmpty()) {
        QFile::remove(m_coverFile);
    }
}

// ============================================================================
// Notifications
// ============================================================================

QString SystemPlaybackNotifier::statusText(TtsStatus status)
{
    switch (status) {
        case TtsStatus::Running: return QCoreApplication::translate("Playback", "Reading");
        case TtsStatus::Paused:  return QCoreApplication::translate("Playback", "Paused");
        case TtsStatus::Stopped: return QCoreApplication::translate("Playback", "Stopped");
    }
    return QString();
}

QString SystemPlaybackNotifier::coverPath(const QString& bookTitle, const QByteArray& cover)
{
    if (cover.isEmpty()) {
        return QString();
    }
    if (bookTitle == m_coverBook && !m_coverFile.isEmpty()) {
        return m_coverFile;
    }

    if (!m_coverFile.isEmpty()) {
        QFile::remove(m_coverFile);
        m_coverFile.clear();
    }

    QString dir = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    QString path = QDir(dir).filePath(
        QStringLiteral("quire-cover-%1.png").arg(QCoreApplication::applicationPid()));

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(cover) != cover.size()) {
        qWarning() << "SystemPlaybackNotifier: Cannot write cover to" << path;
        return QString();
    }

    m_coverBook = bookTitle;
    m_coverFile = path;
    return m_coverFile;
}

void SystemPlaybackNotifier::notify(const QString& bookTitle, const QString& chapterTitle,
                                    const QByteArray& cover, TtsStatus status)
{
    QMutexLocker lock(&m_mutex);

    QString body = chapterTitle.isEmpty()
        ? statusText(status)
        : QStringLiteral("%1 - %2").arg(statusText(status), chapterTitle);

#ifdef Q_OS_LINUX
    if (!m_available) {
        return;
    }

    QDBusInterface iface(NOTIFY_SERVICE, NOTIFY_PATH, NOTIFY_INTERFACE,
                         QDBusConnection::sessionBus());
    if (!iface.isValid()) {
        return;
    }

    QVariantMap hints;
    hints["urgency"] = QVariant::fromValue(static_cast<uchar>(0)); // Low, it updates often
    hints["category"] = QStringLiteral("x-quire.playback");
    QString image = coverPath(bookTitle, cover);
    if (!image.isEmpty()) {
        hints["image-path"] = image;
    }

    // A stopped notification expires; a running one stays until replaced
    const int timeout = (status == TtsStatus::Stopped) ? 5000 : 0;

    QDBusReply<uint> reply = iface.call(
        "Notify",
        "Quire",                // app_name
        m_notificationId,       // replaces_id
        "audio-speakers",       // app_icon
        bookTitle,              // summary
        body,                   // body
        QStringList(),          // actions
        hints,                  // hints
        timeout                 // expire_timeout
    );

    if (reply.isValid()) {
        m_notificationId = reply.value();
    } else {
        qDebug() << "SystemPlaybackNotifier: Notify failed:" << reply.error().message();
    }

    if (status == TtsStatus::Stopped) {
        // Next playback starts a fresh notification
        m_notificationId = 0;
    }
#else
    Q_UNUSED(cover)
    qDebug() << "SystemPlaybackNotifier:" << bookTitle << "-" << body;
#endif
}

void SystemPlaybackNotifier::dismiss()
{
    QMutexLocker lock(&m_mutex);

#ifdef Q_OS_LINUX
    if (!m_available || m_notificationId == 0) {
        return;
    }

    QDBusInterface iface(NOTIFY_SERVICE, NOTIFY_PATH, NOTIFY_INTERFACE,
                         QDBusConnection::sessionBus());
    if (iface.isValid()) {
        iface.call("CloseNotification", m_notificationId);
    }
#endif
    m_notificationId = 0;
}
