#include "ConsoleSpeechBackend.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QTextStream>
#include <QThread>
#include <QtConcurrent/QtConcurrent>

ConsoleSpeechBackend::ConsoleSpeechBackend(bool echo, int wordsPerMinute)
    : m_echo(echo)
    , m_wordsPerMinute(wordsPerMinute > 0 ? wordsPerMinute : DEFAULT_WORDS_PER_MINUTE)
{
    // One utterance at a time
    m_pool.setMaxThreadCount(1);
}

ConsoleSpeechBackend::~ConsoleSpeechBackend()
{
    m_interrupt.store(true);
    m_pool.waitForDone();
}

int ConsoleSpeechBackend::durationFor(const QString& text) const
{
    const int fixed = m_fixedLineMs.load();
    if (fixed >= 0) {
        return fixed;
    }

    static const QRegularExpression wordSplit(QStringLiteral("\\s+"));
    const int words = static_cast<int>(text.split(wordSplit, Qt::SkipEmptyParts).size());
    return qMax(1, words) * 60000 / m_wordsPerMinute;
}

QFuture<void> ConsoleSpeechBackend::speak(const SpeechLine& line, const std::optional<SpeechLine>& next)
{
    Q_UNUSED(next)

    m_interrupt.store(false);
    {
        QMutexLocker lock(&m_mutex);
        m_spoken.append(line.text);
    }

    if (m_echo) {
        QTextStream out(stdout);
        out << line.text << "\n";
        out.flush();
    }

    const int durationMs = durationFor(line.text);
    return QtConcurrent::run(&m_pool, [this, durationMs]() {
        QElapsedTimer timer;
        timer.start();
        while (timer.elapsed() < durationMs && !m_interrupt.load()) {
            QThread::msleep(qMin<qint64>(10, durationMs - timer.elapsed() + 1));
        }
    });
}

void ConsoleSpeechBackend::stopSpeaking()
{
    m_interrupt.store(true);
}

void ConsoleSpeechBackend::setLanguage(const QLocale& locale)
{
    QMutexLocker lock(&m_mutex);
    m_language = locale;
    qDebug() << "ConsoleSpeechBackend: Language set to" << locale.name();
}

void ConsoleSpeechBackend::setVoice(const QString& voice)
{
    QMutexLocker lock(&m_mutex);
    m_voice = voice;
    qDebug() << "ConsoleSpeechBackend: Voice set to" << voice;
}

void ConsoleSpeechBackend::registerPlayback()
{
    m_registered.store(true);
    m_registerCount.fetch_add(1);
}

void ConsoleSpeechBackend::unregisterPlayback()
{
    m_registered.store(false);
    m_unregisterCount.fetch_add(1);
}

void ConsoleSpeechBackend::release()
{
    m_interrupt.store(true);
    m_pool.waitForDone();
    m_initialized.store(false);
}

QStringList ConsoleSpeechBackend::spokenLines() const
{
    QMutexLocker lock(&m_mutex);
    return m_spoken;
}

QLocale ConsoleSpeechBackend::language() const
{
    QMutexLocker lock(&m_mutex);
    return m_language;
}

QString ConsoleSpeechBackend::voice() const
{
    QMutexLocker lock(&m_mutex);
    return m_voice;
}
