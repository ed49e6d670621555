#include "logger.h"
#include <QDebug>
#include <QMutex>
#include <QAtomicInt>

// The instance lives for the application's lifetime and is never deleted.
static Logger* s_instance = nullptr;
static QMutex s_instanceMutex;
static QAtomicInt s_consoleEcho(1);

Logger::Logger() : QObject(nullptr)
{
}

Logger* Logger::instance()
{
    // Double-checked locking, QMutex provides the memory barriers
    if (!s_instance)
    {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance)
        {
            s_instance = new Logger();
        }
    }
    return s_instance;
}

void Logger::setConsoleEcho(bool enabled)
{
    s_consoleEcho.storeRelease(enabled ? 1 : 0);
}

bool Logger::consoleEcho()
{
    return s_consoleEcho.loadAcquire() != 0;
}

void Logger::log(const QString &msg, const QString &file, int line)
{
    QString fullMessage;
    if (!file.isEmpty() && line > 0)
    {
        // Extract just the filename from the full path
        QString filename = file;
        int lastSlash = filename.lastIndexOf('/');
        if (lastSlash == -1)
        {
            lastSlash = filename.lastIndexOf('\\');
        }
        if (lastSlash >= 0)
        {
            filename = filename.mid(lastSlash + 1);
        }

        fullMessage = QString("[%1:%2] %3").arg(filename).arg(line).arg(msg);
    }
    else
    {
        fullMessage = msg;
    }

    if (consoleEcho())
    {
        qDebug().noquote() << fullMessage;
    }

    emit instance()->logMessage(fullMessage);
}
