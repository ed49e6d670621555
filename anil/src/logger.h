#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QObject>

/**
 * Unified logging system for anil
 *
 * This class provides a centralized logging mechanism that:
 * - Outputs to console (qDebug) when console echo is enabled
 * - Emits a signal so a front end (or a test) can collect the messages
 *
 * The command line front end keeps console echo off by default so log output
 * does not interleave with the player's terminal status line; --verbose
 * turns it on.
 *
 * Usage:
 *   LOG("Your message here");
 *   LOG(QString("Formatted %1 message %2").arg(var1).arg(var2));
 */
class Logger : public QObject
{
    Q_OBJECT

public:
    /**
     * Main unified logging function
     *
     * @param msg The message to log
     * @param file Source file name, normally __FILE__ via the LOG macro
     * @param line Source line number, normally __LINE__ via the LOG macro
     *
     * When file is empty or line is not positive the message is logged
     * without the [file:line] prefix.
     */
    static void log(const QString &msg, const QString &file, int line);

    /**
     * Get the singleton instance of the Logger
     */
    static Logger* instance();

    /**
     * Enable or disable echoing messages to the console
     */
    static void setConsoleEcho(bool enabled);
    static bool consoleEcho();

signals:
    /**
     * Signal emitted when a message is logged
     */
    void logMessage(QString message);

private:
    Logger();
};

/**
 * Convenience macro for logging with file and line info
 * Usage: LOG("Your message")
 */
#define LOG(msg) Logger::log(msg, __FILE__, __LINE__)

#endif // LOGGER_H
