/**
 * Scripted stand-in for mpv used by the playback tests
 *
 * Listens on the path given by --input-ipc-server=<path> and runs the steps
 * found in ANIL_FAKE_PLAYER_SCRIPT, one per line:
 *
 *   nolisten           never open the IPC server (must be the first step)
 *   accept             wait for the controller to connect
 *   send:<json>        write one line to the controller
 *   expect:<text>      read lines until one contains <text>
 *   sleep:<ms>         pause
 *   exit:<code>        stop with an exit code
 *
 * Every argument and every line received is appended to the file named by
 * ANIL_FAKE_PLAYER_LOG as "arg:<value>" and "cmd:<line>".
 */

#include <QCoreApplication>
#include <QLocalServer>
#include <QLocalSocket>
#include <QElapsedTimer>
#include <QFile>
#include <QTextStream>
#include <QThread>
#include <QStringList>

namespace {

const int kStepTimeoutMs = 5000;

class ScriptLog
{
public:
    explicit ScriptLog(const QString &path) : m_file(path)
    {
        if (!path.isEmpty()) {
            m_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
        }
    }

    void write(const QString &line)
    {
        if (m_file.isOpen()) {
            m_file.write(line.toUtf8());
            m_file.write("\n");
            m_file.flush();
        }
    }

private:
    QFile m_file;
};

bool readUntil(QLocalSocket *socket, const QString &text, ScriptLog &log)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < kStepTimeoutMs) {
        if (!socket->canReadLine()) {
            socket->waitForReadyRead(50);
            continue;
        }
        QString line = QString::fromUtf8(socket->readLine()).trimmed();
        log.write("cmd:" + line);
        if (line.contains(text)) {
            return true;
        }
    }
    return false;
}

void drain(QLocalSocket *socket, ScriptLog &log)
{
    if (!socket) {
        return;
    }
    socket->waitForReadyRead(100);
    while (socket->canReadLine()) {
        log.write("cmd:" + QString::fromUtf8(socket->readLine()).trimmed());
    }
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    ScriptLog log(qEnvironmentVariable("ANIL_FAKE_PLAYER_LOG"));
    const QStringList steps = qEnvironmentVariable("ANIL_FAKE_PLAYER_SCRIPT").split('\n', Qt::SkipEmptyParts);

    QString socketPath;
    const QStringList arguments = app.arguments().mid(1);
    for (const QString &argument : arguments) {
        log.write("arg:" + argument);
        if (argument.startsWith("--input-ipc-server=")) {
            socketPath = argument.mid(QString("--input-ipc-server=").size());
        }
    }

    QLocalServer server;
    bool listen = steps.isEmpty() || steps.first().trimmed() != "nolisten";
    if (listen && (socketPath.isEmpty() || !server.listen(socketPath))) {
        QTextStream(stderr) << "fake player: cannot listen on " << socketPath << "\n";
        return 2;
    }

    QLocalSocket *socket = nullptr;
    for (const QString &rawStep : steps) {
        const QString step = rawStep.trimmed();
        const int colon = step.indexOf(':');
        const QString name = colon < 0 ? step : step.left(colon);
        const QString value = colon < 0 ? QString() : step.mid(colon + 1);

        if (name == "nolisten") {
            continue;
        } else if (name == "accept") {
            if (!server.waitForNewConnection(kStepTimeoutMs)) {
                QTextStream(stderr) << "fake player: nobody connected\n";
                return 3;
            }
            socket = server.nextPendingConnection();
        } else if (name == "send") {
            if (socket) {
                socket->write(value.toUtf8() + "\n");
                socket->flush();
                socket->waitForBytesWritten(1000);
            }
        } else if (name == "expect") {
            if (!socket || !readUntil(socket, value, log)) {
                QTextStream(stderr) << "fake player: never received " << value << "\n";
                return 4;
            }
        } else if (name == "sleep") {
            QThread::msleep(value.toULong());
        } else if (name == "exit") {
            drain(socket, log);
            return value.toInt();
        }
    }

    drain(socket, log);
    if (socket) {
        socket->disconnectFromServer();
    }
    server.close();
    return 0;
}
