#include "playbackcontroller.h"
#include "logger.h"
#include <QProcess>
#include <QLocalSocket>
#include <QEventLoop>
#include <QTimer>
#include <QElapsedTimer>
#include <QThread>
#include <QFile>
#include <QDir>
#include <QCoreApplication>
#include <QRandomGenerator>

namespace {

struct KeyBinding {
    const char *key;
    const char *signal;
};

// Primary and fallback key for each direction
const KeyBinding kNavigationBindings[] = {
    { "N", PlayerIpc::NextEpisodeSignal },
    { "Ctrl+n", PlayerIpc::NextEpisodeSignal },
    { "B", PlayerIpc::PreviousEpisodeSignal },
    { "Ctrl+b", PlayerIpc::PreviousEpisodeSignal },
};

}

PlaybackController::PlaybackController(QObject *parent)
    : QObject(parent)
    , m_process(nullptr)
    , m_socket(nullptr)
    , m_navigator(nullptr)
    , m_navigating(false)
    , m_watchedFraction(0.0)
    , m_channelAvailable(false)
    , m_error(NoError)
    , m_playerProgram("mpv")
    , m_connectAttempts(DefaultConnectAttempts)
    , m_connectIntervalMs(DefaultConnectIntervalMs)
    , m_pollIntervalMs(DefaultPollIntervalMs)
{
}

PlaybackController::~PlaybackController()
{
}

QString PlaybackController::generateSocketPath()
{
    return QDir(QDir::tempPath()).filePath(QString("anil-mpv-%1-%2.sock")
        .arg(QCoreApplication::applicationPid())
        .arg(QRandomGenerator::global()->generate()));
}

QStringList PlaybackController::buildArguments(const PlaybackRequest &request, const QString &socketPath) const
{
    QStringList arguments;
    arguments << "--force-window=yes";
    arguments << "--keep-open=yes";
    arguments << QString("--input-ipc-server=%1").arg(socketPath);
    arguments << "--term-osd-bar";
    arguments << "--term-status-msg=Status: ${time-pos} / ${duration} (${percent-pos}%)";

    // One option per header, header values may themselves contain commas
    const QStringList headerLines = request.headerLines();
    for (const QString &line : headerLines) {
        arguments << QString("--http-header-fields-append=%1").arg(line);
    }

    for (const QString &subtitle : request.subtitles) {
        arguments << QString("--sub-file=%1").arg(subtitle);
    }

    if (!request.title.isEmpty()) {
        arguments << QString("--title=%1").arg(request.title);
    }
    if (!request.startTime.isEmpty()) {
        arguments << QString("--start=%1").arg(request.startTime);
    }

    arguments << "--";
    arguments << request.url;
    return arguments;
}

bool PlaybackController::play(const PlaybackRequest &initial, EpisodeNavigator *navigator)
{
    m_error = NoError;
    m_errorString.clear();
    m_watchedFraction = 0.0;
    m_channelAvailable = false;
    m_navigating = false;

    if (!initial.isValid()) {
        m_error = InvalidRequestError;
        m_errorString = "Playback request has no URL";
        LOG(QString("Playback error: %1").arg(m_errorString));
        return false;
    }

    m_socketPath = generateSocketPath();
    if (QFile::exists(m_socketPath)) {
        QFile::remove(m_socketPath);
    }

    QProcess process;
    process.setProgram(m_playerProgram);
    process.setArguments(buildArguments(initial, m_socketPath));
    // The player draws its status line and reads keys on our terminal
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.setInputChannelMode(QProcess::ForwardedInputChannel);

    LOG(QString("Starting player: %1 %2").arg(m_playerProgram, initial.url));
    process.start();
    if (!process.waitForStarted()) {
        m_error = ProcessSpawnError;
        m_errorString = QString("Failed to start %1: %2").arg(m_playerProgram, process.errorString());
        LOG(QString("Playback error: %1").arg(m_errorString));
        return false;
    }

    QLocalSocket socket;
    m_process = &process;
    m_socket = &socket;
    m_navigator = navigator;

    if (connectChannel()) {
        m_channelAvailable = true;
        LOG(QString("Connected to player IPC at %1").arg(m_socketPath));
        registerBindings();
        runEventLoop();
    } else {
        LOG(QString("Player IPC unavailable after %1 attempts, playing without navigation")
            .arg(m_connectAttempts));
    }

    // Whatever ended the loop, the player owns the terminal until it exits
    if (process.state() != QProcess::NotRunning) {
        process.waitForFinished(-1);
    }

    // Events already received before the exit still count
    if (m_channelAvailable) {
        if (socket.state() == QLocalSocket::ConnectedState) {
            socket.waitForReadyRead(0);
        }
        processLines();
    }

    socket.abort();
    m_socket = nullptr;
    m_process = nullptr;
    m_navigator = nullptr;

    if (QFile::exists(m_socketPath)) {
        QFile::remove(m_socketPath);
    }

    LOG(QString("Player exited (code %1), watched %2%")
        .arg(process.exitCode()).arg(m_watchedFraction, 0, 'f', 1));
    return true;
}

bool PlaybackController::connectChannel()
{
    // The player needs a moment before its IPC server listens
    for (int attempt = 1; attempt <= m_connectAttempts; ++attempt) {
        if (m_process->state() == QProcess::NotRunning || m_process->waitForFinished(0)) {
            LOG("Player exited before the IPC channel came up");
            return false;
        }

        QElapsedTimer attemptTimer;
        attemptTimer.start();
        m_socket->connectToServer(m_socketPath);
        if (m_socket->waitForConnected(m_connectIntervalMs)) {
            return true;
        }
        m_socket->abort();

        // One interval per attempt, whether the connect failed fast or timed out
        qint64 remaining = m_connectIntervalMs - attemptTimer.elapsed();
        if (remaining > 0 && attempt < m_connectAttempts) {
            QThread::msleep(static_cast<unsigned long>(remaining));
        }
    }
    return false;
}

void PlaybackController::registerBindings()
{
    for (const KeyBinding &binding : kNavigationBindings) {
        sendCommand(PlayerIpc::keybind(binding.key, binding.signal));
    }
    sendCommand(PlayerIpc::observeProperty(PlayerIpc::PositionObserverId, PlayerIpc::PositionProperty));
}

void PlaybackController::runEventLoop()
{
    QEventLoop loop;
    QTimer livenessTimer;

    connect(m_socket, &QLocalSocket::readyRead, &loop, [this]() {
        processLines();
    });
    connect(m_process, &QProcess::finished, &loop, &QEventLoop::quit);
    connect(m_socket, &QLocalSocket::disconnected, &loop, [&loop]() {
        LOG("Player IPC channel closed");
        loop.quit();
    });
    connect(m_socket, &QLocalSocket::errorOccurred, &loop, [this, &loop](QLocalSocket::LocalSocketError) {
        LOG(QString("Player IPC channel error: %1").arg(m_socket->errorString()));
        loop.quit();
    });

    livenessTimer.setInterval(m_pollIntervalMs);
    connect(&livenessTimer, &QTimer::timeout, &loop, [this, &loop]() {
        if (m_process->state() == QProcess::NotRunning) {
            loop.quit();
        }
    });
    livenessTimer.start();

    // Lines that arrived while bindings were being registered
    processLines();

    if (m_process->state() != QProcess::NotRunning
        && m_socket->state() == QLocalSocket::ConnectedState) {
        loop.exec();
    }

    livenessTimer.stop();
}

void PlaybackController::processLines()
{
    // Lines arriving while the navigator runs its own event loop wait in the
    // socket buffer; the dispatch that started the navigation picks them up
    if (m_navigating) {
        return;
    }
    while (m_socket && m_socket->canReadLine()) {
        const QByteArray line = m_socket->readLine();
        dispatch(PlayerIpc::parseEvent(line));
    }
}

void PlaybackController::dispatch(const PlayerEvent &event)
{
    switch (event.kind) {
    case PlayerEvent::PropertyChange:
        if (event.name == QLatin1String(PlayerIpc::PositionProperty) && event.hasValue) {
            double position = qBound(0.0, event.value, 100.0);
            if (position > m_watchedFraction) {
                m_watchedFraction = position;
                emit watchedFractionChanged(m_watchedFraction);
            }
        }
        break;
    case PlayerEvent::ClientMessage: {
        NavigationAction action;
        if (PlayerIpc::actionForEvent(event, &action)) {
            handleNavigation(action);
        }
        break;
    }
    case PlayerEvent::Other:
    case PlayerEvent::Invalid:
        break;
    }
}

void PlaybackController::handleNavigation(NavigationAction action)
{
    const bool next = (action == NavigationAction::Next);

    if (!m_navigator) {
        LOG(QString("Ignoring %1 episode request, no navigator").arg(next ? "next" : "previous"));
        return;
    }
    if (m_process->state() == QProcess::NotRunning) {
        LOG("Ignoring episode request received after the player exited");
        return;
    }

    sendCommand(PlayerIpc::showText(next ? "Fetching next episode..." : "Fetching previous episode..."));
    LOG(QString("Fetching %1 episode").arg(next ? "next" : "previous"));

    m_navigating = true;
    NavigationResult result = m_navigator->resolve(action);
    m_navigating = false;

    switch (result.outcome) {
    case NavigationResult::Loaded: {
        const PlaybackRequest &request = result.request;
        if (!request.headers.isEmpty()) {
            sendCommand(PlayerIpc::changeList("http-header-fields", "clr", QString()));
            const QStringList headerLines = request.headerLines();
            for (const QString &line : headerLines) {
                sendCommand(PlayerIpc::changeList("http-header-fields", "append", line));
            }
        }
        sendCommand(PlayerIpc::loadFile(request.url));
        if (!request.title.isEmpty()) {
            sendCommand(PlayerIpc::setProperty("title", request.title));
        }

        // Progress belongs to the episode that is now loaded
        m_watchedFraction = 0.0;
        emit watchedFractionChanged(m_watchedFraction);
        emit episodeLoaded(request.title);
        LOG(QString("Loaded %1").arg(request.title.isEmpty() ? request.url : request.title));
        break;
    }
    case NavigationResult::NotFound:
        sendCommand(PlayerIpc::showText(next ? "No next episode found" : "No previous episode found"));
        LOG(QString("No %1 episode found").arg(next ? "next" : "previous"));
        break;
    case NavigationResult::Error:
        sendCommand(PlayerIpc::showText(QString("Error: %1").arg(result.errorString)));
        LOG(QString("Error fetching episode: %1").arg(result.errorString));
        break;
    }

    emit navigationFinished(action, result.outcome);
}

void PlaybackController::sendCommand(const QByteArray &command)
{
    if (!m_socket || m_socket->state() != QLocalSocket::ConnectedState) {
        return;
    }
    if (m_socket->write(command) != command.size()) {
        LOG(QString("Failed to write player command: %1").arg(m_socket->errorString()));
        return;
    }
    m_socket->flush();
}
