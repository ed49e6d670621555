#ifndef PLAYBACKCONTROLLER_H
#define PLAYBACKCONTROLLER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "playbackrequest.h"
#include "episodenavigator.h"
#include "playeripc.h"

class QProcess;
class QLocalSocket;

/**
 * @brief Runs the external media player and follows its playback
 *
 * This class launches mpv with a JSON IPC server bound to a per-call socket,
 * tracks the highest playback percentage of the loaded episode, and swaps
 * episodes in the running player when the user presses the next/previous
 * episode keys. play() blocks (running a local event loop) until the player
 * exits.
 */
class PlaybackController : public QObject
{
    Q_OBJECT

public:
    enum PlayerError {
        NoError,
        InvalidRequestError,   // Request has no URL
        ProcessSpawnError      // Player binary missing or could not start
    };
    Q_ENUM(PlayerError)

    explicit PlaybackController(QObject *parent = nullptr);
    ~PlaybackController();

    /**
     * @brief Play a request and block until the player exits
     * @param initial First episode to open
     * @param navigator Called for next/previous requests, may be null
     * @return false only when the player could not be launched (see error())
     *
     * When the IPC channel never comes up the player still runs to completion
     * but navigation is unavailable and the watched fraction stays 0.
     */
    bool play(const PlaybackRequest &initial, EpisodeNavigator *navigator = nullptr);

    /**
     * @brief Highest playback percentage (0-100) of the current episode
     *
     * Reset to 0 whenever a navigation loads a new episode. After play()
     * returns this is the value for the last episode played.
     */
    double watchedFraction() const { return m_watchedFraction; }

    /**
     * @brief Whether the last play() established the control channel
     */
    bool channelAvailable() const { return m_channelAvailable; }

    PlayerError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    // Player program, resolved on PATH when not absolute
    QString playerProgram() const { return m_playerProgram; }
    void setPlayerProgram(const QString &program) { m_playerProgram = program; }

    // Channel establishment and liveness polling
    int connectAttempts() const { return m_connectAttempts; }
    void setConnectAttempts(int attempts) { m_connectAttempts = attempts; }
    int connectIntervalMs() const { return m_connectIntervalMs; }
    void setConnectIntervalMs(int ms) { m_connectIntervalMs = ms; }
    int pollIntervalMs() const { return m_pollIntervalMs; }
    void setPollIntervalMs(int ms) { m_pollIntervalMs = ms; }

    /**
     * @brief Command line passed to the player for a request
     */
    QStringList buildArguments(const PlaybackRequest &request, const QString &socketPath) const;

    /**
     * @brief New unique IPC socket path in the temp directory
     */
    static QString generateSocketPath();

    static const int DefaultConnectAttempts = 20;
    static const int DefaultConnectIntervalMs = 100;
    static const int DefaultPollIntervalMs = 100;

signals:
    /**
     * @brief Emitted when the watched fraction grows, and with 0 on an episode swap
     */
    void watchedFractionChanged(double fraction);

    /**
     * @brief Emitted once for every navigation signal handled
     */
    void navigationFinished(NavigationAction action, NavigationResult::Outcome outcome);

    /**
     * @brief Emitted after a navigation loaded a new episode
     */
    void episodeLoaded(const QString &title);

private:
    bool connectChannel();
    void registerBindings();
    void runEventLoop();
    void processLines();
    void dispatch(const PlayerEvent &event);
    void handleNavigation(NavigationAction action);
    void sendCommand(const QByteArray &command);

    // Per-call state, only valid inside play()
    QProcess *m_process;
    QLocalSocket *m_socket;
    EpisodeNavigator *m_navigator;
    bool m_navigating;            // Inside EpisodeNavigator::resolve()
    QString m_socketPath;

    double m_watchedFraction;
    bool m_channelAvailable;
    PlayerError m_error;
    QString m_errorString;

    QString m_playerProgram;
    int m_connectAttempts;
    int m_connectIntervalMs;
    int m_pollIntervalMs;
};

#endif // PLAYBACKCONTROLLER_H
