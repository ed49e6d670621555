#ifndef STREAMSESSION_H
#define STREAMSESSION_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "anilisttypes.h"
#include "applicationsettings.h"

class StreamResolver;
class PlaybackController;
class AniListApi;

/**
 * @brief Outcome of one StreamSession::run()
 */
struct SessionResult
{
    bool played;              // Player ran (even if no progress was made)
    double watchedFraction;   // Highest percentage of the last episode played
    int finalEpisode;         // Episode loaded when the player exited
    bool progressUpdated;     // AniList progress was written
    QString errorString;

    SessionResult() : played(false), watchedFraction(0.0), finalEpisode(0), progressUpdated(false) {}
};

/**
 * @brief Plays an AniList entry from start to progress sync
 *
 * Finds the show on the aggregator, resolves the requested episode, hands
 * playback to the PlaybackController with a navigator bound to a shared
 * episode cursor, and afterwards reports the last episode to AniList when
 * enough of it was watched.
 */
class StreamSession : public QObject
{
    Q_OBJECT

public:
    /**
     * @param anilist May be null, progress is then never synced
     */
    StreamSession(StreamResolver *resolver,
                  PlaybackController *controller,
                  AniListApi *anilist,
                  const ApplicationSettings &settings,
                  QObject *parent = nullptr);

    void setPriorities(const QStringList &priorities) { m_priorities = priorities; }
    QStringList priorities() const { return m_priorities; }

    SessionResult run(const AniListMedia &media, int episode);

    /**
     * @brief Whether a watched percentage counts the episode as finished
     */
    static bool isEpisodeComplete(double watchedFraction, int completeAt);

signals:
    /**
     * @brief Human readable progress of the session
     */
    void sessionLog(const QString &message);

private:
    void report(const QString &message);
    void syncProgress(const AniListMedia &media, SessionResult &result);

    StreamResolver *m_resolver;
    PlaybackController *m_controller;
    AniListApi *m_anilist;
    ApplicationSettings::StreamSettings m_stream;
    ApplicationSettings::AuthSettings m_auth;
    QStringList m_priorities;
};

#endif // STREAMSESSION_H
