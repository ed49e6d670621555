#ifndef EPISODENAVIGATOR_H
#define EPISODENAVIGATOR_H

#include <QString>
#include <QStringList>
#include <QSharedPointer>
#include <QMetaType>
#include "playbackrequest.h"
#include "episodecursor.h"

class StreamResolver;

/**
 * @brief Direction requested from inside the player
 */
enum class NavigationAction {
    Next,
    Previous
};

/**
 * @brief Outcome of one navigation request
 */
struct NavigationResult
{
    enum Outcome {
        Loaded,     // request holds the episode to load
        NotFound,   // no such episode, or no source could be extracted
        Error       // resolver transport failure, see errorString
    };

    Outcome outcome;
    PlaybackRequest request;
    QString errorString;

    NavigationResult() : outcome(NotFound) {}

    static NavigationResult loaded(const PlaybackRequest &request)
    {
        NavigationResult result;
        result.outcome = Loaded;
        result.request = request;
        return result;
    }

    static NavigationResult notFound()
    {
        return NavigationResult();
    }

    static NavigationResult error(const QString &message)
    {
        NavigationResult result;
        result.outcome = Error;
        result.errorString = message;
        return result;
    }
};

/**
 * @brief Capability the playback controller calls for next/previous episode
 *
 * Supplied by whoever starts playback. resolve() may block on network I/O;
 * the controller never calls it re-entrantly.
 */
class EpisodeNavigator
{
public:
    virtual ~EpisodeNavigator() = default;

    virtual NavigationResult resolve(NavigationAction action) = 0;
};

/**
 * ProviderEpisodeNavigator - navigator backed by a StreamResolver
 *
 * Moves a shared EpisodeCursor and resolves the target episode through the
 * resolver, trying candidate sources in priority order. Next increments and
 * Previous decrements the cursor before resolving, whatever the outcome, so
 * repeated presses walk through consecutive episodes. Previous at episode 1
 * leaves the cursor alone and resolves nothing.
 */
class ProviderEpisodeNavigator : public EpisodeNavigator
{
public:
    ProviderEpisodeNavigator(StreamResolver *resolver,
                             const QString &showId,
                             const QString &showName,
                             QSharedPointer<EpisodeCursor> cursor,
                             const QStringList &priorities);

    NavigationResult resolve(NavigationAction action) override;

    /**
     * @brief Resolve one episode to a playable request
     *
     * Candidates are extracted in SourceSelector::orderByPriority() order and
     * the first success wins, titled "<show> - Episode <n>". Per-candidate
     * extraction failures are skipped. NotFound when the episode does not
     * exist or nothing extracts, Error when the resolver itself failed.
     */
    static NavigationResult resolveEpisode(StreamResolver *resolver,
                                           const QString &showId,
                                           const QString &showName,
                                           int episode,
                                           const QStringList &priorities);

    static QString episodeTitle(const QString &showName, int episode);

private:
    StreamResolver *m_resolver;
    QString m_showId;
    QString m_showName;
    QSharedPointer<EpisodeCursor> m_cursor;
    QStringList m_priorities;
};

Q_DECLARE_METATYPE(NavigationAction)
Q_DECLARE_METATYPE(NavigationResult::Outcome)

#endif // EPISODENAVIGATOR_H
