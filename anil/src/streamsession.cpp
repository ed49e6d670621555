#include "streamsession.h"
#include "streamresolver.h"
#include "playbackcontroller.h"
#include "episodenavigator.h"
#include "episodecursor.h"
#include "sourceselector.h"
#include "titlematcher.h"
#include "anilistapi.h"
#include "logger.h"
#include <QSharedPointer>

StreamSession::StreamSession(StreamResolver *resolver,
                             PlaybackController *controller,
                             AniListApi *anilist,
                             const ApplicationSettings &settings,
                             QObject *parent)
    : QObject(parent)
    , m_resolver(resolver)
    , m_controller(controller)
    , m_anilist(anilist)
    , m_stream(settings.stream())
    , m_auth(settings.auth())
    , m_priorities(SourceSelector::defaultPriorities())
{
}

bool StreamSession::isEpisodeComplete(double watchedFraction, int completeAt)
{
    return watchedFraction >= static_cast<double>(completeAt);
}

void StreamSession::report(const QString &message)
{
    LOG(message);
    emit sessionLog(message);
}

SessionResult StreamSession::run(const AniListMedia &media, int episode)
{
    SessionResult result;
    const QString query = media.preferredTitle();
    if (episode < 1) {
        episode = 1;
    }

    report(QString("Searching provider for %1...").arg(query));
    QList<ProviderShow> shows;
    QString error;
    if (!m_resolver->search(query, shows, &error)) {
        result.errorString = QString("Search failed: %1").arg(error);
        report(result.errorString);
        return result;
    }

    int index = TitleMatcher::bestMatch(query, shows);
    if (index < 0) {
        result.errorString = "No results found on provider";
        report(result.errorString);
        return result;
    }
    const ProviderShow show = shows[index];
    report(QString("Found %1 (%2)").arg(show.name, show.id));

    report(QString("Fetching episode %1...").arg(episode));
    NavigationResult first = ProviderEpisodeNavigator::resolveEpisode(m_resolver, show.id, show.name,
                                                                      episode, m_priorities);
    if (first.outcome == NavigationResult::Error) {
        result.errorString = QString("Source error: %1").arg(first.errorString);
        report(result.errorString);
        return result;
    }
    if (first.outcome == NavigationResult::NotFound) {
        result.errorString = "No playable stream found";
        report(result.errorString);
        return result;
    }
    report("Stream found, starting player");

    QSharedPointer<EpisodeCursor> cursor(new EpisodeCursor(episode));
    ProviderEpisodeNavigator navigator(m_resolver, show.id, show.name, cursor, m_priorities);

    if (!m_controller->play(first.request, &navigator)) {
        result.errorString = QString("Player error: %1").arg(m_controller->errorString());
        report(result.errorString);
        return result;
    }

    result.played = true;
    result.watchedFraction = m_controller->watchedFraction();
    result.finalEpisode = cursor->current();
    report(QString("Playback finished at %1% of episode %2")
        .arg(result.watchedFraction, 0, 'f', 1).arg(result.finalEpisode));

    syncProgress(media, result);
    return result;
}

void StreamSession::syncProgress(const AniListMedia &media, SessionResult &result)
{
    if (!isEpisodeComplete(result.watchedFraction, m_stream.episodeCompleteAt)) {
        return;
    }
    if (!m_anilist || !m_auth.isLoggedIn()) {
        LOG("Not logged in to AniList, skipping progress sync");
        return;
    }

    report("Updating AniList...");
    int remoteProgress = 0;
    QString error;
    if (!m_anilist->userProgress(m_auth.anilistToken, media.id, m_auth.username, &remoteProgress, &error)) {
        report(QString("Sync error: %1").arg(error));
        return;
    }

    if (result.finalEpisode <= remoteProgress) {
        LOG(QString("AniList already at episode %1, nothing to update").arg(remoteProgress));
        return;
    }

    if (!m_anilist->updateProgress(m_auth.anilistToken, media.id, result.finalEpisode, "CURRENT", nullptr, &error)) {
        report(QString("Update failed: %1").arg(error));
        return;
    }

    result.progressUpdated = true;
    report(QString("AniList updated to episode %1").arg(result.finalEpisode));
}
