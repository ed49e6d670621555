#include "episodenavigator.h"
#include "streamresolver.h"
#include "sourceselector.h"
#include "logger.h"

ProviderEpisodeNavigator::ProviderEpisodeNavigator(StreamResolver *resolver,
                                                   const QString &showId,
                                                   const QString &showName,
                                                   QSharedPointer<EpisodeCursor> cursor,
                                                   const QStringList &priorities)
    : m_resolver(resolver)
    , m_showId(showId)
    , m_showName(showName)
    , m_cursor(cursor)
    , m_priorities(priorities)
{
}

NavigationResult ProviderEpisodeNavigator::resolve(NavigationAction action)
{
    // Held across the resolution so the cursor cannot move underneath us
    QMutexLocker locker(m_cursor->mutex());

    int current = m_cursor->episodeLocked();
    if (action == NavigationAction::Previous && current <= 1) {
        LOG("Previous episode requested at episode 1, nothing to load");
        return NavigationResult::notFound();
    }

    // The cursor moves first, every action consumes exactly one index
    int target = (action == NavigationAction::Next) ? current + 1 : current - 1;
    m_cursor->setEpisode(target);

    LOG(QString("Navigating %1 -> episode %2 of %3")
        .arg(action == NavigationAction::Next ? "forward" : "back")
        .arg(target).arg(m_showName));

    return resolveEpisode(m_resolver, m_showId, m_showName, target, m_priorities);
}

NavigationResult ProviderEpisodeNavigator::resolveEpisode(StreamResolver *resolver,
                                                          const QString &showId,
                                                          const QString &showName,
                                                          int episode,
                                                          const QStringList &priorities)
{
    if (!resolver || episode < 1) {
        return NavigationResult::notFound();
    }

    QList<SourceCandidate> candidates;
    QString error;
    StreamResolver::Status status = resolver->episodeSources(showId, QString::number(episode), candidates, &error);

    if (status == StreamResolver::NotFound) {
        LOG(QString("Episode %1 of %2 not found: %3").arg(episode).arg(showName, error));
        return NavigationResult::notFound();
    }
    if (status == StreamResolver::TransportError) {
        LOG(QString("Source lookup failed for episode %1 of %2: %3").arg(episode).arg(showName, error));
        return NavigationResult::error(error);
    }

    const QList<SourceCandidate> ordered = SourceSelector::orderByPriority(priorities, candidates);
    for (const SourceCandidate &candidate : ordered) {
        PlaybackRequest request;
        QString extractError;
        if (!resolver->extractStream(candidate.sourceUrl, request, &extractError)) {
            LOG(QString("Source %1 failed to extract: %2").arg(candidate.sourceName, extractError));
            continue;
        }
        request.title = episodeTitle(showName, episode);
        LOG(QString("Resolved episode %1 of %2 via %3").arg(episode).arg(showName, candidate.sourceName));
        return NavigationResult::loaded(request);
    }

    LOG(QString("No playable source among %1 candidates for episode %2").arg(candidates.size()).arg(episode));
    return NavigationResult::notFound();
}

QString ProviderEpisodeNavigator::episodeTitle(const QString &showName, int episode)
{
    return QString("%1 - Episode %2").arg(showName).arg(episode);
}
