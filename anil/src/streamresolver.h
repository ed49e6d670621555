#ifndef STREAMRESOLVER_H
#define STREAMRESOLVER_H

#include <QString>
#include <QList>
#include "playbackrequest.h"

/**
 * @brief One way to play an episode, prior to extraction
 */
struct SourceCandidate
{
    QString sourceName;   // Label, only used for priority matching
    QString sourceUrl;    // Opaque reference handed back to extractStream()

    SourceCandidate() = default;
    SourceCandidate(const QString &name, const QString &url)
        : sourceName(name), sourceUrl(url) {}
};

/**
 * @brief A show as listed by the content aggregator
 */
struct ProviderShow
{
    QString id;
    QString name;
    int subEpisodes;
    int dubEpisodes;
    int rawEpisodes;

    ProviderShow() : subEpisodes(0), dubEpisodes(0), rawEpisodes(0) {}
};

/**
 * @brief Turns a show/episode pair into playable requests
 *
 * Implementations may block on network I/O. The playback controller never
 * talks to a resolver directly, only through an EpisodeNavigator.
 */
class StreamResolver
{
public:
    enum Status {
        Ok,
        NotFound,         // No episode with that label exists
        TransportError    // Request or response failed
    };

    virtual ~StreamResolver() = default;

    /**
     * @brief Find shows by title
     * @return false on transport or parse failure
     */
    virtual bool search(const QString &query, QList<ProviderShow> &shows,
                        QString *errorString = nullptr) = 0;

    /**
     * @brief List candidate sources for an episode, in the aggregator's order
     * @param showId Aggregator show id
     * @param episode Episode label, e.g. "3"
     * @param candidates Filled on Ok
     * @param errorString Set on TransportError (and on NotFound, for logging)
     */
    virtual Status episodeSources(const QString &showId, const QString &episode,
                                  QList<SourceCandidate> &candidates,
                                  QString *errorString = nullptr) = 0;

    /**
     * @brief Convert one candidate reference into a playable request
     * @return false when this candidate cannot be played
     */
    virtual bool extractStream(const QString &sourceUrl, PlaybackRequest &request,
                               QString *errorString = nullptr) = 0;
};

#endif // STREAMRESOLVER_H
