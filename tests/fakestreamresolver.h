#ifndef FAKESTREAMRESOLVER_H
#define FAKESTREAMRESOLVER_H

#include <QMap>
#include <QSet>
#include <QStringList>
#include "../anil/src/streamresolver.h"

/**
 * In-memory StreamResolver for tests
 *
 * Episodes are keyed by number. A candidate whose URL is in brokenUrls fails
 * extraction; every other one extracts to "https://cdn.test/<url>.m3u8".
 */
class FakeStreamResolver : public StreamResolver
{
public:
    FakeStreamResolver() : failSearch(false), failTransport(false), searchCalls(0), extractCalls(0) {}

    bool search(const QString &query, QList<ProviderShow> &result, QString *errorString) override
    {
        ++searchCalls;
        searchQueries << query;
        if (failSearch) {
            if (errorString) {
                *errorString = "search unavailable";
            }
            return false;
        }
        result = shows;
        return true;
    }

    Status episodeSources(const QString &showId, const QString &episode,
                          QList<SourceCandidate> &candidates, QString *errorString) override
    {
        requestedEpisodes << episode;
        requestedShows << showId;
        if (failTransport) {
            if (errorString) {
                *errorString = "connection refused";
            }
            return TransportError;
        }
        int number = episode.toInt();
        if (!episodes.contains(number)) {
            if (errorString) {
                *errorString = "no such episode";
            }
            return NotFound;
        }
        candidates = episodes.value(number);
        return Ok;
    }

    bool extractStream(const QString &sourceUrl, PlaybackRequest &request, QString *errorString) override
    {
        ++extractCalls;
        extractedUrls << sourceUrl;
        if (brokenUrls.contains(sourceUrl)) {
            if (errorString) {
                *errorString = "extraction failed";
            }
            return false;
        }
        request.url = QString("https://cdn.test/%1.m3u8").arg(sourceUrl.mid(2));
        request.headers << qMakePair(QString("Referer"), QString("https://cdn.test/"));
        return true;
    }

    void addEpisode(int number, const QString &label = "S-mp4")
    {
        episodes[number] << SourceCandidate(label, QString("--ep%1-%2").arg(number).arg(label));
    }

    QMap<int, QList<SourceCandidate>> episodes;
    QSet<QString> brokenUrls;
    QList<ProviderShow> shows;
    bool failSearch;
    bool failTransport;

    int searchCalls;
    int extractCalls;
    QStringList searchQueries;
    QStringList requestedEpisodes;
    QStringList requestedShows;
    QStringList extractedUrls;
};

#endif // FAKESTREAMRESOLVER_H
