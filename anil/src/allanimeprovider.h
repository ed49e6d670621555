#ifndef ALLANIMEPROVIDER_H
#define ALLANIMEPROVIDER_H

#include <QObject>
#include <QString>
#include <QList>
#include <QByteArray>
#include <QUrl>
#include "streamresolver.h"

class HttpClient;

/**
 * @brief StreamResolver for the AllAnime aggregator
 *
 * Queries the aggregator's GraphQL endpoint (over GET) for shows and episode
 * sources, decodes the obfuscated "--<hex>" source references and resolves
 * them through the clock.json endpoint into direct stream links.
 *
 * The parse and URL helpers are static so they can be tested without
 * network access.
 */
class AllAnimeProvider : public QObject, public StreamResolver
{
    Q_OBJECT

public:
    /**
     * @param translationType "sub" or "dub"
     * @param quality Preferred vertical resolution, e.g. "1080"
     */
    explicit AllAnimeProvider(const QString &translationType = "sub",
                              const QString &quality = "1080",
                              QObject *parent = nullptr);

    QString translationType() const { return m_translationType; }
    QString quality() const { return m_quality; }

    bool search(const QString &query, QList<ProviderShow> &shows, QString *errorString = nullptr) override;

    Status episodeSources(const QString &showId, const QString &episode,
                          QList<SourceCandidate> &candidates,
                          QString *errorString = nullptr) override;

    bool extractStream(const QString &sourceUrl, PlaybackRequest &request,
                       QString *errorString = nullptr) override;

    // === Protocol helpers ===

    /**
     * @brief Decode a hex string where every byte is XOR'ed with 56
     * @return false on odd length or a non-hex pair
     */
    static bool decryptSourceUrl(const QString &hex, QString &decoded);

    /**
     * @brief Build the clock.json URL for a (possibly obfuscated) source URL
     * @return Invalid QUrl when the reference cannot be decoded
     */
    static QUrl clockUrl(const QString &sourceUrl);

    static QUrl graphqlUrl(const QString &query, const QByteArray &variablesJson);

    static bool parseSearchResponse(const QByteArray &json, QList<ProviderShow> &shows, QString *errorString = nullptr);

    /**
     * @brief Parse an episode query response
     * @return NotFound when data.episode is null, TransportError when malformed
     */
    static Status parseEpisodeResponse(const QByteArray &json, QList<SourceCandidate> &candidates,
                                       QString *errorString = nullptr);

    /**
     * @brief Pick the stream link from a clock.json response
     *
     * The link whose resolutionStr equals "<quality>p", otherwise the last
     * link listed.
     */
    static bool parseClockResponse(const QByteArray &json, const QString &quality,
                                   QString &link, QString *errorString = nullptr);

    static const char *const ApiEndpoint;
    static const char *const ApiReferer;
    static const char *const StreamReferer;
    static const char *const ClockBase;
    static const char *const BrowserUserAgent;
    static const int SearchLimit = 50;

private:
    HttpClient *m_http;
    QString m_translationType;
    QString m_quality;
};

#endif // ALLANIMEPROVIDER_H
