#include "allanimeprovider.h"
#include "httpclient.h"
#include "logger.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonParseError>

const char *const AllAnimeProvider::ApiEndpoint = "https://api.allanime.day/api";
const char *const AllAnimeProvider::ApiReferer = "https://allanime.to/";
const char *const AllAnimeProvider::StreamReferer = "https://allanime.day/";
const char *const AllAnimeProvider::ClockBase = "https://allanime.day";
const char *const AllAnimeProvider::BrowserUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

namespace {

const char *const kSearchQuery =
    "query($search: SearchInput, $limit: Int, $page: Int, "
    "$translationType: VaildTranslationTypeEnumType, $countryOrigin: VaildCountryOriginEnumType) {"
    " shows(search: $search, limit: $limit, page: $page, translationType: $translationType, countryOrigin: $countryOrigin) {"
    " edges { _id name availableEpisodes } } }";

const char *const kEpisodeQuery =
    "query($showId: String!, $translationType: VaildTranslationTypeEnumType!, $episodeString: String!) {"
    " episode(showId: $showId, translationType: $translationType, episodeString: $episodeString) {"
    " sourceUrls } }";

const int kSourceXorKey = 56;

// -1 for anything but 0-9, a-f, A-F
int hexDigitValue(QChar c)
{
    const ushort u = c.unicode();
    if (u >= '0' && u <= '9') {
        return u - '0';
    }
    if (u >= 'a' && u <= 'f') {
        return u - 'a' + 10;
    }
    if (u >= 'A' && u <= 'F') {
        return u - 'A' + 10;
    }
    return -1;
}

bool parseDataObject(const QByteArray &json, QJsonObject &data, QString *errorString)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString) {
            *errorString = QString("Invalid response: %1").arg(parseError.errorString());
        }
        return false;
    }
    QJsonValue value = doc.object().value("data");
    if (!value.isObject()) {
        if (errorString) {
            *errorString = "Response has no data object";
        }
        return false;
    }
    data = value.toObject();
    return true;
}

}

AllAnimeProvider::AllAnimeProvider(const QString &translationType, const QString &quality, QObject *parent)
    : QObject(parent)
    , m_http(new HttpClient(this))
    , m_translationType(translationType)
    , m_quality(quality)
{
    HttpClient::HeaderList headers;
    headers << qMakePair(QByteArray("Referer"), QByteArray(ApiReferer));
    headers << qMakePair(QByteArray("User-Agent"), QByteArray(BrowserUserAgent));
    m_http->setDefaultHeaders(headers);
}

bool AllAnimeProvider::search(const QString &query, QList<ProviderShow> &shows, QString *errorString)
{
    LOG(QString("Searching provider for '%1' [%2]").arg(query, m_translationType));

    QJsonObject search;
    search.insert("allowAdult", false);
    search.insert("allowUnknown", false);
    search.insert("query", query);

    QJsonObject variables;
    variables.insert("search", search);
    variables.insert("limit", SearchLimit);
    variables.insert("page", 1);
    variables.insert("translationType", m_translationType);
    variables.insert("countryOrigin", "ALL");

    HttpResponse response = m_http->get(graphqlUrl(kSearchQuery, QJsonDocument(variables).toJson(QJsonDocument::Compact)));
    if (!response.ok) {
        if (errorString) {
            *errorString = response.errorString;
        }
        return false;
    }

    if (!parseSearchResponse(response.body, shows, errorString)) {
        return false;
    }
    LOG(QString("Provider returned %1 shows").arg(shows.size()));
    return true;
}

StreamResolver::Status AllAnimeProvider::episodeSources(const QString &showId, const QString &episode,
                                                        QList<SourceCandidate> &candidates,
                                                        QString *errorString)
{
    LOG(QString("Fetching %1 sources for show %2, episode %3").arg(m_translationType, showId, episode));

    QJsonObject variables;
    variables.insert("showId", showId);
    variables.insert("translationType", m_translationType);
    variables.insert("episodeString", episode);

    HttpResponse response = m_http->get(graphqlUrl(kEpisodeQuery, QJsonDocument(variables).toJson(QJsonDocument::Compact)));
    if (!response.ok) {
        if (errorString) {
            *errorString = response.errorString;
        }
        return TransportError;
    }

    Status status = parseEpisodeResponse(response.body, candidates, errorString);
    if (status == NotFound && errorString) {
        *errorString = QString("Episode %1 not found for show %2").arg(episode, showId);
    }
    return status;
}

bool AllAnimeProvider::extractStream(const QString &sourceUrl, PlaybackRequest &request, QString *errorString)
{
    QUrl url = clockUrl(sourceUrl);
    if (!url.isValid()) {
        if (errorString) {
            *errorString = "Could not decode source URL";
        }
        return false;
    }

    LOG(QString("Resolving stream from %1").arg(url.toString()));
    HttpResponse response = m_http->get(url);
    if (!response.ok) {
        if (errorString) {
            *errorString = response.errorString;
        }
        return false;
    }

    QString link;
    if (!parseClockResponse(response.body, m_quality, link, errorString)) {
        return false;
    }

    request = PlaybackRequest();
    request.url = link;
    request.title = "Anime Stream";
    request.headers << qMakePair(QString("User-Agent"), QString(BrowserUserAgent));
    request.headers << qMakePair(QString("Referer"), QString(StreamReferer));
    return true;
}

bool AllAnimeProvider::decryptSourceUrl(const QString &hex, QString &decoded)
{
    if (hex.size() % 2 != 0) {
        return false;
    }

    QString result;
    result.reserve(hex.size() / 2);
    for (int i = 0; i < hex.size(); i += 2) {
        int high = hexDigitValue(hex[i]);
        int low = hexDigitValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        result.append(QChar(((high << 4) | low) ^ kSourceXorKey));
    }

    decoded = result;
    return true;
}

QUrl AllAnimeProvider::clockUrl(const QString &sourceUrl)
{
    QString path = sourceUrl;
    if (path.startsWith("--")) {
        if (!decryptSourceUrl(path.mid(2), path)) {
            return QUrl();
        }
    }
    if (!path.startsWith('/')) {
        path.prepend('/');
    }
    path.replace("clock", "clock.json");
    return QUrl(QString(ClockBase) + path);
}

QUrl AllAnimeProvider::graphqlUrl(const QString &query, const QByteArray &variablesJson)
{
    // Encoded by hand so braces, quotes and '+' survive exactly
    QUrl url(ApiEndpoint);
    QString encodedQuery = QString("variables=%1&query=%2")
        .arg(QString::fromLatin1(QUrl::toPercentEncoding(QString::fromUtf8(variablesJson))),
             QString::fromLatin1(QUrl::toPercentEncoding(query)));
    url.setQuery(encodedQuery, QUrl::StrictMode);
    return url;
}

bool AllAnimeProvider::parseSearchResponse(const QByteArray &json, QList<ProviderShow> &shows, QString *errorString)
{
    QJsonObject data;
    if (!parseDataObject(json, data, errorString)) {
        return false;
    }

    shows.clear();
    const QJsonArray edges = data.value("shows").toObject().value("edges").toArray();
    for (const QJsonValue &edgeValue : edges) {
        QJsonObject edge = edgeValue.toObject();
        ProviderShow show;
        show.id = edge.value("_id").toString();
        show.name = edge.value("name").toString();
        QJsonObject available = edge.value("availableEpisodes").toObject();
        show.subEpisodes = available.value("sub").toInt();
        show.dubEpisodes = available.value("dub").toInt();
        show.rawEpisodes = available.value("raw").toInt();
        if (!show.id.isEmpty()) {
            shows.append(show);
        }
    }
    return true;
}

StreamResolver::Status AllAnimeProvider::parseEpisodeResponse(const QByteArray &json, QList<SourceCandidate> &candidates,
                                                              QString *errorString)
{
    QJsonObject data;
    if (!parseDataObject(json, data, errorString)) {
        return TransportError;
    }

    // A null episode means the aggregator has no such episode
    QJsonValue episode = data.value("episode");
    if (!episode.isObject()) {
        return NotFound;
    }

    candidates.clear();
    const QJsonArray sources = episode.toObject().value("sourceUrls").toArray();
    for (const QJsonValue &sourceValue : sources) {
        QJsonObject source = sourceValue.toObject();
        SourceCandidate candidate(source.value("sourceName").toString(),
                                  source.value("sourceUrl").toString());
        if (!candidate.sourceUrl.isEmpty()) {
            candidates.append(candidate);
        }
    }
    LOG(QString("Found %1 source URLs").arg(candidates.size()));
    return Ok;
}

bool AllAnimeProvider::parseClockResponse(const QByteArray &json, const QString &quality,
                                          QString &link, QString *errorString)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString) {
            *errorString = QString("Invalid stream response: %1").arg(parseError.errorString());
        }
        return false;
    }

    const QJsonArray links = doc.object().value("links").toArray();
    if (links.isEmpty()) {
        if (errorString) {
            *errorString = "No stream links found";
        }
        return false;
    }

    const QString wanted = quality + "p";
    for (const QJsonValue &value : links) {
        QJsonObject entry = value.toObject();
        if (entry.value("resolutionStr").toString() == wanted) {
            link = entry.value("link").toString();
            return !link.isEmpty();
        }
    }

    link = links.last().toObject().value("link").toString();
    if (link.isEmpty()) {
        if (errorString) {
            *errorString = "Stream link is empty";
        }
        return false;
    }
    return true;
}
