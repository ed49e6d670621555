#include "anilistapi.h"
#include "httpclient.h"
#include "logger.h"
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonParseError>
#include <QUrl>

const char *const AniListApi::Endpoint = "https://graphql.anilist.co";

namespace {

const char *const kMediaQuery = R"(
query ($search: String, $perPage: Int, $page: Int, $sort: [MediaSort], $id_in: [Int]) {
  Page(perPage: $perPage, page: $page) {
    pageInfo { total currentPage hasNextPage }
    media(search: $search, id_in: $id_in, sort: $sort, type: ANIME) {
      id
      title { romaji english native }
      coverImage { large }
      episodes
      averageScore
      popularity
      favourites
      status
      format
      genres
      synonyms
      description
      startDate { year month day }
      endDate { year month day }
      studios { nodes { name } }
      tags { name }
      trailer { id site }
    }
  }
}
)";

const char *const kViewerQuery = R"(
query {
  Viewer { id name }
}
)";

const char *const kProgressQuery = R"(
query ($mediaId: Int, $userName: String) {
  MediaList(mediaId: $mediaId, userName: $userName) { id mediaId status progress score }
}
)";

const char *const kSaveEntryMutation = R"(
mutation ($mediaId: Int, $progress: Int, $status: MediaListStatus) {
  SaveMediaListEntry(mediaId: $mediaId, progress: $progress, status: $status) { id mediaId status progress score }
}
)";

bool dataObject(const QByteArray &json, QJsonObject &data, QString *errorString)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString) {
            *errorString = QString("Failed to parse AniList response: %1").arg(parseError.errorString());
        }
        return false;
    }
    QJsonValue value = doc.object().value("data");
    if (!value.isObject()) {
        if (errorString) {
            QString message = AniListApi::errorMessage(json);
            *errorString = message.isEmpty() ? QString("AniList response has no data") : message;
        }
        return false;
    }
    data = value.toObject();
    return true;
}

FuzzyDate parseDate(const QJsonValue &value)
{
    FuzzyDate date;
    QJsonObject object = value.toObject();
    date.year = object.value("year").toInt();
    date.month = object.value("month").toInt();
    date.day = object.value("day").toInt();
    return date;
}

QStringList stringList(const QJsonValue &value)
{
    QStringList list;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &item : array) {
        if (item.isString()) {
            list << item.toString();
        }
    }
    return list;
}

QStringList namesOf(const QJsonArray &array)
{
    QStringList names;
    for (const QJsonValue &item : array) {
        QString name = item.toObject().value("name").toString();
        if (!name.isEmpty()) {
            names << name;
        }
    }
    return names;
}

void fillEntry(const QJsonObject &object, MediaListEntry &entry)
{
    entry.id = object.value("id").toInt();
    entry.mediaId = object.value("mediaId").toInt();
    entry.status = object.value("status").toString();
    entry.progress = object.value("progress").toInt();
    entry.score = object.value("score").toDouble();
}

}

AniListApi::AniListApi(QObject *parent)
    : QObject(parent)
    , m_http(new HttpClient(this))
{
}

QByteArray AniListApi::buildPayload(const QString &query, const QJsonObject &variables)
{
    QJsonObject payload;
    payload.insert("query", query);
    payload.insert("variables", variables);
    return QJsonDocument(payload).toJson(QJsonDocument::Compact);
}

QJsonObject AniListApi::searchVariables(const QString &search, int perPage, const QString &sort)
{
    QJsonObject variables;
    if (!search.isEmpty()) {
        variables.insert("search", search);
    }
    variables.insert("perPage", perPage);
    variables.insert("sort", sort);
    return variables;
}

bool AniListApi::execute(const QString &query, const QJsonObject &variables, const QString &token,
                         QByteArray &body, int *status, QString *errorString)
{
    HttpClient::HeaderList headers;
    if (!token.isEmpty()) {
        headers << qMakePair(QByteArray("Authorization"), QString("Bearer %1").arg(token).toUtf8());
    }

    HttpResponse response = m_http->postJson(QUrl(Endpoint), buildPayload(query, variables), headers);
    body = response.body;
    if (status) {
        *status = response.status;
    }
    if (!response.ok) {
        if (errorString) {
            QString message = errorMessage(response.body);
            *errorString = QString("AniList API error: %1")
                .arg(message.isEmpty() ? response.errorString : message);
        }
        return false;
    }
    return true;
}

bool AniListApi::searchMedia(const QJsonObject &variables, AniListPage &page, QString *errorString)
{
    QByteArray body;
    if (!execute(kMediaQuery, variables, QString(), body, nullptr, errorString)) {
        return false;
    }
    return parseMediaPage(body, page, errorString);
}

bool AniListApi::viewer(const QString &token, AniListUser &user, QString *errorString)
{
    QByteArray body;
    if (!execute(kViewerQuery, QJsonObject(), token, body, nullptr, errorString)) {
        return false;
    }
    return parseViewer(body, user, errorString);
}

bool AniListApi::userProgress(const QString &token, int mediaId, const QString &userName,
                              int *progress, QString *errorString)
{
    QJsonObject variables;
    variables.insert("mediaId", mediaId);
    variables.insert("userName", userName);

    QByteArray body;
    int status = 0;
    if (!execute(kProgressQuery, variables, token, body, &status, errorString)) {
        // AniList answers 404 when the anime is not on the list
        if (status == 404) {
            if (progress) {
                *progress = 0;
            }
            return true;
        }
        return false;
    }

    MediaListEntry entry;
    if (!parseMediaListEntry(body, "MediaList", entry, nullptr)) {
        entry.progress = 0;
    }
    if (progress) {
        *progress = entry.progress;
    }
    return true;
}

bool AniListApi::updateProgress(const QString &token, int mediaId, int progress, const QString &status,
                                MediaListEntry *saved, QString *errorString)
{
    QJsonObject variables;
    variables.insert("mediaId", mediaId);
    variables.insert("progress", progress);
    variables.insert("status", status);

    LOG(QString("Updating AniList media %1 to episode %2 (%3)").arg(mediaId).arg(progress).arg(status));

    QByteArray body;
    if (!execute(kSaveEntryMutation, variables, token, body, nullptr, errorString)) {
        return false;
    }

    MediaListEntry entry;
    if (!parseMediaListEntry(body, "SaveMediaListEntry", entry, errorString)) {
        return false;
    }
    if (saved) {
        *saved = entry;
    }
    return true;
}

bool AniListApi::parseMediaPage(const QByteArray &json, AniListPage &page, QString *errorString)
{
    QJsonObject data;
    if (!dataObject(json, data, errorString)) {
        return false;
    }

    QJsonValue pageValue = data.value("Page");
    if (!pageValue.isObject()) {
        if (errorString) {
            *errorString = "AniList response has no Page";
        }
        return false;
    }

    QJsonObject pageObject = pageValue.toObject();
    QJsonObject pageInfo = pageObject.value("pageInfo").toObject();
    page.total = pageInfo.value("total").toInt();
    page.currentPage = pageInfo.value("currentPage").toInt();
    page.hasNextPage = pageInfo.value("hasNextPage").toBool();
    page.media.clear();

    const QJsonArray mediaArray = pageObject.value("media").toArray();
    for (const QJsonValue &value : mediaArray) {
        QJsonObject object = value.toObject();
        AniListMedia media;
        media.id = object.value("id").toInt();

        QJsonObject title = object.value("title").toObject();
        media.title.romaji = title.value("romaji").toString();
        media.title.english = title.value("english").toString();
        media.title.native = title.value("native").toString();

        media.episodes = object.value("episodes").toInt();
        media.description = object.value("description").toString();
        media.averageScore = object.value("averageScore").toInt();
        media.popularity = object.value("popularity").toInt();
        media.favourites = object.value("favourites").toInt();
        media.status = object.value("status").toString();
        media.format = object.value("format").toString();
        media.genres = stringList(object.value("genres"));
        media.synonyms = stringList(object.value("synonyms"));
        media.studios = namesOf(object.value("studios").toObject().value("nodes").toArray());
        media.tags = namesOf(object.value("tags").toArray());
        media.coverImage = object.value("coverImage").toObject().value("large").toString();

        QJsonObject trailer = object.value("trailer").toObject();
        media.trailerId = trailer.value("id").toString();
        media.trailerSite = trailer.value("site").toString();

        media.startDate = parseDate(object.value("startDate"));
        media.endDate = parseDate(object.value("endDate"));

        page.media.append(media);
    }
    return true;
}

bool AniListApi::parseViewer(const QByteArray &json, AniListUser &user, QString *errorString)
{
    QJsonObject data;
    if (!dataObject(json, data, errorString)) {
        return false;
    }

    QJsonObject viewer = data.value("Viewer").toObject();
    if (viewer.isEmpty()) {
        if (errorString) {
            *errorString = "Token was not accepted by AniList";
        }
        return false;
    }
    user.id = viewer.value("id").toInt();
    user.name = viewer.value("name").toString();
    return true;
}

bool AniListApi::parseMediaListEntry(const QByteArray &json, const QString &field,
                                     MediaListEntry &entry, QString *errorString)
{
    QJsonObject data;
    if (!dataObject(json, data, errorString)) {
        return false;
    }

    QJsonValue value = data.value(field);
    if (!value.isObject()) {
        if (errorString) {
            *errorString = QString("AniList response has no %1").arg(field);
        }
        return false;
    }
    fillEntry(value.toObject(), entry);
    return true;
}

QString AniListApi::errorMessage(const QByteArray &json)
{
    QJsonDocument doc = QJsonDocument::fromJson(json);
    if (!doc.isObject()) {
        return QString();
    }
    const QJsonArray errors = doc.object().value("errors").toArray();
    if (errors.isEmpty()) {
        return QString();
    }
    return errors.first().toObject().value("message").toString();
}
