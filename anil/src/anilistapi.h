#ifndef ANILISTAPI_H
#define ANILISTAPI_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include <QJsonObject>
#include "anilisttypes.h"

class HttpClient;

/**
 * @brief Client for the AniList GraphQL API
 *
 * Covers what the player needs: media search/browse, token verification
 * and reading/updating the user's episode progress. All calls block.
 */
class AniListApi : public QObject
{
    Q_OBJECT

public:
    explicit AniListApi(QObject *parent = nullptr);

    /**
     * @brief Browse or search anime
     * @param variables GraphQL variables: search, perPage, page, sort, id_in
     */
    bool searchMedia(const QJsonObject &variables, AniListPage &page, QString *errorString = nullptr);

    /**
     * @brief Resolve the user owning a token
     */
    bool viewer(const QString &token, AniListUser &user, QString *errorString = nullptr);

    /**
     * @brief Read the user's progress for an anime
     *
     * An anime that is not on the user's list reports progress 0 and
     * succeeds.
     */
    bool userProgress(const QString &token, int mediaId, const QString &userName,
                      int *progress, QString *errorString = nullptr);

    /**
     * @brief Save progress and status for an anime on the user's list
     */
    bool updateProgress(const QString &token, int mediaId, int progress, const QString &status,
                        MediaListEntry *saved = nullptr, QString *errorString = nullptr);

    // === Payloads and parsers ===

    static QByteArray buildPayload(const QString &query, const QJsonObject &variables);

    static QJsonObject searchVariables(const QString &search, int perPage = 20,
                                       const QString &sort = "POPULARITY_DESC");

    static bool parseMediaPage(const QByteArray &json, AniListPage &page, QString *errorString = nullptr);
    static bool parseViewer(const QByteArray &json, AniListUser &user, QString *errorString = nullptr);

    /**
     * @brief Parse a MediaList or SaveMediaListEntry response
     * @param field "MediaList" or "SaveMediaListEntry"
     * @return false when the field is missing or null
     */
    static bool parseMediaListEntry(const QByteArray &json, const QString &field,
                                    MediaListEntry &entry, QString *errorString = nullptr);

    /**
     * @brief First message of a GraphQL "errors" array, empty when none
     */
    static QString errorMessage(const QByteArray &json);

    static const char *const Endpoint;

private:
    bool execute(const QString &query, const QJsonObject &variables, const QString &token,
                 QByteArray &body, int *status, QString *errorString);

    HttpClient *m_http;
};

#endif // ANILISTAPI_H
