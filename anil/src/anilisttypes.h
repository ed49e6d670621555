#ifndef ANILISTTYPES_H
#define ANILISTTYPES_H

#include <QString>
#include <QStringList>
#include <QList>

/**
 * @brief AniList partial date, any component may be missing
 */
struct FuzzyDate
{
    int year;
    int month;
    int day;

    FuzzyDate() : year(0), month(0), day(0) {}

    /**
     * @brief YYYY-MM-DD, YYYY-MM, YYYY or "?" depending on what is known
     */
    QString toString() const;
};

struct MediaTitle
{
    QString romaji;
    QString english;
    QString native;
};

/**
 * @brief One anime entry from the AniList Page.media list
 */
struct AniListMedia
{
    int id;
    MediaTitle title;
    int episodes;             // 0 when unknown
    QString description;
    int averageScore;         // 0 when unknown
    int popularity;
    int favourites;
    QStringList genres;
    QStringList studios;
    QStringList synonyms;
    QStringList tags;
    QString status;
    QString format;
    QString coverImage;
    QString trailerId;
    QString trailerSite;
    FuzzyDate startDate;
    FuzzyDate endDate;

    AniListMedia() : id(0), episodes(0), averageScore(0), popularity(0), favourites(0) {}

    /**
     * @brief English title, else romaji, else native, else "Unknown Title"
     */
    QString preferredTitle() const;
};

struct AniListPage
{
    int total;
    int currentPage;
    bool hasNextPage;
    QList<AniListMedia> media;

    AniListPage() : total(0), currentPage(0), hasNextPage(false) {}
};

struct AniListUser
{
    int id;
    QString name;

    AniListUser() : id(0) {}
};

/**
 * @brief Entry on the user's list (MediaList / SaveMediaListEntry)
 */
struct MediaListEntry
{
    int id;
    int mediaId;
    QString status;
    int progress;
    double score;

    MediaListEntry() : id(0), mediaId(0), progress(0), score(0.0) {}
};

#endif // ANILISTTYPES_H
