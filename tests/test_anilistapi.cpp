#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include "../anil/src/anilistapi.h"
#include "../anil/src/anilisttypes.h"
#include "../anil/src/logger.h"

class TestAniListApi : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() { Logger::setConsoleEcho(false); }

    void testFuzzyDate();
    void testPreferredTitle();
    void testSearchVariables();
    void testBuildPayload();
    void testParseMediaPage();
    void testParseMediaPageErrors();
    void testParseViewer();
    void testParseViewerRejected();
    void testParseMediaListEntry();
    void testErrorMessage();
};

void TestAniListApi::testFuzzyDate()
{
    FuzzyDate date;
    QCOMPARE(date.toString(), QString("?"));

    date.year = 2023;
    QCOMPARE(date.toString(), QString("2023"));

    date.month = 9;
    QCOMPARE(date.toString(), QString("2023-09"));

    date.day = 29;
    QCOMPARE(date.toString(), QString("2023-09-29"));
}

void TestAniListApi::testPreferredTitle()
{
    AniListMedia media;
    QCOMPARE(media.preferredTitle(), QString("Unknown Title"));

    media.title.native = QString::fromUtf8("葬送のフリーレン");
    QCOMPARE(media.preferredTitle(), QString::fromUtf8("葬送のフリーレン"));

    media.title.romaji = "Sousou no Frieren";
    QCOMPARE(media.preferredTitle(), QString("Sousou no Frieren"));

    media.title.english = "Frieren: Beyond Journey's End";
    QCOMPARE(media.preferredTitle(), QString("Frieren: Beyond Journey's End"));
}

void TestAniListApi::testSearchVariables()
{
    QJsonObject withSearch = AniListApi::searchVariables("frieren");
    QCOMPARE(withSearch.value("search").toString(), QString("frieren"));
    QCOMPARE(withSearch.value("perPage").toInt(), 20);
    QCOMPARE(withSearch.value("sort").toString(), QString("POPULARITY_DESC"));

    // Trending and popular lists send no search term at all
    QJsonObject trending = AniListApi::searchVariables(QString(), 10, "TRENDING_DESC");
    QVERIFY(!trending.contains("search"));
    QCOMPARE(trending.value("perPage").toInt(), 10);
    QCOMPARE(trending.value("sort").toString(), QString("TRENDING_DESC"));
}

void TestAniListApi::testBuildPayload()
{
    QJsonObject variables;
    variables.insert("mediaId", 154587);

    QByteArray payload = AniListApi::buildPayload("query { Viewer { id } }", variables);
    QJsonObject object = QJsonDocument::fromJson(payload).object();

    QCOMPARE(object.value("query").toString(), QString("query { Viewer { id } }"));
    QCOMPARE(object.value("variables").toObject().value("mediaId").toInt(), 154587);
}

void TestAniListApi::testParseMediaPage()
{
    QByteArray json = R"({"data":{"Page":{
        "pageInfo":{"total":2,"currentPage":1,"hasNextPage":false},
        "media":[{
            "id":154587,
            "title":{"romaji":"Sousou no Frieren","english":"Frieren: Beyond Journey's End","native":"x"},
            "episodes":28,"averageScore":91,"popularity":500000,"favourites":60000,
            "description":"An elf mage...","status":"FINISHED","format":"TV",
            "genres":["Adventure","Drama"],"synonyms":["Frieren"],
            "studios":{"nodes":[{"name":"Madhouse"}]},
            "tags":[{"name":"Elf"},{"name":"Magic"}],
            "coverImage":{"large":"https://img.test/frieren.jpg"},
            "trailer":{"id":"qgQ","site":"youtube"},
            "startDate":{"year":2023,"month":9,"day":29},
            "endDate":{"year":2024,"month":3,"day":null}
        },{
            "id":1,"title":{"romaji":"Cowboy Bebop"},"episodes":null,"averageScore":null
        }]
    }}})";

    AniListPage page;
    QVERIFY(AniListApi::parseMediaPage(json, page));

    QCOMPARE(page.total, 2);
    QCOMPARE(page.currentPage, 1);
    QVERIFY(!page.hasNextPage);
    QCOMPARE(page.media.size(), 2);

    const AniListMedia &frieren = page.media[0];
    QCOMPARE(frieren.id, 154587);
    QCOMPARE(frieren.episodes, 28);
    QCOMPARE(frieren.averageScore, 91);
    QCOMPARE(frieren.genres, QStringList() << "Adventure" << "Drama");
    QCOMPARE(frieren.studios, QStringList() << "Madhouse");
    QCOMPARE(frieren.tags, QStringList() << "Elf" << "Magic");
    QCOMPARE(frieren.coverImage, QString("https://img.test/frieren.jpg"));
    QCOMPARE(frieren.trailerSite, QString("youtube"));
    QCOMPARE(frieren.startDate.toString(), QString("2023-09-29"));
    QCOMPARE(frieren.endDate.toString(), QString("2024-03"));

    const AniListMedia &bebop = page.media[1];
    QCOMPARE(bebop.preferredTitle(), QString("Cowboy Bebop"));
    QCOMPARE(bebop.episodes, 0);
    QCOMPARE(bebop.averageScore, 0);
    QCOMPARE(bebop.startDate.toString(), QString("?"));
}

void TestAniListApi::testParseMediaPageErrors()
{
    AniListPage page;
    QString error;

    QVERIFY(!AniListApi::parseMediaPage("garbage", page, &error));
    QVERIFY(!error.isEmpty());

    QVERIFY(!AniListApi::parseMediaPage("{\"data\":null,\"errors\":[{\"message\":\"Too Many Requests.\",\"status\":429}]}",
                                        page, &error));
    QCOMPARE(error, QString("Too Many Requests."));

    QVERIFY(!AniListApi::parseMediaPage("{\"data\":{}}", page, &error));
}

void TestAniListApi::testParseViewer()
{
    AniListUser user;
    QVERIFY(AniListApi::parseViewer("{\"data\":{\"Viewer\":{\"id\":42,\"name\":\"himmel\"}}}", user));
    QCOMPARE(user.id, 42);
    QCOMPARE(user.name, QString("himmel"));
}

void TestAniListApi::testParseViewerRejected()
{
    AniListUser user;
    QString error;
    QVERIFY(!AniListApi::parseViewer("{\"data\":{\"Viewer\":null}}", user, &error));
    QVERIFY(!error.isEmpty());
}

void TestAniListApi::testParseMediaListEntry()
{
    QByteArray json = R"({"data":{"SaveMediaListEntry":{"id":9,"mediaId":154587,"status":"CURRENT","progress":5,"score":8.5}}})";

    MediaListEntry entry;
    QVERIFY(AniListApi::parseMediaListEntry(json, "SaveMediaListEntry", entry));
    QCOMPARE(entry.id, 9);
    QCOMPARE(entry.mediaId, 154587);
    QCOMPARE(entry.status, QString("CURRENT"));
    QCOMPARE(entry.progress, 5);
    QCOMPARE(entry.score, 8.5);

    QString error;
    QVERIFY(!AniListApi::parseMediaListEntry(json, "MediaList", entry, &error));
    QVERIFY(error.contains("MediaList"));
}

void TestAniListApi::testErrorMessage()
{
    QCOMPARE(AniListApi::errorMessage("{\"errors\":[{\"message\":\"Invalid token\"}]}"), QString("Invalid token"));
    QVERIFY(AniListApi::errorMessage("{\"data\":{}}").isEmpty());
    QVERIFY(AniListApi::errorMessage("nope").isEmpty());
}

QTEST_GUILESS_MAIN(TestAniListApi)
#include "test_anilistapi.moc"
