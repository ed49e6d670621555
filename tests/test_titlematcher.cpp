#include <QtTest/QtTest>
#include "../anil/src/titlematcher.h"

class TestTitleMatcher : public QObject
{
    Q_OBJECT

private slots:
    void testNormalize();
    void testEditDistance();
    void testSimilarity();
    void testBestMatchPicksClosest();
    void testBestMatchIgnoresPunctuation();
    void testBestMatchEmptyList();
    void testBestMatchTieKeepsFirst();

private:
    static ProviderShow show(const QString &name)
    {
        ProviderShow s;
        s.id = name.toLower();
        s.name = name;
        return s;
    }
};

void TestTitleMatcher::testNormalize()
{
    QCOMPARE(TitleMatcher::normalize("  Re:ZERO -Starting Life-  "), QString("re zero starting life"));
    QCOMPARE(TitleMatcher::normalize("Steins;Gate 0"), QString("steins gate 0"));
    QCOMPARE(TitleMatcher::normalize(""), QString(""));
}

void TestTitleMatcher::testEditDistance()
{
    QCOMPARE(TitleMatcher::editDistance("kitten", "sitting"), 3);
    QCOMPARE(TitleMatcher::editDistance("", "abc"), 3);
    QCOMPARE(TitleMatcher::editDistance("abc", ""), 3);
    QCOMPARE(TitleMatcher::editDistance("same", "same"), 0);
}

void TestTitleMatcher::testSimilarity()
{
    QCOMPARE(TitleMatcher::similarity("", ""), 1.0);
    QCOMPARE(TitleMatcher::similarity("abcd", "abcd"), 1.0);
    QCOMPARE(TitleMatcher::similarity("abcd", "wxyz"), 0.0);
    QCOMPARE(TitleMatcher::similarity("abcd", "abce"), 0.75);
}

void TestTitleMatcher::testBestMatchPicksClosest()
{
    QList<ProviderShow> shows;
    shows << show("Frieren Specials") << show("Sousou no Frieren") << show("Sousou no Frieren 2nd Season");

    QCOMPARE(TitleMatcher::bestMatch("Sousou no Frieren", shows), 1);
}

void TestTitleMatcher::testBestMatchIgnoresPunctuation()
{
    QList<ProviderShow> shows;
    shows << show("Steins Gate 0") << show("Steins;Gate");

    QCOMPARE(TitleMatcher::bestMatch("STEINS;GATE", shows), 1);
}

void TestTitleMatcher::testBestMatchEmptyList()
{
    QCOMPARE(TitleMatcher::bestMatch("anything", QList<ProviderShow>()), -1);
}

void TestTitleMatcher::testBestMatchTieKeepsFirst()
{
    QList<ProviderShow> shows;
    shows << show("abcx") << show("abcy");

    QCOMPARE(TitleMatcher::bestMatch("abcz", shows), 0);
}

QTEST_GUILESS_MAIN(TestTitleMatcher)
#include "test_titlematcher.moc"
