#ifndef TITLEMATCHER_H
#define TITLEMATCHER_H

#include <QString>
#include <QList>
#include "streamresolver.h"

/**
 * TitleMatcher - maps an AniList title onto the aggregator's show list
 *
 * The aggregator names shows differently (season suffixes, punctuation,
 * romanization), so the show is picked by normalized edit distance rather
 * than exact comparison.
 */
class TitleMatcher
{
public:
    /**
     * @brief Lower-case, punctuation folded to spaces, whitespace collapsed
     */
    static QString normalize(const QString &title);

    /**
     * @brief Levenshtein distance between two strings
     */
    static int editDistance(const QString &a, const QString &b);

    /**
     * @brief 1 - distance / max(length), 1.0 for two empty strings
     */
    static double similarity(const QString &a, const QString &b);

    /**
     * @brief Index of the show whose normalized name is most similar to query
     * @return -1 for an empty list; the first show wins ties
     */
    static int bestMatch(const QString &query, const QList<ProviderShow> &shows);
};

#endif // TITLEMATCHER_H
