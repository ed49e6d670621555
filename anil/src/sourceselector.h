#ifndef SOURCESELECTOR_H
#define SOURCESELECTOR_H

#include <QList>
#include <QStringList>
#include "streamresolver.h"

/**
 * SourceSelector - priority policy over the aggregator's candidate sources
 *
 * Some source labels are known to extract reliably and are tried first.
 * The selector only reorders what the resolver returned; it never creates
 * a candidate.
 */
class SourceSelector
{
public:
    /**
     * @brief Preferred source labels, most reliable first
     */
    static QStringList defaultPriorities();

    /**
     * @brief Pick the preferred candidate
     *
     * The first label in priority order that has at least one exact match
     * wins, even when a lower priority candidate appears earlier in the
     * list. Within that label the first candidate in list order is chosen.
     *
     * @return Index into candidates, or -1 when no preferred label is present
     */
    static int selectPreferred(const QStringList &priorities,
                               const QList<SourceCandidate> &candidates);

    /**
     * @brief Full extraction order
     *
     * Candidates grouped by priority label in priority order, followed by
     * every remaining candidate in list order.
     */
    static QList<SourceCandidate> orderByPriority(const QStringList &priorities,
                                                  const QList<SourceCandidate> &candidates);
};

#endif // SOURCESELECTOR_H
