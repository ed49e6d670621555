#include "sourceselector.h"

QStringList SourceSelector::defaultPriorities()
{
    return QStringList() << "S-mp4" << "Luf-mp4" << "Luf-Mp4" << "Sak" << "Default" << "Yt-mp4";
}

int SourceSelector::selectPreferred(const QStringList &priorities,
                                    const QList<SourceCandidate> &candidates)
{
    for (const QString &label : priorities) {
        for (int i = 0; i < candidates.size(); ++i) {
            if (candidates[i].sourceName == label) {
                return i;
            }
        }
    }
    return -1;
}

QList<SourceCandidate> SourceSelector::orderByPriority(const QStringList &priorities,
                                                       const QList<SourceCandidate> &candidates)
{
    QList<SourceCandidate> ordered;
    QList<bool> taken(candidates.size(), false);

    for (const QString &label : priorities) {
        for (int i = 0; i < candidates.size(); ++i) {
            if (!taken[i] && candidates[i].sourceName == label) {
                ordered.append(candidates[i]);
                taken[i] = true;
            }
        }
    }

    // Anything the priority list does not know about, in list order
    for (int i = 0; i < candidates.size(); ++i) {
        if (!taken[i]) {
            ordered.append(candidates[i]);
        }
    }

    return ordered;
}
