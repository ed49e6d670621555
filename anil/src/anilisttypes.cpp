#include "anilisttypes.h"

QString FuzzyDate::toString() const
{
    if (year > 0 && month > 0 && day > 0) {
        return QString("%1-%2-%3")
            .arg(year, 4, 10, QChar('0'))
            .arg(month, 2, 10, QChar('0'))
            .arg(day, 2, 10, QChar('0'));
    }
    if (year > 0 && month > 0) {
        return QString("%1-%2").arg(year, 4, 10, QChar('0')).arg(month, 2, 10, QChar('0'));
    }
    if (year > 0) {
        return QString("%1").arg(year, 4, 10, QChar('0'));
    }
    return "?";
}

QString AniListMedia::preferredTitle() const
{
    if (!title.english.isEmpty()) {
        return title.english;
    }
    if (!title.romaji.isEmpty()) {
        return title.romaji;
    }
    if (!title.native.isEmpty()) {
        return title.native;
    }
    return "Unknown Title";
}
