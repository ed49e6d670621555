#include "titlematcher.h"
#include <QVector>
#include <algorithm>

QString TitleMatcher::normalize(const QString &title)
{
    QString folded;
    folded.reserve(title.size());
    for (const QChar &c : title.toLower()) {
        folded.append(c.isLetterOrNumber() ? c : QChar(' '));
    }
    return folded.simplified();
}

int TitleMatcher::editDistance(const QString &a, const QString &b)
{
    const int n = a.size();
    const int m = b.size();
    if (n == 0) {
        return m;
    }
    if (m == 0) {
        return n;
    }

    // Two rolling rows of the DP table
    QVector<int> previous(m + 1);
    QVector<int> current(m + 1);
    for (int j = 0; j <= m; ++j) {
        previous[j] = j;
    }

    for (int i = 1; i <= n; ++i) {
        current[0] = i;
        for (int j = 1; j <= m; ++j) {
            int cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            current[j] = std::min({ previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost });
        }
        std::swap(previous, current);
    }
    return previous[m];
}

double TitleMatcher::similarity(const QString &a, const QString &b)
{
    const int longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(editDistance(a, b)) / longest;
}

int TitleMatcher::bestMatch(const QString &query, const QList<ProviderShow> &shows)
{
    const QString wanted = normalize(query);
    int best = -1;
    double bestScore = -1.0;

    for (int i = 0; i < shows.size(); ++i) {
        double score = similarity(normalize(shows[i].name), wanted);
        if (score > bestScore) {
            bestScore = score;
            best = i;
        }
    }
    return best;
}
