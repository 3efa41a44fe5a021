#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace ul {

struct HybridConfig {
    // Share of the combined score given to keyword overlap.
    double keywordWeight = 0.3;
};

class HybridRanker {
public:
    // Lower-cased whitespace tokens longer than two characters, Italian stop
    // words removed. Order and duplicates are kept.
    static QStringList extractKeywords(const QString& query);

    // Fraction of keywords found as substrings of the lower-cased text.
    static double keywordMatchScore(const QString& text, const QStringList& keywords);

    // Re-orders chunks by (1 - w) * (1 - i/N) + w * keywordMatch, stable
    // descending. The combined score stays internal; metadata.score is left
    // as the backend recorded it.
    static std::vector<Chunk> rank(const QString& query,
                                   const std::vector<Chunk>& chunks,
                                   HybridConfig config = {});
};

} // namespace ul
