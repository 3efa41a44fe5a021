#include "core/retrieval/hybrid_ranker.h"

#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <utility>

namespace {

const QSet<QString>& italianStopWords()
{
    static const QSet<QString> words = {
        QStringLiteral("il"),    QStringLiteral("lo"),    QStringLiteral("la"),
        QStringLiteral("i"),     QStringLiteral("gli"),   QStringLiteral("le"),
        QStringLiteral("un"),    QStringLiteral("uno"),   QStringLiteral("una"),
        QStringLiteral("di"),    QStringLiteral("a"),     QStringLiteral("da"),
        QStringLiteral("in"),    QStringLiteral("con"),   QStringLiteral("su"),
        QStringLiteral("per"),   QStringLiteral("tra"),   QStringLiteral("fra"),
        QStringLiteral("è"),     QStringLiteral("sono"),  QStringLiteral("sia"),
        QStringLiteral("come"),  QStringLiteral("quale"), QStringLiteral("quali"),
        QStringLiteral("che"),   QStringLiteral("cosa"),
    };
    return words;
}

} // namespace

namespace ul {

QStringList HybridRanker::extractKeywords(const QString& query)
{
    const QStringList tokens = query.toLower().split(QRegularExpression(QStringLiteral("\\s+")),
                                                     Qt::SkipEmptyParts);
    QStringList keywords;
    for (const QString& token : tokens) {
        if (token.size() > 2 && !italianStopWords().contains(token)) {
            keywords.append(token);
        }
    }
    return keywords;
}

double HybridRanker::keywordMatchScore(const QString& text, const QStringList& keywords)
{
    if (keywords.isEmpty()) {
        return 0.0;
    }
    const QString lowered = text.toLower();
    int matches = 0;
    for (const QString& keyword : keywords) {
        if (lowered.contains(keyword)) {
            ++matches;
        }
    }
    return static_cast<double>(matches) / static_cast<double>(keywords.size());
}

std::vector<Chunk> HybridRanker::rank(const QString& query,
                                      const std::vector<Chunk>& chunks,
                                      HybridConfig config)
{
    if (chunks.empty()) {
        return {};
    }

    const double weight = std::clamp(config.keywordWeight, 0.0, 1.0);
    const QStringList keywords = extractKeywords(query);
    const double total = static_cast<double>(chunks.size());

    std::vector<std::pair<double, Chunk>> scored;
    scored.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        const double semantic = 1.0 - static_cast<double>(i) / total;
        const double keyword = keywordMatchScore(chunks[i].text, keywords);
        const double combined = (1.0 - weight) * semantic + weight * keyword;

        scored.emplace_back(combined, chunks[i]);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<Chunk> ranked;
    ranked.reserve(scored.size());
    for (auto& entry : scored) {
        ranked.push_back(std::move(entry.second));
    }
    return ranked;
}

} // namespace ul
