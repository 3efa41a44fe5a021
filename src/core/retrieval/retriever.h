#pragma once

#include "core/index/multi_level_index.h"
#include "core/retrieval/citation.h"
#include "core/retrieval/relevance_compressor.h"
#include "core/shared/settings.h"

#include <QString>

#include <atomic>
#include <optional>
#include <vector>

namespace ul {

struct RetrieverConfig {
    int topK = 5;
    // Chunks whose recorded score is below this are dropped; 0 disables.
    double scoreThreshold = 0.7;
    bool rerank = true;
    bool hybridSearch = true;
    double keywordWeight = 0.3;

    static RetrieverConfig fromSettings(const Settings& settings);
};

struct RetrievalQuery {
    QString query;
    std::optional<QString> municipality;
    std::optional<QString> region;
    std::optional<QString> province;
    // "nazionale", "regionale", "provinciale" or "comunale"; hierarchical
    // search across all applicable tiers when unset.
    std::optional<QString> tier;
    std::optional<int> k;
    std::optional<bool> rerank;
    const std::atomic<bool>* cancel = nullptr;
};

struct RetrievalOutcome {
    std::vector<Chunk> chunks;
    ErrorInfo error;
    bool rerankFellBack = false;
    bool cancelled = false;
    std::vector<TierFailure> tierFailures;

    bool ok() const { return error.ok(); }
};

// Retriever -- the query pipeline: fetch, hybrid re-score, optional
// re-rank, score threshold, top k.
//
// The compressor is optional; without one (or when it fails) re-ranking
// falls back to the hybrid order and the outcome is flagged, not failed.
class Retriever {
public:
    using Config = RetrieverConfig;

    // Borrowed pointers must outlive the retriever.
    Retriever(MultiLevelIndex* index, RelevanceCompressor* compressor,
              const Config& config = {});

    RetrievalOutcome retrieve(const RetrievalQuery& request);

    // "[LR 38/1999 - Art. 12 - Regione Lazio]\n<text>\n" blocks joined by
    // "\n---\n\n". "Documento <i>" when a chunk has no reference.
    static QString formatContext(const std::vector<Chunk>& chunks);
    static QString referenceFor(const Chunk& chunk, int ordinal);

    static std::vector<Citation> getCitations(const std::vector<Chunk>& chunks);

    const Config& config() const { return m_config; }

private:
    SearchOutcome searchSpecificTier(const RetrievalQuery& request, int k);
    // Sets rerankFellBack or cancelled on the outcome.
    std::vector<Chunk> rerank(const QString& query, const std::vector<Chunk>& chunks, int k,
                              const std::atomic<bool>* cancel, RetrievalOutcome& outcome);
    std::vector<Chunk> filterByScore(std::vector<Chunk> chunks) const;

    MultiLevelIndex* m_index = nullptr;
    RelevanceCompressor* m_compressor = nullptr;
    Config m_config;
};

} // namespace ul
