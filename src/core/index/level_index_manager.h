#pragma once

#include "core/embedding/embedding_service.h"
#include "core/shared/chunk.h"
#include "core/shared/error.h"
#include "core/vector/index_backend.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <optional>
#include <vector>

namespace ul {

struct LevelIndexConfig {
    int upsertBatchSize = 100;
};

struct ScoredChunk {
    Chunk chunk;
    // Cosine similarity, 1 - distance.
    double score = 0.0;
};

struct UpsertResult {
    // Ids of every chunk in the batches committed before any failure.
    QStringList ids;
    // 0-based index of the batch that failed, if any.
    std::optional<int> failedBatch;
    ErrorInfo error;

    bool ok() const { return error.ok(); }
};

struct ReplaceResult {
    // Ids of the new chunks; empty when a failed upsert was rolled back.
    QStringList ids;
    // Records of the replaced sources removed once the new ones were stored.
    int superseded = 0;
    ErrorInfo error;

    bool ok() const { return error.ok(); }
};

struct SearchOutcome {
    std::vector<Chunk> chunks;
    ErrorInfo error;
    // Stopped by the cancel flag before the backend was queried; not an error.
    bool cancelled = false;

    bool ok() const { return error.ok(); }
};

struct ScoredSearchOutcome {
    std::vector<ScoredChunk> hits;
    ErrorInfo error;

    bool ok() const { return error.ok(); }
};

struct DeleteOutcome {
    int count = 0;
    ErrorInfo error;

    bool ok() const { return error.ok(); }
};

struct CollectionStats {
    QString collectionName;
    int count = 0;
    QString embeddingModelId;
    ErrorInfo error;
};

// LevelIndexManager -- the collection of one normative tier.
//
// Chunks are embedded through the EmbeddingService (pseudo embedding when
// the model is unavailable) and written in batches of upsertBatchSize.
// Batches commit in order; on failure the ids of the batches already
// committed are returned together with the failing batch index.
//
// Borrowed backend and embedding service must outlive the manager.
class LevelIndexManager {
public:
    using Config = LevelIndexConfig;

    LevelIndexManager(NormativeLevel level, IndexBackend* backend,
                      EmbeddingService* embeddings, const Config& config = {});

    NormativeLevel level() const { return m_level; }
    const QString& collectionName() const { return m_collection; }

    // "normative_nazionale", "normative_regionale", "normative_comunale".
    static QString collectionNameFor(NormativeLevel level);

    UpsertResult upsert(const std::vector<Chunk>& chunks);

    // Stores chunks as the new version of the given source files. The old
    // records of those sources are deleted only after every batch has been
    // stored; a failed upsert removes the batches it committed, leaving the
    // old version in place.
    ReplaceResult replace(const std::vector<Chunk>& chunks, const QStringList& sources);

    // The cancel flag is checked before embedding and again before the
    // backend query.
    SearchOutcome search(const QString& query, int k, const MetadataFilter& filter = {},
                         const std::atomic<bool>* cancel = nullptr);

    // Hits scoring below minScore are removed.
    ScoredSearchOutcome searchWithScore(const QString& query, int k,
                                        const MetadataFilter& filter = {},
                                        std::optional<double> minScore = std::nullopt);

    // Empty filter is a ValidationError; use reset() to empty the collection.
    DeleteOutcome deleteByMetadata(const MetadataFilter& filter);

    CollectionStats stats();

    ErrorInfo reset();

private:
    ErrorInfo validateFilter(const MetadataFilter& filter, const QString& operation) const;
    std::optional<BackendQueryResult> runQuery(const QString& query, int k,
                                               const MetadataFilter& filter,
                                               const std::atomic<bool>* cancel = nullptr);

    NormativeLevel m_level;
    QString m_collection;
    IndexBackend* m_backend = nullptr;
    EmbeddingService* m_embeddings = nullptr;
    Config m_config;
};

} // namespace ul
