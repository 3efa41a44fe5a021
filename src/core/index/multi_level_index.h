#pragma once

#include "core/embedding/embedding_service.h"
#include "core/index/level_index_manager.h"
#include "core/vector/index_backend.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace ul {

struct RouterConfig {
    int tierTimeoutMs = 5000;
    LevelIndexConfig levelConfig;
};

struct TierFailure {
    HierarchyLevel level = HierarchyLevel::Nazionale;
    ErrorInfo error;
    bool timedOut = false;
};

struct HierarchicalSearchOutcome {
    // Comunale, Provinciale, Regionale, Nazionale; each tier in backend order.
    std::vector<Chunk> chunks;
    std::vector<TierFailure> tierFailures;
    bool cancelled = false;
};

struct IndexStatsReport {
    std::map<NormativeLevel, CollectionStats> levels;
    int total = 0;
    ErrorInfo error;
};

// MultiLevelIndex -- routes ingestion and queries across the tier
// collections, one LevelIndexManager per NormativeLevel over a shared
// backend.
//
// Provincial law lives in the regional collection and is selected by its
// province key.
//
// searchHierarchical() runs one thread per consulted tier and waits at most
// tierTimeoutMs for each. A tier that fails or times out contributes nothing
// and is reported; the others are unaffected. Threads that outlive their
// wait stay owned by the router and are joined on destruction. Cancellation
// and timeouts reach the workers, which then skip their backend query if it
// has not started.
class MultiLevelIndex {
public:
    using Config = RouterConfig;

    MultiLevelIndex(std::shared_ptr<IndexBackend> backend,
                    std::shared_ptr<EmbeddingService> embeddings,
                    const Config& config = {});
    ~MultiLevelIndex();

    MultiLevelIndex(const MultiLevelIndex&) = delete;
    MultiLevelIndex& operator=(const MultiLevelIndex&) = delete;

    LevelIndexManager& manager(NormativeLevel level);

    // tierName: "nazionale", "regionale", "provinciale" (stored as regional)
    // or "comunale".
    UpsertResult addDocuments(const std::vector<Chunk>& chunks, const QString& tierName);

    // Re-ingestion: chunks become the only records of the given source
    // files in the tier's collection. See LevelIndexManager::replace().
    ReplaceResult replaceDocuments(const std::vector<Chunk>& chunks, const QString& tierName,
                                   const QStringList& sources);

    // Chunks are stamped with level and the filter's geography.
    SearchOutcome searchTier(HierarchyLevel level, const QString& query, int k,
                             const MetadataFilter& filter = {},
                             const std::atomic<bool>* cancel = nullptr);

    // National law is always consulted; the other tiers when their
    // geography is supplied.
    HierarchicalSearchOutcome searchHierarchical(const QString& query,
                                                 const std::optional<QString>& municipality,
                                                 const std::optional<QString>& province,
                                                 const std::optional<QString>& region,
                                                 int kPerTier,
                                                 const std::atomic<bool>* cancel = nullptr);

    // A failing level maps to an empty list.
    std::map<NormativeLevel, std::vector<Chunk>> searchAllLevels(const QString& query,
                                                                 int kPerLevel);

    IndexStatsReport stats();

    const Config& config() const { return m_config; }

private:
    struct TierWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinishedWorkers();

    std::shared_ptr<IndexBackend> m_backend;
    std::shared_ptr<EmbeddingService> m_embeddings;
    Config m_config;
    std::map<NormativeLevel, std::unique_ptr<LevelIndexManager>> m_managers;

    std::mutex m_workersMutex;
    std::vector<TierWorker> m_workers;
};

} // namespace ul
