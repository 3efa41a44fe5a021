#include "core/index/level_index_manager.h"
#include "core/shared/logging.h"

#include <QUuid>

#include <algorithm>

namespace ul {

namespace {

bool isCancelled(const std::atomic<bool>* cancel)
{
    return cancel != nullptr && cancel->load();
}

} // namespace

LevelIndexManager::LevelIndexManager(NormativeLevel level, IndexBackend* backend,
                                     EmbeddingService* embeddings, const Config& config)
    : m_level(level)
    , m_collection(collectionNameFor(level))
    , m_backend(backend)
    , m_embeddings(embeddings)
    , m_config(config)
{
    if (m_config.upsertBatchSize < 1) {
        m_config.upsertBatchSize = 1;
    }
}

QString LevelIndexManager::collectionNameFor(NormativeLevel level)
{
    return QStringLiteral("normative_") + normativeLevelToString(level);
}

ErrorInfo LevelIndexManager::validateFilter(const MetadataFilter& filter,
                                            const QString& operation) const
{
    for (auto it = filter.constBegin(); it != filter.constEnd(); ++it) {
        if (!isValidMetadataKey(it.key())) {
            return ErrorInfo::make(ErrorKind::Validation,
                                   QStringLiteral("Invalid metadata key '%1'").arg(it.key()),
                                   operation, normativeLevelToString(m_level));
        }
    }
    return ErrorInfo();
}

UpsertResult LevelIndexManager::upsert(const std::vector<Chunk>& chunks)
{
    UpsertResult result;
    const QString operation = QStringLiteral("upsert");
    const QString tier = normativeLevelToString(m_level);

    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].text.trimmed().isEmpty()) {
            result.error = ErrorInfo::make(ErrorKind::Validation,
                                           QStringLiteral("Chunk %1 has empty text").arg(i),
                                           operation, tier);
            return result;
        }
    }

    const size_t batchSize = static_cast<size_t>(m_config.upsertBatchSize);
    int batchIndex = 0;
    int degraded = 0;
    for (size_t start = 0; start < chunks.size(); start += batchSize, ++batchIndex) {
        const size_t end = std::min(start + batchSize, chunks.size());

        std::vector<IndexRecord> records;
        records.reserve(end - start);
        QStringList batchIds;
        for (size_t i = start; i < end; ++i) {
            const Chunk& chunk = chunks[i];
            EmbeddingOutcome embedded = m_embeddings->embed(chunk.text);
            if (embedded.degraded) {
                ++degraded;
            }

            IndexRecord record;
            record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            record.text = chunk.text;
            record.metadata = toMetadataMap(chunk.metadata);
            record.vector = std::move(embedded.vector);
            batchIds.append(record.id);
            records.push_back(std::move(record));
        }

        const ErrorInfo batchError = m_backend->upsert(m_collection, records);
        if (!batchError.ok()) {
            result.failedBatch = batchIndex;
            result.error = ErrorInfo::make(
                ErrorKind::Backend,
                QStringLiteral("Batch %1 failed: %2").arg(batchIndex).arg(batchError.message),
                operation, tier);
            LOG_ERROR(ulIndex, "%s (%d ids committed before failure)",
                      qUtf8Printable(result.error.toString()), static_cast<int>(result.ids.size()));
            return result;
        }

        result.ids.append(batchIds);
        LOG_DEBUG(ulIndex, "Committed batch %d (%d chunks) into %s", batchIndex,
                  static_cast<int>(records.size()), qUtf8Printable(m_collection));
    }

    if (degraded > 0) {
        LOG_WARN(ulIndex, "%d of %d chunks in %s indexed with pseudo embeddings", degraded,
                 static_cast<int>(chunks.size()), qUtf8Printable(m_collection));
    }
    LOG_INFO(ulIndex, "Indexed %d chunks into %s", static_cast<int>(result.ids.size()),
             qUtf8Printable(m_collection));
    return result;
}

ReplaceResult LevelIndexManager::replace(const std::vector<Chunk>& chunks,
                                        const QStringList& sources)
{
    ReplaceResult result;
    const QString operation = QStringLiteral("replace");
    const QString tier = normativeLevelToString(m_level);

    QStringList previous;
    for (const QString& source : sources) {
        MetadataFilter filter;
        filter.insert(QLatin1String(metakey::kSource), source);
        const BackendIdsResult found = m_backend->findIds(m_collection, filter);
        if (!found.error.ok()) {
            result.error = found.error;
            result.error.operation = operation;
            result.error.tier = tier;
            return result;
        }
        previous.append(found.ids);
    }

    const UpsertResult upserted = upsert(chunks);
    if (!upserted.ok()) {
        result.error = upserted.error;
        result.error.operation = operation;
        if (!upserted.ids.isEmpty()) {
            const BackendDeleteResult undone = m_backend->deleteIds(m_collection, upserted.ids);
            if (!undone.error.ok()) {
                result.ids = upserted.ids;
                result.error.message += QStringLiteral("; rollback failed: %1")
                                            .arg(undone.error.message);
                LOG_ERROR(ulIndex, "%s", qUtf8Printable(result.error.toString()));
                return result;
            }
        }
        LOG_WARN(ulIndex, "Replacement in %s failed, kept %d previous chunks",
                 qUtf8Printable(m_collection), static_cast<int>(previous.size()));
        return result;
    }
    result.ids = upserted.ids;

    if (!previous.isEmpty()) {
        const BackendDeleteResult removed = m_backend->deleteIds(m_collection, previous);
        if (!removed.error.ok()) {
            // Both versions are stored; the next replace removes the old one.
            result.error = removed.error;
            result.error.operation = operation;
            result.error.tier = tier;
            LOG_ERROR(ulIndex, "%s", qUtf8Printable(result.error.toString()));
            return result;
        }
        result.superseded = static_cast<int>(removed.deletedIds.size());
    }

    LOG_INFO(ulIndex, "Replaced %d chunks with %d in %s", result.superseded,
             static_cast<int>(result.ids.size()), qUtf8Printable(m_collection));
    return result;
}

// nullopt when cancelled.
std::optional<BackendQueryResult> LevelIndexManager::runQuery(const QString& query, int k,
                                                              const MetadataFilter& filter,
                                                              const std::atomic<bool>* cancel)
{
    if (isCancelled(cancel)) {
        return std::nullopt;
    }
    const EmbeddingOutcome embedded = m_embeddings->embed(query);
    if (isCancelled(cancel)) {
        return std::nullopt;
    }
    BackendQueryResult queried = m_backend->query(m_collection, embedded.vector, k, filter);
    if (!queried.error.ok()) {
        queried.error.operation = QStringLiteral("search");
        queried.error.tier = normativeLevelToString(m_level);
    }
    return queried;
}

SearchOutcome LevelIndexManager::search(const QString& query, int k, const MetadataFilter& filter,
                                        const std::atomic<bool>* cancel)
{
    SearchOutcome outcome;
    outcome.error = validateFilter(filter, QStringLiteral("search"));
    if (!outcome.error.ok() || k <= 0) {
        return outcome;
    }

    std::optional<BackendQueryResult> queried = runQuery(query, k, filter, cancel);
    if (!queried.has_value()) {
        LOG_DEBUG(ulIndex, "Search in %s cancelled", qUtf8Printable(m_collection));
        outcome.cancelled = true;
        return outcome;
    }
    if (!queried->error.ok()) {
        outcome.error = queried->error;
        return outcome;
    }

    outcome.chunks.reserve(queried->hits.size());
    for (const BackendHit& hit : queried->hits) {
        Chunk chunk;
        chunk.text = hit.text;
        chunk.metadata = fromMetadataMap(hit.metadata);
        outcome.chunks.push_back(std::move(chunk));
    }

    LOG_DEBUG(ulIndex, "Search in %s returned %d chunks", qUtf8Printable(m_collection),
              static_cast<int>(outcome.chunks.size()));
    return outcome;
}

ScoredSearchOutcome LevelIndexManager::searchWithScore(const QString& query, int k,
                                                       const MetadataFilter& filter,
                                                       std::optional<double> minScore)
{
    ScoredSearchOutcome outcome;
    outcome.error = validateFilter(filter, QStringLiteral("searchWithScore"));
    if (!outcome.error.ok() || k <= 0) {
        return outcome;
    }

    const std::optional<BackendQueryResult> queried = runQuery(query, k, filter);
    if (!queried.has_value()) {
        return outcome;
    }
    if (!queried->error.ok()) {
        outcome.error = queried->error;
        outcome.error.operation = QStringLiteral("searchWithScore");
        return outcome;
    }

    for (const BackendHit& hit : queried->hits) {
        const double score = 1.0 - static_cast<double>(hit.distance);
        if (minScore.has_value() && score < *minScore) {
            continue;
        }
        ScoredChunk scored;
        scored.chunk.text = hit.text;
        scored.chunk.metadata = fromMetadataMap(hit.metadata);
        scored.chunk.metadata.score = score;
        scored.score = score;
        outcome.hits.push_back(std::move(scored));
    }
    return outcome;
}

DeleteOutcome LevelIndexManager::deleteByMetadata(const MetadataFilter& filter)
{
    DeleteOutcome outcome;
    const QString operation = QStringLiteral("deleteByMetadata");

    if (filter.isEmpty()) {
        outcome.error = ErrorInfo::make(
            ErrorKind::Validation,
            QStringLiteral("Refusing to delete with an empty filter, use reset()"),
            operation, normativeLevelToString(m_level));
        return outcome;
    }
    outcome.error = validateFilter(filter, operation);
    if (!outcome.error.ok()) {
        return outcome;
    }

    BackendDeleteResult deleted = m_backend->deleteWhere(m_collection, filter);
    if (!deleted.error.ok()) {
        outcome.error = deleted.error;
        outcome.error.operation = operation;
        outcome.error.tier = normativeLevelToString(m_level);
        return outcome;
    }

    outcome.count = static_cast<int>(deleted.deletedIds.size());
    LOG_INFO(ulIndex, "Deleted %d chunks from %s", outcome.count, qUtf8Printable(m_collection));
    return outcome;
}

CollectionStats LevelIndexManager::stats()
{
    CollectionStats stats;
    stats.collectionName = m_collection;
    stats.embeddingModelId = m_embeddings->modelId();

    const BackendCountResult counted = m_backend->count(m_collection);
    if (!counted.error.ok()) {
        stats.error = counted.error;
        stats.error.operation = QStringLiteral("stats");
        return stats;
    }
    stats.count = counted.count;
    return stats;
}

ErrorInfo LevelIndexManager::reset()
{
    LOG_WARN(ulIndex, "Resetting collection %s", qUtf8Printable(m_collection));
    ErrorInfo error = m_backend->clear(m_collection);
    if (!error.ok()) {
        error.operation = QStringLiteral("reset");
        error.tier = normativeLevelToString(m_level);
    }
    return error;
}

} // namespace ul
