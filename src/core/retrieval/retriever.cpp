#include "core/retrieval/retriever.h"
#include "core/retrieval/hybrid_ranker.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QStringList>

#include <algorithm>
#include <exception>

namespace ul {

namespace {

bool isCancelled(const std::atomic<bool>* cancel)
{
    return cancel != nullptr && cancel->load();
}

bool hasValue(const std::optional<QString>& value)
{
    return value.has_value() && !value->isEmpty();
}

void truncate(std::vector<Chunk>& chunks, int k)
{
    if (static_cast<int>(chunks.size()) > k) {
        chunks.resize(static_cast<size_t>(k));
    }
}

} // namespace

RetrieverConfig RetrieverConfig::fromSettings(const Settings& settings)
{
    RetrieverConfig config;
    config.topK = settings.topK;
    config.scoreThreshold = settings.scoreThreshold;
    config.rerank = settings.rerank;
    config.hybridSearch = settings.hybridSearch;
    config.keywordWeight = settings.keywordWeight;
    return config;
}

Retriever::Retriever(MultiLevelIndex* index, RelevanceCompressor* compressor,
                     const Config& config)
    : m_index(index)
    , m_compressor(compressor)
    , m_config(config)
{
    if (m_config.topK < 1) {
        m_config.topK = 1;
    }
}

RetrievalOutcome Retriever::retrieve(const RetrievalQuery& request)
{
    RetrievalOutcome outcome;
    QElapsedTimer timer;
    timer.start();

    if (request.query.trimmed().isEmpty()) {
        outcome.error = ErrorInfo::make(ErrorKind::Validation, QStringLiteral("Empty query"),
                                        QStringLiteral("retrieve"));
        return outcome;
    }

    const int k = std::max(1, request.k.value_or(m_config.topK));
    const bool useRerank = request.rerank.value_or(m_config.rerank);

    std::vector<Chunk> chunks;
    if (request.tier.has_value()) {
        SearchOutcome fetched = searchSpecificTier(request, k);
        if (!fetched.ok()) {
            outcome.error = fetched.error;
            return outcome;
        }
        chunks = std::move(fetched.chunks);
        outcome.cancelled = fetched.cancelled;
    } else {
        HierarchicalSearchOutcome fetched = m_index->searchHierarchical(
            request.query, request.municipality, request.province, request.region, k * 2,
            request.cancel);
        chunks = std::move(fetched.chunks);
        outcome.tierFailures = std::move(fetched.tierFailures);
        outcome.cancelled = fetched.cancelled;
    }

    if (!outcome.cancelled && isCancelled(request.cancel)) {
        outcome.cancelled = true;
    }

    if (!outcome.cancelled && m_config.hybridSearch) {
        HybridConfig hybrid;
        hybrid.keywordWeight = m_config.keywordWeight;
        chunks = HybridRanker::rank(request.query, chunks, hybrid);
    }

    if (!outcome.cancelled && isCancelled(request.cancel)) {
        outcome.cancelled = true;
    }

    if (!outcome.cancelled && useRerank && static_cast<int>(chunks.size()) > k) {
        chunks = rerank(request.query, chunks, k, request.cancel, outcome);
    }

    if (m_config.scoreThreshold > 0.0) {
        chunks = filterByScore(std::move(chunks));
    }

    truncate(chunks, k);
    outcome.chunks = std::move(chunks);

    LOG_INFO(ulRetrieval, "Retrieved %d chunks for '%s' (k=%d, rerank=%s%s%s) in %lld ms",
             static_cast<int>(outcome.chunks.size()), qUtf8Printable(request.query), k,
             useRerank ? "on" : "off", outcome.rerankFellBack ? ", fell back" : "",
             outcome.cancelled ? ", cancelled" : "", static_cast<long long>(timer.elapsed()));
    return outcome;
}

SearchOutcome Retriever::searchSpecificTier(const RetrievalQuery& request, int k)
{
    const std::optional<HierarchyLevel> level = hierarchyLevelFromTierName(*request.tier);
    if (!level.has_value()) {
        SearchOutcome outcome;
        outcome.error = ErrorInfo::make(
            ErrorKind::Validation,
            QStringLiteral("Unknown tier '%1'").arg(*request.tier),
            QStringLiteral("retrieve"), *request.tier);
        return outcome;
    }

    MetadataFilter filter;
    switch (*level) {
    case HierarchyLevel::Nazionale:
        break;
    case HierarchyLevel::Comunale:
        if (hasValue(request.municipality)) {
            filter.insert(QLatin1String(metakey::kMunicipality), *request.municipality);
            break;
        }
        [[fallthrough]];
    case HierarchyLevel::Provinciale:
    case HierarchyLevel::Regionale:
        if (hasValue(request.province)) {
            filter.insert(QLatin1String(metakey::kProvince), *request.province);
        } else if (hasValue(request.region)) {
            filter.insert(QLatin1String(metakey::kRegion), *request.region);
        }
        break;
    }

    return m_index->searchTier(*level, request.query, k, filter, request.cancel);
}

std::vector<Chunk> Retriever::rerank(const QString& query, const std::vector<Chunk>& chunks,
                                     int k, const std::atomic<bool>* cancel,
                                     RetrievalOutcome& outcome)
{
    outcome.rerankFellBack = false;

    ErrorInfo failure;
    if (m_compressor == nullptr || !m_compressor->isAvailable()) {
        failure = ErrorInfo::make(ErrorKind::RerankUnavailable,
                                  QStringLiteral("No relevance compressor available"),
                                  QStringLiteral("rerank"));
    } else {
        try {
            CompressionResult compressed = m_compressor->compress(query, chunks, cancel);
            if (compressed.cancelled) {
                // Partial extracts would mix with uncompressed chunks.
                outcome.cancelled = true;
                std::vector<Chunk> original = chunks;
                truncate(original, k);
                return original;
            }
            if (compressed.ok()) {
                LOG_DEBUG(ulRetrieval, "Re-rank kept %d of %d chunks",
                          static_cast<int>(compressed.chunks.size()),
                          static_cast<int>(chunks.size()));
                truncate(compressed.chunks, k);
                return std::move(compressed.chunks);
            }
            failure = compressed.error;
            failure.kind = ErrorKind::RerankUnavailable;
        } catch (const std::exception& e) {
            failure = ErrorInfo::make(ErrorKind::RerankUnavailable,
                                      QString::fromUtf8(e.what()), QStringLiteral("rerank"));
        }
    }

    LOG_WARN(ulRetrieval, "Re-rank failed, keeping original order: %s",
             qUtf8Printable(failure.toString()));
    outcome.rerankFellBack = true;
    std::vector<Chunk> fallback = chunks;
    truncate(fallback, k);
    return fallback;
}

std::vector<Chunk> Retriever::filterByScore(std::vector<Chunk> chunks) const
{
    const size_t before = chunks.size();
    chunks.erase(std::remove_if(chunks.begin(), chunks.end(),
                                [this](const Chunk& chunk) {
                                    return chunk.metadata.score.has_value()
                                        && *chunk.metadata.score < m_config.scoreThreshold;
                                }),
                 chunks.end());
    if (chunks.size() < before) {
        LOG_DEBUG(ulRetrieval, "Dropped %d chunks below score %.2f",
                  static_cast<int>(before - chunks.size()), m_config.scoreThreshold);
    }
    return chunks;
}

QString Retriever::referenceFor(const Chunk& chunk, int ordinal)
{
    const ChunkMetadata& metadata = chunk.metadata;
    QStringList parts;

    const QString law = metadata.lawReference();
    if (!law.isEmpty()) {
        parts.append(law);
    }
    if (hasValue(metadata.article)) {
        parts.append(QStringLiteral("Art. %1").arg(*metadata.article));
    }
    if (metadata.normativeLevel == NormativeLevel::Comunale && hasValue(metadata.municipality)) {
        parts.append(QStringLiteral("Comune di %1").arg(*metadata.municipality));
    } else if (metadata.normativeLevel == NormativeLevel::Regionale && hasValue(metadata.province)) {
        parts.append(QStringLiteral("Provincia di %1").arg(*metadata.province));
    } else if (metadata.normativeLevel == NormativeLevel::Regionale && hasValue(metadata.region)) {
        parts.append(QStringLiteral("Regione %1").arg(*metadata.region));
    }

    if (parts.isEmpty()) {
        return QStringLiteral("Documento %1").arg(ordinal);
    }
    return parts.join(QStringLiteral(" - "));
}

QString Retriever::formatContext(const std::vector<Chunk>& chunks)
{
    QStringList blocks;
    for (size_t i = 0; i < chunks.size(); ++i) {
        blocks.append(QStringLiteral("[%1]\n%2\n")
                          .arg(referenceFor(chunks[i], static_cast<int>(i) + 1), chunks[i].text));
    }
    return blocks.join(QStringLiteral("\n---\n\n"));
}

std::vector<Citation> Retriever::getCitations(const std::vector<Chunk>& chunks)
{
    return citationsFor(chunks);
}

} // namespace ul
