#include "core/embedding/embedding_service.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <random>

namespace ul {

namespace {

constexpr uint32_t kPseudoSeed = 0x55524c58;  // fixed across runs and builds

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

std::vector<float> makePseudoEmbedding(int dimensions)
{
    std::vector<float> values(static_cast<size_t>(std::max(dimensions, 1)));
    // Raw engine output only: minstd_rand is fully specified, distributions are not.
    std::minstd_rand engine(kPseudoSeed);
    for (float& value : values) {
        value = static_cast<float>(engine()) / static_cast<float>(std::minstd_rand::max()) - 0.5f;
    }
    return EmbeddingService::normalizeEmbedding(std::move(values));
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // In open state -- check if enough time has elapsed for half-open
    const int64_t lastFail = lastFailureTime.load();
    if (steadyNowMs() - lastFail >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

EmbeddingService::EmbeddingService(std::shared_ptr<EmbeddingProvider> provider, int dimensions,
                                   const QString& modelId)
    : m_provider(std::move(provider))
    , m_dimensions(dimensions > 0 ? dimensions : 1)
    , m_modelId(modelId)
    , m_pseudo(makePseudoEmbedding(m_dimensions))
{
    if (m_provider && m_provider->dimensions() != m_dimensions) {
        LOG_WARN(ulIndex, "Embedding provider %s reports %d dimensions, index expects %d",
                 qUtf8Printable(m_provider->modelId()), m_provider->dimensions(), m_dimensions);
    }
    if (!m_provider) {
        LOG_WARN(ulIndex, "No embedding provider configured, using pseudo embeddings");
    }
}

EmbeddingService::~EmbeddingService() = default;

QString EmbeddingService::modelId() const
{
    if (m_provider) {
        return m_provider->modelId();
    }
    return m_modelId;
}

std::vector<float> EmbeddingService::normalizeEmbedding(std::vector<float> embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

EmbeddingOutcome EmbeddingService::embed(const QString& text)
{
    EmbeddingOutcome outcome;

    if (!m_provider || !m_provider->isAvailable() || m_circuitBreaker.isOpen()) {
        outcome.vector = m_pseudo;
        outcome.degraded = true;
        return outcome;
    }

    std::vector<float> embedding;
    try {
        embedding = m_provider->embed(text);
    } catch (const std::exception& e) {
        LOG_WARN(ulIndex, "Embedding provider threw: %s", e.what());
        embedding.clear();
    }

    if (embedding.size() != static_cast<size_t>(m_dimensions)) {
        m_circuitBreaker.recordFailure();
        LOG_WARN(ulIndex, "Embedding failed (%d values, expected %d), using pseudo embedding",
                 static_cast<int>(embedding.size()), m_dimensions);
        outcome.vector = m_pseudo;
        outcome.degraded = true;
        return outcome;
    }

    m_circuitBreaker.recordSuccess();
    outcome.vector = normalizeEmbedding(std::move(embedding));
    return outcome;
}

} // namespace ul
