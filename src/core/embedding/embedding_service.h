#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace ul {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct EmbeddingOutcome {
    std::vector<float> vector;
    // True when the pseudo embedding was used.
    bool degraded = false;
};

// EmbeddingService -- embeds text through an optional provider.
//
// When no provider is configured, the provider reports itself unavailable,
// returns a bad vector, throws, or the circuit breaker is open, the service
// answers with the pseudo embedding: a fixed unit vector of the configured
// dimension that does not depend on the text. Ingestion and query therefore
// keep working, with ranking left to keyword overlap.
//
// All vectors are L2-normalised so inner-product distance is 1 - cosine.
//
// Thread safety: embed() may be called from concurrent tier queries as long
// as the provider itself is thread-safe.
class EmbeddingService {
public:
    EmbeddingService(std::shared_ptr<EmbeddingProvider> provider, int dimensions,
                     const QString& modelId);
    ~EmbeddingService();

    EmbeddingService(const EmbeddingService&) = delete;
    EmbeddingService& operator=(const EmbeddingService&) = delete;

    EmbeddingOutcome embed(const QString& text);

    int dimensions() const { return m_dimensions; }
    QString modelId() const;
    bool hasProvider() const { return m_provider != nullptr; }

    // Same vector for every input.
    const std::vector<float>& pseudoEmbedding() const { return m_pseudo; }

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

    static std::vector<float> normalizeEmbedding(std::vector<float> embedding);

private:
    std::shared_ptr<EmbeddingProvider> m_provider;
    int m_dimensions = 0;
    QString m_modelId;
    std::vector<float> m_pseudo;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace ul
