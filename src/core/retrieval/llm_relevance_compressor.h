#pragma once

#include "core/llm/completion_router.h"
#include "core/retrieval/relevance_compressor.h"

namespace ul {

// LlmRelevanceCompressor -- asks a language model, one chunk at a time, for
// the verbatim extract that answers the query.
//
// A reply of NO_OUTPUT drops the chunk; any other reply replaces its text
// and keeps its metadata. One failed completion fails the whole call. The
// cancel flag is checked before each completion.
class LlmRelevanceCompressor : public RelevanceCompressor {
public:
    // Borrowed router must outlive the compressor.
    explicit LlmRelevanceCompressor(CompletionRouter* router);

    bool isAvailable() const override;
    CompressionResult compress(const QString& query,
                               const std::vector<Chunk>& documents,
                               const std::atomic<bool>* cancel = nullptr) override;

    static QString buildPrompt(const QString& query, const QString& context);

    static constexpr const char* kNoOutput = "NO_OUTPUT";

private:
    CompletionRouter* m_router = nullptr;
};

} // namespace ul
