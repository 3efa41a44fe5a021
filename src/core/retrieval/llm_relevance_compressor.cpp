#include "core/retrieval/llm_relevance_compressor.h"
#include "core/shared/logging.h"

namespace ul {

LlmRelevanceCompressor::LlmRelevanceCompressor(CompletionRouter* router)
    : m_router(router)
{
}

bool LlmRelevanceCompressor::isAvailable() const
{
    return m_router != nullptr && m_router->hasProviders();
}

QString LlmRelevanceCompressor::buildPrompt(const QString& query, const QString& context)
{
    return QStringLiteral(
               "Given the following question and context, extract any part of the context "
               "*AS IS* that is relevant to answer the question. If none of the context is "
               "relevant return %1.\n\n"
               "Remember, *DO NOT* edit the extracted parts of the context.\n\n"
               "> Question: %2\n"
               "> Context:\n>>>\n%3\n>>>\n"
               "Extracted relevant parts:")
        .arg(QLatin1String(kNoOutput), query, context);
}

CompressionResult LlmRelevanceCompressor::compress(const QString& query,
                                                   const std::vector<Chunk>& documents,
                                                   const std::atomic<bool>* cancel)
{
    CompressionResult result;
    if (!isAvailable()) {
        result.error = ErrorInfo::make(ErrorKind::RerankUnavailable,
                                       QStringLiteral("No completion provider for re-ranking"),
                                       QStringLiteral("compress"));
        return result;
    }

    result.chunks.reserve(documents.size());
    for (size_t i = 0; i < documents.size(); ++i) {
        if (cancel != nullptr && cancel->load()) {
            LOG_DEBUG(ulRetrieval, "Compression cancelled after %d of %d chunks",
                      static_cast<int>(i), static_cast<int>(documents.size()));
            result.cancelled = true;
            return result;
        }

        const Chunk& document = documents[i];
        const CompletionResult completion =
            m_router->invokeWithFallback(TaskType::Rerank, buildPrompt(query, document.text));
        if (!completion.ok()) {
            result.chunks.clear();
            result.error = ErrorInfo::make(ErrorKind::RerankUnavailable,
                                           completion.error.message,
                                           QStringLiteral("compress"));
            return result;
        }

        const QString extract = completion.text->trimmed();
        if (extract.isEmpty() || extract == QLatin1String(kNoOutput)) {
            continue;
        }

        Chunk compressed = document;
        compressed.text = extract;
        result.chunks.push_back(std::move(compressed));
    }

    LOG_DEBUG(ulRetrieval, "Compressed %d chunks to %d",
              static_cast<int>(documents.size()), static_cast<int>(result.chunks.size()));
    return result;
}

} // namespace ul
