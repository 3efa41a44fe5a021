#pragma once

#include <QString>

namespace ul {

struct Settings {
    // Index storage
    QString indexPath;

    // Embedding
    QString embeddingModelId = QStringLiteral("paraphrase-multilingual-mpnet-base-v2");
    int embeddingDimensions = 768;

    // Chunking (characters)
    int chunkSize = 1000;
    int chunkOverlap = 200;
    double articleOverflowFactor = 1.5;

    // Indexing
    int upsertBatchSize = 100;

    // Retrieval
    int topK = 5;
    double scoreThreshold = 0.7;
    bool rerank = true;
    bool hybridSearch = true;
    double keywordWeight = 0.3;
    int tierTimeoutMs = 5000;
};

} // namespace ul
