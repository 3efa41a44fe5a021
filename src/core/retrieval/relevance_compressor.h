#pragma once

#include "core/shared/chunk.h"
#include "core/shared/error.h"

#include <QString>

#include <atomic>
#include <vector>

namespace ul {

struct CompressionResult {
    std::vector<Chunk> chunks;
    ErrorInfo error;
    // Stopped early by the cancel flag; chunks hold what was done so far.
    bool cancelled = false;

    bool ok() const { return error.ok(); }
};

// RelevanceCompressor -- reduces retrieved chunks to the parts relevant to
// the query, dropping chunks with nothing relevant. Unreliable by nature;
// callers keep a fallback for any failure.
class RelevanceCompressor {
public:
    virtual ~RelevanceCompressor() = default;

    virtual bool isAvailable() const { return true; }
    virtual CompressionResult compress(const QString& query,
                                       const std::vector<Chunk>& documents,
                                       const std::atomic<bool>* cancel = nullptr) = 0;
};

} // namespace ul
