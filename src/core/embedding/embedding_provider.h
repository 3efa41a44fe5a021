#pragma once

#include <QString>

#include <vector>

namespace ul {

// EmbeddingProvider -- maps text to a fixed-dimension vector.
//
// Implementations wrap a concrete model outside this library. An empty
// vector (or one of the wrong size) means the embedding failed; callers
// treat that like an unavailable provider.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<float> embed(const QString& text) = 0;
    virtual int dimensions() const = 0;
    virtual QString modelId() const = 0;
    virtual bool isAvailable() const = 0;
};

} // namespace ul
