#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace ul {

// VectorIndex -- one HNSW graph (inner-product space) per collection.
//
// Vectors are expected to be L2-normalised; distance is 1 - cosine.
// Labels are assigned sequentially, so ascending label is insertion order
// and is used to break distance ties.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    struct IndexMetadata {
        int schemaVersion = 1;
        int dimensions = 0;
        std::string modelId = "unknown";
        std::string collection;
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;
    // Filtered searches over at most this many candidates are answered exactly.
    static constexpr size_t kExactSearchLimit = 2048;

    VectorIndex();
    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool configure(const IndexMetadata& metadata);
    bool create(int initialCapacity = kInitialCapacity);
    bool load(const std::string& indexPath, const std::string& metaPath);
    bool save(const std::string& indexPath, const std::string& metaPath);

    // Returns UINT64_MAX on failure.
    uint64_t addVector(const float* embedding);
    bool deleteVector(uint64_t label);

    // allowedLabels == nullptr searches the whole graph; an empty set
    // matches nothing.
    std::vector<KnnResult> search(const float* queryVector, int k,
                                  const std::unordered_set<uint64_t>* allowedLabels = nullptr);

    int totalElements() const;
    int deletedElements() const;
    int liveElements() const;
    bool isAvailable() const;
    uint64_t nextLabel() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

private:
    bool ensureCapacityForOneMore();
    std::vector<KnnResult> exactSearch(const float* queryVector, int k,
                                       const std::unordered_set<uint64_t>& labels);

    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    uint64_t m_nextLabel = 0;
    int m_deletedCount = 0;
    mutable std::mutex m_writeMutex;
};

} // namespace ul
