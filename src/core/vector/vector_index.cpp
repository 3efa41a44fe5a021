#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QVariant>

#include <algorithm>
#include <limits>
#include <queue>

namespace ul {

namespace {

constexpr int kMetaVersion = 1;
constexpr uint64_t kInvalidLabel = std::numeric_limits<uint64_t>::max();

class AllowedLabelFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit AllowedLabelFilter(const std::unordered_set<uint64_t>& labels)
        : m_labels(labels)
    {
    }

    bool operator()(hnswlib::labeltype id) override
    {
        return m_labels.count(static_cast<uint64_t>(id)) > 0;
    }

private:
    const std::unordered_set<uint64_t>& m_labels;
};

bool knnLess(const VectorIndex::KnnResult& a, const VectorIndex::KnnResult& b)
{
    if (a.distance != b.distance) {
        return a.distance < b.distance;
    }
    return a.label < b.label;
}

} // namespace

VectorIndex::VectorIndex()
{
}

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex()
{
}

bool VectorIndex::configure(const IndexMetadata& metadata)
{
    if (m_index) {
        LOG_WARN(ulIndex, "VectorIndex::configure ignored: index already initialized");
        return false;
    }
    if (metadata.dimensions <= 0) {
        LOG_WARN(ulIndex, "VectorIndex::configure rejected invalid dimensions: %d",
                 metadata.dimensions);
        return false;
    }
    m_metadata = metadata;
    return true;
}

bool VectorIndex::create(int initialCapacity)
{
    if (m_metadata.dimensions <= 0) {
        LOG_ERROR(ulIndex, "VectorIndex::create requires a positive dimension");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        const int capacity = std::max(initialCapacity, 1);
        m_index.reset();
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_nextLabel = 0;
        m_deletedCount = 0;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ulIndex, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::load(const std::string& indexPath, const std::string& metaPath)
{
    QFileInfo indexInfo(QString::fromStdString(indexPath));
    if (!indexInfo.exists() || !indexInfo.isFile()) {
        LOG_ERROR(ulIndex, "VectorIndex::load missing index file: %s",
                  qUtf8Printable(indexInfo.filePath()));
        return false;
    }

    // Truncated payloads can crash HNSW deserialisation.
    constexpr qint64 kMinSerializedIndexBytes = 96;
    if (indexInfo.size() < kMinSerializedIndexBytes) {
        LOG_ERROR(ulIndex, "VectorIndex::load index payload too small: %lld",
                  static_cast<long long>(indexInfo.size()));
        return false;
    }

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::ReadOnly)) {
        LOG_ERROR(ulIndex, "VectorIndex::load failed to open meta file: %s",
                  qUtf8Printable(metaFile.fileName()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument metaDoc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    metaFile.close();
    if (parseError.error != QJsonParseError::NoError || !metaDoc.isObject()) {
        LOG_ERROR(ulIndex, "VectorIndex::load invalid meta JSON: %s",
                  qUtf8Printable(parseError.errorString()));
        return false;
    }

    const QJsonObject meta = metaDoc.object();
    const int dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    if (dimensions <= 0) {
        LOG_ERROR(ulIndex, "VectorIndex::load missing/invalid dimensions in metadata");
        return false;
    }
    if (m_metadata.dimensions > 0 && dimensions != m_metadata.dimensions) {
        LOG_ERROR(ulIndex, "VectorIndex::load dimension mismatch: %d expected %d",
                  dimensions, m_metadata.dimensions);
        return false;
    }

    m_metadata.dimensions = dimensions;
    m_metadata.schemaVersion = meta.value(QStringLiteral("version")).toInt(kMetaVersion);
    m_metadata.modelId = meta.value(QStringLiteral("model_id"))
                             .toString(QStringLiteral("unknown"))
                             .toStdString();
    m_metadata.collection = meta.value(QStringLiteral("collection"))
                                .toString(QString::fromStdString(m_metadata.collection))
                                .toStdString();

    const uint64_t totalElementsMeta =
        meta.value(QStringLiteral("total_elements")).toVariant().toULongLong();
    const uint64_t nextLabelMeta =
        meta.value(QStringLiteral("next_label")).toVariant().toULongLong();
    const int deletedElementsMeta = meta.value(QStringLiteral("deleted_elements")).toInt(0);

    uint64_t targetCapacity = static_cast<uint64_t>(kInitialCapacity);
    targetCapacity = std::max(targetCapacity, nextLabelMeta + 1);
    targetCapacity = std::max(targetCapacity, totalElementsMeta * 2);

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index.reset();
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(m_space.get());
        m_index->loadIndex(indexPath, m_space.get(), static_cast<size_t>(targetCapacity));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_nextLabel = nextLabelMeta;
        m_deletedCount = std::max(deletedElementsMeta, 0);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ulIndex, "VectorIndex::load failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::save(const std::string& indexPath, const std::string& metaPath)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_index) {
        LOG_WARN(ulIndex, "VectorIndex::save called with unavailable index");
        return false;
    }

    try {
        m_index->saveIndex(indexPath);
    } catch (const std::exception& e) {
        LOG_ERROR(ulIndex, "VectorIndex::save failed to persist index: %s", e.what());
        return false;
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("version"), kMetaVersion);
    meta.insert(QStringLiteral("collection"), QString::fromStdString(m_metadata.collection));
    meta.insert(QStringLiteral("model_id"), QString::fromStdString(m_metadata.modelId));
    meta.insert(QStringLiteral("dimensions"), m_metadata.dimensions);
    meta.insert(QStringLiteral("total_elements"),
                static_cast<qint64>(m_index->getCurrentElementCount()));
    meta.insert(QStringLiteral("deleted_elements"), m_deletedCount);
    meta.insert(QStringLiteral("next_label"), static_cast<qint64>(m_nextLabel));
    meta.insert(QStringLiteral("ef_construction"), kEfConstruction);
    meta.insert(QStringLiteral("m"), kM);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ulIndex, "VectorIndex::save failed to open meta file for write: %s",
                  qUtf8Printable(metaFile.fileName()));
        return false;
    }

    const QJsonDocument doc(meta);
    const qint64 written = metaFile.write(doc.toJson(QJsonDocument::Indented));
    metaFile.close();
    if (written < 0) {
        LOG_ERROR(ulIndex, "VectorIndex::save failed writing meta file: %s",
                  qUtf8Printable(metaFile.fileName()));
        return false;
    }
    return true;
}

uint64_t VectorIndex::addVector(const float* embedding)
{
    if (embedding == nullptr) {
        LOG_WARN(ulIndex, "VectorIndex::addVector called with null embedding");
        return kInvalidLabel;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_index) {
        LOG_WARN(ulIndex, "VectorIndex::addVector called with unavailable index");
        return kInvalidLabel;
    }

    if (!ensureCapacityForOneMore()) {
        return kInvalidLabel;
    }

    const uint64_t label = m_nextLabel;
    try {
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(label));
        ++m_nextLabel;
        return label;
    } catch (const std::exception& e) {
        LOG_ERROR(ulIndex, "VectorIndex::addVector failed: %s", e.what());
        return kInvalidLabel;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_index) {
        LOG_WARN(ulIndex, "VectorIndex::deleteVector called with unavailable index");
        return false;
    }

    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ulIndex, "VectorIndex::deleteVector failed: %s", e.what());
        return false;
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(
    const float* queryVector, int k, const std::unordered_set<uint64_t>* allowedLabels)
{
    std::vector<KnnResult> results;
    if (queryVector == nullptr || k <= 0) {
        return results;
    }
    if (allowedLabels && allowedLabels->empty()) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_index) {
        return results;
    }

    if (allowedLabels && allowedLabels->size() <= kExactSearchLimit) {
        return exactSearch(queryVector, k, *allowedLabels);
    }

    try {
        m_index->setEf(static_cast<size_t>(std::max(kEfSearch, k)));
        std::priority_queue<std::pair<float, hnswlib::labeltype>> queue;
        if (allowedLabels) {
            AllowedLabelFilter filter(*allowedLabels);
            queue = m_index->searchKnn(queryVector, static_cast<size_t>(k), &filter);
        } else {
            queue = m_index->searchKnn(queryVector, static_cast<size_t>(k));
        }
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), knnLess);
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(ulIndex, "VectorIndex::search failed: %s", e.what());
        return {};
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::exactSearch(
    const float* queryVector, int k, const std::unordered_set<uint64_t>& labels)
{
    std::vector<KnnResult> results;
    results.reserve(labels.size());

    const auto distance = m_space->get_dist_func();
    void* distanceParam = m_space->get_dist_func_param();

    for (const uint64_t label : labels) {
        try {
            const std::vector<float> data =
                m_index->getDataByLabel<float>(static_cast<hnswlib::labeltype>(label));
            results.push_back(KnnResult{label, distance(queryVector, data.data(), distanceParam)});
        } catch (const std::exception& e) {
            // Deleted or unknown label
            LOG_DEBUG(ulIndex, "VectorIndex::exactSearch skipped label %llu: %s",
                      static_cast<unsigned long long>(label), e.what());
        }
    }

    std::sort(results.begin(), results.end(), knnLess);
    if (results.size() > static_cast<size_t>(k)) {
        results.resize(static_cast<size_t>(k));
    }
    return results;
}

int VectorIndex::totalElements() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount());
}

int VectorIndex::deletedElements() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_deletedCount;
}

int VectorIndex::liveElements() const
{
    return std::max(totalElements() - deletedElements(), 0);
}

bool VectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_index != nullptr;
}

uint64_t VectorIndex::nextLabel() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_nextLabel;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(ulIndex, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        LOG_ERROR(ulIndex, "VectorIndex resize overflow");
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        LOG_INFO(ulIndex, "VectorIndex %s resized to capacity %llu",
                 m_metadata.collection.c_str(), static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(ulIndex, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace ul
