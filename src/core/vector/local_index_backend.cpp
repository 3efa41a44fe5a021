#include "core/vector/local_index_backend.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <limits>
#include <unordered_set>

namespace ul {

namespace {

constexpr const char* kConnectionPragmas = R"(
    PRAGMA journal_mode = WAL;
    PRAGMA synchronous = NORMAL;
    PRAGMA foreign_keys = ON;
)";

constexpr uint64_t kInvalidLabel = std::numeric_limits<uint64_t>::max();

} // namespace

LocalIndexBackend::LocalIndexBackend(const QString& directory, int dimensions,
                                     const QString& modelId)
    : m_directory(directory)
    , m_dimensions(dimensions)
    , m_modelId(modelId)
{
}

LocalIndexBackend::~LocalIndexBackend()
{
    const ErrorInfo flushed = flush();
    if (!flushed.ok()) {
        LOG_ERROR(ulIndex, "%s", qUtf8Printable(flushed.toString()));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_indexes.clear();
    m_records.reset();
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

ErrorInfo LocalIndexBackend::open()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const QString operation = QStringLiteral("open");

    if (m_db) {
        return ErrorInfo();
    }
    if (m_dimensions <= 0) {
        return ErrorInfo::make(ErrorKind::Validation,
                               QStringLiteral("Embedding dimension must be positive"),
                               operation);
    }
    if (!QDir().mkpath(m_directory)) {
        return ErrorInfo::make(ErrorKind::Backend,
                               QStringLiteral("Cannot create index directory %1").arg(m_directory),
                               operation);
    }

    const QString dbPath = QDir(m_directory).filePath(QStringLiteral("records.sqlite3"));
    const int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        sqlite3_close(m_db);
        m_db = nullptr;
        LOG_ERROR(ulIndex, "Failed to open database %s: %s", qUtf8Printable(dbPath),
                  qUtf8Printable(message));
        return ErrorInfo::make(ErrorKind::Backend, message, operation);
    }

    sqlite3_busy_timeout(m_db, 30000);

    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, kConnectionPragmas, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_WARN(ulIndex, "Failed to set connection pragmas: %s", errMsg ? errMsg : "unknown");
        if (errMsg) {
            sqlite3_free(errMsg);
        }
    }

    m_records = std::make_unique<RecordStore>(m_db);
    if (!m_records->isReady()) {
        const QString message = m_records->lastError();
        m_records.reset();
        sqlite3_close(m_db);
        m_db = nullptr;
        return ErrorInfo::make(ErrorKind::Backend,
                               QStringLiteral("Failed to prepare record store: %1").arg(message),
                               operation);
    }

    LOG_INFO(ulIndex, "Opened index at %s (%d dimensions, model %s)",
             qUtf8Printable(m_directory), m_dimensions, qUtf8Printable(m_modelId));
    return ErrorInfo();
}

bool LocalIndexBackend::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records != nullptr;
}

QString LocalIndexBackend::indexFilePath(const QString& collection) const
{
    return QDir(m_directory).filePath(collection + QStringLiteral(".hnsw"));
}

QString LocalIndexBackend::metaFilePath(const QString& collection) const
{
    return QDir(m_directory).filePath(collection + QStringLiteral(".meta.json"));
}

ErrorInfo LocalIndexBackend::backendError(const QString& operation, const QString& collection,
                                          const QString& message) const
{
    ErrorInfo error = ErrorInfo::make(ErrorKind::Backend, message, operation);
    error.tier = collection;
    LOG_ERROR(ulIndex, "%s", qUtf8Printable(error.toString()));
    return error;
}

VectorIndex* LocalIndexBackend::indexFor(const QString& collection, bool createIfMissing)
{
    auto it = m_indexes.find(collection);
    if (it != m_indexes.end()) {
        return it->second.get();
    }

    VectorIndex::IndexMetadata metadata;
    metadata.dimensions = m_dimensions;
    metadata.modelId = m_modelId.toStdString();
    metadata.collection = collection.toStdString();

    auto index = std::make_unique<VectorIndex>(metadata);
    const QString indexPath = indexFilePath(collection);
    if (QFileInfo::exists(indexPath)) {
        if (!index->load(indexPath.toStdString(), metaFilePath(collection).toStdString())) {
            LOG_ERROR(ulIndex, "Cannot load vector index for %s", qUtf8Printable(collection));
            return nullptr;
        }
    } else {
        if (!createIfMissing) {
            return nullptr;
        }
        if (!index->create()) {
            return nullptr;
        }
    }

    VectorIndex* raw = index.get();
    m_indexes.emplace(collection, std::move(index));
    return raw;
}

bool LocalIndexBackend::persistIndex(const QString& collection, VectorIndex& index)
{
    return index.save(indexFilePath(collection).toStdString(),
                      metaFilePath(collection).toStdString());
}

ErrorInfo LocalIndexBackend::upsert(const QString& collection,
                                    const std::vector<IndexRecord>& records)
{
    const QString operation = QStringLiteral("upsert");
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_records) {
        return backendError(operation, collection, QStringLiteral("Backend is not open"));
    }
    if (records.empty()) {
        return ErrorInfo();
    }

    for (const IndexRecord& record : records) {
        if (record.vector.size() != static_cast<size_t>(m_dimensions)) {
            return backendError(operation, collection,
                                QStringLiteral("Vector for %1 has %2 values, expected %3")
                                    .arg(record.id)
                                    .arg(record.vector.size())
                                    .arg(m_dimensions));
        }
    }

    VectorIndex* index = indexFor(collection, true);
    if (!index) {
        return backendError(operation, collection, QStringLiteral("Vector index unavailable"));
    }

    if (!m_records->beginTransaction()) {
        return backendError(operation, collection, m_records->lastError());
    }

    std::vector<uint64_t> addedLabels;
    std::vector<uint64_t> replacedLabels;
    addedLabels.reserve(records.size());

    auto failUpsert = [&](const QString& message) {
        m_records->rollback();
        for (const uint64_t label : addedLabels) {
            index->deleteVector(label);
        }
        if (!persistIndex(collection, *index)) {
            LOG_WARN(ulIndex, "Rolled back upsert into %s but failed to persist the graph",
                     qUtf8Printable(collection));
        }
        return backendError(operation, collection, message);
    };

    for (const IndexRecord& record : records) {
        const std::optional<RecordRef> existing = m_records->findById(collection, record.id);

        const uint64_t label = index->addVector(record.vector.data());
        if (label == kInvalidLabel) {
            return failUpsert(QStringLiteral("Failed to add vector for %1").arg(record.id));
        }
        addedLabels.push_back(label);

        StoredRecord stored;
        stored.id = record.id;
        stored.collection = collection;
        stored.label = label;
        stored.text = record.text;
        stored.metadata = record.metadata;
        if (!m_records->insert(stored)) {
            return failUpsert(QStringLiteral("Failed to store record %1: %2")
                             .arg(record.id, m_records->lastError()));
        }

        if (existing.has_value()) {
            replacedLabels.push_back(existing->label);
        }
    }

    if (!m_records->commit()) {
        return failUpsert(QStringLiteral("Commit failed: %1").arg(m_records->lastError()));
    }

    for (const uint64_t label : replacedLabels) {
        index->deleteVector(label);
    }

    // The rows are committed and the graph in memory is current, so the
    // records are stored and searchable. The graph file is rewritten by the
    // next successful write or flush().
    if (!persistIndex(collection, *index)) {
        LOG_WARN(ulIndex, "Upserted %d records into %s but failed to persist the graph",
                 static_cast<int>(records.size()), qUtf8Printable(collection));
    }

    LOG_DEBUG(ulIndex, "Upserted %d records into %s", static_cast<int>(records.size()),
              qUtf8Printable(collection));
    return ErrorInfo();
}

BackendQueryResult LocalIndexBackend::query(const QString& collection,
                                            const std::vector<float>& vector, int k,
                                            const MetadataFilter& filter)
{
    const QString operation = QStringLiteral("query");
    BackendQueryResult result;
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_records) {
        result.error = backendError(operation, collection, QStringLiteral("Backend is not open"));
        return result;
    }
    if (k <= 0) {
        return result;
    }
    if (vector.size() != static_cast<size_t>(m_dimensions)) {
        result.error = backendError(operation, collection,
                                    QStringLiteral("Query vector has %1 values, expected %2")
                                        .arg(vector.size())
                                        .arg(m_dimensions));
        return result;
    }

    VectorIndex* index = indexFor(collection, false);
    if (!index) {
        if (QFileInfo::exists(indexFilePath(collection))) {
            result.error = backendError(operation, collection,
                                        QStringLiteral("Vector index unavailable"));
        }
        // Never written: empty collection.
        return result;
    }

    std::unordered_set<uint64_t> allowed;
    if (!filter.isEmpty()) {
        const std::optional<std::vector<RecordRef>> matching =
            m_records->findMatching(collection, filter);
        if (!matching.has_value()) {
            result.error = backendError(operation, collection,
                                        QStringLiteral("Metadata filter failed: %1")
                                            .arg(m_records->lastError()));
            return result;
        }
        for (const RecordRef& ref : *matching) {
            allowed.insert(ref.label);
        }
    }

    const std::vector<VectorIndex::KnnResult> knn =
        index->search(vector.data(), k, filter.isEmpty() ? nullptr : &allowed);

    result.hits.reserve(knn.size());
    for (const VectorIndex::KnnResult& entry : knn) {
        const std::optional<StoredRecord> record = m_records->getByLabel(collection, entry.label);
        if (!record.has_value()) {
            LOG_WARN(ulIndex, "Label %llu in %s has no record",
                     static_cast<unsigned long long>(entry.label), qUtf8Printable(collection));
            continue;
        }
        BackendHit hit;
        hit.id = record->id;
        hit.text = record->text;
        hit.metadata = record->metadata;
        hit.distance = entry.distance;
        result.hits.push_back(std::move(hit));
    }
    return result;
}

BackendDeleteResult LocalIndexBackend::deleteWhere(const QString& collection,
                                                   const MetadataFilter& filter)
{
    const QString operation = QStringLiteral("deleteWhere");
    BackendDeleteResult result;
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_records) {
        result.error = backendError(operation, collection, QStringLiteral("Backend is not open"));
        return result;
    }
    if (filter.isEmpty()) {
        result.error = ErrorInfo::make(ErrorKind::Validation,
                                       QStringLiteral("deleteWhere requires a non-empty filter"),
                                       operation, collection);
        return result;
    }

    const std::optional<std::vector<RecordRef>> matching =
        m_records->findMatching(collection, filter);
    if (!matching.has_value()) {
        result.error = backendError(operation, collection,
                                    QStringLiteral("Metadata filter failed: %1")
                                        .arg(m_records->lastError()));
        return result;
    }
    return removeRecords(collection, *matching, operation);
}

BackendIdsResult LocalIndexBackend::findIds(const QString& collection,
                                            const MetadataFilter& filter)
{
    BackendIdsResult result;
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_records) {
        result.error = backendError(QStringLiteral("findIds"), collection,
                                    QStringLiteral("Backend is not open"));
        return result;
    }

    const std::optional<std::vector<RecordRef>> matching =
        m_records->findMatching(collection, filter);
    if (!matching.has_value()) {
        result.error = backendError(QStringLiteral("findIds"), collection,
                                    QStringLiteral("Metadata filter failed: %1")
                                        .arg(m_records->lastError()));
        return result;
    }
    for (const RecordRef& ref : *matching) {
        result.ids.append(ref.id);
    }
    return result;
}

BackendDeleteResult LocalIndexBackend::deleteIds(const QString& collection,
                                                 const QStringList& ids)
{
    const QString operation = QStringLiteral("deleteIds");
    BackendDeleteResult result;
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_records) {
        result.error = backendError(operation, collection, QStringLiteral("Backend is not open"));
        return result;
    }

    std::vector<RecordRef> refs;
    refs.reserve(static_cast<size_t>(ids.size()));
    for (const QString& id : ids) {
        const std::optional<RecordRef> ref = m_records->findById(collection, id);
        if (ref.has_value()) {
            refs.push_back(*ref);
        }
    }
    return removeRecords(collection, refs, operation);
}

BackendDeleteResult LocalIndexBackend::removeRecords(const QString& collection,
                                                     const std::vector<RecordRef>& refs,
                                                     const QString& operation)
{
    BackendDeleteResult result;
    if (refs.empty()) {
        return result;
    }

    if (!m_records->beginTransaction()) {
        result.error = backendError(operation, collection, m_records->lastError());
        return result;
    }
    for (const RecordRef& ref : refs) {
        if (!m_records->removeById(collection, ref.id)) {
            const QString message = m_records->lastError();
            m_records->rollback();
            result.error = backendError(operation, collection,
                                        QStringLiteral("Failed to delete %1: %2")
                                            .arg(ref.id, message));
            return result;
        }
    }
    if (!m_records->commit()) {
        result.error = backendError(operation, collection, m_records->lastError());
        m_records->rollback();
        return result;
    }

    VectorIndex* index = indexFor(collection, false);
    for (const RecordRef& ref : refs) {
        if (index) {
            index->deleteVector(ref.label);
        }
        result.deletedIds.append(ref.id);
    }
    if (index && !persistIndex(collection, *index)) {
        LOG_WARN(ulIndex, "Deleted records from %s but failed to persist the graph",
                 qUtf8Printable(collection));
    }
    return result;
}

BackendCountResult LocalIndexBackend::count(const QString& collection)
{
    BackendCountResult result;
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_records) {
        result.error = backendError(QStringLiteral("count"), collection,
                                    QStringLiteral("Backend is not open"));
        return result;
    }

    const int count = m_records->count(collection);
    if (count < 0) {
        result.error = backendError(QStringLiteral("count"), collection, m_records->lastError());
        return result;
    }
    result.count = count;
    return result;
}

ErrorInfo LocalIndexBackend::clear(const QString& collection)
{
    const QString operation = QStringLiteral("clear");
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_records) {
        return backendError(operation, collection, QStringLiteral("Backend is not open"));
    }
    if (!m_records->clearCollection(collection)) {
        return backendError(operation, collection, m_records->lastError());
    }

    m_indexes.erase(collection);
    for (const QString& path : {indexFilePath(collection), metaFilePath(collection)}) {
        if (QFileInfo::exists(path) && !QFile::remove(path)) {
            return backendError(operation, collection,
                                QStringLiteral("Cannot remove %1").arg(path));
        }
    }

    LOG_INFO(ulIndex, "Cleared collection %s", qUtf8Printable(collection));
    return ErrorInfo();
}

ErrorInfo LocalIndexBackend::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& entry : m_indexes) {
        if (!persistIndex(entry.first, *entry.second)) {
            return backendError(QStringLiteral("flush"), entry.first,
                                QStringLiteral("Failed to persist vector index"));
        }
    }
    return ErrorInfo();
}

} // namespace ul
