#pragma once

#include "core/vector/index_backend.h"
#include "core/vector/record_store.h"
#include "core/vector/vector_index.h"

#include <QString>

#include <map>
#include <memory>
#include <mutex>

struct sqlite3;

namespace ul {

// LocalIndexBackend -- IndexBackend persisted in one directory:
//
//   <dir>/records.sqlite3            text + metadata of every collection
//   <dir>/<collection>.hnsw          HNSW graph per collection
//   <dir>/<collection>.meta.json     graph metadata (dimensions, labels)
//
// Collections are created on first write. A single mutex serialises the
// SQLite connection and the graphs; it is held only for local work.
class LocalIndexBackend : public IndexBackend {
public:
    LocalIndexBackend(const QString& directory, int dimensions, const QString& modelId);
    ~LocalIndexBackend() override;

    LocalIndexBackend(const LocalIndexBackend&) = delete;
    LocalIndexBackend& operator=(const LocalIndexBackend&) = delete;

    // Creates the directory and opens the database. Must succeed before use.
    ErrorInfo open();
    bool isOpen() const;

    ErrorInfo upsert(const QString& collection, const std::vector<IndexRecord>& records) override;
    BackendQueryResult query(const QString& collection, const std::vector<float>& vector,
                             int k, const MetadataFilter& filter) override;
    BackendDeleteResult deleteWhere(const QString& collection,
                                    const MetadataFilter& filter) override;
    BackendIdsResult findIds(const QString& collection, const MetadataFilter& filter) override;
    BackendDeleteResult deleteIds(const QString& collection, const QStringList& ids) override;
    BackendCountResult count(const QString& collection) override;
    ErrorInfo clear(const QString& collection) override;
    ErrorInfo flush() override;

    QString directory() const { return m_directory; }

private:
    VectorIndex* indexFor(const QString& collection, bool createIfMissing);
    bool persistIndex(const QString& collection, VectorIndex& index);
    // Caller holds m_mutex.
    BackendDeleteResult removeRecords(const QString& collection,
                                      const std::vector<RecordRef>& refs,
                                      const QString& operation);
    QString indexFilePath(const QString& collection) const;
    QString metaFilePath(const QString& collection) const;
    ErrorInfo backendError(const QString& operation, const QString& collection,
                           const QString& message) const;

    QString m_directory;
    int m_dimensions = 0;
    QString m_modelId;

    sqlite3* m_db = nullptr;
    std::unique_ptr<RecordStore> m_records;
    std::map<QString, std::unique_ptr<VectorIndex>> m_indexes;
    mutable std::mutex m_mutex;
};

} // namespace ul
