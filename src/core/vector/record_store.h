#pragma once

#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ul {

// Text and metadata of an indexed chunk, keyed by UUID, plus the HNSW label
// of its vector in the owning collection's graph.
struct StoredRecord {
    QString id;
    QString collection;
    uint64_t label = 0;
    QString text;
    MetadataMap metadata;
};

struct RecordRef {
    QString id;
    uint64_t label = 0;
};

// RecordStore -- SQLite table of indexed records shared by all collections.
//
// Metadata is stored as a JSON object; equality filters are evaluated with
// json_extract. Filter keys must satisfy isValidMetadataKey().
//
// Not thread-safe: the owning backend serialises access.
class RecordStore {
public:
    explicit RecordStore(sqlite3* db);
    ~RecordStore();

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    bool isReady() const { return m_ready; }

    bool beginTransaction();
    bool commit();
    bool rollback();

    bool insert(const StoredRecord& record);
    std::optional<RecordRef> findById(const QString& collection, const QString& id);
    std::optional<StoredRecord> getByLabel(const QString& collection, uint64_t label);

    // nullopt on SQL error or invalid key. Ordered by label.
    std::optional<std::vector<RecordRef>> findMatching(const QString& collection,
                                                       const MetadataFilter& filter);

    bool removeById(const QString& collection, const QString& id);
    bool clearCollection(const QString& collection);

    // -1 on error.
    int count(const QString& collection);

    QString lastError() const;

    static QString metadataToJson(const MetadataMap& metadata);
    static MetadataMap metadataFromJson(const QString& json);

private:
    bool prepareStatements();
    static void resetStatement(sqlite3_stmt* stmt);

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_insertStmt = nullptr;
    sqlite3_stmt* m_findByIdStmt = nullptr;
    sqlite3_stmt* m_getByLabelStmt = nullptr;
    sqlite3_stmt* m_removeByIdStmt = nullptr;
    sqlite3_stmt* m_clearStmt = nullptr;
    sqlite3_stmt* m_countStmt = nullptr;
    bool m_ready = false;
};

} // namespace ul
