#include "core/vector/record_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include <limits>

namespace ul {

namespace {

constexpr const char* kCreateRecordsSql = R"(
    CREATE TABLE IF NOT EXISTS records (
        id TEXT NOT NULL,
        collection TEXT NOT NULL,
        hnsw_label INTEGER NOT NULL,
        text TEXT NOT NULL,
        metadata TEXT NOT NULL DEFAULT '{}',
        indexed_at REAL NOT NULL,
        PRIMARY KEY (collection, id),
        UNIQUE (collection, hnsw_label)
    );
    CREATE INDEX IF NOT EXISTS idx_records_label
        ON records(collection, hnsw_label);
)";

// Replaces by id only; a label already owned by another id is a constraint
// error, never a silent delete of that record.
constexpr const char* kInsertSql = R"(
    INSERT INTO records (id, collection, hnsw_label, text, metadata, indexed_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    ON CONFLICT (collection, id) DO UPDATE SET
        hnsw_label = excluded.hnsw_label,
        text = excluded.text,
        metadata = excluded.metadata,
        indexed_at = excluded.indexed_at
)";
constexpr const char* kFindByIdSql =
    "SELECT hnsw_label FROM records WHERE collection = ?1 AND id = ?2";
constexpr const char* kGetByLabelSql =
    "SELECT id, text, metadata FROM records WHERE collection = ?1 AND hnsw_label = ?2";
constexpr const char* kRemoveByIdSql =
    "DELETE FROM records WHERE collection = ?1 AND id = ?2";
constexpr const char* kClearSql = "DELETE FROM records WHERE collection = ?1";
constexpr const char* kCountSql = "SELECT COUNT(*) FROM records WHERE collection = ?1";

bool execSql(sqlite3* db, const char* sql)
{
    if (!db) {
        return false;
    }
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ulIndex, "SQL failed: %s", errMsg ? errMsg : "unknown error");
        if (errMsg) {
            sqlite3_free(errMsg);
        }
        return false;
    }
    return true;
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    if (!text) {
        return QString();
    }
    return QString::fromUtf8(text, sqlite3_column_bytes(stmt, column));
}

} // namespace

RecordStore::RecordStore(sqlite3* db)
    : m_db(db)
{
    m_ready = prepareStatements();
}

RecordStore::~RecordStore()
{
    sqlite3_finalize(m_insertStmt);
    sqlite3_finalize(m_findByIdStmt);
    sqlite3_finalize(m_getByLabelStmt);
    sqlite3_finalize(m_removeByIdStmt);
    sqlite3_finalize(m_clearStmt);
    sqlite3_finalize(m_countStmt);
}

bool RecordStore::beginTransaction()
{
    return m_ready && execSql(m_db, "BEGIN IMMEDIATE TRANSACTION");
}

bool RecordStore::commit()
{
    return m_ready && execSql(m_db, "COMMIT");
}

bool RecordStore::rollback()
{
    return m_ready && execSql(m_db, "ROLLBACK");
}

bool RecordStore::insert(const StoredRecord& record)
{
    if (!m_ready || record.label > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }

    bindText(m_insertStmt, 1, record.id);
    bindText(m_insertStmt, 2, record.collection);
    sqlite3_bind_int64(m_insertStmt, 3, static_cast<int64_t>(record.label));
    bindText(m_insertStmt, 4, record.text);
    bindText(m_insertStmt, 5, metadataToJson(record.metadata));
    sqlite3_bind_double(m_insertStmt, 6,
                        static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0);

    const int rc = sqlite3_step(m_insertStmt);
    resetStatement(m_insertStmt);
    return rc == SQLITE_DONE;
}

std::optional<RecordRef> RecordStore::findById(const QString& collection, const QString& id)
{
    if (!m_ready) {
        return std::nullopt;
    }

    bindText(m_findByIdStmt, 1, collection);
    bindText(m_findByIdStmt, 2, id);
    const int rc = sqlite3_step(m_findByIdStmt);
    if (rc == SQLITE_ROW) {
        const int64_t label = sqlite3_column_int64(m_findByIdStmt, 0);
        resetStatement(m_findByIdStmt);
        if (label < 0) {
            return std::nullopt;
        }
        return RecordRef{id, static_cast<uint64_t>(label)};
    }

    resetStatement(m_findByIdStmt);
    return std::nullopt;
}

std::optional<StoredRecord> RecordStore::getByLabel(const QString& collection, uint64_t label)
{
    if (!m_ready || label > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }

    bindText(m_getByLabelStmt, 1, collection);
    sqlite3_bind_int64(m_getByLabelStmt, 2, static_cast<int64_t>(label));
    const int rc = sqlite3_step(m_getByLabelStmt);
    if (rc != SQLITE_ROW) {
        resetStatement(m_getByLabelStmt);
        return std::nullopt;
    }

    StoredRecord record;
    record.collection = collection;
    record.label = label;
    record.id = columnText(m_getByLabelStmt, 0);
    record.text = columnText(m_getByLabelStmt, 1);
    record.metadata = metadataFromJson(columnText(m_getByLabelStmt, 2));
    resetStatement(m_getByLabelStmt);
    return record;
}

std::optional<std::vector<RecordRef>> RecordStore::findMatching(const QString& collection,
                                                                const MetadataFilter& filter)
{
    if (!m_ready) {
        return std::nullopt;
    }

    QStringList clauses;
    clauses.append(QStringLiteral("collection = ?1"));
    int param = 2;
    for (auto it = filter.constBegin(); it != filter.constEnd(); ++it) {
        if (!isValidMetadataKey(it.key())) {
            LOG_WARN(ulIndex, "Rejected metadata filter key: %s", qUtf8Printable(it.key()));
            return std::nullopt;
        }
        // Keys are identifiers, safe to splice into the JSON path.
        clauses.append(QStringLiteral("json_extract(metadata, '$.%1') = ?%2")
                           .arg(it.key())
                           .arg(param++));
    }

    const QByteArray sql = QStringLiteral("SELECT id, hnsw_label FROM records WHERE %1 "
                                          "ORDER BY hnsw_label ASC")
                               .arg(clauses.join(QStringLiteral(" AND ")))
                               .toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ulIndex, "Failed to prepare filter query: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    bindText(stmt, 1, collection);
    param = 2;
    for (auto it = filter.constBegin(); it != filter.constEnd(); ++it) {
        bindText(stmt, param++, it.value());
    }

    std::vector<RecordRef> refs;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const int64_t label = sqlite3_column_int64(stmt, 1);
        if (label >= 0) {
            refs.push_back(RecordRef{columnText(stmt, 0), static_cast<uint64_t>(label)});
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ulIndex, "Filter query failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return refs;
}

bool RecordStore::removeById(const QString& collection, const QString& id)
{
    if (!m_ready) {
        return false;
    }
    bindText(m_removeByIdStmt, 1, collection);
    bindText(m_removeByIdStmt, 2, id);
    const int rc = sqlite3_step(m_removeByIdStmt);
    resetStatement(m_removeByIdStmt);
    return rc == SQLITE_DONE;
}

bool RecordStore::clearCollection(const QString& collection)
{
    if (!m_ready) {
        return false;
    }
    bindText(m_clearStmt, 1, collection);
    const int rc = sqlite3_step(m_clearStmt);
    resetStatement(m_clearStmt);
    return rc == SQLITE_DONE;
}

int RecordStore::count(const QString& collection)
{
    if (!m_ready) {
        return -1;
    }

    bindText(m_countStmt, 1, collection);
    const int rc = sqlite3_step(m_countStmt);
    if (rc == SQLITE_ROW) {
        const int count = sqlite3_column_int(m_countStmt, 0);
        resetStatement(m_countStmt);
        return count;
    }

    resetStatement(m_countStmt);
    return -1;
}

QString RecordStore::lastError() const
{
    if (!m_db) {
        return QStringLiteral("no database");
    }
    return QString::fromUtf8(sqlite3_errmsg(m_db));
}

QString RecordStore::metadataToJson(const MetadataMap& metadata)
{
    QJsonObject json;
    for (auto it = metadata.constBegin(); it != metadata.constEnd(); ++it) {
        json.insert(it.key(), it.value());
    }
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

MetadataMap RecordStore::metadataFromJson(const QString& json)
{
    MetadataMap metadata;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        return metadata;
    }
    const QJsonObject object = doc.object();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        metadata.insert(it.key(), it.value().toVariant().toString());
    }
    return metadata;
}

bool RecordStore::prepareStatements()
{
    if (!m_db) {
        return false;
    }

    if (!execSql(m_db, kCreateRecordsSql)) {
        return false;
    }

    if (sqlite3_prepare_v2(m_db, kInsertSql, -1, &m_insertStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kFindByIdSql, -1, &m_findByIdStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kGetByLabelSql, -1, &m_getByLabelStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kRemoveByIdSql, -1, &m_removeByIdStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kClearSql, -1, &m_clearStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kCountSql, -1, &m_countStmt, nullptr) != SQLITE_OK) {
        return false;
    }

    return true;
}

void RecordStore::resetStatement(sqlite3_stmt* stmt)
{
    if (!stmt) {
        return;
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

} // namespace ul
