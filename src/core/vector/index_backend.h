#pragma once

#include "core/shared/error.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace ul {

struct IndexRecord {
    QString id;
    QString text;
    MetadataMap metadata;
    std::vector<float> vector;
};

struct BackendHit {
    QString id;
    QString text;
    MetadataMap metadata;
    // Inner-product distance, 1 - cosine for normalised vectors.
    float distance = 0.0f;
};

struct BackendQueryResult {
    std::vector<BackendHit> hits;
    ErrorInfo error;
};

struct BackendDeleteResult {
    QStringList deletedIds;
    ErrorInfo error;
};

struct BackendIdsResult {
    QStringList ids;
    ErrorInfo error;
};

struct BackendCountResult {
    int count = 0;
    ErrorInfo error;
};

// IndexBackend -- persistent named collections of (id, vector, metadata, text).
//
// Filters are conjunctions of metadata equalities. Results of query() are
// ordered by ascending distance, ties in insertion order.
class IndexBackend {
public:
    virtual ~IndexBackend() = default;

    // Atomic per call: either every record is stored or none is. Records
    // with an id already present replace the old entry.
    virtual ErrorInfo upsert(const QString& collection, const std::vector<IndexRecord>& records) = 0;

    virtual BackendQueryResult query(const QString& collection, const std::vector<float>& vector,
                                     int k, const MetadataFilter& filter) = 0;

    virtual BackendDeleteResult deleteWhere(const QString& collection,
                                            const MetadataFilter& filter) = 0;

    // Ids of every record matching the filter; an empty filter matches all.
    virtual BackendIdsResult findIds(const QString& collection, const MetadataFilter& filter) = 0;

    // Atomic like upsert(). Unknown ids are skipped and absent from deletedIds.
    virtual BackendDeleteResult deleteIds(const QString& collection, const QStringList& ids) = 0;

    virtual BackendCountResult count(const QString& collection) = 0;

    virtual ErrorInfo clear(const QString& collection) = 0;

    virtual ErrorInfo flush() = 0;
};

} // namespace ul
