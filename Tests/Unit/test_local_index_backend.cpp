#include <QtTest/QtTest>
#include "core/vector/local_index_backend.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include <memory>

class TestLocalIndexBackend : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Lifecycle ───────────────────────────────────────────────
    void testOpenCreatesDirectoryAndDatabase();
    void testOpenRejectsNonPositiveDimensions();
    void testOperationsBeforeOpenFail();

    // ── Upsert / query ──────────────────────────────────────────
    void testUpsertAndQueryNearest();
    void testQueryUnknownCollectionIsEmpty();
    void testQueryWithFilter();
    void testUpsertReplacesById();
    void testUpsertRejectsWrongDimensions();
    void testUpsertSurvivesGraphSaveFailure();
    void testQueryRejectsWrongDimensions();

    // ── Delete / clear / persistence ────────────────────────────
    void testDeleteWhere();
    void testDeleteWhereRequiresFilter();
    void testFindIdsAndDeleteIds();
    void testClearRemovesFiles();
    void testPersistenceAcrossReopen();

private:
    static constexpr int kDims = 8;
    static std::vector<float> basis(int axis);
    static ul::IndexRecord makeRecord(const QString& id, int axis, const QString& municipality);
    static QStringList hitIds(const ul::BackendQueryResult& result);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<ul::LocalIndexBackend> m_backend;
};

std::vector<float> TestLocalIndexBackend::basis(int axis)
{
    std::vector<float> vector(static_cast<size_t>(kDims), 0.0f);
    vector[static_cast<size_t>(axis % kDims)] = 1.0f;
    return vector;
}

ul::IndexRecord TestLocalIndexBackend::makeRecord(const QString& id, int axis,
                                                  const QString& municipality)
{
    ul::IndexRecord record;
    record.id = id;
    record.text = QStringLiteral("Articolo %1 del regolamento").arg(axis);
    record.metadata.insert(QStringLiteral("normative_level"), QStringLiteral("comunale"));
    record.metadata.insert(QStringLiteral("municipality"), municipality);
    record.vector = basis(axis);
    return record;
}

QStringList TestLocalIndexBackend::hitIds(const ul::BackendQueryResult& result)
{
    QStringList ids;
    for (const ul::BackendHit& hit : result.hits) {
        ids.append(hit.id);
    }
    return ids;
}

void TestLocalIndexBackend::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_backend = std::make_unique<ul::LocalIndexBackend>(m_dir->filePath(QStringLiteral("index")),
                                                        kDims, QStringLiteral("unit-test-model"));
    QVERIFY(m_backend->open().ok());
}

void TestLocalIndexBackend::cleanup()
{
    m_backend.reset();
    m_dir.reset();
}

// ── Lifecycle ───────────────────────────────────────────────────

void TestLocalIndexBackend::testOpenCreatesDirectoryAndDatabase()
{
    QVERIFY(m_backend->isOpen());
    QVERIFY(QFileInfo(m_backend->directory()).isDir());
    QVERIFY(QFileInfo::exists(QDir(m_backend->directory()).filePath(
        QStringLiteral("records.sqlite3"))));

    // Idempotent.
    QVERIFY(m_backend->open().ok());
}

void TestLocalIndexBackend::testOpenRejectsNonPositiveDimensions()
{
    ul::LocalIndexBackend backend(m_dir->filePath(QStringLiteral("zero")), 0,
                                  QStringLiteral("m"));
    const ul::ErrorInfo error = backend.open();
    QCOMPARE(error.kind, ul::ErrorKind::Validation);
    QVERIFY(!backend.isOpen());
}

void TestLocalIndexBackend::testOperationsBeforeOpenFail()
{
    ul::LocalIndexBackend backend(m_dir->filePath(QStringLiteral("closed")), kDims,
                                  QStringLiteral("m"));
    QCOMPARE(backend.upsert(QStringLiteral("c"), {makeRecord(QStringLiteral("a"), 0,
                                                              QStringLiteral("Roma"))}).kind,
             ul::ErrorKind::Backend);
    QCOMPARE(backend.query(QStringLiteral("c"), basis(0), 3, {}).error.kind,
             ul::ErrorKind::Backend);
    QCOMPARE(backend.count(QStringLiteral("c")).error.kind, ul::ErrorKind::Backend);
}

// ── Upsert / query ──────────────────────────────────────────────

void TestLocalIndexBackend::testUpsertAndQueryNearest()
{
    const QString collection = QStringLiteral("normative_comunale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma")),
                                           makeRecord(QStringLiteral("b"), 1, QStringLiteral("Roma")),
                                           makeRecord(QStringLiteral("c"), 2, QStringLiteral("Roma"))})
                .ok());
    QCOMPARE(m_backend->count(collection).count, 3);

    const ul::BackendQueryResult result = m_backend->query(collection, basis(1), 2, {});
    QVERIFY(result.error.ok());
    QCOMPARE(static_cast<int>(result.hits.size()), 2);
    QCOMPARE(result.hits[0].id, QStringLiteral("b"));
    QCOMPARE(result.hits[0].text, QStringLiteral("Articolo 1 del regolamento"));
    QCOMPARE(result.hits[0].metadata.value(QStringLiteral("municipality")), QStringLiteral("Roma"));
    QVERIFY(std::abs(result.hits[0].distance) < 1e-5f);
    // Equidistant remainder comes back in insertion order.
    QCOMPARE(result.hits[1].id, QStringLiteral("a"));

    QVERIFY(m_backend->upsert(collection, {}).ok());
    QVERIFY(m_backend->query(collection, basis(1), 0, {}).hits.empty());
}

void TestLocalIndexBackend::testQueryUnknownCollectionIsEmpty()
{
    const ul::BackendQueryResult result =
        m_backend->query(QStringLiteral("normative_nazionale"), basis(0), 5, {});
    QVERIFY(result.error.ok());
    QVERIFY(result.hits.empty());
    QCOMPARE(m_backend->count(QStringLiteral("normative_nazionale")).count, 0);
}

void TestLocalIndexBackend::testQueryWithFilter()
{
    const QString collection = QStringLiteral("normative_comunale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("roma-1"), 0, QStringLiteral("Roma")),
                                           makeRecord(QStringLiteral("milano-1"), 1, QStringLiteral("Milano")),
                                           makeRecord(QStringLiteral("roma-2"), 2, QStringLiteral("Roma"))})
                .ok());

    ul::MetadataFilter filter;
    filter.insert(QStringLiteral("municipality"), QStringLiteral("Roma"));
    const ul::BackendQueryResult result = m_backend->query(collection, basis(1), 5, filter);
    QVERIFY(result.error.ok());
    QCOMPARE(hitIds(result), QStringList({QStringLiteral("roma-1"), QStringLiteral("roma-2")}));

    filter.insert(QStringLiteral("municipality"), QStringLiteral("Napoli"));
    QVERIFY(m_backend->query(collection, basis(1), 5, filter).hits.empty());

    ul::MetadataFilter invalid;
    invalid.insert(QStringLiteral("bad key"), QStringLiteral("x"));
    QCOMPARE(m_backend->query(collection, basis(1), 5, invalid).error.kind,
             ul::ErrorKind::Backend);
}

void TestLocalIndexBackend::testUpsertReplacesById()
{
    const QString collection = QStringLiteral("normative_comunale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma")),
                                           makeRecord(QStringLiteral("b"), 3, QStringLiteral("Roma"))})
                .ok());

    ul::IndexRecord replacement = makeRecord(QStringLiteral("a"), 5, QStringLiteral("Torino"));
    replacement.text = QStringLiteral("Testo aggiornato");
    QVERIFY(m_backend->upsert(collection, {replacement}).ok());

    QCOMPARE(m_backend->count(collection).count, 2);

    const ul::BackendQueryResult nearOld = m_backend->query(collection, basis(0), 5, {});
    QCOMPARE(static_cast<int>(nearOld.hits.size()), 2);
    for (const ul::BackendHit& hit : nearOld.hits) {
        QVERIFY(hit.distance > 0.5f);
    }

    const ul::BackendQueryResult nearNew = m_backend->query(collection, basis(5), 1, {});
    QCOMPARE(nearNew.hits.front().id, QStringLiteral("a"));
    QCOMPARE(nearNew.hits.front().text, QStringLiteral("Testo aggiornato"));
    QCOMPARE(nearNew.hits.front().metadata.value(QStringLiteral("municipality")),
             QStringLiteral("Torino"));
}

void TestLocalIndexBackend::testUpsertRejectsWrongDimensions()
{
    const QString collection = QStringLiteral("normative_comunale");
    ul::IndexRecord bad = makeRecord(QStringLiteral("bad"), 0, QStringLiteral("Roma"));
    bad.vector.push_back(0.0f);

    const ul::ErrorInfo error =
        m_backend->upsert(collection, {makeRecord(QStringLiteral("ok"), 1, QStringLiteral("Roma")), bad});
    QCOMPARE(error.kind, ul::ErrorKind::Backend);
    QCOMPARE(error.operation, QStringLiteral("upsert"));
    QCOMPARE(error.tier, collection);
    // Nothing from the failed call is visible.
    QCOMPARE(m_backend->count(collection).count, 0);
}

void TestLocalIndexBackend::testUpsertSurvivesGraphSaveFailure()
{
    // A directory where the graph metadata belongs makes every save fail.
    const QString collection = QStringLiteral("normative_comunale");
    const QDir dir(m_backend->directory());
    QVERIFY(dir.mkdir(collection + QStringLiteral(".meta.json")));

    const ul::ErrorInfo error = m_backend->upsert(
        collection, {makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma")),
                     makeRecord(QStringLiteral("b"), 3, QStringLiteral("Roma"))});
    QVERIFY(error.ok());
    QCOMPARE(m_backend->count(collection).count, 2);
    QCOMPARE(hitIds(m_backend->query(collection, basis(3), 1, {})),
             QStringList({QStringLiteral("b")}));

    // The failure still surfaces on an explicit flush.
    QCOMPARE(m_backend->flush().kind, ul::ErrorKind::Backend);
    QVERIFY(QDir(dir.filePath(collection + QStringLiteral(".meta.json"))).removeRecursively());
    QVERIFY(m_backend->flush().ok());
}

void TestLocalIndexBackend::testQueryRejectsWrongDimensions()
{
    const ul::BackendQueryResult result = m_backend->query(
        QStringLiteral("normative_comunale"), std::vector<float>(3, 1.0f), 5, {});
    QCOMPARE(result.error.kind, ul::ErrorKind::Backend);
}

// ── Delete / clear / persistence ────────────────────────────────

void TestLocalIndexBackend::testDeleteWhere()
{
    const QString collection = QStringLiteral("normative_comunale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("roma-1"), 0, QStringLiteral("Roma")),
                                           makeRecord(QStringLiteral("milano-1"), 1, QStringLiteral("Milano")),
                                           makeRecord(QStringLiteral("roma-2"), 2, QStringLiteral("Roma"))})
                .ok());

    ul::MetadataFilter filter;
    filter.insert(QStringLiteral("municipality"), QStringLiteral("Roma"));
    const ul::BackendDeleteResult deleted = m_backend->deleteWhere(collection, filter);
    QVERIFY(deleted.error.ok());
    QCOMPARE(deleted.deletedIds, QStringList({QStringLiteral("roma-1"), QStringLiteral("roma-2")}));
    QCOMPARE(m_backend->count(collection).count, 1);

    const ul::BackendQueryResult remaining = m_backend->query(collection, basis(0), 5, {});
    QCOMPARE(hitIds(remaining), QStringList({QStringLiteral("milano-1")}));

    const ul::BackendDeleteResult again = m_backend->deleteWhere(collection, filter);
    QVERIFY(again.error.ok());
    QVERIFY(again.deletedIds.isEmpty());
}

void TestLocalIndexBackend::testDeleteWhereRequiresFilter()
{
    const QString collection = QStringLiteral("normative_comunale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))})
                .ok());

    const ul::BackendDeleteResult result = m_backend->deleteWhere(collection, {});
    QCOMPARE(result.error.kind, ul::ErrorKind::Validation);
    QCOMPARE(m_backend->count(collection).count, 1);
}

void TestLocalIndexBackend::testFindIdsAndDeleteIds()
{
    const QString collection = QStringLiteral("normative_comunale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("roma-1"), 0, QStringLiteral("Roma")),
                                           makeRecord(QStringLiteral("milano-1"), 1, QStringLiteral("Milano")),
                                           makeRecord(QStringLiteral("roma-2"), 2, QStringLiteral("Roma"))})
                .ok());

    ul::MetadataFilter filter;
    filter.insert(QStringLiteral("municipality"), QStringLiteral("Roma"));
    const ul::BackendIdsResult found = m_backend->findIds(collection, filter);
    QVERIFY(found.error.ok());
    QCOMPARE(found.ids, QStringList({QStringLiteral("roma-1"), QStringLiteral("roma-2")}));
    QCOMPARE(static_cast<int>(m_backend->findIds(collection, {}).ids.size()), 3);
    QVERIFY(m_backend->findIds(QStringLiteral("normative_nazionale"), filter).ids.isEmpty());

    const ul::BackendDeleteResult deleted = m_backend->deleteIds(
        collection, {QStringLiteral("roma-2"), QStringLiteral("sconosciuto")});
    QVERIFY(deleted.error.ok());
    QCOMPARE(deleted.deletedIds, QStringList({QStringLiteral("roma-2")}));
    QCOMPARE(m_backend->count(collection).count, 2);
    QCOMPARE(hitIds(m_backend->query(collection, basis(2), 5, filter)),
             QStringList({QStringLiteral("roma-1")}));

    QVERIFY(m_backend->deleteIds(collection, {}).deletedIds.isEmpty());
}

void TestLocalIndexBackend::testClearRemovesFiles()
{
    const QString collection = QStringLiteral("normative_regionale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))})
                .ok());
    QVERIFY(m_backend->upsert(QStringLiteral("normative_comunale"),
                              {makeRecord(QStringLiteral("b"), 1, QStringLiteral("Roma"))})
                .ok());

    const QDir dir(m_backend->directory());
    QVERIFY(QFileInfo::exists(dir.filePath(collection + QStringLiteral(".hnsw"))));
    QVERIFY(QFileInfo::exists(dir.filePath(collection + QStringLiteral(".meta.json"))));

    QVERIFY(m_backend->clear(collection).ok());
    QCOMPARE(m_backend->count(collection).count, 0);
    QVERIFY(!QFileInfo::exists(dir.filePath(collection + QStringLiteral(".hnsw"))));
    QVERIFY(!QFileInfo::exists(dir.filePath(collection + QStringLiteral(".meta.json"))));
    QVERIFY(m_backend->query(collection, basis(0), 5, {}).hits.empty());
    QCOMPARE(m_backend->count(QStringLiteral("normative_comunale")).count, 1);

    // Clearing twice is harmless and the collection can be written again.
    QVERIFY(m_backend->clear(collection).ok());
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("c"), 2, QStringLiteral("Roma"))})
                .ok());
    QCOMPARE(hitIds(m_backend->query(collection, basis(2), 5, {})),
             QStringList({QStringLiteral("c")}));
}

void TestLocalIndexBackend::testPersistenceAcrossReopen()
{
    const QString collection = QStringLiteral("normative_nazionale");
    QVERIFY(m_backend->upsert(collection, {makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma")),
                                           makeRecord(QStringLiteral("b"), 4, QStringLiteral("Roma"))})
                .ok());
    QVERIFY(m_backend->flush().ok());

    const QString directory = m_backend->directory();
    m_backend.reset();

    ul::LocalIndexBackend reopened(directory, kDims, QStringLiteral("unit-test-model"));
    QVERIFY(reopened.open().ok());
    QCOMPARE(reopened.count(collection).count, 2);

    const ul::BackendQueryResult result = reopened.query(collection, basis(4), 1, {});
    QVERIFY(result.error.ok());
    QCOMPARE(hitIds(result), QStringList({QStringLiteral("b")}));

    QVERIFY(reopened.upsert(collection, {makeRecord(QStringLiteral("c"), 6, QStringLiteral("Roma"))})
                .ok());
    QCOMPARE(hitIds(reopened.query(collection, basis(6), 1, {})),
             QStringList({QStringLiteral("c")}));
}

QTEST_MAIN(TestLocalIndexBackend)
#include "test_local_index_backend.moc"
