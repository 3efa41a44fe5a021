#include <QtTest/QtTest>
#include "core/vector/record_store.h"

#include <sqlite3.h>

#include <memory>

class TestRecordStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testReadyOnOpenDatabase();
    void testNullDatabaseIsNotReady();
    void testInsertAndLookup();
    void testInsertReplacesSameId();
    void testLabelCollisionFailsWithoutDeleting();
    void testCollectionsAreIsolated();
    void testFindMatchingOrdersByLabel();
    void testFindMatchingRejectsInvalidKey();
    void testRemoveAndClear();
    void testRollbackDiscardsInserts();
    void testMetadataJsonRoundTripKeepsText();

private:
    static ul::StoredRecord makeRecord(const QString& id, uint64_t label,
                                       const QString& municipality,
                                       const QString& collection = QStringLiteral("normative_comunale"));

    sqlite3* m_db = nullptr;
    std::unique_ptr<ul::RecordStore> m_store;
};

ul::StoredRecord TestRecordStore::makeRecord(const QString& id, uint64_t label,
                                             const QString& municipality,
                                             const QString& collection)
{
    ul::StoredRecord record;
    record.id = id;
    record.collection = collection;
    record.label = label;
    record.text = QStringLiteral("Testo del record %1").arg(id);
    record.metadata.insert(QStringLiteral("normative_level"), QStringLiteral("comunale"));
    record.metadata.insert(QStringLiteral("municipality"), municipality);
    record.metadata.insert(QStringLiteral("article"), QString::number(label + 1));
    return record;
}

void TestRecordStore::init()
{
    QCOMPARE(sqlite3_open(":memory:", &m_db), SQLITE_OK);
    m_store = std::make_unique<ul::RecordStore>(m_db);
}

void TestRecordStore::cleanup()
{
    m_store.reset();
    sqlite3_close(m_db);
    m_db = nullptr;
}

void TestRecordStore::testReadyOnOpenDatabase()
{
    QVERIFY(m_store->isReady());
    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 0);
}

void TestRecordStore::testNullDatabaseIsNotReady()
{
    ul::RecordStore store(nullptr);
    QVERIFY(!store.isReady());
    QVERIFY(!store.insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))));
    QCOMPARE(store.count(QStringLiteral("normative_comunale")), -1);
    QVERIFY(!store.findMatching(QStringLiteral("normative_comunale"), {}).has_value());
    QCOMPARE(store.lastError(), QStringLiteral("no database"));
}

void TestRecordStore::testInsertAndLookup()
{
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))));
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("b"), 1, QStringLiteral("Milano"))));
    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 2);

    const auto ref = m_store->findById(QStringLiteral("normative_comunale"), QStringLiteral("b"));
    QVERIFY(ref.has_value());
    QCOMPARE(ref->label, static_cast<uint64_t>(1));
    QVERIFY(!m_store->findById(QStringLiteral("normative_comunale"), QStringLiteral("zz")));

    const auto record = m_store->getByLabel(QStringLiteral("normative_comunale"), 0);
    QVERIFY(record.has_value());
    QCOMPARE(record->id, QStringLiteral("a"));
    QCOMPARE(record->text, QStringLiteral("Testo del record a"));
    QCOMPARE(record->metadata.value(QStringLiteral("municipality")), QStringLiteral("Roma"));
    QCOMPARE(record->metadata.value(QStringLiteral("article")), QStringLiteral("1"));
    QVERIFY(!m_store->getByLabel(QStringLiteral("normative_comunale"), 42));
}

void TestRecordStore::testInsertReplacesSameId()
{
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))));
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 5, QStringLiteral("Torino"))));

    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 1);
    const auto ref = m_store->findById(QStringLiteral("normative_comunale"), QStringLiteral("a"));
    QVERIFY(ref.has_value());
    QCOMPARE(ref->label, static_cast<uint64_t>(5));
    QVERIFY(!m_store->getByLabel(QStringLiteral("normative_comunale"), 0));
}

void TestRecordStore::testLabelCollisionFailsWithoutDeleting()
{
    const QString collection = QStringLiteral("normative_comunale");
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 3, QStringLiteral("Roma"))));
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("b"), 4, QStringLiteral("Roma"))));

    // A stale graph handing out label 3 again must not evict "a".
    QVERIFY(!m_store->insert(makeRecord(QStringLiteral("c"), 3, QStringLiteral("Milano"))));
    QCOMPARE(m_store->count(collection), 2);
    QVERIFY(!m_store->findById(collection, QStringLiteral("c")).has_value());
    const auto owner = m_store->getByLabel(collection, 3);
    QVERIFY(owner.has_value());
    QCOMPARE(owner->id, QStringLiteral("a"));

    // Same for an existing id moved onto another record's label.
    QVERIFY(!m_store->insert(makeRecord(QStringLiteral("b"), 3, QStringLiteral("Milano"))));
    QCOMPARE(m_store->findById(collection, QStringLiteral("b"))->label, static_cast<uint64_t>(4));

    // The same label in another collection is unrelated.
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("c"), 3, QStringLiteral("Milano"),
                                       QStringLiteral("normative_regionale"))));
}

void TestRecordStore::testCollectionsAreIsolated()
{
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))));
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"),
                                       QStringLiteral("normative_nazionale"))));

    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 1);
    QCOMPARE(m_store->count(QStringLiteral("normative_nazionale")), 1);

    QVERIFY(m_store->clearCollection(QStringLiteral("normative_nazionale")));
    QCOMPARE(m_store->count(QStringLiteral("normative_nazionale")), 0);
    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 1);
}

void TestRecordStore::testFindMatchingOrdersByLabel()
{
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("c"), 7, QStringLiteral("Roma"))));
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 2, QStringLiteral("Roma"))));
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("b"), 4, QStringLiteral("Milano"))));

    ul::MetadataFilter filter;
    filter.insert(QStringLiteral("municipality"), QStringLiteral("Roma"));
    const auto matching = m_store->findMatching(QStringLiteral("normative_comunale"), filter);
    QVERIFY(matching.has_value());
    QCOMPARE(static_cast<int>(matching->size()), 2);
    QCOMPARE(matching->at(0).id, QStringLiteral("a"));
    QCOMPARE(matching->at(1).id, QStringLiteral("c"));

    filter.insert(QStringLiteral("article"), QStringLiteral("8"));
    const auto conjunction = m_store->findMatching(QStringLiteral("normative_comunale"), filter);
    QVERIFY(conjunction.has_value());
    QCOMPARE(static_cast<int>(conjunction->size()), 1);
    QCOMPARE(conjunction->front().label, static_cast<uint64_t>(7));

    const auto all = m_store->findMatching(QStringLiteral("normative_comunale"), {});
    QVERIFY(all.has_value());
    QCOMPARE(static_cast<int>(all->size()), 3);

    ul::MetadataFilter absent;
    absent.insert(QStringLiteral("region"), QStringLiteral("Lazio"));
    const auto none = m_store->findMatching(QStringLiteral("normative_comunale"), absent);
    QVERIFY(none.has_value());
    QVERIFY(none->empty());
}

void TestRecordStore::testFindMatchingRejectsInvalidKey()
{
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))));

    ul::MetadataFilter filter;
    filter.insert(QStringLiteral("municipality') OR 1=1 --"), QStringLiteral("x"));
    QVERIFY(!m_store->findMatching(QStringLiteral("normative_comunale"), filter).has_value());
}

void TestRecordStore::testRemoveAndClear()
{
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))));
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("b"), 1, QStringLiteral("Roma"))));

    QVERIFY(m_store->removeById(QStringLiteral("normative_comunale"), QStringLiteral("a")));
    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 1);
    QVERIFY(!m_store->findById(QStringLiteral("normative_comunale"), QStringLiteral("a")));

    QVERIFY(m_store->clearCollection(QStringLiteral("normative_comunale")));
    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 0);
}

void TestRecordStore::testRollbackDiscardsInserts()
{
    QVERIFY(m_store->beginTransaction());
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("a"), 0, QStringLiteral("Roma"))));
    QVERIFY(m_store->rollback());
    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 0);

    QVERIFY(m_store->beginTransaction());
    QVERIFY(m_store->insert(makeRecord(QStringLiteral("b"), 1, QStringLiteral("Roma"))));
    QVERIFY(m_store->commit());
    QCOMPARE(m_store->count(QStringLiteral("normative_comunale")), 1);
}

void TestRecordStore::testMetadataJsonRoundTripKeepsText()
{
    ul::MetadataMap metadata;
    metadata.insert(QStringLiteral("municipality"), QStringLiteral("Città di Castello"));
    metadata.insert(QStringLiteral("law_year"), QStringLiteral("1999"));

    const QString json = ul::RecordStore::metadataToJson(metadata);
    QVERIFY(json.contains(QStringLiteral("\"law_year\":\"1999\"")));
    QCOMPARE(ul::RecordStore::metadataFromJson(json), metadata);
    QVERIFY(ul::RecordStore::metadataFromJson(QStringLiteral("not json")).isEmpty());
}

QTEST_MAIN(TestRecordStore)
#include "test_record_store.moc"
