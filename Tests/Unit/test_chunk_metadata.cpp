#include <QtTest/QtTest>
#include "core/shared/chunk.h"
#include "core/shared/error.h"

class TestChunkMetadata : public QObject {
    Q_OBJECT

private slots:
    void testNormativeLevelNames();
    void testHierarchyLevelNames();
    void testProvincialStoredAsRegional();
    void testMetadataKeyValidation();
    void testFlattenOmitsAbsentFields();
    void testFlattenRoundTripKeepsExtraKeys();
    void testFromMapParsesScoreAndRejectsBadPart();
    void testLawReference();
    void testErrorInfoToString();
};

void TestChunkMetadata::testNormativeLevelNames()
{
    QCOMPARE(ul::normativeLevelToString(ul::NormativeLevel::Comunale), QStringLiteral("comunale"));
    QCOMPARE(ul::normativeLevelFromString(QStringLiteral(" Regionale ")),
             std::optional<ul::NormativeLevel>(ul::NormativeLevel::Regionale));
    QVERIFY(!ul::normativeLevelFromString(QStringLiteral("provinciale")).has_value());
}

void TestChunkMetadata::testHierarchyLevelNames()
{
    QCOMPARE(ul::hierarchyLevelToString(ul::HierarchyLevel::Provinciale),
             QStringLiteral("Provinciale"));
    QCOMPARE(ul::hierarchyLevelFromTierName(QStringLiteral("PROVINCIALE")),
             std::optional<ul::HierarchyLevel>(ul::HierarchyLevel::Provinciale));
    QVERIFY(!ul::hierarchyLevelFromTierName(QStringLiteral("europeo")).has_value());
}

void TestChunkMetadata::testProvincialStoredAsRegional()
{
    QCOMPARE(ul::storageLevelFor(ul::HierarchyLevel::Provinciale), ul::NormativeLevel::Regionale);
    QCOMPARE(ul::storageLevelFor(ul::HierarchyLevel::Comunale), ul::NormativeLevel::Comunale);
    QCOMPARE(ul::storageLevelFor(ul::HierarchyLevel::Nazionale), ul::NormativeLevel::Nazionale);
}

void TestChunkMetadata::testMetadataKeyValidation()
{
    QVERIFY(ul::isValidMetadataKey(QStringLiteral("municipality")));
    QVERIFY(ul::isValidMetadataKey(QStringLiteral("_law2")));
    QVERIFY(!ul::isValidMetadataKey(QString()));
    QVERIFY(!ul::isValidMetadataKey(QStringLiteral("2law")));
    QVERIFY(!ul::isValidMetadataKey(QStringLiteral("a.b")));
    QVERIFY(!ul::isValidMetadataKey(QStringLiteral("x') OR 1=1 --")));
}

void TestChunkMetadata::testFlattenOmitsAbsentFields()
{
    ul::ChunkMetadata metadata;
    metadata.normativeLevel = ul::NormativeLevel::Nazionale;
    metadata.article = QStringLiteral("3");

    const ul::MetadataMap map = ul::toMetadataMap(metadata);
    QCOMPARE(map.value(QStringLiteral("normative_level")), QStringLiteral("nazionale"));
    QCOMPARE(map.value(QStringLiteral("article")), QStringLiteral("3"));
    QVERIFY(!map.contains(QStringLiteral("region")));
    QVERIFY(!map.contains(QStringLiteral("article_part")));
    QVERIFY(!map.contains(QStringLiteral("processed_date")));
    QVERIFY(!map.contains(QStringLiteral("score")));
}

void TestChunkMetadata::testFlattenRoundTripKeepsExtraKeys()
{
    ul::ChunkMetadata metadata;
    metadata.normativeLevel = ul::NormativeLevel::Regionale;
    metadata.region = QStringLiteral("Lazio");
    metadata.province = QStringLiteral("Viterbo");
    metadata.lawType = QStringLiteral("LR");
    metadata.lawNumber = QStringLiteral("38");
    metadata.lawYear = QStringLiteral("1999");
    metadata.articlePart = 2;
    metadata.processedDate = QStringLiteral("2026-01-15T10:00:00");
    metadata.source = QStringLiteral("/norme/lr38.pdf");
    metadata.extra.insert(QStringLiteral("gazzetta"), QStringLiteral("BUR 24"));

    const ul::ChunkMetadata back = ul::fromMetadataMap(ul::toMetadataMap(metadata));
    QCOMPARE(back.normativeLevel, ul::NormativeLevel::Regionale);
    QCOMPARE(back.region, metadata.region);
    QCOMPARE(back.province, metadata.province);
    QVERIFY(!back.municipality.has_value());
    QCOMPARE(back.lawReference(), QStringLiteral("LR 38/1999"));
    QCOMPARE(back.articlePart, std::optional<int>(2));
    QCOMPARE(back.processedDate, metadata.processedDate);
    QCOMPARE(back.source, metadata.source);
    QCOMPARE(back.extra.value(QStringLiteral("gazzetta")), QStringLiteral("BUR 24"));
    QCOMPARE(static_cast<int>(back.extra.size()), 1);
}

void TestChunkMetadata::testFromMapParsesScoreAndRejectsBadPart()
{
    ul::MetadataMap map;
    map.insert(QStringLiteral("normative_level"), QStringLiteral("comunale"));
    map.insert(QStringLiteral("score"), QStringLiteral("0.82"));
    map.insert(QStringLiteral("article_part"), QStringLiteral("zero"));

    const ul::ChunkMetadata metadata = ul::fromMetadataMap(map);
    QCOMPARE(metadata.normativeLevel, ul::NormativeLevel::Comunale);
    QVERIFY(metadata.score.has_value());
    QVERIFY(qFuzzyCompare(*metadata.score, 0.82));
    QVERIFY(!metadata.articlePart.has_value());
    QVERIFY(metadata.extra.isEmpty());
}

void TestChunkMetadata::testLawReference()
{
    ul::ChunkMetadata metadata;
    QVERIFY(metadata.lawReference().isEmpty());
    metadata.lawType = QStringLiteral("DPR");
    QVERIFY(metadata.lawReference().isEmpty());
    metadata.lawNumber = QStringLiteral("380");
    metadata.lawYear = QStringLiteral("2001");
    QCOMPARE(metadata.lawReference(), QStringLiteral("DPR 380/2001"));
}

void TestChunkMetadata::testErrorInfoToString()
{
    ul::ErrorInfo ok;
    QVERIFY(ok.ok());

    const ul::ErrorInfo error = ul::ErrorInfo::make(ul::ErrorKind::Backend,
                                                    QStringLiteral("disk full"),
                                                    QStringLiteral("upsert"),
                                                    QStringLiteral("comunale"),
                                                    QStringLiteral("doc-1"));
    QVERIFY(!error.ok());
    QCOMPARE(error.toString(),
             QStringLiteral("BackendError [operation=upsert tier=comunale document=doc-1]: disk full"));
    QCOMPARE(ul::ErrorInfo::make(ul::ErrorKind::Validation, QStringLiteral("bad key")).toString(),
             QStringLiteral("ValidationError: bad key"));
}

QTEST_MAIN(TestChunkMetadata)
#include "test_chunk_metadata.moc"
