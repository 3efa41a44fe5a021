#include <QtTest/QtTest>
#include "core/ingest/document_processor.h"
#include "core/ingest/text_normalizer.h"

#include <QDir>
#include <QFile>
#include <QSet>
#include <QTemporaryDir>

class TestDocumentProcessor : public QObject {
    Q_OBJECT

private slots:
    // ── Validation ───────────────────────────────────────────────
    void testEmptyDocumentRejected();
    void testUnknownTierRejected();
    void testProvincialTierRejected();

    // ── Article-aligned chunking ─────────────────────────────────
    void testArticleChunksAreLossless();
    void testArticleNeverRepeatsAcrossNonAdjacentChunks();
    void testPreambleBecomesOwnChunk();
    void testLongArticleSplitIntoParts();

    // ── Fallback splitting ───────────────────────────────────────
    void testSingleHeadingUsesFallback();
    void testFallbackChunksBoundedByOverflowLimit();

    // ── Metadata ─────────────────────────────────────────────────
    void testJurisdictionMetadataStoredAsSupplied();
    void testLawReferenceOnlyFromChunk();
    void testExtractLawReferenceVariants();
    void testLeadingArticle();
    void testProcessRegulatoryDocument();

    // ── Files and directories ────────────────────────────────────
    void testProcessFileSetsSource();
    void testProcessDirectoryIsolatesFailures();
    void testProcessDirectoryNonRecursive();
    void testProcessDirectoryMissing();

private:
    static QString regulationText();
    static QString filler(int words);
    static void writeFile(const QString& path, const QByteArray& content);
    static QString stripWhitespace(const QString& text);
};

QString TestDocumentProcessor::filler(int words)
{
    QStringList list;
    for (int i = 0; i < words; ++i) {
        list.append(QStringLiteral("prescrizione%1").arg(i));
    }
    return list.join(QLatin1Char(' ')) + QStringLiteral(".");
}

QString TestDocumentProcessor::regulationText()
{
    return QStringLiteral(
               "REGOLAMENTO EDILIZIO COMUNALE\n\n"
               "Art. 1 Oggetto\nIl presente regolamento disciplina l'attivita' edilizia.\n\n"
               "Art. 2 Definizioni\nSi applicano le definizioni della L.R. n. 38/1999 "
               "e del comma  3.\n\n"
               "Art. 3 Distanze\n")
        + filler(80);
}

void TestDocumentProcessor::writeFile(const QString& path, const QByteArray& content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(content);
}

QString TestDocumentProcessor::stripWhitespace(const QString& text)
{
    QString out;
    for (const QChar ch : text) {
        if (!ch.isSpace()) {
            out.append(ch);
        }
    }
    return out;
}

// ── Validation ───────────────────────────────────────────────────

void TestDocumentProcessor::testEmptyDocumentRejected()
{
    ul::DocumentProcessor processor;
    const auto result = processor.process(QStringLiteral("  \n "), QStringLiteral("nazionale"));
    QVERIFY(!result.ok());
    QCOMPARE(result.error.kind, ul::ErrorKind::Validation);
    QVERIFY(result.chunks.empty());
}

void TestDocumentProcessor::testUnknownTierRejected()
{
    ul::DocumentProcessor processor;
    const auto result = processor.process(QStringLiteral("Art. 1 testo"), QStringLiteral("europeo"));
    QCOMPARE(result.error.kind, ul::ErrorKind::Validation);
    QCOMPARE(result.error.tier, QStringLiteral("europeo"));
}

void TestDocumentProcessor::testProvincialTierRejected()
{
    ul::DocumentProcessor processor;
    const auto result = processor.process(QStringLiteral("Art. 1 testo"),
                                          QStringLiteral("provinciale"));
    QCOMPARE(result.error.kind, ul::ErrorKind::Validation);
}

// ── Article-aligned chunking ─────────────────────────────────────

void TestDocumentProcessor::testArticleChunksAreLossless()
{
    ul::ProcessorConfig config;
    config.chunkSize = 200;
    config.chunkOverlap = 40;
    ul::DocumentProcessor processor(config);

    const QString text = regulationText();
    const auto result = processor.process(text, QStringLiteral("comunale"));
    QVERIFY(result.ok());
    QCOMPARE(result.strategy, ul::ProcessResult::Strategy::Articles);

    QString joined;
    for (const auto& chunk : result.chunks) {
        QVERIFY(!chunk.text.isEmpty());
        joined += chunk.text;
    }
    QCOMPARE(stripWhitespace(joined), stripWhitespace(ul::TextNormalizer::normalize(text)));
}

void TestDocumentProcessor::testArticleNeverRepeatsAcrossNonAdjacentChunks()
{
    ul::ProcessorConfig config;
    config.chunkSize = 200;
    ul::DocumentProcessor processor(config);

    const auto result = processor.process(regulationText(), QStringLiteral("comunale"));
    QVERIFY(result.ok());

    QSet<QString> closed;
    QString current;
    for (const auto& chunk : result.chunks) {
        const QString article = chunk.metadata.article.value_or(QString());
        if (article == current) {
            continue;
        }
        QVERIFY2(!closed.contains(article), qPrintable(article));
        if (!current.isEmpty()) {
            closed.insert(current);
        }
        current = article;
    }
}

void TestDocumentProcessor::testPreambleBecomesOwnChunk()
{
    ul::DocumentProcessor processor;
    const auto result = processor.process(regulationText(), QStringLiteral("comunale"));
    QVERIFY(result.ok());
    QVERIFY(result.chunks.size() >= 4);

    QCOMPARE(result.chunks[0].text, QStringLiteral("REGOLAMENTO EDILIZIO COMUNALE"));
    QVERIFY(!result.chunks[0].metadata.article.has_value());
    QCOMPARE(result.chunks[1].metadata.article, std::optional<QString>(QStringLiteral("1")));
    QVERIFY(result.chunks[1].text.startsWith(QStringLiteral("Articolo 1 Oggetto")));
    QCOMPARE(result.chunks[2].metadata.article, std::optional<QString>(QStringLiteral("2")));
}

void TestDocumentProcessor::testLongArticleSplitIntoParts()
{
    ul::ProcessorConfig config;
    config.chunkSize = 200;
    config.articleOverflowFactor = 1.5;
    ul::DocumentProcessor processor(config);

    const auto result = processor.process(regulationText(), QStringLiteral("comunale"));
    QVERIFY(result.ok());

    int expectedPart = 1;
    for (const auto& chunk : result.chunks) {
        if (chunk.metadata.article != std::optional<QString>(QStringLiteral("3"))) {
            QVERIFY(!chunk.metadata.articlePart.has_value());
            continue;
        }
        QCOMPARE(chunk.metadata.articlePart, std::optional<int>(expectedPart));
        QVERIFY(chunk.text.size() <= 200);
        ++expectedPart;
    }
    QVERIFY(expectedPart > 2);
}

// ── Fallback splitting ───────────────────────────────────────────

void TestDocumentProcessor::testSingleHeadingUsesFallback()
{
    ul::DocumentProcessor processor;
    const auto result = processor.process(
        QStringLiteral("Art. 7 Unico articolo della delibera."), QStringLiteral("comunale"));
    QVERIFY(result.ok());
    QCOMPARE(result.strategy, ul::ProcessResult::Strategy::Recursive);
    QCOMPARE(static_cast<int>(result.chunks.size()), 1);
    QCOMPARE(result.chunks[0].metadata.article, std::optional<QString>(QStringLiteral("7")));
}

void TestDocumentProcessor::testFallbackChunksBoundedByOverflowLimit()
{
    ul::ProcessorConfig config;
    config.chunkSize = 100;
    config.chunkOverlap = 20;
    config.articleOverflowFactor = 1.5;
    ul::DocumentProcessor processor(config);

    const auto result = processor.process(filler(300), QStringLiteral("nazionale"));
    QVERIFY(result.ok());
    QCOMPARE(result.strategy, ul::ProcessResult::Strategy::Recursive);
    QVERIFY(result.chunks.size() > 10);
    for (const auto& chunk : result.chunks) {
        QVERIFY(chunk.text.size() <= 150);
        QVERIFY(!chunk.metadata.articlePart.has_value());
    }
}

// ── Metadata ─────────────────────────────────────────────────────

void TestDocumentProcessor::testJurisdictionMetadataStoredAsSupplied()
{
    ul::DocumentProcessor processor;
    const auto result = processor.process(regulationText(), QStringLiteral("comunale"),
                                          QStringLiteral("Lazio"), QStringLiteral("Viterbo"),
                                          QStringLiteral("Tarquinia"));
    QVERIFY(result.ok());
    for (const auto& chunk : result.chunks) {
        QCOMPARE(chunk.metadata.normativeLevel, ul::NormativeLevel::Comunale);
        QCOMPARE(chunk.metadata.region, std::optional<QString>(QStringLiteral("Lazio")));
        QCOMPARE(chunk.metadata.province, std::optional<QString>(QStringLiteral("Viterbo")));
        QCOMPARE(chunk.metadata.municipality, std::optional<QString>(QStringLiteral("Tarquinia")));
        QVERIFY(QDateTime::fromString(chunk.metadata.processedDate, Qt::ISODate).isValid());
        QVERIFY(!chunk.metadata.source.has_value());
    }
}

void TestDocumentProcessor::testLawReferenceOnlyFromChunk()
{
    const QString text = QStringLiteral(
        "Art. 1 Ambito. Si applica il D.P.R. 380/2001.\n"
        "Art. 2 Rinvio. Vedi anche la L.R. 38/1999.\n"
        "Art. 3 Norme finali senza riferimenti.");
    ul::DocumentProcessor processor;
    const auto result = processor.process(text, QStringLiteral("regionale"),
                                          QStringLiteral("Lazio"));
    QVERIFY(result.ok());
    QCOMPARE(static_cast<int>(result.chunks.size()), 3);

    QCOMPARE(result.chunks[0].metadata.lawReference(), QStringLiteral("DPR 380/2001"));
    QCOMPARE(result.chunks[1].metadata.lawReference(), QStringLiteral("LR 38/1999"));
    // Citations elsewhere in the document do not leak into this article.
    QVERIFY(result.chunks[2].metadata.lawReference().isEmpty());
    QVERIFY(!result.chunks[2].metadata.lawType.has_value());
    QVERIFY(!result.chunks[2].metadata.lawNumber.has_value());
}

void TestDocumentProcessor::testExtractLawReferenceVariants()
{
    auto ref = ul::DocumentProcessor::extractLawReference(QStringLiteral("ai sensi della L.R. n. 38/1999"));
    QVERIFY(ref.has_value());
    QCOMPARE(ref->type, QStringLiteral("LR"));
    QCOMPARE(ref->number, QStringLiteral("38"));
    QCOMPARE(ref->year, QStringLiteral("1999"));

    ref = ul::DocumentProcessor::extractLawReference(QStringLiteral("Legge Regionale 12 2005"));
    QVERIFY(ref.has_value());
    QCOMPARE(ref->type, QStringLiteral("Legge Regionale"));
    QCOMPARE(ref->number, QStringLiteral("12"));
    QCOMPARE(ref->year, QStringLiteral("2005"));

    ref = ul::DocumentProcessor::extractLawReference(QStringLiteral("il dpr 380 / 2001"));
    QVERIFY(ref.has_value());
    QCOMPARE(ref->type, QStringLiteral("DPR"));

    ref = ul::DocumentProcessor::extractLawReference(QStringLiteral("Decreto n.5/2010"));
    QVERIFY(ref.has_value());
    QCOMPARE(ref->type, QStringLiteral("Decreto"));
    QCOMPARE(ref->number, QStringLiteral("5"));

    QVERIFY(!ul::DocumentProcessor::extractLawReference(QStringLiteral("nessun riferimento")).has_value());
    QVERIFY(!ul::DocumentProcessor::extractLawReference(QStringLiteral("LR 38/99")).has_value());
}

void TestDocumentProcessor::testLeadingArticle()
{
    QCOMPARE(ul::DocumentProcessor::leadingArticle(QStringLiteral("Articolo 12 Distanze")),
             std::optional<QString>(QStringLiteral("12")));
    QCOMPARE(ul::DocumentProcessor::leadingArticle(QStringLiteral("Art 4 bis")),
             std::optional<QString>(QStringLiteral("4")));
    QVERIFY(!ul::DocumentProcessor::leadingArticle(QStringLiteral("come da Articolo 12")).has_value());
}

void TestDocumentProcessor::testProcessRegulatoryDocument()
{
    ul::RegulatoryDocument document;
    document.text = regulationText();
    document.sourcePath = QStringLiteral("/norme/tarquinia/re.txt");
    document.level = ul::NormativeLevel::Comunale;
    document.municipality = QStringLiteral("Tarquinia");

    ul::DocumentProcessor processor;
    const auto result = processor.process(document);
    QVERIFY(result.ok());
    for (const auto& chunk : result.chunks) {
        QCOMPARE(chunk.metadata.source, std::optional<QString>(document.sourcePath));
        QCOMPARE(chunk.metadata.municipality, document.municipality);
    }
}

// ── Files and directories ────────────────────────────────────────

void TestDocumentProcessor::testProcessFileSetsSource()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("regolamento.txt"));
    writeFile(path, regulationText().toUtf8());

    ul::DocumentProcessor processor;
    const auto result = processor.processFile(path, QStringLiteral("comunale"), std::nullopt,
                                              std::nullopt, QStringLiteral("Tarquinia"));
    QVERIFY(result.ok());
    QVERIFY(!result.chunks.empty());
    QCOMPARE(result.chunks.front().metadata.source, std::optional<QString>(path));
}

void TestDocumentProcessor::testProcessDirectoryIsolatesFailures()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    writeFile(dir.filePath(QStringLiteral("a.txt")), regulationText().toUtf8());
    writeFile(dir.filePath(QStringLiteral("b.HTML")),
              "<html><body><h1>Delibera</h1><p>Art. 1 Parcheggi</p><p>Art. 2 Verde</p></body></html>");
    writeFile(dir.filePath(QStringLiteral("empty.txt")), "   \n");
    writeFile(dir.filePath(QStringLiteral("notes.docx")), "ignored");
    QVERIFY(QDir(dir.path()).mkpath(QStringLiteral("sub")));
    writeFile(dir.filePath(QStringLiteral("sub/c.txt")), "Art. 9 Norma transitoria.");

    ul::DocumentProcessor processor;
    const auto report = processor.processDirectory(dir.path(), QStringLiteral("comunale"),
                                                   QStringLiteral("Lazio"), std::nullopt,
                                                   QStringLiteral("Tarquinia"));
    QVERIFY(report.error.ok());
    QCOMPARE(static_cast<int>(report.processedFiles.size()), 3);
    QCOMPARE(static_cast<int>(report.failures.size()), 1);
    QVERIFY(report.failures[0].path.endsWith(QStringLiteral("empty.txt")));
    QCOMPARE(report.failures[0].error.kind, ul::ErrorKind::Load);
    QVERIFY(!report.chunks.empty());
    for (const auto& chunk : report.chunks) {
        QCOMPARE(chunk.metadata.region, std::optional<QString>(QStringLiteral("Lazio")));
        QVERIFY(chunk.metadata.source.has_value());
    }
}

void TestDocumentProcessor::testProcessDirectoryNonRecursive()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    writeFile(dir.filePath(QStringLiteral("a.txt")), "Art. 1 Primo.");
    QVERIFY(QDir(dir.path()).mkpath(QStringLiteral("sub")));
    writeFile(dir.filePath(QStringLiteral("sub/c.txt")), "Art. 9 Secondo.");

    ul::DocumentProcessor processor;
    const auto report = processor.processDirectory(dir.path(), QStringLiteral("nazionale"),
                                                   std::nullopt, std::nullopt, std::nullopt,
                                                   false);
    QCOMPARE(static_cast<int>(report.processedFiles.size()), 1);
    QVERIFY(report.processedFiles[0].endsWith(QStringLiteral("a.txt")));
}

void TestDocumentProcessor::testProcessDirectoryMissing()
{
    ul::DocumentProcessor processor;
    const auto report = processor.processDirectory(QStringLiteral("/nonexistent/urbanlex/dir"),
                                                   QStringLiteral("nazionale"));
    QCOMPARE(report.error.kind, ul::ErrorKind::Load);
    QVERIFY(report.chunks.empty());
}

QTEST_MAIN(TestDocumentProcessor)
#include "test_document_processor.moc"
