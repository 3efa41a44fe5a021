#include "core/ingest/document_processor.h"
#include "core/ingest/text_normalizer.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QRegularExpression>

#include <algorithm>

namespace ul {

namespace {

const QRegularExpression& articleHeadingPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("\\bArt(?:icolo)?\\s+(\\d+)"),
        QRegularExpression::CaseInsensitiveOption);
    return pattern;
}

QString canonicalLawType(const QString& raw)
{
    const QString compact = raw.toUpper().remove(QLatin1Char('.')).simplified();
    if (compact == QLatin1String("LR")) {
        return QStringLiteral("LR");
    }
    if (compact == QLatin1String("DPR")) {
        return QStringLiteral("DPR");
    }
    if (compact == QLatin1String("LEGGE REGIONALE")) {
        return QStringLiteral("Legge Regionale");
    }
    return QStringLiteral("Decreto");
}

SplitterConfig partSplitterConfig(const ProcessorConfig& config)
{
    SplitterConfig splitter;
    splitter.chunkSize = config.chunkSize;
    // Article parts are contiguous so that concatenation gives back the article.
    splitter.chunkOverlap = 0;
    return splitter;
}

SplitterConfig fallbackSplitterConfig(const ProcessorConfig& config)
{
    SplitterConfig splitter;
    splitter.chunkSize = config.chunkSize;
    splitter.chunkOverlap = config.chunkOverlap;
    return splitter;
}

} // namespace

QString processStrategyToString(ProcessResult::Strategy strategy)
{
    switch (strategy) {
    case ProcessResult::Strategy::None:      return QStringLiteral("none");
    case ProcessResult::Strategy::Articles:  return QStringLiteral("articles");
    case ProcessResult::Strategy::Recursive: return QStringLiteral("recursive");
    }
    return QStringLiteral("none");
}

DocumentProcessor::DocumentProcessor(const Config& config)
    : m_config(config)
    , m_splitter(fallbackSplitterConfig(config))
    , m_partSplitter(partSplitterConfig(config))
{
    if (m_config.articleOverflowFactor < 1.0) {
        m_config.articleOverflowFactor = 1.0;
    }
}

std::optional<LawReference> DocumentProcessor::extractLawReference(const QString& text)
{
    static const QRegularExpression pattern(
        QStringLiteral("(L\\.R\\.|\\bLR\\b|\\bLegge\\s+Regionale\\b|D\\.P\\.R\\.|\\bDPR\\b|\\bDecreto\\b)"
                       "\\s*(?:n\\.?\\s*)?(\\d+)(?:\\s*/\\s*|\\s+)(\\d{4})\\b"),
        QRegularExpression::CaseInsensitiveOption);

    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    LawReference ref;
    ref.type = canonicalLawType(match.captured(1));
    ref.number = match.captured(2);
    ref.year = match.captured(3);
    return ref;
}

std::optional<QString> DocumentProcessor::leadingArticle(const QString& text)
{
    const QRegularExpressionMatch match = articleHeadingPattern().match(
        text, 0, QRegularExpression::NormalMatch,
        QRegularExpression::AnchorAtOffsetMatchOption);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1);
}

ProcessResult DocumentProcessor::process(const RegulatoryDocument& document) const
{
    std::optional<QString> source;
    if (!document.sourcePath.isEmpty()) {
        source = document.sourcePath;
    }
    return process(document.text, normativeLevelToString(document.level),
                   document.region, document.province, document.municipality, source);
}

ProcessResult DocumentProcessor::process(const QString& text,
                                         const QString& tierName,
                                         const std::optional<QString>& region,
                                         const std::optional<QString>& province,
                                         const std::optional<QString>& municipality,
                                         const std::optional<QString>& source) const
{
    ProcessResult result;
    const QString operation = QStringLiteral("process");
    const QString documentId = source.value_or(QString());

    const std::optional<NormativeLevel> level = normativeLevelFromString(tierName);
    if (!level.has_value()) {
        result.error = ErrorInfo::make(
            ErrorKind::Validation,
            QStringLiteral("Unknown tier '%1' (expected nazionale, regionale or comunale)")
                .arg(tierName),
            operation, tierName, documentId);
        return result;
    }

    const QString normalized = TextNormalizer::normalize(text);
    if (normalized.isEmpty()) {
        result.error = ErrorInfo::make(ErrorKind::Validation,
                                       QStringLiteral("Document text is empty"),
                                       operation, tierName, documentId);
        return result;
    }

    ChunkMetadata base;
    base.normativeLevel = *level;
    base.region = region;
    base.province = province;
    base.municipality = municipality;
    base.source = source;
    base.processedDate = QDateTime::currentDateTime().toString(Qt::ISODate);

    auto makeChunk = [&](const QString& chunkText, const std::optional<QString>& article,
                         std::optional<int> articlePart) {
        Chunk chunk;
        chunk.text = chunkText;
        chunk.metadata = base;
        chunk.metadata.article = article;
        chunk.metadata.articlePart = articlePart;

        const std::optional<LawReference> law = extractLawReference(chunkText);
        if (law.has_value()) {
            chunk.metadata.lawType = law->type;
            chunk.metadata.lawNumber = law->number;
            chunk.metadata.lawYear = law->year;
        }
        result.chunks.push_back(std::move(chunk));
    };

    struct Heading {
        qsizetype start = 0;
        QString number;
    };
    std::vector<Heading> headings;
    auto it = articleHeadingPattern().globalMatch(normalized);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        headings.push_back({m.capturedStart(), m.captured(1)});
    }

    if (headings.size() < 2) {
        result.strategy = ProcessResult::Strategy::Recursive;
        for (const QString& piece : m_splitter.split(normalized)) {
            makeChunk(piece, leadingArticle(piece), std::nullopt);
        }
    } else {
        result.strategy = ProcessResult::Strategy::Articles;

        const QString preamble = normalized.left(headings.front().start).trimmed();
        if (!preamble.isEmpty()) {
            makeChunk(preamble, std::nullopt, std::nullopt);
        }

        const double overflowLimit = m_config.chunkSize * m_config.articleOverflowFactor;
        for (size_t i = 0; i < headings.size(); ++i) {
            const qsizetype start = headings[i].start;
            const qsizetype end = (i + 1 < headings.size()) ? headings[i + 1].start
                                                            : normalized.size();
            const QString span = normalized.mid(start, end - start).trimmed();
            if (span.isEmpty()) {
                continue;
            }

            if (span.size() > overflowLimit) {
                const std::vector<QString> parts = m_partSplitter.split(span);
                for (size_t part = 0; part < parts.size(); ++part) {
                    makeChunk(parts[part], headings[i].number, static_cast<int>(part + 1));
                }
            } else {
                makeChunk(span, headings[i].number, std::nullopt);
            }
        }
    }

    LOG_INFO(ulIngest, "Processed %s [%s]: %d chunks (%s)",
             qUtf8Printable(documentId.isEmpty() ? QStringLiteral("<inline>") : documentId),
             qUtf8Printable(tierName),
             static_cast<int>(result.chunks.size()),
             qUtf8Printable(processStrategyToString(result.strategy)));
    return result;
}

ProcessResult DocumentProcessor::processFile(const QString& path,
                                             const QString& tierName,
                                             const std::optional<QString>& region,
                                             const std::optional<QString>& province,
                                             const std::optional<QString>& municipality)
{
    ProcessResult result;

    const std::optional<NormativeLevel> level = normativeLevelFromString(tierName);
    if (!level.has_value()) {
        result.error = ErrorInfo::make(ErrorKind::Validation,
                                       QStringLiteral("Unknown tier '%1'").arg(tierName),
                                       QStringLiteral("processFile"), tierName, path);
        return result;
    }

    LoadResult loaded = m_loader.load(path, *level, region, province, municipality);
    if (!loaded.ok()) {
        result.error = loaded.error;
        return result;
    }

    return process(*loaded.document);
}

DirectoryIngestReport DocumentProcessor::processDirectory(const QString& directory,
                                                          const QString& tierName,
                                                          const std::optional<QString>& region,
                                                          const std::optional<QString>& province,
                                                          const std::optional<QString>& municipality,
                                                          bool recursive)
{
    DirectoryIngestReport report;

    const QFileInfo dirInfo(directory);
    if (!dirInfo.exists() || !dirInfo.isDir()) {
        report.error = ErrorInfo::make(ErrorKind::Load,
                                       QStringLiteral("Not a directory"),
                                       QStringLiteral("processDirectory"), tierName, directory);
        LOG_ERROR(ulIngest, "%s", qUtf8Printable(report.error.toString()));
        return report;
    }

    QStringList files;
    QDirIterator it(directory, QDir::Files | QDir::Readable,
                    recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
    while (it.hasNext()) {
        const QString file = it.next();
        if (m_loader.supportsFile(file)) {
            files.append(file);
        }
    }
    // Deterministic ingestion order regardless of filesystem enumeration.
    std::sort(files.begin(), files.end());

    for (const QString& file : files) {
        ProcessResult fileResult = processFile(file, tierName, region, province, municipality);
        if (!fileResult.ok()) {
            LOG_WARN(ulIngest, "Skipping %s: %s", qUtf8Printable(file),
                     qUtf8Printable(fileResult.error.toString()));
            report.failures.push_back({file, fileResult.error});
            continue;
        }

        report.processedFiles.append(file);
        for (Chunk& chunk : fileResult.chunks) {
            report.chunks.push_back(std::move(chunk));
        }
    }

    LOG_INFO(ulIngest, "Directory %s: %d files, %d chunks, %d failures",
             qUtf8Printable(directory),
             static_cast<int>(report.processedFiles.size()),
             static_cast<int>(report.chunks.size()),
             static_cast<int>(report.failures.size()));
    return report;
}

} // namespace ul
