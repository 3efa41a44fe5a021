#pragma once

#include "core/extraction/document_loader.h"
#include "core/ingest/text_splitter.h"
#include "core/shared/chunk.h"
#include "core/shared/error.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace ul {

struct ProcessorConfig {
    int chunkSize = 1000;
    int chunkOverlap = 200;
    // Articles longer than chunkSize * factor are split into parts.
    double articleOverflowFactor = 1.5;
};

struct LawReference {
    QString type;    // canonical: "LR", "DPR", "Legge Regionale", "Decreto"
    QString number;
    QString year;
};

struct ProcessResult {
    enum class Strategy {
        None,
        Articles,
        Recursive,
    };

    std::vector<Chunk> chunks;
    Strategy strategy = Strategy::None;
    ErrorInfo error;

    bool ok() const { return error.ok(); }
};

struct IngestFailure {
    QString path;
    ErrorInfo error;
};

struct DirectoryIngestReport {
    std::vector<Chunk> chunks;
    QStringList processedFiles;
    std::vector<IngestFailure> failures;
    // Set when the directory itself could not be walked.
    ErrorInfo error;
};

// DocumentProcessor -- normative text to article-aligned chunks.
//
// The text is normalised (TextNormalizer), then split on article headings
// ("Art. 5", "Articolo 12"). Documents with fewer than two headings fall back
// to the recursive TextSplitter. Each chunk carries jurisdiction metadata,
// the article number when the chunk starts at a heading, and the first law
// citation found in the chunk itself. A chunk citing no law has none.
//
// No storage side effects: callers hand the chunks to the index.
class DocumentProcessor {
public:
    using Config = ProcessorConfig;

    explicit DocumentProcessor(const Config& config = {});

    // tierName is "nazionale", "regionale" or "comunale".
    ProcessResult process(const QString& text,
                          const QString& tierName,
                          const std::optional<QString>& region = std::nullopt,
                          const std::optional<QString>& province = std::nullopt,
                          const std::optional<QString>& municipality = std::nullopt,
                          const std::optional<QString>& source = std::nullopt) const;

    ProcessResult process(const RegulatoryDocument& document) const;

    ProcessResult processFile(const QString& path,
                              const QString& tierName,
                              const std::optional<QString>& region = std::nullopt,
                              const std::optional<QString>& province = std::nullopt,
                              const std::optional<QString>& municipality = std::nullopt);

    // One file's failure is recorded in the report and never aborts the batch.
    DirectoryIngestReport processDirectory(const QString& directory,
                                           const QString& tierName,
                                           const std::optional<QString>& region = std::nullopt,
                                           const std::optional<QString>& province = std::nullopt,
                                           const std::optional<QString>& municipality = std::nullopt,
                                           bool recursive = true);

    // First "LR 38/1999"-style citation in text.
    static std::optional<LawReference> extractLawReference(const QString& text);

    // Article number when text starts with an article heading.
    static std::optional<QString> leadingArticle(const QString& text);

    const Config& config() const { return m_config; }

private:
    Config m_config;
    TextSplitter m_splitter;
    TextSplitter m_partSplitter;
    DocumentLoader m_loader;
};

QString processStrategyToString(ProcessResult::Strategy strategy);

} // namespace ul
