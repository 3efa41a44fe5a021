#pragma once

#include <QString>
#include <QtGlobal>

#include <optional>

namespace ul {

// Result of a text extraction attempt.
// Every extraction produces a status; content is present only on Success.
struct ExtractionResult {
    enum class Status {
        Success,
        CorruptedFile,
        UnsupportedFormat,
        SizeExceeded,
        Inaccessible,
        Unknown,
    };

    Status status = Status::Unknown;
    std::optional<QString> content;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

// FileExtractor -- abstract interface for source-document text extraction.
//
// Each implementation handles one family of regulatory source formats
// (plain text, HTML pages saved from official portals, PDF gazettes).
// DocumentLoader selects the extractor by file suffix.
class FileExtractor {
public:
    virtual ~FileExtractor() = default;

    virtual ExtractionResult extract(const QString& filePath) = 0;

    // extension is lowercase without a leading dot (e.g. "pdf").
    virtual bool supports(const QString& extension) const = 0;

protected:
    // Failure result when filePath is missing, unreadable or larger than
    // maxBytes (0 disables the size check); nullopt when it can be read.
    static std::optional<ExtractionResult> checkSource(const QString& filePath, qint64 maxBytes = 0);
};

} // namespace ul
