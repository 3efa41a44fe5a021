#pragma once

#include "core/extraction/extractor.h"
#include "core/extraction/html_extractor.h"
#include "core/extraction/pdf_extractor.h"
#include "core/extraction/text_extractor.h"
#include "core/shared/chunk.h"
#include "core/shared/error.h"

#include <QStringList>

#include <memory>
#include <optional>

namespace ul {

struct LoadResult {
    std::optional<RegulatoryDocument> document;
    ErrorInfo error;

    bool ok() const { return error.ok() && document.has_value(); }
};

// DocumentLoader -- turns a source file into a RegulatoryDocument.
//
// The suffix (case-insensitive) selects the extractor. Unsupported suffixes
// are a FormatError; missing, unreadable, corrupt or empty documents are a
// LoadError.
class DocumentLoader {
public:
    DocumentLoader();
    ~DocumentLoader();

    DocumentLoader(const DocumentLoader&) = delete;
    DocumentLoader& operator=(const DocumentLoader&) = delete;

    LoadResult load(const QString& path,
                    NormativeLevel level,
                    const std::optional<QString>& region = std::nullopt,
                    const std::optional<QString>& province = std::nullopt,
                    const std::optional<QString>& municipality = std::nullopt);

    bool supportsFile(const QString& path) const;

    // Lowercase suffixes without the dot.
    static QStringList supportedSuffixes();

private:
    FileExtractor* extractorFor(const QString& suffix) const;

    std::unique_ptr<TextExtractor> m_textExtractor;
    std::unique_ptr<HtmlExtractor> m_htmlExtractor;
    std::unique_ptr<PdfExtractor> m_pdfExtractor;
};

} // namespace ul
