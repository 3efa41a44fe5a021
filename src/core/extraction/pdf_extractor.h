#pragma once

#include "core/extraction/extractor.h"

namespace ul {

// PdfExtractor -- extracts text from PDF gazettes using Poppler (Qt6).
//
// Limits:
//   - 1000-page cap per document
//   - 10 MB extracted text cap
//   - Encrypted PDFs are rejected (CorruptedFile status)
//
// Pages are joined with a single newline; no page markers are inserted so
// article headings that straddle a page break still match.
class PdfExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QString& filePath) override;
    bool supports(const QString& extension) const override;
};

} // namespace ul
