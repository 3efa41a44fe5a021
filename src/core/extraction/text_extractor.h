#pragma once

#include "core/extraction/extractor.h"

#include <QByteArray>

namespace ul {

// TextExtractor -- reads plain-text regulation files (.txt).
//
// Attempts UTF-8 decoding first, falling back to Latin-1 which many
// municipal portals still publish in.
//
// Size limit: files larger than 50 MB are rejected with SizeExceeded.
class TextExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QString& filePath) override;
    bool supports(const QString& extension) const override;

    // Shared with HtmlExtractor.
    static QString decode(const QByteArray& rawBytes, const QString& filePath);
    static std::optional<ExtractionResult> readRaw(const QString& filePath, QByteArray& out);
};

} // namespace ul
