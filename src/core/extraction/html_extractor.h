#pragma once

#include "core/extraction/extractor.h"

namespace ul {

// HtmlExtractor -- visible text of regulation pages saved as .html/.htm.
//
// Script, style and comment blocks are dropped, block-level tags become
// line breaks, remaining tags are stripped and common entities decoded.
class HtmlExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QString& filePath) override;
    bool supports(const QString& extension) const override;

    static QString htmlToText(const QString& html);
};

} // namespace ul
