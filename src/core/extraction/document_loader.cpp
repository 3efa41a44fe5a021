#include "core/extraction/document_loader.h"
#include "core/shared/logging.h"

#include <QFileInfo>

namespace ul {

DocumentLoader::DocumentLoader()
    : m_textExtractor(std::make_unique<TextExtractor>())
    , m_htmlExtractor(std::make_unique<HtmlExtractor>())
    , m_pdfExtractor(std::make_unique<PdfExtractor>())
{
}

DocumentLoader::~DocumentLoader() = default;

QStringList DocumentLoader::supportedSuffixes()
{
    return {QStringLiteral("txt"), QStringLiteral("html"), QStringLiteral("htm"),
            QStringLiteral("pdf")};
}

FileExtractor* DocumentLoader::extractorFor(const QString& suffix) const
{
    if (m_textExtractor->supports(suffix)) {
        return m_textExtractor.get();
    }
    if (m_htmlExtractor->supports(suffix)) {
        return m_htmlExtractor.get();
    }
    if (m_pdfExtractor->supports(suffix)) {
        return m_pdfExtractor.get();
    }
    return nullptr;
}

bool DocumentLoader::supportsFile(const QString& path) const
{
    return extractorFor(QFileInfo(path).suffix().toLower()) != nullptr;
}

LoadResult DocumentLoader::load(const QString& path,
                                NormativeLevel level,
                                const std::optional<QString>& region,
                                const std::optional<QString>& province,
                                const std::optional<QString>& municipality)
{
    LoadResult result;
    const QString operation = QStringLiteral("load");

    const QString suffix = QFileInfo(path).suffix().toLower();
    FileExtractor* extractor = extractorFor(suffix);
    if (!extractor) {
        result.error = ErrorInfo::make(
            ErrorKind::Format,
            QStringLiteral("Unsupported file type '.%1'").arg(suffix),
            operation, normativeLevelToString(level), path);
        return result;
    }

    ExtractionResult extracted = extractor->extract(path);
    if (extracted.status != ExtractionResult::Status::Success || !extracted.content.has_value()) {
        result.error = ErrorInfo::make(
            ErrorKind::Load,
            extracted.errorMessage.value_or(QStringLiteral("Extraction failed")),
            operation, normativeLevelToString(level), path);
        LOG_WARN(ulExtraction, "%s", qUtf8Printable(result.error.toString()));
        return result;
    }

    if (extracted.content->trimmed().isEmpty()) {
        result.error = ErrorInfo::make(ErrorKind::Load,
                                       QStringLiteral("Document contains no text"),
                                       operation, normativeLevelToString(level), path);
        LOG_WARN(ulExtraction, "%s", qUtf8Printable(result.error.toString()));
        return result;
    }

    RegulatoryDocument document;
    document.text = std::move(*extracted.content);
    document.sourcePath = path;
    document.level = level;
    document.region = region;
    document.province = province;
    document.municipality = municipality;

    LOG_INFO(ulExtraction, "Loaded %s (%lld chars, %d ms)",
             qUtf8Printable(path), static_cast<long long>(document.text.size()),
             extracted.durationMs);

    result.document = std::move(document);
    return result;
}

} // namespace ul
