#include "core/extraction/pdf_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QRectF>
#include <QStringList>

#include <poppler/qt6/poppler-qt6.h>

#include <algorithm>
#include <memory>

namespace ul {

namespace {

constexpr int kMaxPages = 1000;
constexpr qint64 kMaxExtractedChars = 10LL * 1024 * 1024;

ExtractionResult corrupted(const QString& message, const QElapsedTimer& timer)
{
    ExtractionResult result;
    result.status = ExtractionResult::Status::CorruptedFile;
    result.errorMessage = message;
    result.durationMs = static_cast<int>(timer.elapsed());
    return result;
}

} // namespace

bool PdfExtractor::supports(const QString& extension) const
{
    return extension.compare(QLatin1String("pdf"), Qt::CaseInsensitive) == 0;
}

ExtractionResult PdfExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    if (auto failure = checkSource(filePath)) {
        failure->durationMs = static_cast<int>(timer.elapsed());
        return *failure;
    }

    const std::unique_ptr<Poppler::Document> document = Poppler::Document::load(filePath);
    if (!document) {
        LOG_WARN(ulExtraction, "Poppler could not open %s", qUtf8Printable(filePath));
        return corrupted(QStringLiteral("Failed to load PDF document"), timer);
    }
    if (document->isLocked()) {
        LOG_INFO(ulExtraction, "Skipping password-protected gazette %s", qUtf8Printable(filePath));
        return corrupted(QStringLiteral("PDF is encrypted or password-protected"), timer);
    }

    const int pageCount = std::min(document->numPages(), kMaxPages);
    if (document->numPages() > kMaxPages) {
        LOG_INFO(ulExtraction, "%s has %d pages, reading the first %d",
                 qUtf8Printable(filePath), document->numPages(), kMaxPages);
    }

    QStringList pages;
    qint64 extractedChars = 0;
    for (int i = 0; i < pageCount && extractedChars <= kMaxExtractedChars; ++i) {
        const std::unique_ptr<Poppler::Page> page = document->page(i);
        if (!page) {
            LOG_DEBUG(ulExtraction, "Page %d of %s is empty", i + 1, qUtf8Printable(filePath));
            continue;
        }
        pages.append(page->text(QRectF()));
        extractedChars += pages.last().size();
    }
    if (extractedChars > kMaxExtractedChars) {
        LOG_INFO(ulExtraction, "Stopped reading %s after %lld chars",
                 qUtf8Printable(filePath), static_cast<long long>(extractedChars));
    }

    ExtractionResult result;
    result.status = ExtractionResult::Status::Success;
    result.content = pages.join(QLatin1Char('\n'));
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_DEBUG(ulExtraction, "Read %d pages from %s in %d ms",
              static_cast<int>(pages.size()), qUtf8Printable(filePath), result.durationMs);
    return result;
}

} // namespace ul
