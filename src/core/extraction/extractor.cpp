#include "core/extraction/extractor.h"
#include "core/shared/logging.h"

#include <QFileInfo>

namespace ul {

std::optional<ExtractionResult> FileExtractor::checkSource(const QString& filePath, qint64 maxBytes)
{
    const QFileInfo info(filePath);
    ExtractionResult failure;
    failure.status = ExtractionResult::Status::Inaccessible;

    if (!info.exists() || !info.isFile()) {
        failure.errorMessage = QStringLiteral("File does not exist or is not a regular file");
        return failure;
    }
    if (!info.isReadable()) {
        failure.errorMessage = QStringLiteral("File is not readable");
        return failure;
    }
    if (maxBytes > 0 && info.size() > maxBytes) {
        failure.status = ExtractionResult::Status::SizeExceeded;
        failure.errorMessage = QStringLiteral("File size %1 bytes exceeds limit of %2 bytes")
                                   .arg(info.size())
                                   .arg(maxBytes);
        LOG_INFO(ulExtraction, "Skipping oversized source %s (%lld bytes)",
                 qUtf8Printable(filePath), static_cast<long long>(info.size()));
        return failure;
    }
    return std::nullopt;
}

} // namespace ul
