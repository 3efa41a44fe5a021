#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>
#include <QStringConverter>

namespace ul {

namespace {

// Consolidated codes run to a few MB; anything past this is not a regulation.
constexpr qint64 kMaxTextBytes = 50 * 1024 * 1024;

} // namespace

bool TextExtractor::supports(const QString& extension) const
{
    return extension.compare(QLatin1String("txt"), Qt::CaseInsensitive) == 0;
}

std::optional<ExtractionResult> TextExtractor::readRaw(const QString& filePath, QByteArray& out)
{
    if (auto failure = checkSource(filePath, kMaxTextBytes)) {
        return failure;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        ExtractionResult failure;
        failure.status = ExtractionResult::Status::Inaccessible;
        failure.errorMessage = QStringLiteral("Cannot open %1: %2")
                                   .arg(filePath, file.errorString());
        return failure;
    }
    out = file.readAll();
    return std::nullopt;
}

QString TextExtractor::decode(const QByteArray& rawBytes, const QString& filePath)
{
    QStringDecoder utf8(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    const QString text = utf8(rawBytes);
    if (!utf8.hasError()) {
        return text;
    }

    LOG_DEBUG(ulExtraction, "%s is not valid UTF-8, reading as Latin-1",
              qUtf8Printable(filePath));
    return QString::fromLatin1(rawBytes);
}

ExtractionResult TextExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    QByteArray rawBytes;
    std::optional<ExtractionResult> failure = readRaw(filePath, rawBytes);
    if (failure.has_value()) {
        failure->durationMs = static_cast<int>(timer.elapsed());
        return *failure;
    }

    ExtractionResult result;
    result.status = ExtractionResult::Status::Success;
    result.content = decode(rawBytes, filePath);
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_DEBUG(ulExtraction, "Read %lld chars of plain text from %s",
              static_cast<long long>(result.content->size()), qUtf8Printable(filePath));
    return result;
}

} // namespace ul
