#include "core/shared/chunk.h"

namespace ul {

namespace {

void putOptional(MetadataMap& map, const char* key, const std::optional<QString>& value)
{
    if (value.has_value() && !value->isEmpty()) {
        map.insert(QLatin1String(key), *value);
    }
}

std::optional<QString> takeOptional(MetadataMap& map, const char* key)
{
    const QString k = QLatin1String(key);
    auto it = map.find(k);
    if (it == map.end()) {
        return std::nullopt;
    }
    QString value = it.value();
    map.erase(it);
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

QString ChunkMetadata::lawReference() const
{
    if (!lawType.has_value() || !lawNumber.has_value()) {
        return QString();
    }
    return QStringLiteral("%1 %2/%3").arg(*lawType, *lawNumber, lawYear.value_or(QString()));
}

MetadataMap toMetadataMap(const ChunkMetadata& metadata)
{
    MetadataMap map = metadata.extra;
    map.insert(QLatin1String(metakey::kNormativeLevel),
               normativeLevelToString(metadata.normativeLevel));
    putOptional(map, metakey::kRegion, metadata.region);
    putOptional(map, metakey::kProvince, metadata.province);
    putOptional(map, metakey::kMunicipality, metadata.municipality);
    putOptional(map, metakey::kArticle, metadata.article);
    putOptional(map, metakey::kLawType, metadata.lawType);
    putOptional(map, metakey::kLawNumber, metadata.lawNumber);
    putOptional(map, metakey::kLawYear, metadata.lawYear);
    putOptional(map, metakey::kSource, metadata.source);
    if (!metadata.processedDate.isEmpty()) {
        map.insert(QLatin1String(metakey::kProcessedDate), metadata.processedDate);
    }
    if (metadata.articlePart.has_value()) {
        map.insert(QLatin1String(metakey::kArticlePart),
                   QString::number(*metadata.articlePart));
    }
    return map;
}

ChunkMetadata fromMetadataMap(const MetadataMap& map)
{
    MetadataMap rest = map;
    ChunkMetadata metadata;

    const std::optional<QString> level = takeOptional(rest, metakey::kNormativeLevel);
    if (level.has_value()) {
        metadata.normativeLevel =
            normativeLevelFromString(*level).value_or(NormativeLevel::Nazionale);
    }
    metadata.region = takeOptional(rest, metakey::kRegion);
    metadata.province = takeOptional(rest, metakey::kProvince);
    metadata.municipality = takeOptional(rest, metakey::kMunicipality);
    metadata.article = takeOptional(rest, metakey::kArticle);
    metadata.lawType = takeOptional(rest, metakey::kLawType);
    metadata.lawNumber = takeOptional(rest, metakey::kLawNumber);
    metadata.lawYear = takeOptional(rest, metakey::kLawYear);
    metadata.source = takeOptional(rest, metakey::kSource);
    metadata.processedDate = takeOptional(rest, metakey::kProcessedDate).value_or(QString());

    const std::optional<QString> part = takeOptional(rest, metakey::kArticlePart);
    if (part.has_value()) {
        bool ok = false;
        const int ordinal = part->toInt(&ok);
        if (ok && ordinal > 0) {
            metadata.articlePart = ordinal;
        }
    }

    const std::optional<QString> score = takeOptional(rest, metakey::kScore);
    if (score.has_value()) {
        bool ok = false;
        const double value = score->toDouble(&ok);
        if (ok) {
            metadata.score = value;
        }
    }

    metadata.extra = rest;
    return metadata;
}

} // namespace ul
