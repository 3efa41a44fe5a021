#include "core/retrieval/citation.h"

#include <QStringList>

namespace ul {

Citation Citation::fromChunk(const Chunk& chunk)
{
    const ChunkMetadata& metadata = chunk.metadata;

    Citation citation;
    citation.level = metadata.normativeLevel;
    citation.hierarchyLevel = metadata.hierarchyLevel;

    const QString law = metadata.lawReference();
    if (!law.isEmpty()) {
        citation.law = law;
    }
    if (metadata.article.has_value() && !metadata.article->isEmpty()) {
        citation.article = metadata.article;
    }
    if (metadata.municipality.has_value() && !metadata.municipality->isEmpty()) {
        citation.municipality = metadata.municipality;
    } else if (metadata.province.has_value() && !metadata.province->isEmpty()) {
        citation.province = metadata.province;
    } else if (metadata.region.has_value() && !metadata.region->isEmpty()) {
        citation.region = metadata.region;
    }

    if (chunk.text.size() > kPreviewLength) {
        // Never end the preview on the first half of a surrogate pair.
        int cut = kPreviewLength;
        if (chunk.text.at(cut - 1).isHighSurrogate()) {
            --cut;
        }
        citation.preview = chunk.text.left(cut);
        citation.preview += QStringLiteral("...");
    } else {
        citation.preview = chunk.text;
    }
    return citation;
}

QString Citation::levelName() const
{
    if (hierarchyLevel.has_value()) {
        return hierarchyLevelToString(*hierarchyLevel).toLower();
    }
    if (level == NormativeLevel::Regionale && province.has_value()) {
        return hierarchyLevelToString(HierarchyLevel::Provinciale).toLower();
    }
    return normativeLevelToString(level);
}

QString Citation::displayText() const
{
    QStringList parts;
    if (law.has_value()) {
        parts.append(*law);
    }
    if (article.has_value()) {
        parts.append(QStringLiteral("Art. %1").arg(*article));
    }

    QString text = parts.isEmpty() ? levelName() : parts.join(QStringLiteral(", "));
    if (municipality.has_value()) {
        text += QStringLiteral(" (Comune di %1)").arg(*municipality);
    } else if (province.has_value()) {
        text += QStringLiteral(" (Provincia di %1)").arg(*province);
    } else if (region.has_value()) {
        text += QStringLiteral(" (Regione %1)").arg(*region);
    }
    return text;
}

QJsonObject Citation::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("level")] = levelName();
    json[QStringLiteral("text")] = preview;
    if (law.has_value()) {
        json[QStringLiteral("law")] = *law;
    }
    if (article.has_value()) {
        json[QStringLiteral("article")] = *article;
    }
    if (municipality.has_value()) {
        json[QStringLiteral("municipality")] = *municipality;
    } else if (province.has_value()) {
        json[QStringLiteral("province")] = *province;
    } else if (region.has_value()) {
        json[QStringLiteral("region")] = *region;
    }
    return json;
}

std::vector<Citation> citationsFor(const std::vector<Chunk>& chunks)
{
    std::vector<Citation> citations;
    citations.reserve(chunks.size());
    for (const Chunk& chunk : chunks) {
        citations.push_back(Citation::fromChunk(chunk));
    }
    return citations;
}

} // namespace ul
