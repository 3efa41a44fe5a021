#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace ul {

// Raw regulatory text as loaded from a source file (or handed in directly).
struct RegulatoryDocument {
    QString text;
    QString sourcePath;
    NormativeLevel level = NormativeLevel::Nazionale;
    std::optional<QString> region;
    std::optional<QString> province;
    std::optional<QString> municipality;
};

// Metadata keys as stored in the index backend.
namespace metakey {
inline constexpr const char* kNormativeLevel = "normative_level";
inline constexpr const char* kRegion = "region";
inline constexpr const char* kProvince = "province";
inline constexpr const char* kMunicipality = "municipality";
inline constexpr const char* kArticle = "article";
inline constexpr const char* kLawType = "law_type";
inline constexpr const char* kLawNumber = "law_number";
inline constexpr const char* kLawYear = "law_year";
inline constexpr const char* kProcessedDate = "processed_date";
inline constexpr const char* kArticlePart = "article_part";
inline constexpr const char* kSource = "source";
inline constexpr const char* kScore = "score";
} // namespace metakey

struct ChunkMetadata {
    NormativeLevel normativeLevel = NormativeLevel::Nazionale;
    std::optional<QString> region;
    std::optional<QString> province;
    std::optional<QString> municipality;
    std::optional<QString> article;
    std::optional<QString> lawType;
    std::optional<QString> lawNumber;
    std::optional<QString> lawYear;
    QString processedDate;
    std::optional<int> articlePart;
    std::optional<QString> source;

    // Ephemeral, never persisted by the processor.
    std::optional<double> score;
    std::optional<HierarchyLevel> hierarchyLevel;
    QString contextScope;

    // Backend-specific keys that have no field above.
    MetadataMap extra;

    // "LR 38/1999" when a law citation was recognised, empty otherwise.
    QString lawReference() const;
};

struct Chunk {
    QString text;
    ChunkMetadata metadata;
};

// Flattening used by the index backend. Unknown keys round-trip via extra.
MetadataMap toMetadataMap(const ChunkMetadata& metadata);
ChunkMetadata fromMetadataMap(const MetadataMap& map);

} // namespace ul
