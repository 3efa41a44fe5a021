#pragma once

#include "core/shared/chunk.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace ul {

struct Citation {
    NormativeLevel level = NormativeLevel::Nazionale;
    // Level the chunk was found at; set by hierarchical search.
    std::optional<HierarchyLevel> hierarchyLevel;
    std::optional<QString> law;        // "LR 38/1999"
    std::optional<QString> article;
    // Narrowest scope only: municipality, else province, else region.
    std::optional<QString> municipality;
    std::optional<QString> province;
    std::optional<QString> region;
    QString preview;

    static constexpr int kPreviewLength = 200;

    static Citation fromChunk(const Chunk& chunk);

    // Lowercase tier name: the search level when known, "provinciale" for a
    // province-scoped regional chunk, otherwise the storage level.
    QString levelName() const;

    // "LR 38/1999, Art. 12 (Regione Lazio)"; level name when nothing else
    // identifies the source.
    QString displayText() const;

    // Keys: level, text, and law/article/municipality/province/region when
    // present.
    QJsonObject toJson() const;
};

std::vector<Citation> citationsFor(const std::vector<Chunk>& chunks);

} // namespace ul
