#pragma once

#include <QMap>
#include <QString>

#include <optional>

namespace ul {

// Jurisdiction tier a chunk is indexed under. Provincial law has no tier of
// its own: it is stored in the regional collection with a province key.
enum class NormativeLevel {
    Nazionale,
    Regionale,
    Comunale,
};

QString normativeLevelToString(NormativeLevel level);
std::optional<NormativeLevel> normativeLevelFromString(const QString& str);

// Level a result was found at during hierarchical search.
enum class HierarchyLevel {
    Nazionale,
    Regionale,
    Provinciale,
    Comunale,
};

// Display form: "Nazionale", "Regionale", ...
QString hierarchyLevelToString(HierarchyLevel level);
std::optional<HierarchyLevel> hierarchyLevelFromString(const QString& str);

// Accepts the lowercase tier names used by callers ("nazionale",
// "regionale", "provinciale", "comunale"), case-insensitively.
std::optional<HierarchyLevel> hierarchyLevelFromTierName(const QString& tierName);

// Collection a hierarchy level is stored in.
NormativeLevel storageLevelFor(HierarchyLevel level);

// Flat string metadata as persisted by the index backend and used for
// equality filters. Ordered so serialisation is deterministic.
using MetadataMap = QMap<QString, QString>;
using MetadataFilter = QMap<QString, QString>;

// Filter keys end up inside SQL json paths; only identifiers are accepted.
bool isValidMetadataKey(const QString& key);

} // namespace ul
