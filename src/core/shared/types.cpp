#include "core/shared/types.h"

#include <QRegularExpression>

namespace ul {

QString normativeLevelToString(NormativeLevel level)
{
    switch (level) {
    case NormativeLevel::Nazionale: return QStringLiteral("nazionale");
    case NormativeLevel::Regionale: return QStringLiteral("regionale");
    case NormativeLevel::Comunale:  return QStringLiteral("comunale");
    }
    return QStringLiteral("nazionale");
}

std::optional<NormativeLevel> normativeLevelFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("nazionale")) return NormativeLevel::Nazionale;
    if (lower == QLatin1String("regionale")) return NormativeLevel::Regionale;
    if (lower == QLatin1String("comunale"))  return NormativeLevel::Comunale;
    return std::nullopt;
}

QString hierarchyLevelToString(HierarchyLevel level)
{
    switch (level) {
    case HierarchyLevel::Nazionale:   return QStringLiteral("Nazionale");
    case HierarchyLevel::Regionale:   return QStringLiteral("Regionale");
    case HierarchyLevel::Provinciale: return QStringLiteral("Provinciale");
    case HierarchyLevel::Comunale:    return QStringLiteral("Comunale");
    }
    return QStringLiteral("Nazionale");
}

std::optional<HierarchyLevel> hierarchyLevelFromString(const QString& str)
{
    return hierarchyLevelFromTierName(str);
}

std::optional<HierarchyLevel> hierarchyLevelFromTierName(const QString& tierName)
{
    const QString lower = tierName.trimmed().toLower();
    if (lower == QLatin1String("nazionale"))   return HierarchyLevel::Nazionale;
    if (lower == QLatin1String("regionale"))   return HierarchyLevel::Regionale;
    if (lower == QLatin1String("provinciale")) return HierarchyLevel::Provinciale;
    if (lower == QLatin1String("comunale"))    return HierarchyLevel::Comunale;
    return std::nullopt;
}

NormativeLevel storageLevelFor(HierarchyLevel level)
{
    switch (level) {
    case HierarchyLevel::Nazionale:   return NormativeLevel::Nazionale;
    case HierarchyLevel::Regionale:
    case HierarchyLevel::Provinciale: return NormativeLevel::Regionale;
    case HierarchyLevel::Comunale:    return NormativeLevel::Comunale;
    }
    return NormativeLevel::Nazionale;
}

bool isValidMetadataKey(const QString& key)
{
    static const QRegularExpression kKeyPattern(QStringLiteral("^[A-Za-z_][A-Za-z0-9_]*$"));
    return kKeyPattern.match(key).hasMatch();
}

} // namespace ul
