#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ul {

// SettingsManager -- JSON save/load for Settings.
//
// Default location:
//   <GenericDataLocation>/urbanlex/settings.json
// Keys missing from the file keep their built-in defaults.
class SettingsManager {
public:
    // Returns nullopt if the file doesn't exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath);

    // Creates the parent directory if needed. Returns true on success.
    static bool save(const Settings& settings, const QString& filePath);

    // Built-in defaults with indexPath resolved.
    static Settings defaults();

    static QString defaultSettingsPath();
    static QString defaultIndexPath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace ul
