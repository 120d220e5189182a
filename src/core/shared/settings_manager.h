#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace nr {

// SettingsManager -- JSON save/load for engine settings.
//
// The default location is <AppDataLocation>/newsrank/engine.json. Keys that are
// absent keep their defaults, so a partial file is a valid configuration.
class SettingsManager {
public:
    // Load settings from filePath. Returns nullopt if the file doesn't exist
    // or cannot be parsed.
    static std::optional<EngineSettings> load(const QString& filePath);

    // Load settings, falling back to defaults on any failure.
    static EngineSettings loadOrDefault(const QString& filePath);

    // Save settings to filePath. Creates the directory if it doesn't exist.
    static bool save(const QString& filePath, const EngineSettings& settings);

    static QString defaultSettingsPath();
    static QString defaultDatabasePath();

    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);
};

} // namespace nr
