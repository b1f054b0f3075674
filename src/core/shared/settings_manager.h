#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace vd {

// SettingsManager -- JSON save/load for engine settings.
//
// The settings file is looked up at:
//   $VERDICT_CONFIG, or <GenericDataLocation>/verdict/settings.json
// $VERDICT_DATA_DIR overrides dataDir after loading.
class SettingsManager {
public:
    // Load settings from the default location. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<EngineSettings> load();
    static std::optional<EngineSettings> load(const QString& filePath);

    static bool save(const EngineSettings& settings);
    static bool save(const EngineSettings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultDataDir();

    // Applies environment overrides and fills empty paths from dataDir.
    static void resolvePaths(EngineSettings* settings);

    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);
};

} // namespace vd
