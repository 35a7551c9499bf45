#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ci {

// SettingsManager -- JSON save/load for learning settings.
//
// Settings are stored as a JSON file at:
//   $CODEINDEX_SETTINGS_PATH, or
//   <GenericDataLocation>/codeindex/learning.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<LearningSettings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const LearningSettings& settings,
                     const QString& filePath = settingsFilePath());

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Default snapshot database location next to the settings file.
    static QString defaultDbPath();

    // Convert settings to/from JSON. Missing keys keep their defaults and
    // out-of-range values are clamped.
    static QJsonObject toJson(const LearningSettings& settings);
    static LearningSettings fromJson(const QJsonObject& json);
};

} // namespace ci
