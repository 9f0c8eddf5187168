#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace oni {

// SettingsManager -- JSON save/load for shell settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/onishell/settings.json
// Only launch details (interpreter, script locations, spawn/stop timeouts)
// are read. Every key is optional; absent keys keep the built-in defaults.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<ShellSettings> load();
    static std::optional<ShellSettings> loadFrom(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const ShellSettings& settings);
    static bool saveTo(const ShellSettings& settings, const QString& filePath);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const ShellSettings& settings);
    static ShellSettings fromJson(const QJsonObject& json);
};

} // namespace oni
