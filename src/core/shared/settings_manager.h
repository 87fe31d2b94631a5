#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace pa {

// SettingsManager -- JSON save/load for advisor settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/phoneadvisor/settings.json
// PHONEADVISOR_SETTINGS overrides the location.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Load, falling back to defaults. dbPath is filled in when unset.
    static Settings loadOrDefault();

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultDbPath();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace pa
