#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace sv {

// SettingsManager -- JSON save/load for the retrieval core settings.
//
// Default location: <AppDataLocation>/settings.json. Each component config
// is a nested object ("chunker", "embedding", "retriever", ...); keys that
// are absent keep their defaults.
class SettingsManager {
public:
    // Returns nullopt if the file doesn't exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath());

    // Defaults (with a warning for a malformed file) when load() fails.
    static Settings loadOrDefault(const QString& filePath = settingsFilePath());

    // Creates the parent directory if needed. Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = settingsFilePath());

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace sv
