/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace PhantomMaze {

/**
 * @brief Settings store organised by category
 *
 * Holds the "debug" flags (cheats, ghost target overlay) and the "simulation"
 * driver values (start level, frame count) with typed access and defaults.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   bool showTargets = settings.get<bool>("debug", "show_ghost_targets", false);
 *   settings.set("simulation", "level", 3);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file of the form
     * { "category": { "key": value, ... }, ... }
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise (existing values kept)
     *
     * A simulation.level below 1 or a negative simulation.frames is dropped
     * with a warning so callers get their defaults.
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief True when debug.<cheat> is set and debug.allow_cheats is on
     * @param cheat Key under "debug", e.g. "player_invincible"
     */
    bool isCheatEnabled(const std::string& cheat) const;

    /**
     * @brief Gets a typed setting value with optional default
     * @return The setting value, or defaultValue if missing or of another type
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getKeys(const std::string& category) const;

private:
    void dropInvalidSimulationSettings();

    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&keyIt->second)) {
            return *value;
        }
        // Whole-number floats in JSON load as int
        if constexpr (std::is_same_v<T, float>) {
            if (const int* asInt = std::get_if<int>(&keyIt->second)) {
                return static_cast<float>(*asInt);
            }
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace PhantomMaze

#endif // SETTINGS_MANAGER_HPP
