/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>

namespace PhantomMaze {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from file: {} - {}",
                                   filepath, reader.getLastError()));
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;

            // Debug flags are booleans, simulation level and frame counts
            // whole numbers
            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                if (numValue == static_cast<int>(numValue)) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = settingValue;
        }
    }

    dropInvalidSimulationSettings();

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::isCheatEnabled(const std::string& cheat) const {
    return get<bool>("debug", "allow_cheats", false) && get<bool>("debug", cheat, false);
}

void SettingsManager::dropInvalidSimulationSettings() {
    if (has("simulation", "level") && get<int>("simulation", "level", 0) < 1) {
        SETTINGS_WARNING("simulation.level must be a whole number from 1, using the default");
        remove("simulation", "level");
    }
    if (has("simulation", "frames") && get<int>("simulation", "frames", -1) < 0) {
        SETTINGS_WARNING("simulation.frames must be a whole number from 0, using the default");
        remove("simulation", "frames");
    }
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    if (categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void SettingsManager::clearAll() {
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace PhantomMaze
