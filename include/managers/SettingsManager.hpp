/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace HexCrawl {

class JsonValue;

/**
 * @brief Category/key settings store for engine tuning
 *
 * Constructed by the host and passed by reference to whatever needs
 * tuning values; there is no global instance.
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/settings.json");
 *   int maxRounds = settings.get<int>("game", "maxRounds", 20);
 *   settings.set("threat", "decayRate", 0.2f);
 */
class SettingsManager {
public:
    SettingsManager() = default;
    ~SettingsManager() = default;

    /**
     * @brief Supported setting value types
     */
    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file of {category: {key: value}}
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise
     *
     * Existing values are kept unless the file overrides them.
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile for an in-memory JSON document
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Gets a typed setting value with optional default
     * @tparam T int, float, bool, or std::string
     * @return The setting value, or defaultValue if missing or mistyped
     *
     * An int setting also satisfies a float request.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    // Multiple concurrent reads or a single write
    mutable std::shared_mutex m_settingsMutex;

    bool loadFromRoot(const JsonValue& root, const std::string& source);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, int>) {
        if (const int* v = std::get_if<int>(&value)) {
            return *v;
        }
    } else if constexpr (std::is_same_v<T, float>) {
        if (const float* v = std::get_if<float>(&value)) {
            return *v;
        }
        if (const int* v = std::get_if<int>(&value)) {
            return static_cast<float>(*v);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const bool* v = std::get_if<bool>(&value)) {
            return *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const std::string* v = std::get_if<std::string>(&value)) {
            return *v;
        }
    }
    // Type mismatch or unsupported type
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int>) {
        settingValue = value;
    } else if constexpr (std::is_same_v<T, float>) {
        settingValue = value;
    } else if constexpr (std::is_same_v<T, bool>) {
        settingValue = value;
    } else if constexpr (std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace HexCrawl

#endif // SETTINGS_MANAGER_HPP
