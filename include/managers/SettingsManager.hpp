/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <cmath>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Vantage {

class JsonValue;

/**
 * @brief Process-wide settings store, grouped by category
 *
 * Values are int, float, bool or string. Numeric reads convert between
 * int and float so a JSON "25" and "25.0" read the same way.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int cap = settings.get<int>("postquery", "max_worker_count", 5);
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
     * @brief Change notification
     * @param category Category of the changed key
     * @param key Changed key
     * @param newValue Value after the change
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Merges a parsed JSON object of the form {"category": {"key": value}}
     * @param root Parsed JSON root
     * @param source Name used in log messages
     * @return false if root is not an object
     *
     * Listeners are notified for every stored key.
     */
    bool loadFromJson(const JsonValue& root, const std::string& source);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed read with a fallback
     *
     * A float read as int is returned only when it is a whole number that
     * fits in an int; otherwise defaultValue is returned.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    // Stored value as-is, nullopt if the key is absent
    std::optional<SettingValue> getValue(const std::string& category, const std::string& key) const;

    // int as-is; float only if finite, whole and within int range
    static std::optional<int> toWholeInt(const SettingValue& value) {
        if (const int* asInt = std::get_if<int>(&value)) {
            return *asInt;
        }
        if (const float* asFloat = std::get_if<float>(&value)) {
            const double number = *asFloat;
            if (std::isfinite(number) && std::trunc(number) == number &&
                number >= std::numeric_limits<int>::min() &&
                number <= std::numeric_limits<int>::max()) {
                return static_cast<int>(number);
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Stores a value and notifies listeners
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Registers a listener
     * @param category Category to watch, empty watches every category
     * @return Id for unregisterChangeListener
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);
    size_t getListenerCount() const;

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId{0};

    void store(const std::string& category, const std::string& key, SettingValue value);

    // Callbacks run on a copy of the listener list so they may (un)register
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    static std::string escapeJson(const std::string& text);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

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

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, int>) {
        return toWholeInt(stored).value_or(defaultValue);
    } else if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<float>(*asInt);
        }
        if (const float* asFloat = std::get_if<float>(&stored)) {
            return *asFloat;
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
        return defaultValue;
    } else {
        return defaultValue;
    }
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

    store(category, key, settingValue);
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace Vantage

#endif // SETTINGS_MANAGER_HPP
