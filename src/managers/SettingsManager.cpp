/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <utility>

namespace Vantage {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return loadFromJson(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromJson(const JsonValue& root, const std::string& source) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    std::vector<std::pair<std::string, std::pair<std::string, SettingValue>>> loaded;

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;
            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double number = value.asNumber();
                bool integral = std::trunc(number) == number &&
                                std::abs(number) <= std::numeric_limits<int>::max();
                if (integral) {
                    settingValue = static_cast<int>(number);
                } else {
                    settingValue = static_cast<float>(number);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            loaded.push_back({categoryName, {key, std::move(settingValue)}});
        }
    }

    for (const auto& [category, entry] : loaded) {
        store(category, entry.first, entry.second);
    }
    for (const auto& [category, entry] : loaded) {
        notifyListeners(category, entry.first, entry.second);
    }

    SETTINGS_INFO("Loaded " + std::to_string(loaded.size()) + " settings from " + source);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    file << "{\n";
    size_t categoryIndex = 0;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        file << "  \"" << escapeJson(categoryName) << "\": {\n";

        size_t keyIndex = 0;
        for (const auto& [key, value] : categorySettings) {
            file << "    \"" << escapeJson(key) << "\": ";
            std::visit([&file](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, bool>) {
                    file << (arg ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    file << "\"" << escapeJson(arg) << "\"";
                } else {
                    file << arg;
                }
            }, value);

            file << (++keyIndex < categorySettings.size() ? ",\n" : "\n");
        }

        file << (++categoryIndex < m_settings.size() ? "  },\n" : "  }\n");
    }
    file << "}\n";

    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

std::optional<SettingsManager::SettingValue>
SettingsManager::getValue(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return std::nullopt;
    }
    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return std::nullopt;
    }
    return keyIt->second;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() &&
           categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [callbackId](const ListenerInfo& info) { return info.id == callbackId; }),
        m_listeners.end());
}

size_t SettingsManager::getListenerCount() const {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    return m_listeners.size();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void SettingsManager::store(const std::string& category, const std::string& key, SettingValue value) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(value);
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key,
                                      const SettingValue& newValue) {
    std::vector<ListenerInfo> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        listeners = m_listeners;
    }

    for (const auto& listener : listeners) {
        if (listener.category.empty() || listener.category == category) {
            listener.callback(category, key, newValue);
        }
    }
}

std::string SettingsManager::escapeJson(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"':
            escaped += "\\\"";
            break;
        case '\\':
            escaped += "\\\\";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\t':
            escaped += "\\t";
            break;
        default:
            escaped.push_back(c);
        }
    }
    return escaped;
}

} // namespace Vantage
