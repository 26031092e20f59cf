#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed engine configuration with dotted-key typed access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "dcc/foundation/engine_result.hpp"

namespace dcc::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Typed access to YAML configuration values by dotted key
/// (e.g. "engine.max_encounters").
///
/// The YAML tree is flattened into a key-value map on load so lookups
/// never walk yaml-cpp's reference-semantic nodes.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    EngineResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    EngineResult<void> loadFromString(std::string_view yaml);

    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    EngineResult<T> get(std::string_view key) const;

    /// Value for @p key, or @p fallback if missing or of the wrong type.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set a value and notify watchers of @p key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Sorted leaf keys under @p section ("logging" yields
    /// "logging.level", "logging.categories.damage", ...). An empty section
    /// lists every key.
    [[nodiscard]] std::vector<std::string> keys(std::string_view section = {}) const;

private:
    EngineResult<void> loadNode(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
EngineResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return EngineResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasValue()) {
        return std::move(result).value();
    }
    return fallback;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace dcc::foundation
