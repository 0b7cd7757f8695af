#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gk/foundation/service_result.hpp"

namespace gk::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "auth.secret_key_base"), setting values at runtime, and
/// registering callbacks for change notification.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    ServiceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    ServiceResult<void> loadString(std::string_view document);

    /// Retrieve a typed value by dotted key (e.g., "auth.min_password_length").
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ServiceResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is absent or
    /// cannot be converted.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    /// Notifies any registered watchers for this key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
ServiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ServiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (!result) {
        return fallback;
    }
    return std::move(result).value();
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace gk::foundation
