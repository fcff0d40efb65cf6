// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <stt/SttSettings.hpp>
#include <worker/RetryPolicy.hpp>

#include <string>
#include <string_view>

namespace callscribe
{

/// @brief Queue store configuration section.
struct StoreConfig
{
    std::string backend = "redis"; ///< "redis" or "memory".
    std::string host = "localhost";
    int port = 6379;
    std::string keyPrefix = "stt";
    int connectTimeoutMs = 2000;
};

/// @brief Call record configuration section.
struct RecordsConfig
{
    std::string directory = "./storage/records";
};

/// @brief Metrics endpoint configuration section.
struct MetricsConfig
{
    bool enabled = true;
    std::string host = "0.0.0.0";
    int port = 9108;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    StoreConfig store;
    WorkerSettings worker;
    SttSettings stt;
    RecordsConfig records;
    MetricsConfig metrics;

    /// @brief Log level name, e.g. "info" or "debug".
    std::string logLevel = "info";
};

/// @brief Loads the configuration from the default config path.
///
/// A missing default file is not an error; the defaults are used.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @param path The path to the config file. It must exist.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Fields that are absent keep their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Returns the default config directory path.
/// On Linux: $XDG_CONFIG_HOME/callscribe or ~/.config/callscribe
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace callscribe
