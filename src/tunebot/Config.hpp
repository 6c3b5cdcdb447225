// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <net/HttpClient.hpp>
#include <youtube/YoutubeClient.hpp>

#include <string>
#include <string_view>

namespace tunebot
{

/// @brief Logging configuration section.
struct LogConfig
{
    log::Level level = log::Level::Info;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    HttpClientConfig http;
    youtube::YoutubeConfig youtube;
    LogConfig log;
};

/// @brief Environment variable consulted when no YouTube API key is configured.
inline constexpr auto YoutubeApiKeyEnv = std::string_view { "YOUTUBE_API_KEY" };

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error; the defaults are used instead.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an InvalidConfig error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an InvalidConfig error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace tunebot
