// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <net/Url.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace tunebot
{

namespace
{

    auto configError(std::string_view path, std::string reason) -> std::unexpected<Error>
    {
        return makeError(errors::InvalidConfig { .path = std::string(path), .reason = std::move(reason) });
    }

    constexpr auto MaxTimeout = std::chrono::seconds { 24 * 60 * 60 };

    /// @brief Reads a positive number of seconds; absent, non-integer or non-positive values keep @p fallback.
    auto readTimeout(std::string_view path,
                     const nlohmann::json& section,
                     std::string_view key,
                     std::chrono::seconds fallback) -> Result<std::chrono::seconds>
    {
        auto const it = section.find(std::string(key));
        if (it == section.end() || !it->is_number_unsigned())
            return fallback;

        auto const seconds = it->get<std::uint64_t>();
        if (seconds == 0)
            return fallback;
        if (seconds > static_cast<std::uint64_t>(MaxTimeout.count()))
            return configError(path, std::format("http.{} must be at most {} seconds", key, MaxTimeout.count()));

        return std::chrono::seconds { static_cast<std::chrono::seconds::rep>(seconds) };
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\tunebot";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/tunebot";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/tunebot";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/tunebot";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return configError(path, "cannot open file");

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto root = nlohmann::json {};
    try
    {
        root = nlohmann::json::parse(ss.str());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return configError(path, std::format("JSON parse error: {}", e.what()));
    }

    if (!root.is_object())
        return configError(path, "top-level value must be an object");

    auto config = AppConfig {};

    // HTTP section
    if (root.contains("http"))
    {
        auto const& http = root["http"];
        config.http.userAgent = json::getStringOr(http, "userAgent", config.http.userAgent);

        auto const connectTimeout = readTimeout(path, http, "connectTimeoutSeconds", config.http.connectTimeout);
        if (!connectTimeout)
            return std::unexpected(connectTimeout.error());
        config.http.connectTimeout = *connectTimeout;

        auto const requestTimeout = readTimeout(path, http, "requestTimeoutSeconds", config.http.requestTimeout);
        if (!requestTimeout)
            return std::unexpected(requestTimeout.error());
        config.http.requestTimeout = *requestTimeout;
    }

    // YouTube section
    if (root.contains("youtube"))
    {
        auto const& youtube = root["youtube"];
        config.youtube.apiKey = json::getStringOr(youtube, "apiKey", "");
        config.youtube.apiBaseUrl = json::getStringOr(youtube, "apiBaseUrl", config.youtube.apiBaseUrl);
    }

    if (auto const base = Url::parse(config.youtube.apiBaseUrl); !base)
        return configError(path, std::format("youtube.apiBaseUrl: {}", base.error().describe()));

    if (config.youtube.apiKey.empty())
    {
        if (auto const* const apiKey = std::getenv(YoutubeApiKeyEnv.data()))
            config.youtube.apiKey = apiKey;
    }

    // Log section
    if (root.contains("log"))
        config.log.level = log::levelFromString(json::getStringOr(root["log"], "level", "info"));

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // HTTP section
    auto http = nlohmann::json::object();
    http["userAgent"] = config.http.userAgent;
    http["connectTimeoutSeconds"] = config.http.connectTimeout.count();
    http["requestTimeoutSeconds"] = config.http.requestTimeout.count();
    root["http"] = std::move(http);

    // YouTube section
    auto youtube = nlohmann::json::object();
    if (!config.youtube.apiKey.empty())
        youtube["apiKey"] = config.youtube.apiKey;
    youtube["apiBaseUrl"] = config.youtube.apiBaseUrl;
    root["youtube"] = std::move(youtube);

    // Log section
    root["log"] = nlohmann::json { { "level", log::levelToString(config.log.level) } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return configError(path,
                               std::format("failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return configError(path, "cannot write file");

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        auto config = AppConfig {};
        if (auto const* const apiKey = std::getenv(YoutubeApiKeyEnv.data()))
            config.youtube.apiKey = apiKey;
        return config;
    }

    return loadConfigFromFile(path);
}

} // namespace tunebot
