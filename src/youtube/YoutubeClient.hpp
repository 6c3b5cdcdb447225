// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/HttpClient.hpp>

#include <boost/asio/awaitable.hpp>

#include <string>
#include <string_view>

namespace tunebot::youtube
{

/// @brief YouTube Data API settings.
struct YoutubeConfig
{
    std::string apiKey;
    std::string apiBaseUrl = "https://www.googleapis.com/youtube/v3";
};

/// @brief A video found through the Data API.
struct Video
{
    std::string id;
    std::string title;
    std::string channelTitle;
};

/// @brief Looks up videos through the YouTube Data API v3.
class YoutubeClient
{
  public:
    /// @param http Shared HTTP client; must outlive this object.
    /// @param config API key and base URL.
    YoutubeClient(const HttpClient& http, YoutubeConfig config);

    /// @brief Returns the best search match for @p query, or YtVidNotFound.
    [[nodiscard]] auto findVideo(std::string query) const -> boost::asio::awaitable<Result<Video>>;

    /// @brief Fetches a video by id, or YtVidNotFound if it does not exist.
    [[nodiscard]] auto videoById(std::string id) const -> boost::asio::awaitable<Result<Video>>;

    /// @brief Resolves user input: a YouTube URL is looked up by id, anything else is searched for.
    [[nodiscard]] auto resolve(std::string input) const -> boost::asio::awaitable<Result<Video>>;

    [[nodiscard]] auto config() const -> const YoutubeConfig& { return _config; }

  private:
    [[nodiscard]] auto endpoint(std::string_view name) const -> Result<Url>;

    const HttpClient& _http;
    YoutubeConfig _config;
};

} // namespace tunebot::youtube
