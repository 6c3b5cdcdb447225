// SPDX-License-Identifier: Apache-2.0
#include "YoutubeClient.hpp"

#include <core/Log.hpp>
#include <youtube/VideoId.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace tunebot::youtube
{

namespace
{

    /// @brief The "items" array shared by the search and videos endpoints.
    struct VideoList
    {
        std::vector<Video> items;
    };

    /// @brief search.list returns {"id": {"videoId": ...}}, videos.list returns {"id": "..."}.
    auto videoIdOf(const nlohmann::json& item) -> std::string
    {
        auto const& id = item.at("id");
        if (id.is_string())
            return id.get<std::string>();
        return id.at("videoId").get<std::string>();
    }

    void from_json(const nlohmann::json& json, VideoList& list)
    {
        for (const auto& item: json.at("items"))
        {
            auto const& snippet = item.at("snippet");
            list.items.push_back(Video {
                .id = videoIdOf(item),
                .title = snippet.at("title").get<std::string>(),
                .channelTitle = snippet.value("channelTitle", ""),
            });
        }
    }

    auto looksLikeUrl(std::string_view input) -> bool
    {
        return input.find("://") != std::string_view::npos || input.starts_with("youtu.be/")
               || input.starts_with("youtube.com/") || input.starts_with("www.youtube.com/");
    }

} // namespace

YoutubeClient::YoutubeClient(const HttpClient& http, YoutubeConfig config): _http(http), _config(std::move(config))
{
}

auto YoutubeClient::endpoint(std::string_view name) const -> Result<Url>
{
    return Url::parse(_config.apiBaseUrl).transform([name](const Url& base) { return base.withPathSegments({ name }); });
}

auto YoutubeClient::findVideo(std::string query) const -> boost::asio::awaitable<Result<Video>>
{
    auto url = endpoint("search");
    if (!url)
        co_return std::unexpected(std::move(url).error());

    auto list = co_await _http.getJson<VideoList>(std::move(*url),
                                                  {
                                                      { "part", "snippet" },
                                                      { "type", "video" },
                                                      { "maxResults", "1" },
                                                      { "q", query },
                                                      { "key", _config.apiKey },
                                                  });
    if (!list)
        co_return std::unexpected(std::move(list).error());

    if (list->items.empty())
        co_return makeError(errors::YtVidNotFound { .query = std::move(query) });

    log::debug("YouTube search for \"{}\" found {}", query, list->items.front().id);
    co_return std::move(list->items.front());
}

auto YoutubeClient::videoById(std::string id) const -> boost::asio::awaitable<Result<Video>>
{
    auto url = endpoint("videos");
    if (!url)
        co_return std::unexpected(std::move(url).error());

    auto list = co_await _http.getJson<VideoList>(std::move(*url),
                                                  {
                                                      { "part", "snippet" },
                                                      { "id", id },
                                                      { "key", _config.apiKey },
                                                  });
    if (!list)
        co_return std::unexpected(std::move(list).error());

    if (list->items.empty())
        co_return makeError(errors::YtVidNotFound { .query = std::move(id) });

    co_return std::move(list->items.front());
}

auto YoutubeClient::resolve(std::string input) const -> boost::asio::awaitable<Result<Video>>
{
    if (!looksLikeUrl(input))
        co_return co_await findVideo(std::move(input));

    auto id = inferVideoId(input);
    if (!id)
        co_return std::unexpected(std::move(id).error());

    co_return co_await videoById(std::move(*id));
}

} // namespace tunebot::youtube
