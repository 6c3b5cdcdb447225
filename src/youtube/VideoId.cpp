// SPDX-License-Identifier: Apache-2.0
#include "VideoId.hpp"

#include <net/Url.hpp>

#include <algorithm>
#include <array>
#include <format>

namespace tunebot::youtube
{

namespace
{

    constexpr auto VideoIdLength = std::size_t { 11 };

    constexpr auto YoutubeHosts = std::array<std::string_view, 4> {
        "youtube.com",
        "www.youtube.com",
        "m.youtube.com",
        "music.youtube.com",
    };

    constexpr auto IdPathPrefixes = std::array<std::string_view, 4> { "/embed/", "/shorts/", "/v/", "/live/" };

    /// @brief First path segment after @p prefix, without a trailing slash.
    auto segmentAfter(std::string_view path, std::string_view prefix) -> std::string_view
    {
        auto segment = path.substr(prefix.size());
        return segment.substr(0, segment.find('/'));
    }

    auto findId(const Url& url) -> std::string
    {
        auto const& host = url.host;
        auto const path = std::string_view { url.path };

        if (host == "youtu.be" || host == "www.youtu.be")
            return std::string(segmentAfter(path, "/"));

        if (std::ranges::find(YoutubeHosts, host) == YoutubeHosts.end())
            return {};

        if (path == "/watch" || path == "/watch/")
            return url.queryValue("v").value_or("");

        for (auto const prefix: IdPathPrefixes)
        {
            if (path.starts_with(prefix))
                return std::string(segmentAfter(path, prefix));
        }
        return {};
    }

} // namespace

auto isVideoId(std::string_view id) -> bool
{
    return id.size() == VideoIdLength && std::ranges::all_of(id, [](char ch) {
               return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-'
                      || ch == '_';
           });
}

auto inferVideoId(std::string_view url) -> Result<std::string>
{
    auto const fail = [url] { return makeError(errors::YtInferVideoId { .url = std::string(url) }); };

    // Links pasted into chat often lack the scheme.
    auto const text = url.find("://") == std::string_view::npos ? std::format("https://{}", url) : std::string(url);

    // A malformed URL is reported as an unusable YouTube URL rather than a generic URL error.
    auto const parsed = Url::parse(text);
    if (!parsed)
        return fail();

    auto const id = findId(*parsed);
    if (!isVideoId(id))
        return fail();
    return id;
}

auto watchUrl(std::string_view videoId) -> std::string
{
    return std::format("https://www.youtube.com/watch?v={}", videoId);
}

} // namespace tunebot::youtube
