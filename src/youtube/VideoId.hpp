// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace tunebot::youtube
{

/// @brief Returns true if @p id looks like a YouTube video id (11 chars of [A-Za-z0-9_-]).
[[nodiscard]] auto isVideoId(std::string_view id) -> bool;

/// @brief Extracts the video id from a YouTube URL.
///
/// Understands youtube.com (www., m., music.) watch, embed, shorts, v and live
/// URLs as well as youtu.be short links.
/// @param url The URL as typed by the user.
/// @return The video id or YtInferVideoId.
[[nodiscard]] auto inferVideoId(std::string_view url) -> Result<std::string>;

/// @brief Canonical watch URL of a video.
[[nodiscard]] auto watchUrl(std::string_view videoId) -> std::string;

} // namespace tunebot::youtube
