// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tunebot
{

/// @brief Characters a correlation id is drawn from (URL- and chat-safe).
inline constexpr auto CorrelationIdAlphabet =
    std::string_view { "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz_-" };

/// @brief Default number of characters in a correlation id.
inline constexpr std::size_t CorrelationIdLength = 6;

/// @brief Generates a short random token used to match a chat reply with its log entry.
///
/// Ids are only meant to be copied by hand and grepped for; uniqueness is best-effort.
/// @param length Number of characters to generate.
/// @return A fresh token of exactly @p length characters from CorrelationIdAlphabet.
[[nodiscard]] auto generateCorrelationId(std::size_t length = CorrelationIdLength) -> std::string;

} // namespace tunebot
