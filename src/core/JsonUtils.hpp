// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace tunebot::json
{

/// @brief Parses a JSON document and converts it to @p T via its from_json.
///
/// Syntax errors and shape mismatches (missing keys, wrong types) both
/// surface as UnexpectedJsonShape.
/// @param input The JSON text.
/// @return The converted value or an Error.
template <typename T>
[[nodiscard]] auto decode(std::string_view input) -> Result<T>
{
    try
    {
        return nlohmann::json::parse(input).get<T>();
    }
    catch (const nlohmann::json::exception& e)
    {
        return makeError(errors::UnexpectedJsonShape { .exceptionId = e.id, .message = e.what() });
    }
}

/// @brief Returns the string member @p key of @p obj, or @p fallback if it is absent or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj, std::string_view key, std::string_view fallback)
    -> std::string
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string())
        return std::string(fallback);
    return it->get<std::string>();
}

} // namespace tunebot::json
