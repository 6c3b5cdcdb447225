// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tunebot::args
{

/// @brief Parses a signed decimal integer; the whole input must be consumed.
[[nodiscard]] auto parseInt(std::string_view input) -> Result<std::int64_t>;

/// @brief Parses a non-negative decimal integer.
[[nodiscard]] auto parseIndex(std::string_view input) -> Result<std::size_t>;

/// @brief Parses a zero-based index into a list of @p trackCount tracks.
/// @return The index, ParseInt if it is not a number, or TrackIndexOutOfBounds.
[[nodiscard]] auto parseTrackIndex(std::string_view input, std::size_t trackCount) -> Result<std::size_t>;

/// @brief Splits whitespace-separated image tags. Tags must not contain commas.
[[nodiscard]] auto parseImageTags(std::string_view input) -> Result<std::vector<std::string>>;

/// @brief Cursor over the whitespace-separated arguments of a command message.
class ArgumentList
{
  public:
    explicit ArgumentList(std::string_view text);

    /// @brief Consumes the next argument and runs @p parser on it.
    ///
    /// A missing argument yields MissingArgument; a parser failure is wrapped
    /// into ParseArg naming the argument.
    /// @param name Argument name used in error messages.
    /// @param parser Callable taking std::string_view and returning a Result.
    template <typename Parser>
        requires std::invocable<Parser&, std::string_view>
    [[nodiscard]] auto single(std::string_view name, Parser&& parser)
        -> std::invoke_result_t<Parser&, std::string_view>
    {
        auto const token = next();
        if (token.empty())
            return makeError(errors::MissingArgument { .argument = std::string(name) });

        auto result = parser(token);
        if (!result)
            return makeError(errors::ParseArg {
                .argument = std::string(name),
                .cause = std::make_shared<const Error>(std::move(result).error()),
            });
        return result;
    }

    /// @brief Consumes and returns everything after the current position, trimmed.
    [[nodiscard]] auto rest() -> std::string_view;

    /// @brief Returns true if no arguments are left.
    [[nodiscard]] auto empty() const -> bool;

  private:
    [[nodiscard]] auto next() -> std::string_view;
    void skipWhitespace();

    std::string_view _text;
    std::size_t _position = 0;
};

} // namespace tunebot::args
