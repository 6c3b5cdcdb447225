// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/ErrorKind.hpp>

#include <boost/stacktrace.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tunebot
{

/// @brief Chat reply describing a failed command.
struct Message
{
    std::string title;
    std::string body;
    std::uint32_t accentColor = 0xA70E25;
};

/// @brief A classified failure with a correlation id.
///
/// Constructing an Error is the only way to report a failure: the constructor
/// assigns a fresh correlation id, captures a stack trace for internal failures
/// and logs the failure. Afterwards the value is immutable.
class Error
{
  public:
    /// @brief Wraps a failure kind (or any of its payload types).
    template <typename Kind>
        requires(!std::same_as<std::remove_cvref_t<Kind>, Error> && std::constructible_from<ErrorKind, Kind &&>)
    Error(Kind&& kind): Error(std::in_place, ErrorKind(std::forward<Kind>(kind)))
    {
    }

    /// @brief Short token identifying this failure in the logs.
    [[nodiscard]] auto id() const noexcept -> const std::string& { return _id; }

    /// @brief The failure itself.
    [[nodiscard]] auto kind() const noexcept -> const ErrorKind& { return _kind; }

    /// @brief Stack at the point of construction; only present for internal failures.
    [[nodiscard]] auto backtrace() const noexcept -> const std::optional<boost::stacktrace::stacktrace>&
    {
        return _backtrace;
    }

    [[nodiscard]] auto classification() const -> Classification { return classify(_kind); }

    /// @brief Returns true if the kind holds the payload type @p T.
    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool
    {
        return std::holds_alternative<T>(_kind);
    }

    /// @brief Returns the payload if the kind holds @p T, nullptr otherwise.
    template <typename T>
    [[nodiscard]] auto as() const noexcept -> const T*
    {
        return std::get_if<T>(&_kind);
    }

    /// @brief Display sentence of the failure.
    [[nodiscard]] auto describe() const -> std::string;

    /// @brief Builds the chat reply: title, description, correlation id and a dump of the kind.
    [[nodiscard]] auto render() const -> Message;

  private:
    Error(std::in_place_t, ErrorKind kind);

    void logCreation() const noexcept;

    std::string _id;
    std::optional<boost::stacktrace::stacktrace> _backtrace;
    ErrorKind _kind;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param kind The failure kind or one of its payload types.
/// @return An unexpected Error.
template <typename Kind>
[[nodiscard]] auto makeError(Kind&& kind) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error(std::forward<Kind>(kind)));
}

} // namespace tunebot

template <>
struct std::formatter<tunebot::Error>: std::formatter<std::string>
{
    auto format(const tunebot::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(error.describe(), ctx);
    }
};
