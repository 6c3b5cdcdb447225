// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/system/error_code.hpp>

#include <string>
#include <type_traits>

namespace tunebot
{

/// @brief Transport failures detected by the HTTP client itself rather than the network stack.
enum class HttpErrc
{
    TooManyRedirects = 1,
    InvalidRedirect,
};

/// @brief Category of HttpErrc codes ("tunebot.http").
class HttpErrorCategory final: public boost::system::error_category
{
  public:
    using boost::system::error_category::message;

    [[nodiscard]] auto name() const noexcept -> const char* override;
    [[nodiscard]] auto message(int ev) const -> std::string override;

    [[nodiscard]] static auto instance() -> const HttpErrorCategory&;
};

[[nodiscard]] auto make_error_code(HttpErrc code) noexcept -> boost::system::error_code;

} // namespace tunebot

template <>
struct boost::system::is_error_code_enum<tunebot::HttpErrc>: std::true_type
{
};
