// SPDX-License-Identifier: Apache-2.0
#include "HttpError.hpp"

namespace tunebot
{

auto HttpErrorCategory::name() const noexcept -> const char*
{
    return "tunebot.http";
}

auto HttpErrorCategory::message(int ev) const -> std::string
{
    switch (static_cast<HttpErrc>(ev))
    {
        case HttpErrc::TooManyRedirects: return "too many redirects";
        case HttpErrc::InvalidRedirect: return "redirect without a Location header";
    }
    return "unknown http client error";
}

auto HttpErrorCategory::instance() -> const HttpErrorCategory&
{
    static auto const category = HttpErrorCategory {};
    return category;
}

auto make_error_code(HttpErrc code) noexcept -> boost::system::error_code
{
    return { static_cast<int>(code), HttpErrorCategory::instance() };
}

} // namespace tunebot
