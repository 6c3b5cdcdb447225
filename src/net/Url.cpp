// SPDX-License-Identifier: Apache-2.0
#include "Url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace tunebot
{

namespace
{

    auto invalid(std::string_view input, std::string reason) -> std::unexpected<Error>
    {
        return makeError(errors::InvalidUrl { .input = std::string(input), .reason = std::move(reason) });
    }

    auto defaultPort(std::string_view scheme) -> std::uint16_t
    {
        return scheme == "https" ? 443 : 80;
    }

    auto isUnreserved(unsigned char ch) -> bool
    {
        return std::isalnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
    }

    auto isControlOrSpace(char ch) -> bool
    {
        auto const byte = static_cast<unsigned char>(ch);
        return byte <= 0x20 || byte == 0x7F;
    }

    auto hexValue(char ch) -> int
    {
        if (ch >= '0' && ch <= '9')
            return ch - '0';
        if (ch >= 'a' && ch <= 'f')
            return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F')
            return ch - 'A' + 10;
        return -1;
    }

} // namespace

auto Url::parse(std::string_view text) -> Result<Url>
{
    if (std::ranges::any_of(text, isControlOrSpace))
        return invalid(text, "contains spaces or control characters");

    auto const schemeEnd = text.find("://");
    if (schemeEnd == std::string_view::npos)
        return invalid(text, "missing scheme");

    auto result = Url {};
    result.scheme = std::string(text.substr(0, schemeEnd));
    std::ranges::transform(result.scheme, result.scheme.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (result.scheme != "http" && result.scheme != "https")
        return invalid(text, std::format("unsupported scheme '{}'", result.scheme));

    auto rest = text.substr(schemeEnd + 3);
    if (auto const hash = rest.find('#'); hash != std::string_view::npos)
        rest = rest.substr(0, hash);

    auto const authorityEnd = rest.find_first_of("/?");
    auto authority = rest.substr(0, authorityEnd);
    auto const pathAndQuery =
        authorityEnd == std::string_view::npos ? std::string_view {} : rest.substr(authorityEnd);

    if (authority.find('@') != std::string_view::npos)
        return invalid(text, "user info is not supported");

    auto portText = std::string_view {};
    if (authority.starts_with('['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return invalid(text, "unterminated IPv6 address");
        result.host = std::string(authority.substr(1, close - 1));
        auto const after = authority.substr(close + 1);
        if (!after.empty())
        {
            if (!after.starts_with(':'))
                return invalid(text, "unexpected characters after IPv6 address");
            portText = after.substr(1);
        }
    }
    else
    {
        auto const colon = authority.rfind(':');
        result.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos)
            portText = authority.substr(colon + 1);
    }

    if (result.host.empty())
        return invalid(text, "missing host");
    std::ranges::transform(result.host, result.host.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    result.port = defaultPort(result.scheme);
    if (!portText.empty())
    {
        auto port = 0u;
        auto const [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc {} || ptr != portText.data() + portText.size() || port == 0 || port > 65535)
            return invalid(text, std::format("invalid port '{}'", portText));
        result.port = static_cast<std::uint16_t>(port);
    }

    auto const questionMark = pathAndQuery.find('?');
    auto const path = pathAndQuery.substr(0, questionMark);
    result.path = path.empty() ? "/" : std::string(path);
    if (questionMark != std::string_view::npos)
        result.query = std::string(pathAndQuery.substr(questionMark + 1));

    return result;
}

auto Url::target() const -> std::string
{
    if (query.empty())
        return path;
    return std::format("{}?{}", path, query);
}

auto Url::authority() const -> std::string
{
    auto const hostPart = host.find(':') != std::string::npos ? std::format("[{}]", host) : host;
    if (port == defaultPort(scheme))
        return hostPart;
    return std::format("{}:{}", hostPart, port);
}

auto Url::toString() const -> std::string
{
    return std::format("{}://{}{}", scheme, authority(), target());
}

auto Url::withPathSegments(std::initializer_list<std::string_view> segments) const -> Url
{
    auto copy = *this;
    for (auto const segment: segments)
    {
        if (!copy.path.ends_with('/'))
            copy.path += '/';
        copy.path += url::encodeComponent(segment);
    }
    return copy;
}

auto Url::withQuery(const QueryParams& params) const -> Url
{
    auto copy = *this;
    auto const encoded = url::encodeQuery(params);
    if (encoded.empty())
        return copy;
    if (!copy.query.empty())
        copy.query += '&';
    copy.query += encoded;
    return copy;
}

auto Url::resolve(std::string_view reference) const -> Result<Url>
{
    if (reference.starts_with("//"))
        return parse(std::format("{}:{}", scheme, reference));
    if (reference.starts_with('/'))
        return parse(std::format("{}://{}{}", scheme, authority(), reference));
    if (reference.starts_with('?'))
        return parse(std::format("{}://{}{}{}", scheme, authority(), path, reference));
    if (reference.find("://") != std::string_view::npos)
        return parse(reference);

    auto const directory = path.substr(0, path.rfind('/') + 1);
    return parse(std::format("{}://{}{}{}", scheme, authority(), directory, reference));
}

auto Url::queryValue(std::string_view name) const -> std::optional<std::string>
{
    auto remaining = std::string_view { query };
    while (!remaining.empty())
    {
        auto const amp = remaining.find('&');
        auto const pair = remaining.substr(0, amp);
        remaining = amp == std::string_view::npos ? std::string_view {} : remaining.substr(amp + 1);

        auto const eq = pair.find('=');
        auto const key = url::decodeComponent(pair.substr(0, eq), true);
        if (key != name)
            continue;
        if (eq == std::string_view::npos)
            return std::string {};
        return url::decodeComponent(pair.substr(eq + 1), true);
    }
    return std::nullopt;
}

namespace url
{
    auto encodeComponent(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());
        for (auto const ch: text)
        {
            auto const byte = static_cast<unsigned char>(ch);
            if (isUnreserved(byte))
                out += ch;
            else
                out += std::format("%{:02X}", byte);
        }
        return out;
    }

    auto decodeComponent(std::string_view text, bool plusAsSpace) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());
        for (auto i = std::size_t { 0 }; i < text.size(); ++i)
        {
            auto const ch = text[i];
            if (ch == '+' && plusAsSpace)
            {
                out += ' ';
            }
            else if (ch == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0)
            {
                out += static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2]));
                i += 2;
            }
            else
            {
                out += ch;
            }
        }
        return out;
    }

    auto encodeQuery(const QueryParams& params) -> std::string
    {
        auto out = std::string {};
        for (const auto& [key, value]: params)
        {
            if (!out.empty())
                out += '&';
            out += encodeComponent(key);
            out += '=';
            out += encodeComponent(value);
        }
        return out;
    }
} // namespace url

} // namespace tunebot
