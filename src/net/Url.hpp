// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tunebot
{

/// @brief Ordered list of query parameters; keys may repeat.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// @brief An absolute http(s) URL split into the parts a request needs.
struct Url
{
    std::string scheme; ///< "http" or "https", lowercase
    std::string host;   ///< Without brackets for IPv6 literals.
    std::uint16_t port = 0;
    std::string path = "/";
    std::string query; ///< Encoded, without the leading '?'.

    /// @brief Parses an absolute http or https URL. The fragment is dropped.
    ///
    /// Spaces and control characters are rejected; they must be percent-encoded.
    /// @param text The URL text.
    /// @return The parsed URL or an InvalidUrl error.
    [[nodiscard]] static auto parse(std::string_view text) -> Result<Url>;

    /// @brief Returns true for https.
    [[nodiscard]] auto isSecure() const -> bool { return scheme == "https"; }

    /// @brief Request target: path plus query string.
    [[nodiscard]] auto target() const -> std::string;

    /// @brief Value of the Host header (port omitted when it is the scheme default).
    [[nodiscard]] auto authority() const -> std::string;

    [[nodiscard]] auto toString() const -> std::string;

    /// @brief Returns a copy with each segment percent-encoded and appended to the path.
    [[nodiscard]] auto withPathSegments(std::initializer_list<std::string_view> segments) const -> Url;

    /// @brief Returns a copy with the parameters encoded and appended to the query.
    [[nodiscard]] auto withQuery(const QueryParams& params) const -> Url;

    /// @brief Resolves a reference (as found in a Location header) against this URL.
    ///
    /// Accepts absolute URLs, scheme-relative "//host/..." references, absolute
    /// paths, relative paths and query-only references.
    [[nodiscard]] auto resolve(std::string_view reference) const -> Result<Url>;

    /// @brief Decoded value of the first query parameter named @p name.
    [[nodiscard]] auto queryValue(std::string_view name) const -> std::optional<std::string>;
};

namespace url
{
    /// @brief Percent-encodes everything except RFC 3986 unreserved characters.
    [[nodiscard]] auto encodeComponent(std::string_view text) -> std::string;

    /// @brief Decodes percent escapes and, in query strings, '+' as space.
    ///
    /// Malformed escapes are kept verbatim.
    [[nodiscard]] auto decodeComponent(std::string_view text, bool plusAsSpace = false) -> std::string;

    /// @brief Encodes parameters as "k1=v1&k2=v2".
    [[nodiscard]] auto encodeQuery(const QueryParams& params) -> std::string;
} // namespace url

} // namespace tunebot
