// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/JsonUtils.hpp>
#include <net/Url.hpp>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace tunebot
{

/// @brief Client-wide HTTP settings.
struct HttpClientConfig
{
    /// @brief Sent as the User-Agent header of every request.
    std::string userAgent = "tunebot";

    /// @brief Time allowed for resolving and connecting (and the TLS handshake) on each hop.
    std::chrono::seconds connectTimeout { 30 };

    /// @brief Time allowed for the whole request including redirects, from resolving to reading the body.
    std::chrono::seconds requestTimeout { 30 };
};

/// @brief Minimal asynchronous HTTP(S) client for JSON APIs.
///
/// Every request is a single attempt without retries; each hop uses a fresh
/// connection. Up to 10 redirects (301, 302, 303, 307, 308) are followed.
/// Failures map to the error taxonomy as follows:
/// - no response (DNS, connect, TLS, timeout, broken connection, redirect
///   loop): SendRequest
/// - 4xx or 5xx status: GetRequest with the status and the body text
/// - any other status whose body cannot be read or is not the expected JSON:
///   UnexpectedJsonShape
///
/// The client only holds read-only state and can be shared by concurrent
/// coroutines. It must outlive the requests started through it.
class HttpClient
{
  public:
    explicit HttpClient(HttpClientConfig config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Sends a GET request and returns the body of a non-error response.
    /// @param url The request URL.
    /// @param query Parameters appended to the URL's query string.
    /// @return The response body or an error.
    [[nodiscard]] auto getBody(Url url, QueryParams query = {}) const -> boost::asio::awaitable<Result<std::string>>;

    /// @brief Sends a GET request and decodes the response body as @p T.
    /// @tparam T A type nlohmann::json can convert to (via from_json).
    /// @param url The request URL.
    /// @param query Parameters appended to the URL's query string.
    /// @return The decoded value or an error.
    template <typename T>
    [[nodiscard]] auto getJson(Url url, QueryParams query = {}) const -> boost::asio::awaitable<Result<T>>
    {
        auto body = co_await getBody(std::move(url), std::move(query));
        if (!body)
            co_return std::unexpected(std::move(body).error());
        co_return json::decode<T>(*body);
    }

    [[nodiscard]] auto config() const -> const HttpClientConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tunebot
