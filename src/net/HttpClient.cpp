// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>
#include <net/HttpError.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <format>

namespace tunebot
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace
{

    constexpr auto MaxBodySize = std::uint64_t { 16 } * 1024 * 1024;
    constexpr auto MaxRedirects = 10;

    using Clock = std::chrono::steady_clock;
    using Request = http::request<http::empty_body>;

    /// @brief A response that made it past status classification.
    struct Reply
    {
        unsigned status = 0;
        std::string location;
        std::string body;
    };

    auto sendFailure(std::string_view stage, const boost::system::error_code& ec) -> std::unexpected<Error>
    {
        return makeError(errors::SendRequest { .stage = std::string(stage), .code = ec });
    }

    auto isErrorStatus(unsigned status) -> bool
    {
        auto const statusClass = http::to_status_class(status);
        return statusClass == http::status_class::client_error || statusClass == http::status_class::server_error;
    }

    auto isFollowedRedirect(unsigned status) -> bool
    {
        switch (http::int_to_status(status))
        {
            case http::status::moved_permanently:
            case http::status::found:
            case http::status::see_other:
            case http::status::temporary_redirect:
            case http::status::permanent_redirect: return true;
            default: return false;
        }
    }

    auto buildRequest(const Url& url, std::string_view userAgent) -> Request
    {
        auto request = Request { http::verb::get, url.target(), 11 };
        request.set(http::field::host, url.authority());
        request.set(http::field::user_agent, userAgent);
        request.set(http::field::accept, "application/json");
        request.set(http::field::connection, "close");
        return request;
    }

    /// @brief Resolver and deadline timer; the completion handler keeps it alive past a timeout.
    struct PendingResolve
    {
        explicit PendingResolve(const asio::any_io_executor& executor): resolver(executor), timer(executor) {}

        tcp::resolver resolver;
        asio::steady_timer timer;
        boost::system::error_code ec;
        tcp::resolver::results_type endpoints;
        bool done = false;
    };

    /// @brief Resolves the host, giving up with beast::error::timeout at @p deadline.
    auto resolve(const Url& url, Clock::time_point deadline) -> asio::awaitable<Result<tcp::resolver::results_type>>
    {
        if (Clock::now() >= deadline)
            co_return sendFailure("resolve", beast::error::timeout);

        auto const state = std::make_shared<PendingResolve>(co_await asio::this_coro::executor);
        state->timer.expires_at(deadline);
        state->resolver.async_resolve(
            url.host,
            std::to_string(url.port),
            [state](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
                state->ec = ec;
                state->endpoints = std::move(endpoints);
                state->done = true;
                state->timer.cancel();
            });

        auto ec = boost::system::error_code {};
        co_await state->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

        // getaddrinfo cannot be interrupted; a late result is dropped by the handler.
        if (!state->done)
        {
            state->resolver.cancel();
            co_return sendFailure("resolve", beast::error::timeout);
        }
        if (state->ec)
            co_return sendFailure("resolve", state->ec);

        co_return std::move(state->endpoints);
    }

    auto connect(beast::tcp_stream& socket, const Url& url, Clock::time_point connectDeadline)
        -> asio::awaitable<VoidResult>
    {
        auto const endpoints = co_await resolve(url, connectDeadline);
        if (!endpoints)
            co_return std::unexpected(endpoints.error());

        auto ec = boost::system::error_code {};
        socket.expires_at(connectDeadline);
        co_await socket.async_connect(*endpoints, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return sendFailure("connect", ec);

        co_return VoidResult {};
    }

    /// @brief Writes the request and reads the response, classifying it by status.
    template <typename Stream>
    auto exchange(Stream& stream, const Request& request, Clock::time_point deadline) -> asio::awaitable<Result<Reply>>
    {
        auto ec = boost::system::error_code {};
        auto& socket = beast::get_lowest_layer(stream);

        socket.expires_at(deadline);
        co_await http::async_write(stream, request, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return sendFailure("write request", ec);

        auto buffer = beast::flat_buffer {};
        auto parser = http::response_parser<http::string_body> {};
        parser.body_limit(MaxBodySize);

        co_await http::async_read_header(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return sendFailure("read header", ec);

        auto const status = parser.get().result_int();
        auto location = std::string(parser.get()[http::field::location]);
        co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));

        if (isErrorStatus(status))
        {
            // The status code is what matters; a body that cannot be read is described instead.
            auto body = ec ? std::format("Could not collect the GET request body: {}", ec.message())
                           : std::move(parser.get().body());
            co_return makeError(errors::GetRequest { .status = status, .body = std::move(body) });
        }

        // The body of a successful response is what gets decoded, so losing it is a shape failure.
        if (ec)
            co_return makeError(errors::UnexpectedJsonShape {
                .exceptionId = 0,
                .message = std::format("Could not read the response body: {}", ec.message()),
            });

        co_return Reply { .status = status, .location = std::move(location), .body = std::move(parser.get().body()) };
    }

} // namespace

struct HttpClient::Impl
{
    explicit Impl(HttpClientConfig config): config(std::move(config)), tls(ssl::context::tls_client) {}

    /// @brief Performs one GET on a fresh connection.
    auto fetch(const Url& target, Clock::time_point deadline) const -> asio::awaitable<Result<Reply>>;

    HttpClientConfig config;
    mutable ssl::context tls;
};

auto HttpClient::Impl::fetch(const Url& target, Clock::time_point deadline) const -> asio::awaitable<Result<Reply>>
{
    auto const request = buildRequest(target, config.userAgent);
    auto const connectDeadline = std::min(deadline, Clock::now() + config.connectTimeout);
    auto executor = co_await asio::this_coro::executor;

    // The query may carry credentials, so only the path is logged.
    log::debug("GET {}://{}{}", target.scheme, target.authority(), target.path);

    if (!target.isSecure())
    {
        auto stream = beast::tcp_stream { executor };
        auto connected = co_await connect(stream, target, connectDeadline);
        if (!connected)
            co_return std::unexpected(std::move(connected).error());
        co_return co_await exchange(stream, request, deadline);
    }

    auto stream = beast::ssl_stream<beast::tcp_stream> { executor, tls };
    if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str()))
    {
        auto const ec = boost::system::error_code { static_cast<int>(::ERR_get_error()),
                                                    asio::error::get_ssl_category() };
        co_return sendFailure("tls setup", ec);
    }
    stream.set_verify_callback(ssl::host_name_verification(target.host));

    auto connected = co_await connect(beast::get_lowest_layer(stream), target, connectDeadline);
    if (!connected)
        co_return std::unexpected(std::move(connected).error());

    auto ec = boost::system::error_code {};
    beast::get_lowest_layer(stream).expires_at(connectDeadline);
    co_await stream.async_handshake(ssl::stream_base::client, asio::redirect_error(asio::use_awaitable, ec));
    if (ec)
        co_return sendFailure("tls handshake", ec);

    auto result = co_await exchange(stream, request, deadline);

    beast::get_lowest_layer(stream).expires_at(deadline);
    co_await stream.async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
    // Servers commonly close without a close_notify; the response is complete either way.
    if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated)
        log::debug("TLS shutdown with {} failed: {}", target.host, ec.message());

    co_return result;
}

HttpClient::HttpClient(HttpClientConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
    auto ec = boost::system::error_code {};
    _impl->tls.set_default_verify_paths(ec);
    if (ec)
        log::warning("Could not load the system certificate store: {}", ec.message());
    _impl->tls.set_verify_mode(ssl::verify_peer, ec);
    if (ec)
        log::warning("Could not enable TLS peer verification: {}", ec.message());
}

HttpClient::~HttpClient() = default;

auto HttpClient::config() const -> const HttpClientConfig&
{
    return _impl->config;
}

auto HttpClient::getBody(Url url, QueryParams query) const -> asio::awaitable<Result<std::string>>
{
    auto target = url.withQuery(query);
    auto const deadline = Clock::now() + _impl->config.requestTimeout;

    for (auto redirects = 0;; ++redirects)
    {
        auto reply = co_await _impl->fetch(target, deadline);
        if (!reply)
            co_return std::unexpected(std::move(reply).error());

        if (!isFollowedRedirect(reply->status))
            co_return std::move(reply->body);

        if (redirects == MaxRedirects)
            co_return sendFailure("redirect", HttpErrc::TooManyRedirects);
        if (reply->location.empty())
            co_return sendFailure("redirect", HttpErrc::InvalidRedirect);

        auto next = target.resolve(reply->location);
        if (!next)
            co_return std::unexpected(std::move(next).error());

        log::debug("Following {} redirect to {}://{}{}", reply->status, next->scheme, next->authority(), next->path);
        target = std::move(*next);
    }
}

} // namespace tunebot
