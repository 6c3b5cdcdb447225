// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/ErrorKind.hpp>
#include <core/Log.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tunebot::test
{

/// @brief One value of every user-facing kind.
inline auto userKinds() -> std::vector<ErrorKind>
{
    return {
        errors::TrackIndexOutOfBounds { .index = 7, .available = IndexRange { .begin = 0, .end = 3 } },
        errors::NoActiveTrack {},
        errors::UserNotInGuild {},
        errors::ParseInt { .input = "abc", .reason = std::errc::invalid_argument },
        errors::ParseArg { .argument = "index", .cause = nullptr },
        errors::MissingArgument { .argument = "query" },
        errors::CommaInImageTag { .input = "cat,dog" },
        errors::UserNotInVoiceChannel {},
    };
}

/// @brief One value of every internal kind.
inline auto internalKinds() -> std::vector<ErrorKind>
{
    return {
        errors::JoinVoiceChannel { .channel = "General" },
        errors::AudioStart { .cause = PlatformError { .code = 4006, .message = "session no longer valid" } },
        errors::UnknownDiscord { .cause = PlatformError { .code = 50013, .message = "missing permissions" } },
        errors::SendRequest { .stage = "connect", .code = boost::asio::error::connection_refused },
        errors::GetRequest { .status = 404, .body = "not found" },
        errors::UnexpectedJsonShape { .exceptionId = 101, .message = "syntax error" },
        errors::YtVidNotFound { .query = "never gonna" },
        errors::YtInferVideoId { .url = "https://example.com" },
        errors::InvalidUrl { .input = "ftp://x", .reason = "unsupported scheme 'ftp'" },
        errors::InvalidConfig { .path = "/tmp/config.json", .reason = "cannot open file" },
    };
}

/// @brief Owned copy of a log::Record.
struct CapturedRecord
{
    log::Level level = log::Level::Info;
    std::string message;
    std::map<std::string, std::string> fields;

    [[nodiscard]] auto has(const std::string& name) const -> bool { return fields.contains(name); }
};

/// @brief Routes log records into a vector for the lifetime of the object.
class LogCapture
{
  public:
    LogCapture()
    {
        log::setCallback([this](const log::Record& record) {
            auto captured = CapturedRecord { .level = record.level, .message = std::string(record.message), .fields = {} };
            for (const auto& field: record.fields)
                captured.fields.emplace(std::string(field.name), field.value);
            records.push_back(std::move(captured));
        });
    }

    ~LogCapture() { log::setCallback({}); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    /// @brief Records carrying a correlation id field equal to @p id.
    [[nodiscard]] auto withId(const std::string& id) const -> std::vector<CapturedRecord>
    {
        auto matches = std::vector<CapturedRecord> {};
        std::ranges::copy_if(records, std::back_inserter(matches), [&id](const CapturedRecord& record) {
            auto const it = record.fields.find("id");
            return it != record.fields.end() && it->second == id;
        });
        return matches;
    }

    std::vector<CapturedRecord> records;
};

/// @brief Runs @p task on @p ioc until it completes and returns its value.
template <typename T>
auto runSync(boost::asio::io_context& ioc, boost::asio::awaitable<T> task) -> T
{
    auto future = boost::asio::co_spawn(ioc, std::move(task), boost::asio::use_future);
    ioc.run();
    return future.get();
}

/// @brief One-shot HTTP server on 127.0.0.1 answering a single request with a canned response.
class MockHttpServer
{
  public:
    explicit MockHttpServer(boost::asio::io_context& ioc):
        _acceptor(ioc, { boost::asio::ip::make_address("127.0.0.1"), 0 })
    {
    }

    [[nodiscard]] auto port() const -> unsigned short { return _acceptor.local_endpoint().port(); }

    [[nodiscard]] auto url(std::string_view target) const -> std::string
    {
        return std::format("http://127.0.0.1:{}{}", port(), target);
    }

    /// @brief Answers the next request with the given status and body.
    void respond(boost::beast::http::status status, std::string body, std::string contentType = "application/json")
    {
        auto response = boost::beast::http::response<boost::beast::http::string_body> { status, 11 };
        response.set(boost::beast::http::field::content_type, contentType);
        response.body() = std::move(body);
        response.prepare_payload();
        boost::asio::co_spawn(_acceptor.get_executor(), serve(std::move(response)), boost::asio::detached);
    }

    /// @brief Answers the next request with a redirect to @p location.
    void redirect(boost::beast::http::status status, std::string location)
    {
        auto response = boost::beast::http::response<boost::beast::http::string_body> { status, 11 };
        response.set(boost::beast::http::field::location, location);
        response.prepare_payload();
        boost::asio::co_spawn(_acceptor.get_executor(), serve(std::move(response)), boost::asio::detached);
    }

    /// @brief Accepts and reads the next request but never answers it.
    void hold()
    {
        boost::asio::co_spawn(_acceptor.get_executor(), serveNothing(), boost::asio::detached);
    }

    /// @brief Answers the next request with raw bytes, then closes the connection.
    void respondRaw(std::string bytes)
    {
        boost::asio::co_spawn(_acceptor.get_executor(), serveRaw(std::move(bytes)), boost::asio::detached);
    }

    /// @brief The last request received.
    boost::beast::http::request<boost::beast::http::string_body> request;

  private:
    auto readRequest(boost::asio::ip::tcp::socket& socket) -> boost::asio::awaitable<void>
    {
        auto buffer = boost::beast::flat_buffer {};
        co_await boost::beast::http::async_read(socket, buffer, request, boost::asio::use_awaitable);
    }

    auto serve(boost::beast::http::response<boost::beast::http::string_body> response)
        -> boost::asio::awaitable<void>
    {
        auto socket = co_await _acceptor.async_accept(boost::asio::use_awaitable);
        co_await readRequest(socket);
        co_await boost::beast::http::async_write(socket, response, boost::asio::use_awaitable);
        auto ec = boost::system::error_code {};
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    }

    auto serveRaw(std::string bytes) -> boost::asio::awaitable<void>
    {
        auto socket = co_await _acceptor.async_accept(boost::asio::use_awaitable);
        co_await readRequest(socket);
        co_await boost::asio::async_write(socket, boost::asio::buffer(bytes), boost::asio::use_awaitable);
        auto ec = boost::system::error_code {};
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    }

    auto serveNothing() -> boost::asio::awaitable<void>
    {
        auto socket = co_await _acceptor.async_accept(boost::asio::use_awaitable);
        co_await readRequest(socket);
        // Completes once the client gives up and closes its end.
        auto byte = char {};
        auto ec = boost::system::error_code {};
        co_await boost::asio::async_read(
            socket, boost::asio::buffer(&byte, 1), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    boost::asio::ip::tcp::acceptor _acceptor;
};

/// @brief Returns a local port nothing is listening on.
inline auto closedPort(boost::asio::io_context& ioc) -> unsigned short
{
    auto acceptor = boost::asio::ip::tcp::acceptor { ioc, { boost::asio::ip::make_address("127.0.0.1"), 0 } };
    auto const port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace tunebot::test
