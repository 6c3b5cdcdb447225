// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/system/error_code.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace tunebot
{

class Error;

/// @brief Whether a failure was caused by the user's input or by the bot itself.
enum class Classification
{
    /// Expected condition, e.g. a malformed argument. Logged without a stack trace.
    User,
    /// Unexpected condition, e.g. a failed HTTP request. Logged with a stack trace.
    Internal,
};

/// @brief Half-open range [begin, end) of valid indices.
struct IndexRange
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

/// @brief Failure reported by the chat platform SDK.
struct PlatformError
{
    int code = 0;
    std::string message;
};

/// @brief Payload types, one per kind of failure.
namespace errors
{
    struct TrackIndexOutOfBounds
    {
        std::size_t index = 0;
        std::optional<IndexRange> available;
    };

    struct NoActiveTrack
    {
    };

    struct UserNotInGuild
    {
    };

    struct ParseInt
    {
        std::string input;
        std::errc reason = std::errc::invalid_argument;
    };

    /// @brief The parser of a named argument failed; owns the failure it produced.
    struct ParseArg
    {
        std::string argument;
        std::shared_ptr<const Error> cause;
    };

    /// @brief The argument list ended before a required argument.
    struct MissingArgument
    {
        std::string argument;
    };

    struct CommaInImageTag
    {
        std::string input;
    };

    struct UserNotInVoiceChannel
    {
    };

    struct JoinVoiceChannel
    {
        std::optional<std::string> channel;
    };

    struct AudioStart
    {
        PlatformError cause;
    };

    struct UnknownDiscord
    {
        PlatformError cause;
    };

    /// @brief The request could not be sent or no response arrived.
    struct SendRequest
    {
        std::string stage; ///< e.g. "resolve", "connect", "read header"
        boost::system::error_code code;
    };

    /// @brief The server answered with a 4xx or 5xx status.
    struct GetRequest
    {
        unsigned status = 0;
        std::string body;
    };

    struct UnexpectedJsonShape
    {
        int exceptionId = 0; ///< nlohmann::json exception id, 0 if the body could not be read
        std::string message;
    };

    struct YtVidNotFound
    {
        std::string query;
    };

    struct YtInferVideoId
    {
        std::string url;
    };

    struct InvalidUrl
    {
        std::string input;
        std::string reason;
    };

    struct InvalidConfig
    {
        std::string path;
        std::string reason;
    };
} // namespace errors

/// @brief Closed set of failure kinds.
///
/// Every function below visits all alternatives explicitly, so adding an
/// alternative does not compile until each of them handles it.
using ErrorKind = std::variant<errors::TrackIndexOutOfBounds,
                               errors::NoActiveTrack,
                               errors::UserNotInGuild,
                               errors::ParseInt,
                               errors::ParseArg,
                               errors::MissingArgument,
                               errors::CommaInImageTag,
                               errors::UserNotInVoiceChannel,
                               errors::JoinVoiceChannel,
                               errors::AudioStart,
                               errors::UnknownDiscord,
                               errors::SendRequest,
                               errors::GetRequest,
                               errors::UnexpectedJsonShape,
                               errors::YtVidNotFound,
                               errors::YtInferVideoId,
                               errors::InvalidUrl,
                               errors::InvalidConfig>;

/// @brief Classifies a failure as user-facing or internal.
[[nodiscard]] auto classify(const ErrorKind& kind) -> Classification;

/// @brief Returns true if a stack trace should be captured for this kind.
[[nodiscard]] auto shouldCapture(const ErrorKind& kind) -> bool;

/// @brief Short title shown as the heading of the chat reply.
[[nodiscard]] auto title(const ErrorKind& kind) -> std::string_view;

/// @brief Name of the variant, e.g. "GetRequest".
[[nodiscard]] auto kindName(const ErrorKind& kind) -> std::string_view;

/// @brief Long-form sentence describing the failure, including nested causes.
[[nodiscard]] auto describe(const ErrorKind& kind) -> std::string;

/// @brief Structured form of the failure (variant name and payload), including nested causes.
[[nodiscard]] auto toJson(const ErrorKind& kind) -> nlohmann::json;

} // namespace tunebot
