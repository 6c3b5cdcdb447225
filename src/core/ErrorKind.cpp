// SPDX-License-Identifier: Apache-2.0
#include "ErrorKind.hpp"

#include <core/Error.hpp>

#include <format>

namespace tunebot
{

namespace
{

    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto platformErrorJson(const PlatformError& error) -> nlohmann::json
    {
        return nlohmann::json {
            { "code", error.code },
            { "message", error.message },
        };
    }

} // namespace

auto classify(const ErrorKind& kind) -> Classification
{
    using enum Classification;

    // clang-format off
    return std::visit(Overloaded {
        [](const errors::TrackIndexOutOfBounds&) { return User; },
        [](const errors::NoActiveTrack&) { return User; },
        [](const errors::UserNotInGuild&) { return User; },
        [](const errors::ParseInt&) { return User; },
        [](const errors::ParseArg&) { return User; },
        [](const errors::MissingArgument&) { return User; },
        [](const errors::CommaInImageTag&) { return User; },
        [](const errors::UserNotInVoiceChannel&) { return User; },
        [](const errors::JoinVoiceChannel&) { return Internal; },
        [](const errors::AudioStart&) { return Internal; },
        [](const errors::UnknownDiscord&) { return Internal; },
        [](const errors::SendRequest&) { return Internal; },
        [](const errors::GetRequest&) { return Internal; },
        [](const errors::UnexpectedJsonShape&) { return Internal; },
        [](const errors::YtVidNotFound&) { return Internal; },
        [](const errors::YtInferVideoId&) { return Internal; },
        [](const errors::InvalidUrl&) { return Internal; },
        [](const errors::InvalidConfig&) { return Internal; },
    }, kind);
    // clang-format on
}

auto shouldCapture(const ErrorKind& kind) -> bool
{
    return classify(kind) == Classification::Internal;
}

auto title(const ErrorKind& kind) -> std::string_view
{
    // clang-format off
    return std::visit(Overloaded {
        [](const errors::NoActiveTrack&) -> std::string_view { return "Invalid command error"; },
        [](const errors::UserNotInGuild&) -> std::string_view { return "Not in a guild error"; },
        [](const errors::TrackIndexOutOfBounds&) -> std::string_view { return "Invalid argument error"; },
        [](const errors::ParseInt&) -> std::string_view { return "Invalid argument error"; },
        [](const errors::ParseArg&) -> std::string_view { return "Invalid argument error"; },
        [](const errors::MissingArgument&) -> std::string_view { return "Invalid argument error"; },
        [](const errors::CommaInImageTag&) -> std::string_view { return "Invalid argument error"; },
        [](const errors::UserNotInVoiceChannel&) -> std::string_view { return "Not in a voice channel error"; },
        [](const errors::JoinVoiceChannel&) -> std::string_view { return "Permissions error"; },
        [](const errors::AudioStart&) -> std::string_view { return "Internal error"; },
        [](const errors::UnknownDiscord&) -> std::string_view { return "Internal error"; },
        [](const errors::SendRequest&) -> std::string_view { return "Send request error"; },
        [](const errors::GetRequest&) -> std::string_view { return "HTTP error"; },
        [](const errors::UnexpectedJsonShape&) -> std::string_view { return "HTTP error"; },
        [](const errors::YtVidNotFound&) -> std::string_view { return "YouTube error"; },
        [](const errors::YtInferVideoId&) -> std::string_view { return "Bad YouTube URL"; },
        [](const errors::InvalidUrl&) -> std::string_view { return "Bad URL"; },
        [](const errors::InvalidConfig&) -> std::string_view { return "Configuration error"; },
    }, kind);
    // clang-format on
}

auto kindName(const ErrorKind& kind) -> std::string_view
{
    // clang-format off
    return std::visit(Overloaded {
        [](const errors::TrackIndexOutOfBounds&) -> std::string_view { return "TrackIndexOutOfBounds"; },
        [](const errors::NoActiveTrack&) -> std::string_view { return "NoActiveTrack"; },
        [](const errors::UserNotInGuild&) -> std::string_view { return "UserNotInGuild"; },
        [](const errors::ParseInt&) -> std::string_view { return "ParseInt"; },
        [](const errors::ParseArg&) -> std::string_view { return "ParseArg"; },
        [](const errors::MissingArgument&) -> std::string_view { return "MissingArgument"; },
        [](const errors::CommaInImageTag&) -> std::string_view { return "CommaInImageTag"; },
        [](const errors::UserNotInVoiceChannel&) -> std::string_view { return "UserNotInVoiceChannel"; },
        [](const errors::JoinVoiceChannel&) -> std::string_view { return "JoinVoiceChannel"; },
        [](const errors::AudioStart&) -> std::string_view { return "AudioStart"; },
        [](const errors::UnknownDiscord&) -> std::string_view { return "UnknownDiscord"; },
        [](const errors::SendRequest&) -> std::string_view { return "SendRequest"; },
        [](const errors::GetRequest&) -> std::string_view { return "GetRequest"; },
        [](const errors::UnexpectedJsonShape&) -> std::string_view { return "UnexpectedJsonShape"; },
        [](const errors::YtVidNotFound&) -> std::string_view { return "YtVidNotFound"; },
        [](const errors::YtInferVideoId&) -> std::string_view { return "YtInferVideoId"; },
        [](const errors::InvalidUrl&) -> std::string_view { return "InvalidUrl"; },
        [](const errors::InvalidConfig&) -> std::string_view { return "InvalidConfig"; },
    }, kind);
    // clang-format on
}

auto describe(const ErrorKind& kind) -> std::string
{
    return std::visit(
        Overloaded {
            [](const errors::TrackIndexOutOfBounds& e) {
                if (!e.available)
                    return std::format("Given track index `{}` is out of bounds, there are no tracks", e.index);
                return std::format("Given track index `{}` is out of bounds, available range: {}..{}",
                                   e.index,
                                   e.available->begin,
                                   e.available->end);
            },
            [](const errors::NoActiveTrack&) -> std::string { return "No track is currently playing"; },
            [](const errors::UserNotInGuild&) -> std::string {
                return "You are not in a discord server (guild) right now";
            },
            [](const errors::ParseInt& e) {
                return std::format("Failed to parse an integer from `{}`: {}",
                                   e.input,
                                   std::make_error_code(e.reason).message());
            },
            [](const errors::ParseArg& e) {
                if (!e.cause)
                    return std::format("Parsing the argument `{}` finished with an error", e.argument);
                return std::format("Parsing the argument `{}` finished with an error: {}",
                                   e.argument,
                                   describe(e.cause->kind()));
            },
            [](const errors::MissingArgument& e) {
                return std::format("The argument `{}` is required but was not given", e.argument);
            },
            [](const errors::CommaInImageTag& e) {
                return std::format("The specified image tags contain a comma (which is prohibited): {}",
                                   e.input);
            },
            [](const errors::UserNotInVoiceChannel&) -> std::string {
                return "You are not in a voice channel. You need to connect to one first so that "
                       "I can understand which channel to join.";
            },
            [](const errors::JoinVoiceChannel& e) {
                return std::format("I cannot join the voice channel {}",
                                   e.channel.value_or("<unknown channel name>"));
            },
            [](const errors::AudioStart& e) {
                return std::format("Failed to start streaming the audio: {}", e.cause.message);
            },
            [](const errors::UnknownDiscord& e) {
                return std::format("Unknown discord error: {}", e.cause.message);
            },
            [](const errors::SendRequest& e) {
                return std::format("Failed to send an http request ({}: {})", e.stage, e.code.message());
            },
            [](const errors::GetRequest& e) {
                return std::format("GET request has failed (http status code: {}):\n{}", e.status, e.body);
            },
            [](const errors::UnexpectedJsonShape& e) {
                return std::format("The server has returned an unexpected response JSON object: {}", e.message);
            },
            [](const errors::YtVidNotFound& e) {
                return std::format("Failed to find youtube video for \"{}\" query.", e.query);
            },
            [](const errors::YtInferVideoId& e) {
                return std::format("Could not infer YouTube video id from the url `{}`", e.url);
            },
            [](const errors::InvalidUrl& e) {
                return std::format("`{}` is not a valid URL: {}", e.input, e.reason);
            },
            [](const errors::InvalidConfig& e) {
                return std::format("Invalid configuration in {}: {}", e.path, e.reason);
            },
        },
        kind);
}

auto toJson(const ErrorKind& kind) -> nlohmann::json
{
    auto payload = std::visit(
        Overloaded {
            [](const errors::TrackIndexOutOfBounds& e) {
                auto available = nlohmann::json {};
                if (e.available)
                    available = { { "begin", e.available->begin }, { "end", e.available->end } };
                return nlohmann::json { { "index", e.index }, { "available", std::move(available) } };
            },
            [](const errors::NoActiveTrack&) { return nlohmann::json::object(); },
            [](const errors::UserNotInGuild&) { return nlohmann::json::object(); },
            [](const errors::ParseInt& e) {
                return nlohmann::json {
                    { "input", e.input },
                    { "reason", std::make_error_code(e.reason).message() },
                };
            },
            [](const errors::ParseArg& e) {
                auto cause = nlohmann::json {};
                if (e.cause)
                {
                    cause = toJson(e.cause->kind());
                    cause["id"] = e.cause->id();
                }
                return nlohmann::json { { "argument", e.argument }, { "cause", std::move(cause) } };
            },
            [](const errors::MissingArgument& e) { return nlohmann::json { { "argument", e.argument } }; },
            [](const errors::CommaInImageTag& e) { return nlohmann::json { { "input", e.input } }; },
            [](const errors::UserNotInVoiceChannel&) { return nlohmann::json::object(); },
            [](const errors::JoinVoiceChannel& e) {
                auto channel = nlohmann::json {};
                if (e.channel)
                    channel = *e.channel;
                return nlohmann::json { { "channel", std::move(channel) } };
            },
            [](const errors::AudioStart& e) {
                return nlohmann::json { { "cause", platformErrorJson(e.cause) } };
            },
            [](const errors::UnknownDiscord& e) {
                return nlohmann::json { { "cause", platformErrorJson(e.cause) } };
            },
            [](const errors::SendRequest& e) {
                return nlohmann::json {
                    { "stage", e.stage },
                    { "cause",
                      {
                          { "category", e.code.category().name() },
                          { "value", e.code.value() },
                          { "message", e.code.message() },
                      } },
                };
            },
            [](const errors::GetRequest& e) {
                return nlohmann::json { { "status", e.status }, { "body", e.body } };
            },
            [](const errors::UnexpectedJsonShape& e) {
                return nlohmann::json { { "exceptionId", e.exceptionId }, { "message", e.message } };
            },
            [](const errors::YtVidNotFound& e) { return nlohmann::json { { "query", e.query } }; },
            [](const errors::YtInferVideoId& e) { return nlohmann::json { { "url", e.url } }; },
            [](const errors::InvalidUrl& e) {
                return nlohmann::json { { "input", e.input }, { "reason", e.reason } };
            },
            [](const errors::InvalidConfig& e) {
                return nlohmann::json { { "path", e.path }, { "reason", e.reason } };
            },
        },
        kind);

    payload["kind"] = kindName(kind);
    return payload;
}

} // namespace tunebot
