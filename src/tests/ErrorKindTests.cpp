// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/ErrorKind.hpp>

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/error.hpp>

#include <memory>
#include <vector>

#include "TestSupport.hpp"

using namespace tunebot;

TEST_CASE("classify separates user errors from internal errors", "[error]")
{
    for (const auto& kind: test::userKinds())
    {
        INFO(kindName(kind));
        CHECK(classify(kind) == Classification::User);
        CHECK(!shouldCapture(kind));
    }

    for (const auto& kind: test::internalKinds())
    {
        INFO(kindName(kind));
        CHECK(classify(kind) == Classification::Internal);
        CHECK(shouldCapture(kind));
    }
}

TEST_CASE("classify is deterministic", "[error]")
{
    auto const first = test::internalKinds();
    auto const second = test::internalKinds();
    for (auto i = std::size_t { 0 }; i < first.size(); ++i)
        CHECK(classify(first[i]) == classify(second[i]));

    for (const auto& kind: test::userKinds())
        CHECK(classify(kind) == classify(kind));
}

TEST_CASE("title groups related kinds", "[error]")
{
    CHECK(title(errors::NoActiveTrack {}) == "Invalid command error");
    CHECK(title(errors::UserNotInGuild {}) == "Not in a guild error");
    CHECK(title(errors::ParseInt {}) == "Invalid argument error");
    CHECK(title(errors::ParseArg {}) == "Invalid argument error");
    CHECK(title(errors::MissingArgument {}) == "Invalid argument error");
    CHECK(title(errors::CommaInImageTag {}) == "Invalid argument error");
    CHECK(title(errors::TrackIndexOutOfBounds {}) == "Invalid argument error");
    CHECK(title(errors::UserNotInVoiceChannel {}) == "Not in a voice channel error");
    CHECK(title(errors::JoinVoiceChannel {}) == "Permissions error");
    CHECK(title(errors::AudioStart {}) == "Internal error");
    CHECK(title(errors::UnknownDiscord {}) == "Internal error");
    CHECK(title(errors::SendRequest {}) == "Send request error");
    CHECK(title(errors::GetRequest {}) == "HTTP error");
    CHECK(title(errors::UnexpectedJsonShape {}) == "HTTP error");
    CHECK(title(errors::YtVidNotFound {}) == "YouTube error");
    CHECK(title(errors::YtInferVideoId {}) == "Bad YouTube URL");
    CHECK(title(errors::InvalidUrl {}) == "Bad URL");
    CHECK(title(errors::InvalidConfig {}) == "Configuration error");
}

TEST_CASE("describe interpolates the payload", "[error]")
{
    CHECK(describe(errors::TrackIndexOutOfBounds { .index = 7, .available = IndexRange { .begin = 0, .end = 3 } })
          == "Given track index `7` is out of bounds, available range: 0..3");
    CHECK(describe(errors::TrackIndexOutOfBounds { .index = 0, .available = std::nullopt })
          == "Given track index `0` is out of bounds, there are no tracks");
    CHECK(describe(errors::GetRequest { .status = 404, .body = "not found" })
          == "GET request has failed (http status code: 404):\nnot found");
    CHECK(describe(errors::JoinVoiceChannel { .channel = std::nullopt })
          == "I cannot join the voice channel <unknown channel name>");
    CHECK(describe(errors::JoinVoiceChannel { .channel = "General" }) == "I cannot join the voice channel General");
    CHECK(describe(errors::YtVidNotFound { .query = "lofi" }) == "Failed to find youtube video for \"lofi\" query.");
    CHECK(describe(errors::CommaInImageTag { .input = "a,b" })
          == "The specified image tags contain a comma (which is prohibited): a,b");
}

TEST_CASE("describe and toJson follow a nested argument error", "[error]")
{
    auto const capture = test::LogCapture {};
    auto const inner = std::make_shared<const Error>(errors::ParseInt { .input = "x1", .reason = std::errc::invalid_argument });
    auto const kind = ErrorKind { errors::ParseArg { .argument = "index", .cause = inner } };

    auto const text = describe(kind);
    CHECK(text.starts_with("Parsing the argument `index` finished with an error: "));
    CHECK(text.find("Failed to parse an integer from `x1`") != std::string::npos);

    auto const json = toJson(kind);
    CHECK(json["kind"] == "ParseArg");
    CHECK(json["argument"] == "index");
    CHECK(json["cause"]["kind"] == "ParseInt");
    CHECK(json["cause"]["input"] == "x1");
    CHECK(json["cause"]["id"] == inner->id());
}

TEST_CASE("toJson carries the variant name and payload", "[error]")
{
    auto const json = toJson(errors::SendRequest { .stage = "connect", .code = boost::asio::error::connection_refused });
    CHECK(json["kind"] == "SendRequest");
    CHECK(json["stage"] == "connect");
    CHECK(json["cause"]["value"] == static_cast<int>(boost::asio::error::connection_refused));

    auto const bounds = toJson(errors::TrackIndexOutOfBounds { .index = 5, .available = std::nullopt });
    CHECK(bounds["index"] == 5);
    CHECK(bounds["available"].is_null());

    CHECK(toJson(errors::NoActiveTrack {}) == nlohmann::json { { "kind", "NoActiveTrack" } });
}
