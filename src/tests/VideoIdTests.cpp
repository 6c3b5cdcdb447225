// SPDX-License-Identifier: Apache-2.0
#include <youtube/VideoId.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

#include "TestSupport.hpp"

using namespace tunebot;

TEST_CASE("isVideoId checks length and alphabet", "[youtube]")
{
    CHECK(youtube::isVideoId("dQw4w9WgXcQ"));
    CHECK(youtube::isVideoId("a-b_c-d_e-f"));
    CHECK(!youtube::isVideoId("dQw4w9WgXc"));
    CHECK(!youtube::isVideoId("dQw4w9WgXcQQ"));
    CHECK(!youtube::isVideoId("dQw4w9WgX?Q"));
}

TEST_CASE("inferVideoId understands the common URL forms", "[youtube]")
{
    auto const capture = test::LogCapture {};

    auto const cases = {
        std::pair { "https://www.youtube.com/watch?v=dQw4w9WgXcQ", "dQw4w9WgXcQ" },
        std::pair { "https://youtube.com/watch?feature=share&v=dQw4w9WgXcQ&t=42", "dQw4w9WgXcQ" },
        std::pair { "https://m.youtube.com/watch?v=dQw4w9WgXcQ", "dQw4w9WgXcQ" },
        std::pair { "https://music.youtube.com/watch?v=dQw4w9WgXcQ&list=RD", "dQw4w9WgXcQ" },
        std::pair { "https://youtu.be/dQw4w9WgXcQ?si=abc", "dQw4w9WgXcQ" },
        std::pair { "http://www.youtube.com/embed/dQw4w9WgXcQ", "dQw4w9WgXcQ" },
        std::pair { "https://www.youtube.com/shorts/dQw4w9WgXcQ/", "dQw4w9WgXcQ" },
        std::pair { "https://www.youtube.com/live/dQw4w9WgXcQ", "dQw4w9WgXcQ" },
        std::pair { "www.youtube.com/watch?v=dQw4w9WgXcQ", "dQw4w9WgXcQ" },
        std::pair { "youtu.be/dQw4w9WgXcQ", "dQw4w9WgXcQ" },
    };

    for (auto const& [url, id]: cases)
    {
        INFO(url);
        auto const result = youtube::inferVideoId(url);
        REQUIRE(result.has_value());
        CHECK(*result == id);
    }
    CHECK(capture.records.empty());
}

TEST_CASE("inferVideoId rejects other URLs", "[youtube]")
{
    auto const capture = test::LogCapture {};

    for (auto const* const url: { "https://example.com/watch?v=dQw4w9WgXcQ",
                                  "https://www.youtube.com/watch",
                                  "https://www.youtube.com/watch?v=short",
                                  "https://www.youtube.com/channel/UC123",
                                  "ftp://youtube.com/watch?v=dQw4w9WgXcQ",
                                  "not a url at all" })
    {
        INFO(url);
        auto const result = youtube::inferVideoId(url);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().is<errors::YtInferVideoId>());
        CHECK(result.error().as<errors::YtInferVideoId>()->url == url);
        CHECK(result.error().render().title == "Bad YouTube URL");
    }
}

TEST_CASE("watchUrl builds the canonical link", "[youtube]")
{
    CHECK(youtube::watchUrl("dQw4w9WgXcQ") == "https://www.youtube.com/watch?v=dQw4w9WgXcQ");
}
