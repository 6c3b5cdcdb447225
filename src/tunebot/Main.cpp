// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <net/HttpClient.hpp>
#include <tunebot/Config.hpp>
#include <youtube/VideoId.hpp>
#include <youtube/YoutubeClient.hpp>

#include <CLI/CLI.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <exception>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace
{

auto joinWords(const std::vector<std::string>& words) -> std::string
{
    auto text = std::string {};
    for (const auto& word: words)
    {
        if (!text.empty())
            text += ' ';
        text += word;
    }
    return text;
}

/// @brief Prints the reply a chat user would see for a failed command.
auto reportFailure(const tunebot::Error& error) -> int
{
    auto const message = error.render();
    std::println("{}\n\n{}", message.title, message.body);
    return 1;
}

auto printVideo(const tunebot::youtube::Video& video) -> int
{
    std::println("{}\n{}\n{}", video.title, video.channelTitle, tunebot::youtube::watchUrl(video.id));
    return 0;
}

/// @brief Runs a YouTube lookup to completion on a private io_context.
template <typename Lookup>
auto runLookup(const tunebot::AppConfig& config, Lookup lookup) -> int
{
    auto ioc = boost::asio::io_context {};
    auto http = tunebot::HttpClient(config.http);
    auto youtube = tunebot::youtube::YoutubeClient(http, config.youtube);

    auto future = boost::asio::co_spawn(ioc, lookup(youtube), boost::asio::use_future);
    ioc.run();

    auto const result = future.get();
    if (!result)
        return reportFailure(result.error());
    return printVideo(*result);
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "tunebot: music bot command core" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    auto words = std::vector<std::string> {};
    auto url = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* search = app.add_subcommand("search", "Search YouTube and print the best match");
    search->add_option("query", words, "Search terms")->required();

    auto* resolve = app.add_subcommand("resolve", "Look up a YouTube URL or search for the given terms");
    resolve->add_option("input", words, "YouTube URL or search terms")->required();

    auto* videoId = app.add_subcommand("video-id", "Print the video id of a YouTube URL");
    videoId->add_option("url", url, "YouTube URL")->required();

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? tunebot::loadConfig() : tunebot::loadConfigFromFile(configPath);
    if (!configResult)
        return reportFailure(configResult.error());

    auto& config = *configResult;
    tunebot::log::setLevel(verbose ? tunebot::log::Level::Debug : config.log.level);

    auto exitCode = 0;
    try
    {
        if (*videoId)
        {
            auto const id = tunebot::youtube::inferVideoId(url);
            if (id)
                std::println("{}", *id);
            else
                exitCode = reportFailure(id.error());
        }
        else if (*search)
        {
            exitCode = runLookup(config, [query = joinWords(words)](const auto& youtube) {
                return youtube.findVideo(query);
            });
        }
        else if (*resolve)
        {
            exitCode = runLookup(config, [input = joinWords(words)](const auto& youtube) {
                return youtube.resolve(input);
            });
        }
    }
    catch (const std::exception& e)
    {
        tunebot::log::error("Unhandled exception: {}", e.what());
        exitCode = 2;
    }

    tunebot::log::flush();
    return exitCode;
}
