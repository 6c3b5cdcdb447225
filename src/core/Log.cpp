// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <cstdio>
#include <print>

namespace tunebot::log
{

namespace
{
    auto currentLevel = Level::Info;
    auto sink = LogCallback {};
} // namespace

void setCallback(LogCallback callback)
{
    sink = std::move(callback);
}

void setLevel(Level level)
{
    currentLevel = level;
}

auto getLevel() -> Level
{
    return currentLevel;
}

auto levelFromString(std::string_view name) -> Level
{
    if (name == "error")
        return Level::Error;
    if (name == "warning")
        return Level::Warning;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return Level::Info;
}

auto levelToString(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

void write(Level level, std::string_view message, std::span<const Field> fields)
{
    if (level > currentLevel)
        return;

    if (sink)
    {
        sink(Record {
            .level = level,
            .timestamp = std::chrono::system_clock::now(),
            .message = message,
            .fields = fields,
        });
        return;
    }

    auto line = std::format("[{:<7}] {}", levelToString(level), message);
    for (const auto& field: fields)
    {
        // Multi-line values (stack traces) go below the line they belong to.
        if (field.value.find('\n') != std::string::npos)
            line += std::format("\n  {}:\n{}", field.name, field.value);
        else
            line += std::format(" {}={}", field.name, field.value);
    }

    std::println(stderr, "{}", line);
}

void flush()
{
    std::fflush(stderr);
}

} // namespace tunebot::log
