// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <format>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace tunebot::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief A named value attached to a log record.
struct Field
{
    std::string_view name;
    std::string value;
};

/// @brief A single log event as handed to the installed sink.
///
/// The record only borrows its message and fields; a sink that keeps them
/// around must copy.
struct Record
{
    Level level = Level::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string_view message;
    std::span<const Field> fields;
};

/// @brief Callback type that receives all log records.
using LogCallback = std::function<void(const Record& record)>;

/// @brief Sets a callback that receives all log records.
///
/// When set, records are routed to the callback instead of stderr.
/// An empty callback restores the stderr sink.
/// A callback may throw, but only exceptions derived from std::exception;
/// Error construction logs from a noexcept context and drops those.
void setCallback(LogCallback callback);

/// @brief Records less severe than @p level are dropped.
void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name (error, warning, info, debug, trace).
/// @return The level, or Level::Info if the name is unknown.
[[nodiscard]] auto levelFromString(std::string_view name) -> Level;

/// @brief Returns the lowercase name of a level.
[[nodiscard]] auto levelToString(Level level) -> std::string_view;

/// @brief Writes a log record at the given level.
///
/// If a callback is installed via setCallback(), the record is routed there.
/// Otherwise, it is written to stderr with a level prefix, followed by its fields.
/// @param level The log level.
/// @param message The message to output.
/// @param fields Structured fields attached to the message.
void write(Level level, std::string_view message, std::span<const Field> fields = {});

/// @brief Flushes the default stderr sink. Called once at shutdown.
void flush();

/// @brief Formats and writes a message if @p level is enabled.
template <typename... Args>
void emit(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (level <= getLevel())
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace tunebot::log
