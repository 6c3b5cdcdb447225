// SPDX-License-Identifier: Apache-2.0
#include "Error.hpp"

#include <core/CorrelationId.hpp>
#include <core/Log.hpp>

#include <cstdio>
#include <exception>
#include <format>
#include <vector>

namespace tunebot
{

namespace
{

    /// @brief Dumps JSON without throwing on invalid UTF-8 in payload strings.
    auto dumpJson(const nlohmann::json& value, int indent) -> std::string
    {
        return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }

} // namespace

Error::Error(std::in_place_t, ErrorKind kind): _id(generateCorrelationId()), _kind(std::move(kind))
{
    if (shouldCapture(_kind))
        _backtrace.emplace();

    logCreation();
}

void Error::logCreation() const noexcept
{
    try
    {
        auto fields = std::vector<log::Field> {
            { .name = "id", .value = _id },
            { .name = "kind", .value = dumpJson(toJson(_kind), -1) },
        };
        if (_backtrace)
            fields.push_back({ .name = "backtrace", .value = boost::stacktrace::to_string(*_backtrace) });

        log::write(log::Level::Error, tunebot::describe(_kind), fields);
    }
    catch (const std::exception& e)
    {
        // The failure is still returned to the caller; only its log entry is lost.
        std::fprintf(stderr, "failed to log error %s: %s\n", _id.c_str(), e.what());
    }
}

auto Error::describe() const -> std::string
{
    return tunebot::describe(_kind);
}

auto Error::render() const -> Message
{
    return Message {
        .title = std::string(title(_kind)),
        .body = std::format(
            "{}\n\nError id: **`{}`**\n\n```\n{}\n```", describe(), _id, dumpJson(toJson(_kind), 2)),
    };
}

} // namespace tunebot
