// SPDX-License-Identifier: Apache-2.0
#include "CorrelationId.hpp"

#include <chrono>
#include <random>
#include <system_error>

namespace tunebot
{

namespace
{

    auto seed() noexcept -> std::mt19937::result_type
    {
        try
        {
            return std::random_device {}();
        }
        catch (const std::system_error&)
        {
            // No entropy source on this platform; ids only need to differ between runs.
            return static_cast<std::mt19937::result_type>(
                std::chrono::steady_clock::now().time_since_epoch().count());
        }
    }

} // namespace

auto generateCorrelationId(std::size_t length) -> std::string
{
    thread_local auto engine = std::mt19937 { seed() };
    auto distribution = std::uniform_int_distribution<std::size_t> { 0, CorrelationIdAlphabet.size() - 1 };

    auto id = std::string(length, '\0');
    for (auto& ch: id)
        ch = CorrelationIdAlphabet[distribution(engine)];
    return id;
}

} // namespace tunebot
