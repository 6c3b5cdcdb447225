// SPDX-License-Identifier: Apache-2.0
#include "Arguments.hpp"

#include <charconv>

namespace tunebot::args
{

namespace
{

    auto isSpace(char ch) -> bool
    {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    }

    template <typename Int>
    auto parseNumber(std::string_view input) -> Result<Int>
    {
        auto value = Int {};
        auto const* const end = input.data() + input.size();
        auto const [ptr, ec] = std::from_chars(input.data(), end, value);
        if (ec != std::errc {})
            return makeError(errors::ParseInt { .input = std::string(input), .reason = ec });
        if (ptr != end)
            return makeError(errors::ParseInt { .input = std::string(input), .reason = std::errc::invalid_argument });
        return value;
    }

} // namespace

auto parseInt(std::string_view input) -> Result<std::int64_t>
{
    return parseNumber<std::int64_t>(input);
}

auto parseIndex(std::string_view input) -> Result<std::size_t>
{
    return parseNumber<std::size_t>(input);
}

auto parseTrackIndex(std::string_view input, std::size_t trackCount) -> Result<std::size_t>
{
    return parseIndex(input).and_then([trackCount](std::size_t index) -> Result<std::size_t> {
        if (index < trackCount)
            return index;

        auto bounds = errors::TrackIndexOutOfBounds { .index = index, .available = std::nullopt };
        if (trackCount > 0)
            bounds.available = IndexRange { .begin = 0, .end = trackCount };
        return makeError(std::move(bounds));
    });
}

auto parseImageTags(std::string_view input) -> Result<std::vector<std::string>>
{
    if (input.find(',') != std::string_view::npos)
        return makeError(errors::CommaInImageTag { .input = std::string(input) });

    auto tags = std::vector<std::string> {};
    auto position = std::size_t { 0 };
    while (position < input.size())
    {
        while (position < input.size() && isSpace(input[position]))
            ++position;
        auto const start = position;
        while (position < input.size() && !isSpace(input[position]))
            ++position;
        if (position > start)
            tags.emplace_back(input.substr(start, position - start));
    }
    return tags;
}

ArgumentList::ArgumentList(std::string_view text): _text(text)
{
    skipWhitespace();
}

auto ArgumentList::next() -> std::string_view
{
    skipWhitespace();
    auto const start = _position;
    while (_position < _text.size() && !isSpace(_text[_position]))
        ++_position;
    return _text.substr(start, _position - start);
}

auto ArgumentList::rest() -> std::string_view
{
    skipWhitespace();
    auto remaining = _text.substr(_position);
    while (!remaining.empty() && isSpace(remaining.back()))
        remaining.remove_suffix(1);
    _position = _text.size();
    return remaining;
}

auto ArgumentList::empty() const -> bool
{
    for (auto i = _position; i < _text.size(); ++i)
    {
        if (!isSpace(_text[i]))
            return false;
    }
    return true;
}

void ArgumentList::skipWhitespace()
{
    while (_position < _text.size() && isSpace(_text[_position]))
        ++_position;
}

} // namespace tunebot::args
