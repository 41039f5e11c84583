// SPDX-License-Identifier: Apache-2.0
#include "SseParser.hpp"

#include <format>

namespace mcpgate::sse
{

namespace
{

    auto fieldValue(std::string_view line, std::string_view field) -> std::optional<std::string_view>
    {
        if (!line.starts_with(field) || line.size() <= field.size() || line[field.size()] != ':')
        {
            if (line == field)
                return std::string_view {};
            return std::nullopt;
        }
        auto value = line.substr(field.size() + 1);
        if (value.starts_with(' '))
            value.remove_prefix(1);
        return value;
    }

} // namespace

auto FrameParser::feed(std::string_view chunk) -> std::vector<Event>
{
    auto events = std::vector<Event> {};
    _lineBuffer.append(chunk);

    auto consumed = size_t { 0 };
    for (auto pos = _lineBuffer.find('\n', consumed); pos != std::string::npos;
         pos = _lineBuffer.find('\n', consumed))
    {
        auto line = std::string_view(_lineBuffer).substr(consumed, pos - consumed);
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        processLine(line, events);
        consumed = pos + 1;
    }
    _lineBuffer.erase(0, consumed);

    return events;
}

void FrameParser::reset()
{
    _lineBuffer.clear();
    _eventName.clear();
    _data.clear();
    _hasData = false;
}

void FrameParser::processLine(std::string_view line, std::vector<Event>& out)
{
    if (line.empty())
    {
        if (_hasData)
            out.push_back(Event { .name = std::move(_eventName), .data = std::move(_data) });
        _eventName.clear();
        _data.clear();
        _hasData = false;
        return;
    }

    if (line.starts_with(':'))
        return;

    if (auto const name = fieldValue(line, "event"))
    {
        _eventName = std::string(*name);
        return;
    }

    if (auto const data = fieldValue(line, "data"))
    {
        if (_hasData)
            _data += '\n';
        _data.append(*data);
        _hasData = true;
    }
}

auto extractSessionId(std::string_view stream) -> std::optional<std::string>
{
    constexpr auto Marker = std::string_view { "sessionId=" };

    while (!stream.empty())
    {
        auto const eol = stream.find('\n');
        auto const line = stream.substr(0, eol);
        stream = eol == std::string_view::npos ? std::string_view {} : stream.substr(eol + 1);

        if (!line.starts_with("data:"))
            continue;

        auto const marker = line.find(Marker);
        if (marker == std::string_view::npos)
            continue;

        auto value = line.substr(marker + Marker.size());
        auto const end = value.find_first_of("& \t\r\"");
        value = value.substr(0, end);
        if (!value.empty())
            return std::string(value);
    }
    return std::nullopt;
}

auto deriveMessageUrl(std::string_view streamUrl, std::string_view sessionId) -> std::string
{
    auto base = streamUrl;
    if (base.ends_with("/sse"))
        base.remove_suffix(4);
    if (base.ends_with('/'))
        base.remove_suffix(1);
    return std::format("{}/message?sessionId={}", base, sessionId);
}

} // namespace mcpgate::sse
