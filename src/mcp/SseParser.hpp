// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate::sse
{

/// @brief One dispatched server-sent event.
struct Event
{
    /// Event name, empty when the frame had no "event:" field.
    std::string name;
    /// "data:" lines joined with '\n'.
    std::string data;
};

/// @brief Incremental server-sent-events frame assembler.
///
/// Chunks may split lines anywhere. A blank line terminates the current
/// frame. Comment lines and the "id:" and "retry:" fields are ignored.
class FrameParser
{
  public:
    /// @brief Feeds a chunk of the stream.
    /// @return The events completed by this chunk, in arrival order.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<Event>;

    /// @brief Discards any partially received frame.
    void reset();

  private:
    void processLine(std::string_view line, std::vector<Event>& out);

    std::string _lineBuffer;
    std::string _eventName;
    std::string _data;
    bool _hasData = false;
};

/// @brief Finds the session id announced in an SSE handshake.
///
/// Looks for a "data:" line containing "sessionId=" and returns the value up
/// to the next '&', whitespace, or end of line.
[[nodiscard]] auto extractSessionId(std::string_view stream) -> std::optional<std::string>;

/// @brief Derives the message submission URL for a session.
///
/// A trailing "/sse" and then a trailing '/' are stripped from the stream
/// URL before "/message?sessionId=<id>" is appended.
[[nodiscard]] auto deriveMessageUrl(std::string_view streamUrl, std::string_view sessionId) -> std::string;

} // namespace mcpgate::sse
