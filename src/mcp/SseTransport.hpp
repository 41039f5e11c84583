// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/Transport.hpp>

#include <memory>
#include <string>

namespace mcpgate
{

/// @brief Configuration for an SSE backend.
struct SseTransportConfig
{
    /// Event stream URL, usually ending in "/sse".
    std::string url;
    http::Headers headers;

    /// Bound for receiving the session announcement after connecting.
    std::chrono::milliseconds handshakeTimeout = std::chrono::seconds(10);

    std::string label;
};

/// @brief Transport pairing a server-sent event stream with a message endpoint.
///
/// A background thread keeps the GET stream open and assembles frames.
/// Requests are POSTed to the session's message URL and their replies,
/// pushed back over the stream, are matched by JSON-RPC id.
class SseTransport: public Transport
{
  public:
    SseTransport();
    ~SseTransport() override;

    SseTransport(const SseTransport&) = delete;
    SseTransport& operator=(const SseTransport&) = delete;

    /// @brief Opens the event stream and waits for the session announcement.
    /// @return Success, or BackendUnreachable, Timeout or ProtocolDesync.
    [[nodiscard]] auto start(SseTransportConfig config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief POSTs the request and waits for the pushed reply with its id.
    ///
    /// Exchanges may run concurrently. Replies can arrive in any order.
    [[nodiscard]] auto exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json> override;

    /// @brief Returns the session id announced by the backend.
    [[nodiscard]] auto sessionId() const -> std::string;

    /// @brief Returns the URL requests are POSTed to.
    [[nodiscard]] auto messageUrl() const -> std::string;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
