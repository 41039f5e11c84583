// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/Transport.hpp>

#include <deque>
#include <string>

namespace mcpgate
{

/// @brief Configuration for a direct HTTP backend.
struct HttpTransportConfig
{
    std::string url;
    http::Headers headers;

    /// Bound for a plain send() of a request; exchange() uses its own timeout.
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(30);

    std::string label;
};

/// @brief Transport for backends reachable by one POST per JSON-RPC message.
///
/// There is no persistent connection. A request's reply is the body of the
/// POST that carried it.
class HttpTransport: public Transport
{
  public:
    /// @brief Prepares the transport. No network traffic happens here.
    [[nodiscard]] auto start(HttpTransportConfig config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json> override;

  private:
    [[nodiscard]] auto post(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

    HttpTransportConfig _config;
    std::deque<nlohmann::json> _replies;
    bool _started = false;
};

} // namespace mcpgate
