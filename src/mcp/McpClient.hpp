// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Progress of the MCP handshake with one backend.
enum class HandshakeState
{
    NotStarted,
    Initializing,
    Initialized,
    ToolsListed,
    Ready,
    Failed,
};

/// @brief Converts a HandshakeState enum to its string representation.
[[nodiscard]] constexpr auto handshakeStateToString(HandshakeState state) -> std::string_view
{
    switch (state)
    {
        case HandshakeState::NotStarted: return "not-started";
        case HandshakeState::Initializing: return "initializing";
        case HandshakeState::Initialized: return "initialized";
        case HandshakeState::ToolsListed: return "tools-listed";
        case HandshakeState::Ready: return "ready";
        case HandshakeState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

/// @brief Client session for the Model Context Protocol (MCP) with one backend.
///
/// Drives the handshake (initialize, initialized notification, tools/list)
/// and issues tool calls. Request ids increase monotonically per session.
/// All methods are safe to call concurrently. Stdio and HTTP exchanges queue
/// on the transport's exchange lock, SSE exchanges overlap.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param backendId The backend identifier the discovered tools are tagged with.
    /// @param transport The connected transport to use for communication.
    McpClient(std::string backendId, std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the initialize request and sends the initialized notification.
    /// @param timeout Upper bound for the initialize reply.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto initialize(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>;

    /// @brief Lists available tools from the backend.
    /// @param timeout Upper bound for the tools/list reply.
    /// @return The tools, tagged with this session's backend id, or an error.
    [[nodiscard]] auto listTools(std::chrono::milliseconds timeout) -> Result<std::vector<Tool>>;

    /// @brief Runs initialize and tools/list against a shared deadline.
    ///
    /// On success the session is Ready; on failure it is Failed and
    /// failureReason() explains why.
    /// @param timeout Upper bound for the whole handshake.
    /// @return The discovered tools or an error.
    [[nodiscard]] auto handshake(std::chrono::milliseconds timeout) -> Result<std::vector<Tool>>;

    /// @brief Calls a tool on the backend.
    /// @param name The backend-native tool name.
    /// @param arguments The tool arguments.
    /// @param timeout Upper bound for the reply.
    /// @return The backend's result object (content, isError) or an error.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Sends a ping request.
    /// @return Success if the backend answered, including with an RPC error.
    [[nodiscard]] auto ping(std::chrono::milliseconds timeout) -> VoidResult;

    /// @brief Returns the tools reported by the most recent successful tools/list.
    [[nodiscard]] auto tools() const -> std::vector<Tool>;

    /// @brief Returns the server capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> McpServerCapabilities;

    /// @brief Returns the current handshake state.
    [[nodiscard]] auto state() const -> HandshakeState;

    /// @brief Returns why the session failed, empty unless state() is Failed.
    [[nodiscard]] auto failureReason() const -> std::string;

    /// @brief Returns true once the handshake completed.
    [[nodiscard]] auto isReady() const -> bool;

    /// @brief Returns the backend identifier of this session.
    [[nodiscard]] auto backendId() const -> const std::string&;

    /// @brief Returns the underlying transport.
    [[nodiscard]] auto transport() -> Transport&;

  private:
    void setState(HandshakeState state);
    void fail(const Error& error);

    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    std::string _backendId;
    std::unique_ptr<Transport> _transport;
    std::atomic<int64_t> _nextId = 1;

    mutable std::mutex _mutex;
    HandshakeState _state = HandshakeState::NotStarted;
    std::string _failureReason;
    McpServerCapabilities _capabilities;
    std::vector<Tool> _tools;
};

} // namespace mcpgate
