// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Configuration for spawning an MCP backend process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;

    /// Overrides merged on top of the inherited environment.
    std::map<std::string, std::string> env;

    /// Directory the child starts in. Empty keeps the gateway's directory.
    std::string workingDirectory;

    /// Label used to prefix log lines, usually the backend id.
    std::string label;
};

/// @brief Transport that communicates with an MCP backend via stdio pipes.
///
/// Spawns the backend in its own process group and exchanges newline
/// delimited JSON over its stdin/stdout. Standard error is drained on a
/// background thread and forwarded to the debug log.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the backend process.
    /// @param config The process configuration.
    /// @return Success, or BackendUnreachable if the process could not be spawned.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto exitCode() -> std::optional<int> override;

    /// @brief Returns the child's process id, or -1 if none is running.
    [[nodiscard]] auto pid() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
