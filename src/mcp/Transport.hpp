// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace mcpgate
{

/// @brief Abstract interface for a live channel to one MCP backend.
///
/// Implementations carry newline-delimited JSON over pipes, single HTTP
/// POSTs, or an SSE stream paired with a message endpoint.
class Transport
{
  public:
    /// @brief Maximum number of stray lines, notifications or late replies a
    /// single receive may discard before giving up with ProtocolDesync.
    static constexpr auto MaxSkippedMessages = 50;

    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the backend.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON-RPC reply from the backend.
    ///
    /// Notifications and incidental output are skipped.
    /// @param timeout Upper bound for the wait.
    /// @return The reply, or Timeout, ConnectionClosed or ProtocolDesync.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Closes the connection and releases its resources.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns the exit code of a backend process that has terminated.
    /// Transports without a process always return std::nullopt.
    [[nodiscard]] virtual auto exitCode() -> std::optional<int> { return std::nullopt; }

    /// @brief Sends a request and waits for the reply carrying the same id.
    ///
    /// The whole exchange holds the transport's exchange lock so concurrent
    /// callers queue instead of interleaving. Waiting for the lock counts
    /// against the timeout. Replies with another id (for
    /// example a late reply to an earlier timed-out request) are discarded.
    /// @param request A JSON-RPC request with an "id" member.
    /// @param timeout Upper bound for the whole exchange.
    /// @return The matching reply or an error.
    [[nodiscard]] virtual auto exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

  protected:
    /// @brief Acquires the exchange lock, giving up with Timeout at the deadline.
    [[nodiscard]] auto lockExchange(std::chrono::steady_clock::time_point deadline)
        -> Result<std::unique_lock<std::timed_mutex>>;

    std::timed_mutex _exchangeMutex;
};

/// @brief Opens transports for backend definitions.
class TransportFactory
{
  public:
    virtual ~TransportFactory() = default;

    /// @brief Opens a connection to the backend.
    /// @param backend The backend to reach.
    /// @param timeout Upper bound for establishing the connection.
    /// @return The connected transport, or BackendUnreachable/Timeout.
    [[nodiscard]] virtual auto open(const BackendDefinition& backend, std::chrono::milliseconds timeout)
        -> Result<std::unique_ptr<Transport>> = 0;
};

} // namespace mcpgate
