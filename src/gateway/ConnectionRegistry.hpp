// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpClient.hpp>

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Opens a session to a backend and completes its handshake.
/// @param backendId The backend to open.
/// @param directory Caller directory for directory-scoped opens, empty otherwise.
using SessionOpener =
    std::function<Result<std::shared_ptr<McpClient>>(const std::string& backendId, const std::string& directory)>;

/// @brief Holds at most one live session per backend id.
///
/// Concurrent getOrOpen() callers for the same id share one in-flight open:
/// the first caller runs the opener, the others wait on its result. Sessions
/// whose transport has died are replaced on the next getOrOpen().
class ConnectionRegistry
{
  public:
    explicit ConnectionRegistry(SessionOpener opener);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// @brief Returns the live session for the backend, opening it if needed.
    [[nodiscard]] auto getOrOpen(const std::string& backendId) -> Result<std::shared_ptr<McpClient>>;

    /// @brief Closes any existing session for the backend and opens a new one bound to the directory.
    [[nodiscard]] auto openScoped(const std::string& backendId, const std::string& directory)
        -> Result<std::shared_ptr<McpClient>>;

    /// @brief Returns the existing session, or nullptr if none is open.
    [[nodiscard]] auto get(const std::string& backendId) const -> std::shared_ptr<McpClient>;

    /// @brief Closes and forgets the session for the backend.
    void remove(const std::string& backendId);

    /// @brief Returns the ids of all backends with an open session.
    [[nodiscard]] auto list() const -> std::vector<std::string>;

    /// @brief Closes every session.
    void closeAll();

  private:
    using OpenResult = Result<std::shared_ptr<McpClient>>;

    struct Slot
    {
        std::shared_ptr<McpClient> session;
        std::shared_future<OpenResult> pending;
        uint64_t generation = 0;
    };

    [[nodiscard]] auto runOpen(std::unique_lock<std::shared_mutex>& lock,
                               const std::string& backendId,
                               const std::string& directory) -> OpenResult;

    [[nodiscard]] static auto isAlive(const std::shared_ptr<McpClient>& session) -> bool;

    SessionOpener _opener;
    mutable std::shared_mutex _mutex;
    std::map<std::string, Slot, std::less<>> _slots;
    uint64_t _nextGeneration = 0;
};

} // namespace mcpgate
