// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcpgate
{

/// @brief Correlates pushed JSON-RPC replies with the requests waiting for them.
///
/// A requester registers its id before sending, then waits on the returned
/// future. The stream reader hands every reply to deliver(), which fulfils
/// the waiter whose id matches. Thread-safe.
class PendingReplies
{
  public:
    using Reply = Result<nlohmann::json>;

    /// @brief Registers interest in the reply with the given id.
    /// @return A future that resolves with the reply, or with an error from failAll().
    [[nodiscard]] auto expect(const nlohmann::json& id) -> std::future<Reply>;

    /// @brief Routes a reply to its waiter.
    /// @return False if no request with the reply's id is pending.
    [[nodiscard]] auto deliver(const nlohmann::json& reply) -> bool;

    /// @brief Drops a registration, e.g. after its waiter timed out.
    void cancel(const nlohmann::json& id);

    /// @brief Resolves every pending waiter with the given error.
    void failAll(const Error& error);

    /// @brief Returns the number of requests still waiting.
    [[nodiscard]] auto size() const -> size_t;

  private:
    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<std::promise<Reply>>> _pending;
};

} // namespace mcpgate
