// SPDX-License-Identifier: Apache-2.0
#include "Transport.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcpgate
{

auto Transport::lockExchange(std::chrono::steady_clock::time_point deadline)
    -> Result<std::unique_lock<std::timed_mutex>>
{
    auto lock = std::unique_lock(_exchangeMutex, deadline);
    if (!lock.owns_lock())
        return makeError(ErrorCode::Timeout, "Connection stayed busy with another request");
    return lock;
}

auto Transport::exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    using std::chrono::steady_clock;

    auto const deadline = steady_clock::now() + timeout;
    auto const lock = lockExchange(deadline);
    if (!lock)
        return std::unexpected(lock.error());

    auto const& expectedId = request["id"];

    if (auto sent = send(request); !sent)
        return std::unexpected(sent.error());

    for (auto stray = 0; stray <= MaxSkippedMessages; ++stray)
    {
        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0)
            break;

        auto reply = receive(remaining);
        if (!reply)
            return reply;

        if (reply->value("id", nlohmann::json {}) == expectedId)
            return reply;

        log::debug("Discarding reply with unexpected id {} (waiting for {})",
                   reply->value("id", nlohmann::json {}).dump(),
                   expectedId.dump());
    }

    if (steady_clock::now() < deadline)
        return makeError(ErrorCode::ProtocolDesync,
                         std::format("No reply with id {} among {} messages", expectedId.dump(), MaxSkippedMessages));

    return makeError(ErrorCode::Timeout,
                     std::format("Timed out after {}ms waiting for reply to {}",
                                 timeout.count(),
                                 request.value("method", "request")));
}

} // namespace mcpgate
