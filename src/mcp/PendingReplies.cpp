// SPDX-License-Identifier: Apache-2.0
#include "PendingReplies.hpp"

namespace mcpgate
{

// Ids are keyed by their JSON text so 7 and "7" stay distinct.

auto PendingReplies::expect(const nlohmann::json& id) -> std::future<Reply>
{
    auto promise = std::make_shared<std::promise<Reply>>();
    auto future = promise->get_future();

    auto const lock = std::scoped_lock(_mutex);
    _pending[id.dump()] = std::move(promise);
    return future;
}

auto PendingReplies::deliver(const nlohmann::json& reply) -> bool
{
    if (!reply.is_object() || !reply.contains("id"))
        return false;

    auto promise = std::shared_ptr<std::promise<Reply>> {};
    {
        auto const lock = std::scoped_lock(_mutex);
        auto const it = _pending.find(reply["id"].dump());
        if (it == _pending.end())
            return false;
        promise = std::move(it->second);
        _pending.erase(it);
    }

    promise->set_value(reply);
    return true;
}

void PendingReplies::cancel(const nlohmann::json& id)
{
    auto const lock = std::scoped_lock(_mutex);
    _pending.erase(id.dump());
}

void PendingReplies::failAll(const Error& error)
{
    auto waiting = decltype(_pending) {};
    {
        auto const lock = std::scoped_lock(_mutex);
        waiting.swap(_pending);
    }

    for (auto& [id, promise]: waiting)
        promise->set_value(std::unexpected(error));
}

auto PendingReplies::size() const -> size_t
{
    auto const lock = std::scoped_lock(_mutex);
    return _pending.size();
}

} // namespace mcpgate
