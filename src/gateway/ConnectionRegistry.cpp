// SPDX-License-Identifier: Apache-2.0
#include "ConnectionRegistry.hpp"

#include <core/Log.hpp>

#include <utility>

namespace mcpgate
{

ConnectionRegistry::ConnectionRegistry(SessionOpener opener): _opener(std::move(opener))
{
}

ConnectionRegistry::~ConnectionRegistry()
{
    closeAll();
}

auto ConnectionRegistry::isAlive(const std::shared_ptr<McpClient>& session) -> bool
{
    return session && session->isReady() && session->transport().isConnected();
}

auto ConnectionRegistry::getOrOpen(const std::string& backendId) -> Result<std::shared_ptr<McpClient>>
{
    auto lock = std::unique_lock(_mutex);
    auto& slot = _slots[backendId];

    if (isAlive(slot.session))
        return slot.session;

    if (slot.pending.valid())
    {
        auto pending = slot.pending;
        lock.unlock();
        return pending.get();
    }

    if (slot.session)
        log::info("[{}] Session is no longer usable, reopening", backendId);

    return runOpen(lock, backendId, {});
}

auto ConnectionRegistry::openScoped(const std::string& backendId, const std::string& directory)
    -> Result<std::shared_ptr<McpClient>>
{
    auto lock = std::unique_lock(_mutex);

    // Let an open that is already in flight finish before replacing it.
    while (true)
    {
        auto const it = _slots.find(backendId);
        if (it == _slots.end() || !it->second.pending.valid())
            break;
        auto pending = it->second.pending;
        lock.unlock();
        pending.wait();
        lock.lock();
    }

    auto& slot = _slots[backendId];
    if (auto previous = std::exchange(slot.session, nullptr))
    {
        log::debug("[{}] Replacing session for directory '{}'", backendId, directory);
        previous->transport().close();
    }

    return runOpen(lock, backendId, directory);
}

auto ConnectionRegistry::runOpen(std::unique_lock<std::shared_mutex>& lock,
                                 const std::string& backendId,
                                 const std::string& directory) -> OpenResult
{
    auto promise = std::promise<OpenResult> {};
    auto const generation = ++_nextGeneration;
    {
        auto& slot = _slots[backendId];
        slot.session.reset();
        slot.pending = promise.get_future().share();
        slot.generation = generation;
    }
    lock.unlock();

    auto result = _opener(backendId, directory);

    lock.lock();
    if (auto const it = _slots.find(backendId); it != _slots.end() && it->second.generation == generation)
    {
        if (result)
        {
            it->second.session = *result;
            it->second.pending = {};
        }
        else
            _slots.erase(it);
    }
    lock.unlock();

    if (!result)
        log::warning("[{}] Failed to open session: {}", backendId, result.error());

    promise.set_value(result);
    return result;
}

auto ConnectionRegistry::get(const std::string& backendId) const -> std::shared_ptr<McpClient>
{
    auto const lock = std::shared_lock(_mutex);
    auto const it = _slots.find(backendId);
    return it != _slots.end() ? it->second.session : nullptr;
}

void ConnectionRegistry::remove(const std::string& backendId)
{
    auto session = std::shared_ptr<McpClient> {};
    {
        auto const lock = std::unique_lock(_mutex);
        auto const it = _slots.find(backendId);
        if (it == _slots.end())
            return;

        session = std::move(it->second.session);
        _slots.erase(it);
    }

    if (session)
    {
        log::debug("[{}] Closing session", backendId);
        session->transport().close();
    }
}

auto ConnectionRegistry::list() const -> std::vector<std::string>
{
    auto const lock = std::shared_lock(_mutex);
    auto result = std::vector<std::string> {};
    for (auto const& [id, slot]: _slots)
    {
        if (slot.session)
            result.push_back(id);
    }
    return result;
}

void ConnectionRegistry::closeAll()
{
    auto sessions = std::vector<std::shared_ptr<McpClient>> {};
    {
        auto const lock = std::unique_lock(_mutex);
        for (auto& [id, slot]: _slots)
        {
            if (slot.session)
                sessions.push_back(std::move(slot.session));
        }
        _slots.clear();
    }

    for (auto const& session: sessions)
        session->transport().close();
}

} // namespace mcpgate
