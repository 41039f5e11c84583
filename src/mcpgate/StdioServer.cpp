// SPDX-License-Identifier: Apache-2.0
#include "StdioServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace mcpgate
{

namespace
{
    constexpr auto PollIntervalMs = 200;
    constexpr auto ReadChunkSize = size_t { 65536 };

    auto isToolCall(const std::string& line) -> bool
    {
        auto const message = json::parse(line);
        return message && message->is_object() && message->value("method", nlohmann::json {}) == "tools/call";
    }
} // namespace

StdioServer::StdioServer(Gateway& gateway, int inputFd, int outputFd):
    _gateway(gateway), _inputFd(inputFd), _outputFd(outputFd)
{
}

StdioServer::~StdioServer()
{
    joinCalls();
}

auto StdioServer::run(const std::atomic<bool>& stopRequested) -> int
{
    auto buffer = std::string {};
    auto chunk = std::vector<char>(ReadChunkSize);
    auto exitCode = 0;

    log::info("Serving JSON-RPC on stdio");

    while (!stopRequested)
    {
        auto pfd = pollfd { .fd = _inputFd, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, PollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            log::error("poll on input failed: {}", std::strerror(errno));
            exitCode = 1;
            break;
        }
        if (ready == 0)
            continue;

        auto const n = ::read(_inputFd, chunk.data(), chunk.size());
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            log::error("read on input failed: {}", std::strerror(errno));
            exitCode = 1;
            break;
        }
        if (n == 0)
        {
            log::info("Input closed");
            break;
        }

        buffer.append(chunk.data(), static_cast<size_t>(n));
        for (auto pos = buffer.find('\n'); pos != std::string::npos; pos = buffer.find('\n'))
        {
            auto line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos)
                continue;
            dispatch(std::move(line));
        }
    }

    if (!buffer.empty() && buffer.find_first_not_of(" \t\r\n") != std::string::npos && !stopRequested)
        dispatch(std::move(buffer));

    joinCalls();
    return exitCode;
}

void StdioServer::dispatch(std::string line)
{
    if (!isToolCall(line))
    {
        if (auto reply = _gateway.handleLine(line))
            writeMessage(*reply);
        return;
    }

    auto const lock = std::scoped_lock(_callsMutex);
    std::erase_if(_calls, [](const Call& call) { return call.done->load(); });

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::jthread([this, done, line = std::move(line)] {
        if (auto reply = _gateway.handleLine(line))
            writeMessage(*reply);
        done->store(true);
    });
    _calls.push_back(Call { .thread = std::move(thread), .done = std::move(done) });
}

void StdioServer::writeMessage(const nlohmann::json& message)
{
    auto const text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

    auto const lock = std::scoped_lock(_writeMutex);
    auto offset = size_t { 0 };
    while (offset < text.size())
    {
        auto const n = ::write(_outputFd, text.data() + offset, text.size() - offset);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            log::error("write on output failed: {}", std::strerror(errno));
            return;
        }
        offset += static_cast<size_t>(n);
    }
}

void StdioServer::joinCalls()
{
    auto calls = std::vector<Call> {};
    {
        auto const lock = std::scoped_lock(_callsMutex);
        calls.swap(_calls);
    }
    for (auto& call: calls)
    {
        if (call.thread.joinable())
            call.thread.join();
    }
}

} // namespace mcpgate
