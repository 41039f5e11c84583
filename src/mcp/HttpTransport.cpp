// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace mcpgate
{

auto HttpTransport::start(HttpTransportConfig config) -> VoidResult
{
    if (config.url.empty())
        return makeError(ErrorCode::BackendUnreachable, "No URL configured");

    http::ensureInitialized();
    _config = std::move(config);
    if (_config.label.empty())
        _config.label = _config.url;
    _started = true;
    return {};
}

auto HttpTransport::post(const nlohmann::json& message, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    if (!_started)
        return makeError(ErrorCode::ConnectionClosed, "Transport not started");

    log::trace("[{}] POST {}", _config.label, message.dump());
    return http::postJson(_config.url, message.dump(), _config.headers, timeout)
        .and_then([](const http::Response& response) { return http::parseReplyBody(response.body); });
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (jsonrpc::isNotification(message))
    {
        if (!_started)
            return makeError(ErrorCode::ConnectionClosed, "Transport not started");

        // Servers answer notifications with 202 and no body; only delivery matters.
        return http::postJson(_config.url, message.dump(), _config.headers, _config.requestTimeout)
            .transform([](const http::Response&) {});
    }

    return post(message, _config.requestTimeout).transform([this](nlohmann::json reply) {
        _replies.push_back(std::move(reply));
    });
}

auto HttpTransport::receive(std::chrono::milliseconds /*timeout*/) -> Result<nlohmann::json>
{
    if (_replies.empty())
        return makeError(ErrorCode::Timeout, std::format("No pending reply from '{}'", _config.label));

    auto reply = std::move(_replies.front());
    _replies.pop_front();
    return reply;
}

auto HttpTransport::exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto const lock = lockExchange(deadline);
    if (!lock)
        return std::unexpected(lock.error());

    auto const remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return post(request, std::max(remaining, std::chrono::milliseconds(1))).and_then([&](nlohmann::json reply) -> Result<nlohmann::json> {
        if (!jsonrpc::isReply(reply))
            return makeError(ErrorCode::ProtocolDesync,
                             std::format("'{}' answered with a non-reply message", _config.label));
        return reply;
    });
}

void HttpTransport::close()
{
    _started = false;
    _replies.clear();
}

auto HttpTransport::isConnected() const -> bool
{
    return _started;
}

} // namespace mcpgate
