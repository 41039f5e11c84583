// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace mcpgate
{

namespace
{
    constexpr auto ClientName = std::string_view { "mcpgate" };
    constexpr auto ClientVersion = std::string_view { "0.1.0" };

    auto remainingUntil(std::chrono::steady_clock::time_point deadline) -> std::chrono::milliseconds
    {
        auto const left =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }
} // namespace

McpClient::McpClient(std::string backendId, std::unique_ptr<Transport> transport):
    _backendId(std::move(backendId)), _transport(std::move(transport))
{
}

McpClient::~McpClient()
{
    if (_transport)
        _transport->close();
}

auto McpClient::initialize(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>
{
    setState(HandshakeState::Initializing);

    auto params = nlohmann::json {
        { "protocolVersion", std::string(jsonrpc::ProtocolVersion) },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", std::string(ClientName) },
              { "version", std::string(ClientVersion) },
          } },
    };

    auto result =
        sendRequest("initialize", std::move(params), timeout)
            .and_then([this](const nlohmann::json& reply) -> Result<McpServerCapabilities> {
                auto caps = McpServerCapabilities {};
                auto const serverInfo = reply.value("serverInfo", nlohmann::json::object());
                caps.serverName = json::getStringOr(serverInfo, "name", "unknown");
                caps.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
                caps.protocolVersion = json::getStringOr(reply, "protocolVersion", "");

                if (reply.contains("capabilities") && reply["capabilities"].is_object())
                {
                    auto const& declared = reply["capabilities"];
                    caps.hasTools = declared.contains("tools");
                    caps.hasResources = declared.contains("resources");
                    caps.hasPrompts = declared.contains("prompts");
                }

                auto notified = _transport->send(jsonrpc::makeNotification("notifications/initialized"));
                if (!notified)
                    return std::unexpected(notified.error());

                {
                    auto const lock = std::scoped_lock(_mutex);
                    _capabilities = caps;
                    _state = HandshakeState::Initialized;
                }

                log::info("[{}] MCP server initialized: {} v{}", _backendId, caps.serverName, caps.serverVersion);
                return caps;
            });

    if (!result)
        fail(result.error());
    return result;
}

auto McpClient::listTools(std::chrono::milliseconds timeout) -> Result<std::vector<Tool>>
{
    if (state() == HandshakeState::NotStarted || state() == HandshakeState::Initializing)
        return makeError(ErrorCode::ProtocolError, std::format("Session '{}' is not initialized", _backendId));

    auto result =
        sendRequest("tools/list", nullptr, timeout)
            .and_then([this](const nlohmann::json& reply) -> Result<std::vector<Tool>> {
                auto tools = std::vector<Tool> {};

                if (!reply.contains("tools") || !reply["tools"].is_array())
                    return tools;

                for (const auto& toolJson: reply["tools"])
                {
                    auto name = json::getStringOr(toolJson, "name", "");
                    if (name.empty())
                    {
                        log::warning("[{}] Ignoring tool without a name", _backendId);
                        continue;
                    }

                    tools.push_back(Tool {
                        .name = std::move(name),
                        .description = json::getStringOr(toolJson, "description", ""),
                        .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
                        .backendId = _backendId,
                    });
                }

                return tools;
            });

    if (!result)
    {
        fail(result.error());
        return result;
    }

    auto const lock = std::scoped_lock(_mutex);
    if (_state != HandshakeState::Ready)
        _state = HandshakeState::ToolsListed;
    _tools = *result;
    return result;
}

auto McpClient::handshake(std::chrono::milliseconds timeout) -> Result<std::vector<Tool>>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    return initialize(timeout)
        .and_then([&](const McpServerCapabilities&) { return listTools(remainingUntil(deadline)); })
        .transform([this](std::vector<Tool> tools) {
            setState(HandshakeState::Ready);
            log::debug("[{}] Handshake complete, {} tools", _backendId, tools.size());
            return tools;
        });
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    if (!isReady())
        return makeError(ErrorCode::ProtocolError, std::format("Session '{}' is not ready", _backendId));

    auto params = nlohmann::json {
        { "name", std::string(name) },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return sendRequest("tools/call", std::move(params), timeout).transform([&](nlohmann::json result) {
        log::debug("[{}] Tool '{}' returned (isError: {})", _backendId, name, result.value("isError", false));
        return result;
    });
}

auto McpClient::ping(std::chrono::milliseconds timeout) -> VoidResult
{
    auto result = sendRequest("ping", nullptr, timeout);
    if (!result && result.error().code != ErrorCode::ProtocolError && result.error().code != ErrorCode::ToolCallError)
        return std::unexpected(result.error());
    return {};
}

auto McpClient::tools() const -> std::vector<Tool>
{
    auto const lock = std::scoped_lock(_mutex);
    return _tools;
}

auto McpClient::capabilities() const -> McpServerCapabilities
{
    auto const lock = std::scoped_lock(_mutex);
    return _capabilities;
}

auto McpClient::state() const -> HandshakeState
{
    auto const lock = std::scoped_lock(_mutex);
    return _state;
}

auto McpClient::failureReason() const -> std::string
{
    auto const lock = std::scoped_lock(_mutex);
    return _failureReason;
}

auto McpClient::isReady() const -> bool
{
    return state() == HandshakeState::Ready;
}

auto McpClient::backendId() const -> const std::string&
{
    return _backendId;
}

auto McpClient::transport() -> Transport&
{
    return *_transport;
}

void McpClient::setState(HandshakeState state)
{
    auto const lock = std::scoped_lock(_mutex);
    _state = state;
    if (state != HandshakeState::Failed)
        _failureReason.clear();
}

void McpClient::fail(const Error& error)
{
    auto const lock = std::scoped_lock(_mutex);
    // A failed call on an established session leaves the handshake intact.
    if (_state == HandshakeState::Ready)
        return;
    _state = HandshakeState::Failed;
    _failureReason = std::format("{}", error);
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto const request = jsonrpc::makeRequest(id, method, std::move(params));

    return _transport->exchange(request, timeout)
        .and_then([](const nlohmann::json& msg) { return jsonrpc::parseResponse(msg); })
        .and_then([method](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
            if (resp.error)
            {
                return makeError(resp.error->code == jsonrpc::codes::MethodNotFound ? ErrorCode::ProtocolError
                                                                                   : ErrorCode::ToolCallError,
                                 std::format("{} failed with RPC error {}: {}",
                                             method,
                                             resp.error->code,
                                             resp.error->message));
            }
            return resp.result.value_or(nlohmann::json::object());
        });
}

} // namespace mcpgate
