// SPDX-License-Identifier: Apache-2.0
#include "Gateway.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <gateway/ToolNameResolver.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/TransportFactory.hpp>

#include <algorithm>
#include <format>

namespace mcpgate
{

namespace
{
    constexpr auto ServerName = std::string_view { "mcpgate" };
    constexpr auto ServerVersion = std::string_view { "0.1.0" };

    auto elapsedSince(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }

    auto textResult(std::string text, bool isError) -> nlohmann::json
    {
        return nlohmann::json {
            { "content", nlohmann::json::array({ { { "type", "text" }, { "text", std::move(text) } } }) },
            { "isError", isError },
        };
    }

    auto joinNames(const std::vector<std::string>& names) -> std::string
    {
        auto result = std::string {};
        for (auto const& name: names)
        {
            if (!result.empty())
                result += ", ";
            result += name;
        }
        return result.empty() ? std::string("(none)") : result;
    }
} // namespace

Gateway::Gateway(std::vector<BackendDefinition> backends,
                 GatewayOptions options,
                 std::shared_ptr<TransportFactory> factory):
    _options(std::move(options)), _factory(factory ? std::move(factory) : std::make_shared<DefaultTransportFactory>())
{
    for (auto& backend: backends)
    {
        _backendIds.push_back(backend.id);
        auto id = backend.id;
        _backends.insert_or_assign(std::move(id), std::move(backend));
    }

    _discovery = std::make_unique<DiscoveryEngine>(
        [this](const BackendDefinition& backend, std::chrono::milliseconds timeout) {
            return discoverBackend(backend, timeout);
        },
        _options.discoveryTimeout);

    _registry = std::make_unique<ConnectionRegistry>(
        [this](const std::string& backendId, const std::string& directory) { return openSession(backendId, directory); });

    _health = std::make_unique<HealthMonitor>(
        _options.health,
        [this](const std::string& backendId, std::chrono::milliseconds timeout) { return checkBackend(backendId, timeout); });

    _recovery = std::make_unique<RecoveryManager>(
        _options.recovery, *_health, [this](const std::string& backendId, std::chrono::milliseconds timeout) {
            return restartBackend(backendId, timeout);
        });

    _health->setRestartHandler([this](const std::string& backendId) {
        if (!_stopping)
            _recovery->handleError(backendId, Error { ErrorCode::ConnectionClosed, "health check requested a restart" });
    });

    _forwarder = std::make_unique<CallForwarder>(
        _backends,
        *_registry,
        *_factory,
        CallForwarder::Timeouts { .call = _options.callTimeout, .handshake = _options.handshakeTimeout });
    if (_options.injectProjectRoot)
        _forwarder->setDefaultInjector(projectRootInjector(_options.projectDir));
    _forwarder->setOutcomeListener([this](const CallOutcome& outcome) { onCallOutcome(outcome); });
}

Gateway::~Gateway()
{
    shutdown();
}

auto Gateway::start() -> DiscoveryReport
{
    auto report = discover();
    for (auto const& id: _backendIds)
        _health->registerBackend(id);
    return report;
}

auto Gateway::discover() -> DiscoveryReport
{
    auto definitions = std::vector<BackendDefinition> {};
    definitions.reserve(_backends.size());
    for (auto const& id: _backendIds)
        definitions.push_back(_backends.at(id));

    auto report = _discovery->discoverAll(definitions);
    _catalog.replaceAll(report.tools());
    return report;
}

auto Gateway::openSession(const std::string& backendId, const std::string& directory)
    -> Result<std::shared_ptr<McpClient>>
{
    auto const it = _backends.find(backendId);
    if (it == _backends.end())
        return makeError(ErrorCode::BackendNotFound, std::format("Backend '{}' is not configured", backendId));

    auto const backend = scopeToDirectory(it->second, directory);
    auto const timeout = _discovery->timeoutFor(backend);

    auto transport = _factory->open(backend, timeout);
    if (!transport)
        return std::unexpected(transport.error());

    auto session = std::make_shared<McpClient>(backendId, std::move(*transport));
    auto handshake = session->handshake(timeout);
    if (!handshake)
        return std::unexpected(handshake.error());

    return session;
}

auto Gateway::discoverBackend(const BackendDefinition& backend, std::chrono::milliseconds timeout)
    -> Result<std::vector<Tool>>
{
    if (backend.transport == TransportKind::Stdio)
        return _registry->getOrOpen(backend.id).transform([](const std::shared_ptr<McpClient>& session) {
            return session->tools();
        });

    auto transport = _factory->open(backend, timeout);
    if (!transport)
        return std::unexpected(transport.error());

    auto session = McpClient(backend.id, std::move(*transport));
    return session.handshake(timeout);
}

auto Gateway::checkBackend(const std::string& backendId, std::chrono::milliseconds timeout) -> CheckResult
{
    auto const it = _backends.find(backendId);
    if (it == _backends.end() || _stopping)
        return CheckResult { .kind = CheckResult::Kind::Skipped };

    auto const start = std::chrono::steady_clock::now();

    if (it->second.transport == TransportKind::Stdio)
    {
        auto session = _registry->get(backendId);
        if (!session)
            return CheckResult { .kind = CheckResult::Kind::Failure, .reason = "no live session" };

        if (auto const exitCode = session->transport().exitCode())
            return CheckResult { .kind = CheckResult::Kind::Crashed, .exitCode = exitCode };

        if (auto pinged = session->ping(timeout); !pinged)
            return CheckResult { .kind = CheckResult::Kind::Failure, .reason = pinged.error().message };

        return CheckResult { .kind = CheckResult::Kind::Success, .latency = elapsedSince(start) };
    }

    auto tools = discoverBackend(it->second, timeout);
    if (!tools)
        return CheckResult { .kind = CheckResult::Kind::Failure, .reason = tools.error().message };
    return CheckResult { .kind = CheckResult::Kind::Success, .latency = elapsedSince(start) };
}

auto Gateway::restartBackend(const std::string& backendId, std::chrono::milliseconds timeout) -> VoidResult
{
    auto const it = _backends.find(backendId);
    if (it == _backends.end())
        return makeError(ErrorCode::BackendNotFound, std::format("Backend '{}' is not configured", backendId));
    if (_stopping)
        return makeError(ErrorCode::ConnectionClosed, "Gateway is shutting down");

    if (it->second.transport == TransportKind::Stdio)
        _registry->remove(backendId);

    auto tools = discoverBackend(it->second, timeout);
    if (!tools)
        return std::unexpected(tools.error());

    _catalog.replaceBackend(backendId, std::move(*tools));
    return {};
}

void Gateway::onCallOutcome(const CallOutcome& outcome)
{
    if (!outcome.error)
    {
        _recovery->recordSuccess(outcome.backendId);
        return;
    }

    if (outcome.exitCode)
        _health->markCrashed(outcome.backendId, outcome.exitCode);

    if (!_stopping)
    {
        auto const decision = _recovery->handleError(outcome.backendId, *outcome.error);
        log::debug("[{}] Recovery decision: {} ({})",
                   outcome.backendId,
                   recoveryActionToString(decision.action),
                   decision.reason);
    }
}

void Gateway::checkAll()
{
    for (auto const& id: _backendIds)
        _health->checkNow(id);
}

auto Gateway::handleLine(std::string_view line) -> std::optional<nlohmann::json>
{
    auto message = json::parse(line);
    if (!message)
    {
        log::warning("Unparsable inbound message: {}", message.error().message);
        return jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, "Parse error");
    }
    return handleMessage(*message);
}

auto Gateway::handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>
{
    auto request = jsonrpc::parseRequest(message);
    if (!request)
    {
        auto id = nlohmann::json {};
        if (message.is_object() && message.contains("id")
            && (message["id"].is_string() || message["id"].is_number_integer()))
            id = message["id"];
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidRequest, request.error().message);
    }

    if (request->isNotification())
    {
        log::debug("Inbound notification: {}", request->method);
        return std::nullopt;
    }

    auto const& id = request->id;
    auto const& method = request->method;
    log::debug("Inbound request {}: {}", id.dump(), method);

    if (method == "initialize")
        return jsonrpc::makeResult(id, handleInitialize(request->params));

    if (method == "tools/list")
        return jsonrpc::makeResult(id, handleToolsList());

    if (method == "ping")
        return jsonrpc::makeResult(id, nlohmann::json::object());

    if (method == "tools/call")
    {
        auto const& params = request->params;
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string())
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "tools/call requires a string 'name'");

        auto const arguments = params.value("arguments", nlohmann::json::object());
        if (!arguments.is_object())
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "'arguments' must be an object");

        auto context = CallContext {};
        if (auto const meta = params.find("_meta"); meta != params.end() && meta->is_object())
            context.workingDirectory = json::getStringOr(*meta, "workingDirectory", "");

        return jsonrpc::makeResult(id, callTool(params["name"].get<std::string>(), arguments, context));
    }

    return jsonrpc::makeErrorResponse(id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", method));
}

auto Gateway::handleInitialize(const nlohmann::json& params) const -> nlohmann::json
{
    if (params.is_object())
    {
        auto const clientInfo = params.value("clientInfo", nlohmann::json::object());
        log::info("Client connected: {} {} (protocol {})",
                  json::getStringOr(clientInfo, "name", "unknown"),
                  json::getStringOr(clientInfo, "version", ""),
                  json::getStringOr(params, "protocolVersion", "unspecified"));
    }

    return nlohmann::json {
        { "protocolVersion", std::string(jsonrpc::ProtocolVersion) },
        { "capabilities", { { "tools", { { "listChanged", true } } } } },
        { "serverInfo", { { "name", std::string(ServerName) }, { "version", std::string(ServerVersion) } } },
    };
}

auto Gateway::handleToolsList() const -> nlohmann::json
{
    auto tools = _catalog.toToolList();
    tools.push_back(nlohmann::json {
        { "name", std::string(StatusToolName) },
        { "description", "Report health, restart and circuit breaker state of every backend behind this gateway" },
        { "inputSchema", { { "type", "object" }, { "properties", nlohmann::json::object() } } },
    });
    return nlohmann::json { { "tools", std::move(tools) } };
}

auto Gateway::callTool(std::string_view name, const nlohmann::json& arguments, const CallContext& context)
    -> nlohmann::json
{
    if (name == StatusToolName)
        return textResult(statusSnapshot().dump(2), false);

    if (_stopping)
        return textResult("The gateway is shutting down and no longer accepts tool calls.", true);

    auto resolved = resolveToolName(name, _backendIds, _catalog);
    if (!resolved)
        return textResult(failureText(name, resolved.error(), std::nullopt, std::nullopt), true);

    auto result = _forwarder->call(resolved->backendId, resolved->toolName, arguments, context);
    if (!result)
        return textResult(failureText(name, result.error(), resolved->backendId, resolved->toolName), true);

    if (!result->is_object() || !result->contains("content"))
        return textResult(result->dump(), false);
    return *result;
}

auto Gateway::failureText(std::string_view name,
                          const Error& error,
                          const std::optional<std::string>& backendId,
                          const std::optional<std::string>& toolName) const -> std::string
{
    auto text = std::format("Tool call '{}' failed.\n", name);
    if (backendId)
        text += std::format("Routed to backend '{}' as tool '{}'.\n", *backendId, toolName.value_or(""));
    else
        text += "No backend could be determined from the tool name.\n";

    text += std::format("Error: {}\n", error);
    text += std::format("Available backends: {}\n", joinNames(_backendIds));
    text += "Tool names have the form {server}_{tool}; call tools/list for the exact names.\n";

    switch (error.code)
    {
        case ErrorCode::Timeout:
            text += "The backend did not answer in time. It may be overloaded or still starting.\n";
            break;
        case ErrorCode::BackendUnreachable:
        case ErrorCode::ConnectionClosed:
            text += std::format("Check that the backend is installed and starts correctly; {} shows its state.\n",
                                StatusToolName);
            break;
        default: break;
    }
    return text;
}

auto Gateway::backendIds() const -> std::vector<std::string>
{
    return _backendIds;
}

auto Gateway::exportCatalog() const -> nlohmann::json
{
    return _catalog.toExportJson();
}

auto Gateway::statusSnapshot() const -> nlohmann::json
{
    auto const health = _health->snapshot();
    auto const breakers = _recovery->snapshot();
    auto const open = _registry->list();

    auto backends = nlohmann::json::object();
    for (auto const& id: _backendIds)
    {
        auto const& backend = _backends.at(id);
        auto entry = nlohmann::json {
            { "transport", std::string(transportKindToString(backend.transport)) },
            { "connected", std::ranges::find(open, id) != open.end() },
            { "tools", _catalog.toolsFor(id).size() },
        };
        if (auto const it = health.find(id); it != health.end())
            entry["health"] = it->second.toJson();
        if (auto const it = breakers.find(id); it != breakers.end())
            entry["circuitBreaker"] = it->second.toJson();
        else
            entry["circuitBreaker"] = CircuitBreakerState {}.toJson();
        backends[id] = std::move(entry);
    }

    return nlohmann::json {
        { "backends", std::move(backends) },
        { "toolCount", _catalog.size() },
        { "healthMonitoring", _options.health.enabled },
    };
}

void Gateway::shutdown()
{
    if (_stopping.exchange(true))
        return;

    log::info("Shutting down gateway");
    _health->shutdown();
    _recovery->shutdown();
    _discovery->joinStragglers();
    _registry->closeAll();
}

} // namespace mcpgate
