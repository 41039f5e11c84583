// SPDX-License-Identifier: Apache-2.0
#include "CallForwarder.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <format>

namespace mcpgate
{

namespace
{
    // HTTP backends are stateless; each call carries its own request id.
    constexpr auto HttpCallRequestId = int64_t { 1 };

    auto isSessionFatal(ErrorCode code) -> bool
    {
        return code == ErrorCode::ConnectionClosed || code == ErrorCode::ProtocolDesync;
    }
} // namespace

auto projectRootInjector(std::string projectDir) -> ArgumentInjector
{
    return [projectDir = std::move(projectDir)](nlohmann::json& arguments, const CallContext& context, const BackendDefinition&) {
        if (!arguments.is_object() || arguments.contains("projectRoot"))
            return;
        arguments["projectRoot"] = context.workingDirectory.empty() ? projectDir : context.workingDirectory;
    };
}

CallForwarder::CallForwarder(const std::map<std::string, BackendDefinition>& backends,
                             ConnectionRegistry& registry,
                             TransportFactory& factory,
                             Timeouts timeouts):
    _backends(backends), _registry(registry), _factory(factory), _timeouts(timeouts)
{
}

void CallForwarder::setInjector(const std::string& backendId, ArgumentInjector injector)
{
    auto const lock = std::scoped_lock(_mutex);
    _injectors.insert_or_assign(backendId, std::move(injector));
}

void CallForwarder::setDefaultInjector(ArgumentInjector injector)
{
    auto const lock = std::scoped_lock(_mutex);
    _defaultInjector = std::move(injector);
}

void CallForwarder::setOutcomeListener(CallOutcomeListener listener)
{
    auto const lock = std::scoped_lock(_mutex);
    _listener = std::move(listener);
}

auto CallForwarder::call(const std::string& backendId,
                         const std::string& toolName,
                         nlohmann::json arguments,
                         const CallContext& context) -> Result<nlohmann::json>
{
    auto const it = _backends.find(backendId);
    if (it == _backends.end())
        return makeError(ErrorCode::BackendNotFound, std::format("Backend '{}' is not configured", backendId));

    auto const& backend = it->second;
    if (arguments.is_null())
        arguments = nlohmann::json::object();

    auto injector = ArgumentInjector {};
    auto listener = CallOutcomeListener {};
    {
        auto const lock = std::scoped_lock(_mutex);
        if (auto const found = _injectors.find(backendId); found != _injectors.end())
            injector = found->second;
        else
            injector = _defaultInjector;
        listener = _listener;
    }
    if (injector)
        injector(arguments, context, backend);

    log::debug("[{}] Calling tool '{}'", backendId, toolName);

    auto outcome = CallOutcome { .backendId = backendId };
    auto const start = std::chrono::steady_clock::now();

    auto result = Result<nlohmann::json> {};
    switch (backend.transport)
    {
        case TransportKind::Stdio: result = callSubprocess(backend, toolName, arguments, context, outcome); break;
        case TransportKind::Http: result = callHttp(backend, toolName, arguments); break;
        case TransportKind::Sse: result = callSse(backend, toolName, arguments); break;
    }

    outcome.latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    if (!result)
    {
        outcome.error = result.error();
        log::warning("[{}] Tool '{}' failed after {}ms: {}", backendId, toolName, outcome.latency.count(), result.error());
    }

    if (listener)
        listener(outcome);
    return result;
}

auto CallForwarder::callSubprocess(const BackendDefinition& backend,
                                   const std::string& toolName,
                                   const nlohmann::json& arguments,
                                   const CallContext& context,
                                   CallOutcome& outcome) -> Result<nlohmann::json>
{
    auto session = (backend.directoryScoped && !context.workingDirectory.empty())
                       ? _registry.openScoped(backend.id, context.workingDirectory)
                       : _registry.getOrOpen(backend.id);
    if (!session)
        return std::unexpected(session.error());

    auto result = (*session)->callTool(toolName, arguments, _timeouts.call);
    if (!result && isSessionFatal(result.error().code))
    {
        outcome.exitCode = (*session)->transport().exitCode();
        log::info("[{}] Dropping session after {}", backend.id, errorCodeName(result.error().code));
        _registry.remove(backend.id);
    }
    return result;
}

auto CallForwarder::callHttp(const BackendDefinition& backend,
                             const std::string& toolName,
                             const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    auto transport = _factory.open(backend, _timeouts.call);
    if (!transport)
        return std::unexpected(transport.error());

    auto const request = jsonrpc::makeRequest(HttpCallRequestId,
                                              "tools/call",
                                              nlohmann::json {
                                                  { "name", toolName },
                                                  { "arguments", arguments },
                                              });

    auto result = (*transport)
                      ->exchange(request, _timeouts.call)
                      .and_then([](const nlohmann::json& msg) { return jsonrpc::parseResponse(msg); })
                      .and_then([&](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                          if (resp.error)
                              return makeError(ErrorCode::ToolCallError,
                                               std::format("tools/call '{}' failed with RPC error {}: {}",
                                                           toolName,
                                                           resp.error->code,
                                                           resp.error->message));
                          return resp.result.value_or(nlohmann::json::object());
                      });
    (*transport)->close();
    return result;
}

auto CallForwarder::callSse(const BackendDefinition& backend,
                            const std::string& toolName,
                            const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    auto transport = _factory.open(backend, _timeouts.handshake);
    if (!transport)
        return std::unexpected(transport.error());

    auto session = McpClient(backend.id, std::move(*transport));
    return session.handshake(_timeouts.handshake).and_then([&](const std::vector<Tool>&) {
        return session.callTool(toolName, arguments, _timeouts.call);
    });
}

} // namespace mcpgate
