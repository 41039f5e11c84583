// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <gateway/ConnectionRegistry.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcpgate
{

/// @brief Per-call information supplied by the inbound caller.
struct CallContext
{
    /// Directory the caller works in, empty if it did not say.
    std::string workingDirectory;
};

/// @brief Adds context-derived parameters to a call's arguments before dispatch.
using ArgumentInjector =
    std::function<void(nlohmann::json& arguments, const CallContext& context, const BackendDefinition& backend)>;

/// @brief What happened to one forwarded call.
struct CallOutcome
{
    std::string backendId;
    std::optional<Error> error;

    /// Exit code of a subprocess backend found dead after the call.
    std::optional<int> exitCode;
    std::chrono::milliseconds latency { 0 };
};

using CallOutcomeListener = std::function<void(const CallOutcome& outcome)>;

/// @brief Returns an injector that sets "projectRoot" unless the caller already did.
[[nodiscard]] auto projectRootInjector(std::string projectDir) -> ArgumentInjector;

/// @brief Sends tools/call to the right backend over the right transport.
///
/// Subprocess backends reuse their registry session; HTTP backends get one
/// POST per call; SSE backends get a fresh session with its own handshake.
class CallForwarder
{
  public:
    struct Timeouts
    {
        std::chrono::milliseconds call { 120'000 };
        std::chrono::milliseconds handshake { 30'000 };
    };

    CallForwarder(const std::map<std::string, BackendDefinition>& backends,
                  ConnectionRegistry& registry,
                  TransportFactory& factory,
                  Timeouts timeouts);

    /// @brief Registers the argument injector for one backend id.
    void setInjector(const std::string& backendId, ArgumentInjector injector);

    /// @brief Registers the injector used for backends without their own.
    void setDefaultInjector(ArgumentInjector injector);

    void setOutcomeListener(CallOutcomeListener listener);

    /// @brief Forwards a tool call.
    /// @param backendId The owning backend.
    /// @param toolName The backend-native tool name.
    /// @param arguments The tool arguments.
    /// @param context Caller context for argument injection and directory scoping.
    /// @return The backend's tools/call result or an error.
    [[nodiscard]] auto call(const std::string& backendId,
                            const std::string& toolName,
                            nlohmann::json arguments,
                            const CallContext& context = {}) -> Result<nlohmann::json>;

  private:
    [[nodiscard]] auto callSubprocess(const BackendDefinition& backend,
                                      const std::string& toolName,
                                      const nlohmann::json& arguments,
                                      const CallContext& context,
                                      CallOutcome& outcome) -> Result<nlohmann::json>;

    [[nodiscard]] auto callHttp(const BackendDefinition& backend,
                                const std::string& toolName,
                                const nlohmann::json& arguments) -> Result<nlohmann::json>;

    [[nodiscard]] auto callSse(const BackendDefinition& backend,
                               const std::string& toolName,
                               const nlohmann::json& arguments) -> Result<nlohmann::json>;

    const std::map<std::string, BackendDefinition>& _backends;
    ConnectionRegistry& _registry;
    TransportFactory& _factory;
    Timeouts _timeouts;

    mutable std::mutex _mutex;
    std::map<std::string, ArgumentInjector, std::less<>> _injectors;
    ArgumentInjector _defaultInjector;
    CallOutcomeListener _listener;
};

} // namespace mcpgate
