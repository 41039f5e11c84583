// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <gateway/BackendExtensions.hpp>
#include <gateway/CallForwarder.hpp>
#include <gateway/ConnectionRegistry.hpp>
#include <gateway/Discovery.hpp>
#include <gateway/HealthMonitor.hpp>
#include <gateway/RecoveryManager.hpp>
#include <gateway/ToolCatalog.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Name of the built-in tool that reports backend health.
constexpr auto StatusToolName = std::string_view { "mcpgate_status" };

/// @brief Gateway-wide settings.
struct GatewayOptions
{
    std::chrono::milliseconds discoveryTimeout = DiscoveryEngine::DefaultTimeout;
    std::chrono::milliseconds callTimeout { 120'000 };
    std::chrono::milliseconds handshakeTimeout { 30'000 };

    /// Adds a "projectRoot" argument to every call that does not carry one.
    bool injectProjectRoot = false;

    std::string projectDir;
    HealthConfig health;
    RecoveryConfig recovery;
};

/// @brief Owns every shared structure of the gateway and serves the inbound protocol.
///
/// The catalog, connection registry, health map and circuit breakers live
/// here, each behind its own lock.
class Gateway
{
  public:
    Gateway(std::vector<BackendDefinition> backends,
            GatewayOptions options,
            std::shared_ptr<TransportFactory> factory = nullptr);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// @brief Discovers all backends, publishes the catalog and starts health monitoring.
    auto start() -> DiscoveryReport;

    /// @brief Runs a discovery pass and replaces the catalog with its result.
    auto discover() -> DiscoveryReport;

    /// @brief Handles one inbound line.
    /// @return The reply to write, or std::nullopt for notifications.
    [[nodiscard]] auto handleLine(std::string_view line) -> std::optional<nlohmann::json>;

    /// @brief Handles one inbound JSON-RPC message.
    /// @return The reply to write, or std::nullopt for notifications.
    [[nodiscard]] auto handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>;

    /// @brief Resolves and forwards a tool call.
    /// @return A tools/call result; failures become an isError result with a diagnostic.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments, const CallContext& context = {})
        -> nlohmann::json;

    /// @brief Checks every backend once.
    void checkAll();

    [[nodiscard]] auto catalog() const -> const ToolCatalog& { return _catalog; }
    [[nodiscard]] auto registry() -> ConnectionRegistry& { return *_registry; }
    [[nodiscard]] auto health() -> HealthMonitor& { return *_health; }
    [[nodiscard]] auto recovery() -> RecoveryManager& { return *_recovery; }

    [[nodiscard]] auto backendIds() const -> std::vector<std::string>;
    [[nodiscard]] auto exportCatalog() const -> nlohmann::json;
    [[nodiscard]] auto statusSnapshot() const -> nlohmann::json;

    /// @brief Stops health checks and pending restarts, then closes every connection.
    void shutdown();

  private:
    [[nodiscard]] auto openSession(const std::string& backendId, const std::string& directory)
        -> Result<std::shared_ptr<McpClient>>;
    [[nodiscard]] auto discoverBackend(const BackendDefinition& backend, std::chrono::milliseconds timeout)
        -> Result<std::vector<Tool>>;
    [[nodiscard]] auto checkBackend(const std::string& backendId, std::chrono::milliseconds timeout) -> CheckResult;
    [[nodiscard]] auto restartBackend(const std::string& backendId, std::chrono::milliseconds timeout) -> VoidResult;
    void onCallOutcome(const CallOutcome& outcome);

    [[nodiscard]] auto handleInitialize(const nlohmann::json& params) const -> nlohmann::json;
    [[nodiscard]] auto handleToolsList() const -> nlohmann::json;
    [[nodiscard]] auto failureText(std::string_view name, const Error& error, const std::optional<std::string>& backendId,
                                   const std::optional<std::string>& toolName) const -> std::string;

    GatewayOptions _options;
    std::map<std::string, BackendDefinition> _backends;
    std::vector<std::string> _backendIds;
    std::shared_ptr<TransportFactory> _factory;

    ToolCatalog _catalog;
    std::unique_ptr<DiscoveryEngine> _discovery;
    std::unique_ptr<ConnectionRegistry> _registry;
    std::unique_ptr<HealthMonitor> _health;
    std::unique_ptr<RecoveryManager> _recovery;
    std::unique_ptr<CallForwarder> _forwarder;

    std::atomic<bool> _stopping = false;
};

} // namespace mcpgate
