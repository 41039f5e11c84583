// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace mcpgate
{

/// @brief Health monitoring settings.
struct HealthConfig
{
    bool enabled = true;
    std::chrono::milliseconds checkInterval { 30'000 };
    std::chrono::milliseconds checkTimeout { 5'000 };

    /// Consecutive failed checks that make a backend Unresponsive.
    int failureThreshold = 3;

    /// Consecutive successful checks that bring a backend back to Healthy.
    int recoveryThreshold = 2;

    int maxRestartAttempts = 5;
};

enum class HealthState
{
    Unknown,
    Healthy,
    Degraded,
    Unresponsive,
    Crashed,
    Restarting,
};

[[nodiscard]] constexpr auto healthStateToString(HealthState state) -> std::string_view
{
    switch (state)
    {
        case HealthState::Unknown: return "unknown";
        case HealthState::Healthy: return "healthy";
        case HealthState::Degraded: return "degraded";
        case HealthState::Unresponsive: return "unresponsive";
        case HealthState::Crashed: return "crashed";
        case HealthState::Restarting: return "restarting";
    }
    return "unknown";
}

/// @brief Current health of one backend.
struct HealthStatus
{
    HealthState state = HealthState::Unknown;

    /// Degradation reason, crash description or restart attempt.
    std::string reason;
    std::optional<int> exitCode;

    int consecutiveFailures = 0;
    int consecutiveSuccesses = 0;
    uint64_t totalChecks = 0;
    uint64_t successfulChecks = 0;
    int restartAttempts = 0;

    /// Mean latency over successful checks only.
    double averageLatencyMs = 0.0;

    std::optional<std::chrono::system_clock::time_point> lastCheck;
    std::optional<std::chrono::system_clock::time_point> lastSuccess;
    std::optional<std::chrono::system_clock::time_point> uptimeStart;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/// @brief Outcome of one check.
struct CheckResult
{
    enum class Kind
    {
        Success,
        Failure,
        Crashed,
        Skipped,
    };

    Kind kind = Kind::Skipped;
    std::chrono::milliseconds latency { 0 };
    std::string reason;
    std::optional<int> exitCode;
};

/// @brief Runs one check against a backend within the given timeout.
using HealthCheck = std::function<CheckResult(const std::string& backendId, std::chrono::milliseconds timeout)>;

/// @brief Invoked after a check when a backend qualifies for a restart.
using RestartHandler = std::function<void(const std::string& backendId)>;

/// @brief Tracks per-backend health and checks registered backends periodically.
///
/// Each registered backend gets its own check thread, woken every check
/// interval. All status changes go through the record and mark methods, which
/// may also be called directly by the call path.
class HealthMonitor
{
  public:
    HealthMonitor(HealthConfig config, HealthCheck check);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void setRestartHandler(RestartHandler handler);

    /// @brief Starts tracking the backend and, if monitoring is enabled, its check thread.
    void registerBackend(const std::string& backendId);

    /// @brief Stops the backend's check thread and forgets its status.
    void unregisterBackend(const std::string& backendId);

    void recordSuccess(const std::string& backendId, std::chrono::milliseconds latency);
    void recordFailure(const std::string& backendId, std::string reason);
    void markCrashed(const std::string& backendId, std::optional<int> exitCode);

    /// @brief Counts a restart attempt and moves the backend to Restarting.
    void markRestarting(const std::string& backendId);

    /// @brief Moves the backend back to Unresponsive after a failed restart, so the
    /// next check asks for another one.
    void markRestartFailed(const std::string& backendId, std::string reason);

    /// @brief Gives the backend a fresh restart budget.
    void resetRestartAttempts(const std::string& backendId);

    void markHealthy(const std::string& backendId);

    /// @brief Returns true if the backend crashed, or stayed unresponsive past the
    /// failure threshold. The restart budget is enforced by the RecoveryManager.
    [[nodiscard]] auto shouldRestart(const std::string& backendId) const -> bool;

    [[nodiscard]] auto status(const std::string& backendId) const -> std::optional<HealthStatus>;
    [[nodiscard]] auto snapshot() const -> std::map<std::string, HealthStatus>;

    /// @brief Runs one check synchronously and applies its outcome.
    void checkNow(const std::string& backendId);

    /// @brief Stops and joins every check thread.
    void shutdown();

    [[nodiscard]] auto config() const -> const HealthConfig& { return _config; }

  private:
    void runChecks(const std::stop_token& stopToken, const std::string& backendId);
    void apply(const std::string& backendId, const CheckResult& result);

    HealthConfig _config;
    HealthCheck _check;

    mutable std::mutex _mutex;
    std::map<std::string, HealthStatus, std::less<>> _statuses;
    RestartHandler _restartHandler;

    std::mutex _workersMutex;
    std::map<std::string, std::jthread, std::less<>> _workers;

    std::mutex _sleepMutex;
    std::condition_variable_any _wake;
};

} // namespace mcpgate
