// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <gateway/HealthMonitor.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcpgate
{

/// @brief How an error class should be recovered from.
enum class RecoveryStrategy
{
    None,
    RetryWithDelay,
    RestartServer,
    UseFallback,
    ManualIntervention,
    GracefulDegradation,
};

[[nodiscard]] constexpr auto recoveryStrategyToString(RecoveryStrategy strategy) -> std::string_view
{
    switch (strategy)
    {
        case RecoveryStrategy::None: return "none";
        case RecoveryStrategy::RetryWithDelay: return "retry-with-delay";
        case RecoveryStrategy::RestartServer: return "restart-server";
        case RecoveryStrategy::UseFallback: return "use-fallback";
        case RecoveryStrategy::ManualIntervention: return "manual-intervention";
        case RecoveryStrategy::GracefulDegradation: return "graceful-degradation";
    }
    return "unknown";
}

/// @brief A strategy together with its retry parameters.
struct StrategyPlan
{
    RecoveryStrategy strategy = RecoveryStrategy::None;
    int maxAttempts = 0;
    std::chrono::milliseconds delay { 0 };
};

/// @brief Maps an error code to its recovery strategy.
[[nodiscard]] auto classifyError(ErrorCode code) -> StrategyPlan;

/// @brief The concrete action picked for a strategy.
enum class RecoveryAction
{
    None,
    RetryWithDelay,
    RestartServer,
    SwitchToFallback,
    MarkAsFailed,
    RequireManualIntervention,
};

[[nodiscard]] constexpr auto recoveryActionToString(RecoveryAction action) -> std::string_view
{
    switch (action)
    {
        case RecoveryAction::None: return "none";
        case RecoveryAction::RetryWithDelay: return "retry-with-delay";
        case RecoveryAction::RestartServer: return "restart-server";
        case RecoveryAction::SwitchToFallback: return "switch-to-fallback";
        case RecoveryAction::MarkAsFailed: return "mark-as-failed";
        case RecoveryAction::RequireManualIntervention: return "require-manual-intervention";
    }
    return "unknown";
}

struct RecoveryDecision
{
    RecoveryAction action = RecoveryAction::None;
    std::chrono::milliseconds delay { 0 };

    /// Restart attempt this decision refers to (0-based), or the retry budget for retries.
    int attempt = 0;

    /// Set to CircuitOpen when the breaker declined a restart.
    std::optional<ErrorCode> errorCode;
    std::string reason;
};

/// @brief Restart backoff and circuit breaker settings.
struct RecoveryConfig
{
    std::chrono::milliseconds baseDelay { 1'000 };
    std::chrono::milliseconds maxDelay { 60'000 };
    double backoffMultiplier = 2.0;
    int circuitBreakerThreshold = 5;
    std::chrono::milliseconds circuitBreakerReset { 300'000 };
    std::chrono::milliseconds restartTimeout { 30'000 };
};

/// @brief Per-backend circuit breaker.
struct CircuitBreakerState
{
    bool open = false;
    int trips = 0;
    std::optional<std::chrono::steady_clock::time_point> openedAt;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/// @brief Replaces a backend's connection with a fresh one.
using RestartAction = std::function<VoidResult(const std::string& backendId, std::chrono::milliseconds timeout)>;

/// @brief Turns classified errors into recovery actions and executes restarts.
///
/// Restarts run on tracked background threads with exponential backoff.
/// A circuit breaker per backend stops restart attempts after repeated
/// failures until its cool-down has elapsed.
class RecoveryManager
{
  public:
    RecoveryManager(RecoveryConfig config, HealthMonitor& health, RestartAction restart);
    ~RecoveryManager();

    RecoveryManager(const RecoveryManager&) = delete;
    RecoveryManager& operator=(const RecoveryManager&) = delete;

    /// @brief Picks the concrete action for a strategy. May open the breaker.
    [[nodiscard]] auto decide(const std::string& backendId, const StrategyPlan& plan) -> RecoveryDecision;

    /// @brief Classifies the error, decides, and schedules a restart when one is due.
    auto handleError(const std::string& backendId, const Error& error) -> RecoveryDecision;

    /// @brief Schedules a restart after the delay on a background thread.
    /// Does nothing if a restart for the backend is already pending.
    void scheduleRestart(const std::string& backendId, std::chrono::milliseconds delay);

    /// @brief Runs one restart synchronously, updating health and breaker state.
    auto restartNow(const std::string& backendId) -> VoidResult;

    /// @brief Resets the backend's breaker after a successful call.
    void recordSuccess(const std::string& backendId);

    [[nodiscard]] auto circuitState(const std::string& backendId) const -> CircuitBreakerState;
    [[nodiscard]] auto snapshot() const -> std::map<std::string, CircuitBreakerState>;
    [[nodiscard]] auto isRestartPending(const std::string& backendId) const -> bool;

    /// @brief Cancels pending restarts and joins their threads.
    void shutdown();

    [[nodiscard]] auto config() const -> const RecoveryConfig& { return _config; }

  private:
    struct RestartTask
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    [[nodiscard]] auto backoffDelay(int attempt) const -> std::chrono::milliseconds;

    RecoveryConfig _config;
    HealthMonitor& _health;
    RestartAction _restart;

    mutable std::mutex _mutex;
    std::map<std::string, CircuitBreakerState, std::less<>> _breakers;
    std::set<std::string, std::less<>> _pending;
    std::vector<RestartTask> _tasks;
    bool _shuttingDown = false;

    std::mutex _sleepMutex;
    std::condition_variable_any _wake;
};

} // namespace mcpgate
