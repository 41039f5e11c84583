// SPDX-License-Identifier: Apache-2.0
#include "RecoveryManager.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace mcpgate
{

auto classifyError(ErrorCode code) -> StrategyPlan
{
    using namespace std::chrono_literals;

    switch (code)
    {
        case ErrorCode::BackendNotFound:
        case ErrorCode::ConfigError:
        case ErrorCode::CircuitOpen: return { .strategy = RecoveryStrategy::ManualIntervention };
        case ErrorCode::Timeout: return { .strategy = RecoveryStrategy::RetryWithDelay, .maxAttempts = 3, .delay = 1000ms };
        case ErrorCode::ConnectionClosed:
        case ErrorCode::BackendUnreachable:
        case ErrorCode::ProtocolDesync: return { .strategy = RecoveryStrategy::RestartServer };
        case ErrorCode::UnresolvableToolName:
        case ErrorCode::EmptyToolName:
        case ErrorCode::ProtocolError: return { .strategy = RecoveryStrategy::None };
        default: return { .strategy = RecoveryStrategy::RetryWithDelay, .maxAttempts = 2, .delay = 500ms };
    }
}

auto CircuitBreakerState::toJson() const -> nlohmann::json
{
    auto result = nlohmann::json {
        { "open", open },
        { "trips", trips },
    };
    if (openedAt)
    {
        auto const age = std::chrono::steady_clock::now() - *openedAt;
        result["openForSeconds"] = std::chrono::duration_cast<std::chrono::seconds>(age).count();
    }
    return result;
}

RecoveryManager::RecoveryManager(RecoveryConfig config, HealthMonitor& health, RestartAction restart):
    _config(std::move(config)), _health(health), _restart(std::move(restart))
{
}

RecoveryManager::~RecoveryManager()
{
    shutdown();
}

auto RecoveryManager::backoffDelay(int attempt) const -> std::chrono::milliseconds
{
    auto const scaled =
        static_cast<double>(_config.baseDelay.count()) * std::pow(_config.backoffMultiplier, static_cast<double>(attempt));
    auto const capped = std::min(scaled, static_cast<double>(_config.maxDelay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

auto RecoveryManager::decide(const std::string& backendId, const StrategyPlan& plan) -> RecoveryDecision
{
    switch (plan.strategy)
    {
        case RecoveryStrategy::None:
            return { .action = RecoveryAction::None, .reason = "error is not recoverable by the gateway" };
        case RecoveryStrategy::RetryWithDelay:
            log::debug("[{}] Recovery: retry up to {} times after {}ms", backendId, plan.maxAttempts, plan.delay.count());
            return {
                .action = RecoveryAction::RetryWithDelay,
                .delay = plan.delay,
                .attempt = plan.maxAttempts,
                .reason = std::format("retry up to {} times", plan.maxAttempts),
            };
        case RecoveryStrategy::UseFallback:
            log::info("[{}] Recovery: switching to fallback", backendId);
            return { .action = RecoveryAction::SwitchToFallback, .reason = "fallback requested" };
        case RecoveryStrategy::ManualIntervention:
            log::warning("[{}] Recovery: manual intervention required", backendId);
            return { .action = RecoveryAction::RequireManualIntervention, .reason = "manual intervention required" };
        case RecoveryStrategy::GracefulDegradation:
            log::info("[{}] Recovery: continuing without this backend", backendId);
            return { .action = RecoveryAction::None, .reason = "continuing in degraded mode" };
        case RecoveryStrategy::RestartServer: break;
    }

    auto const attempts = _health.status(backendId).transform([](const HealthStatus& s) { return s.restartAttempts; });
    auto attempt = attempts.value_or(0);

    auto const lock = std::scoped_lock(_mutex);
    auto& breaker = _breakers[backendId];

    if (breaker.open)
    {
        auto const elapsed = std::chrono::steady_clock::now() - breaker.openedAt.value_or(std::chrono::steady_clock::now());
        if (elapsed < _config.circuitBreakerReset)
        {
            auto const remaining =
                std::chrono::duration_cast<std::chrono::seconds>(_config.circuitBreakerReset - elapsed).count();
            log::warning("[{}] Recovery: circuit open ({} trips), restart declined for another {}s",
                         backendId,
                         breaker.trips,
                         remaining);
            return {
                .action = RecoveryAction::RequireManualIntervention,
                .attempt = attempt,
                .errorCode = ErrorCode::CircuitOpen,
                .reason = std::format("circuit breaker open after {} failed restarts", breaker.trips),
            };
        }

        // Half-open: the restart budget starts over, but one more failed restart
        // reopens the breaker.
        log::info("[{}] Recovery: circuit cool-down elapsed, allowing one restart", backendId);
        breaker.open = false;
        breaker.openedAt.reset();
        breaker.trips = std::max(0, _config.circuitBreakerThreshold - 1);
        _health.resetRestartAttempts(backendId);
        attempt = 0;
    }

    if (attempt < _health.config().maxRestartAttempts)
    {
        auto const delay = backoffDelay(attempt);
        log::info("[{}] Recovery: restart attempt {} of {} in {}ms",
                  backendId,
                  attempt + 1,
                  _health.config().maxRestartAttempts,
                  delay.count());
        return {
            .action = RecoveryAction::RestartServer,
            .delay = delay,
            .attempt = attempt,
            .reason = std::format("restart attempt {}", attempt + 1),
        };
    }

    breaker.open = true;
    breaker.openedAt = std::chrono::steady_clock::now();
    log::error("[{}] Recovery: {} restart attempts exhausted, marking backend as failed", backendId, attempt);
    return {
        .action = RecoveryAction::MarkAsFailed,
        .attempt = attempt,
        .reason = std::format("{} restart attempts exhausted", attempt),
    };
}

auto RecoveryManager::handleError(const std::string& backendId, const Error& error) -> RecoveryDecision
{
    auto const plan = classifyError(error.code);
    log::debug("[{}] Classified {} as {}", backendId, errorCodeName(error.code), recoveryStrategyToString(plan.strategy));

    auto decision = decide(backendId, plan);
    if (decision.action == RecoveryAction::RestartServer)
        scheduleRestart(backendId, decision.delay);
    return decision;
}

void RecoveryManager::scheduleRestart(const std::string& backendId, std::chrono::milliseconds delay)
{
    auto const lock = std::scoped_lock(_mutex);
    if (_shuttingDown || _pending.contains(backendId))
        return;

    std::erase_if(_tasks, [](const RestartTask& task) { return task.done->load(); });

    _pending.insert(backendId);
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::jthread([this, backendId, delay, done](const std::stop_token& token) {
        {
            auto sleepLock = std::unique_lock(_sleepMutex);
            _wake.wait_for(sleepLock, token, delay, [] { return false; });
        }

        if (!token.stop_requested())
        {
            if (auto result = restartNow(backendId); !result)
                log::debug("[{}] Scheduled restart failed: {}", backendId, result.error());
        }
        else
            log::debug("[{}] Scheduled restart cancelled", backendId);

        {
            auto const pendingLock = std::scoped_lock(_mutex);
            _pending.erase(backendId);
        }
        done->store(true);
    });

    _tasks.push_back(RestartTask { .thread = std::move(thread), .done = std::move(done) });
}

auto RecoveryManager::restartNow(const std::string& backendId) -> VoidResult
{
    _health.markRestarting(backendId);
    auto const attempt = _health.status(backendId).transform([](const HealthStatus& s) { return s.restartAttempts; });
    log::info("[{}] Restarting backend (attempt {})", backendId, attempt.value_or(1));

    auto result = _restart ? _restart(backendId, _config.restartTimeout)
                           : VoidResult(makeError(ErrorCode::Unknown, "No restart action configured"));
    if (!result)
        _health.markRestartFailed(backendId, result.error().message);

    auto const lock = std::scoped_lock(_mutex);
    auto& breaker = _breakers[backendId];

    if (result)
    {
        _health.markHealthy(backendId);
        breaker = CircuitBreakerState {};
        log::info("[{}] Backend restarted", backendId);
        return {};
    }

    breaker.trips++;
    if (breaker.trips >= _config.circuitBreakerThreshold && !breaker.open)
    {
        breaker.open = true;
        breaker.openedAt = std::chrono::steady_clock::now();
        log::error("[{}] Circuit breaker opened after {} failed restarts", backendId, breaker.trips);
    }
    else
        log::warning("[{}] Restart failed (trip {} of {}): {}",
                     backendId,
                     breaker.trips,
                     _config.circuitBreakerThreshold,
                     result.error());
    return result;
}

void RecoveryManager::recordSuccess(const std::string& backendId)
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _breakers.find(backendId);
    if (it == _breakers.end())
        return;

    if (it->second.open || it->second.trips > 0)
        log::info("[{}] Successful call, circuit breaker reset", backendId);
    it->second = CircuitBreakerState {};
}

auto RecoveryManager::circuitState(const std::string& backendId) const -> CircuitBreakerState
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _breakers.find(backendId);
    return it != _breakers.end() ? it->second : CircuitBreakerState {};
}

auto RecoveryManager::snapshot() const -> std::map<std::string, CircuitBreakerState>
{
    auto const lock = std::scoped_lock(_mutex);
    return { _breakers.begin(), _breakers.end() };
}

auto RecoveryManager::isRestartPending(const std::string& backendId) const -> bool
{
    auto const lock = std::scoped_lock(_mutex);
    return _pending.contains(backendId);
}

void RecoveryManager::shutdown()
{
    auto tasks = std::vector<RestartTask> {};
    {
        auto const lock = std::scoped_lock(_mutex);
        _shuttingDown = true;
        tasks = std::move(_tasks);
        _tasks.clear();
    }

    for (auto& task: tasks)
        task.thread.request_stop();
    _wake.notify_all();

    for (auto& task: tasks)
    {
        if (task.thread.joinable())
            task.thread.join();
    }
}

} // namespace mcpgate
