// SPDX-License-Identifier: Apache-2.0
#include "HealthMonitor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <vector>

namespace mcpgate
{

namespace
{
    auto toEpochMillis(std::chrono::system_clock::time_point tp) -> int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
} // namespace

auto HealthStatus::toJson() const -> nlohmann::json
{
    auto result = nlohmann::json {
        { "state", std::string(healthStateToString(state)) },
        { "consecutiveFailures", consecutiveFailures },
        { "consecutiveSuccesses", consecutiveSuccesses },
        { "totalChecks", totalChecks },
        { "successfulChecks", successfulChecks },
        { "restartAttempts", restartAttempts },
        { "averageLatencyMs", averageLatencyMs },
    };

    if (!reason.empty())
        result["reason"] = reason;
    if (exitCode)
        result["exitCode"] = *exitCode;
    if (lastCheck)
        result["lastCheck"] = toEpochMillis(*lastCheck);
    if (lastSuccess)
        result["lastSuccess"] = toEpochMillis(*lastSuccess);
    if (uptimeStart)
    {
        auto const uptime = std::chrono::system_clock::now() - *uptimeStart;
        result["uptimeSeconds"] = std::chrono::duration_cast<std::chrono::seconds>(uptime).count();
    }
    return result;
}

HealthMonitor::HealthMonitor(HealthConfig config, HealthCheck check):
    _config(std::move(config)), _check(std::move(check))
{
}

HealthMonitor::~HealthMonitor()
{
    shutdown();
}

void HealthMonitor::setRestartHandler(RestartHandler handler)
{
    auto const lock = std::scoped_lock(_mutex);
    _restartHandler = std::move(handler);
}

void HealthMonitor::registerBackend(const std::string& backendId)
{
    {
        auto const lock = std::scoped_lock(_mutex);
        _statuses.try_emplace(backendId);
    }

    if (!_config.enabled || !_check)
        return;

    auto const lock = std::scoped_lock(_workersMutex);
    if (_workers.contains(backendId))
        return;

    _workers.emplace(backendId,
                     std::jthread([this, backendId](const std::stop_token& token) { runChecks(token, backendId); }));
    log::debug("[{}] Health monitoring started (interval {}s)",
               backendId,
               std::chrono::duration_cast<std::chrono::seconds>(_config.checkInterval).count());
}

void HealthMonitor::unregisterBackend(const std::string& backendId)
{
    auto worker = std::jthread {};
    {
        auto const lock = std::scoped_lock(_workersMutex);
        if (auto node = _workers.extract(backendId))
            worker = std::move(node.mapped());
    }

    if (worker.joinable())
    {
        worker.request_stop();
        _wake.notify_all();
        worker.join();
    }

    auto const lock = std::scoped_lock(_mutex);
    _statuses.erase(backendId);
}

void HealthMonitor::runChecks(const std::stop_token& stopToken, const std::string& backendId)
{
    while (!stopToken.stop_requested())
    {
        {
            auto lock = std::unique_lock(_sleepMutex);
            _wake.wait_for(lock, stopToken, _config.checkInterval, [] { return false; });
        }
        if (stopToken.stop_requested())
            break;

        checkNow(backendId);
    }
}

void HealthMonitor::checkNow(const std::string& backendId)
{
    if (!_check)
        return;

    apply(backendId, _check(backendId, _config.checkTimeout));

    auto handler = RestartHandler {};
    {
        auto const lock = std::scoped_lock(_mutex);
        handler = _restartHandler;
    }
    if (handler && shouldRestart(backendId))
        handler(backendId);
}

void HealthMonitor::apply(const std::string& backendId, const CheckResult& result)
{
    switch (result.kind)
    {
        case CheckResult::Kind::Success: recordSuccess(backendId, result.latency); break;
        case CheckResult::Kind::Failure: recordFailure(backendId, result.reason); break;
        case CheckResult::Kind::Crashed: markCrashed(backendId, result.exitCode); break;
        case CheckResult::Kind::Skipped: break;
    }
}

void HealthMonitor::recordSuccess(const std::string& backendId, std::chrono::milliseconds latency)
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return;

    auto& status = it->second;
    auto const now = std::chrono::system_clock::now();

    status.totalChecks++;
    status.successfulChecks++;
    status.averageLatencyMs +=
        (static_cast<double>(latency.count()) - status.averageLatencyMs) / static_cast<double>(status.successfulChecks);
    status.consecutiveFailures = 0;
    status.consecutiveSuccesses++;
    status.lastCheck = now;
    status.lastSuccess = now;

    switch (status.state)
    {
        case HealthState::Unknown:
            status.state = HealthState::Healthy;
            status.uptimeStart = now;
            break;
        case HealthState::Degraded:
        case HealthState::Unresponsive:
        case HealthState::Crashed:
            if (status.consecutiveSuccesses >= _config.recoveryThreshold)
            {
                log::info("[{}] Backend recovered after {} successful checks", backendId, status.consecutiveSuccesses);
                status.state = HealthState::Healthy;
                status.reason.clear();
                status.exitCode.reset();
                status.restartAttempts = 0;
                status.uptimeStart = now;
            }
            break;
        case HealthState::Healthy:
        case HealthState::Restarting: break;
    }
}

void HealthMonitor::recordFailure(const std::string& backendId, std::string reason)
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return;

    auto& status = it->second;
    status.totalChecks++;
    status.consecutiveSuccesses = 0;
    status.consecutiveFailures++;
    status.lastCheck = std::chrono::system_clock::now();

    if (status.state == HealthState::Crashed)
        return;

    if (status.consecutiveFailures >= _config.failureThreshold)
    {
        if (status.state != HealthState::Unresponsive)
            log::warning("[{}] Backend unresponsive after {} failed checks: {}",
                         backendId,
                         status.consecutiveFailures,
                         reason);
        status.state = HealthState::Unresponsive;
        status.reason = std::move(reason);
    }
    else if (status.state == HealthState::Healthy || status.state == HealthState::Unknown)
    {
        log::info("[{}] Backend degraded: {}", backendId, reason);
        status.state = HealthState::Degraded;
        status.reason = std::move(reason);
    }
}

void HealthMonitor::markCrashed(const std::string& backendId, std::optional<int> exitCode)
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return;

    auto& status = it->second;
    if (status.state != HealthState::Crashed)
        log::error("[{}] Backend crashed (exit code {})", backendId, exitCode ? std::to_string(*exitCode) : "unknown");

    status.state = HealthState::Crashed;
    status.exitCode = exitCode;
    status.reason = exitCode ? std::format("exited with code {}", *exitCode) : std::string("process exited");
    status.consecutiveSuccesses = 0;
    status.uptimeStart.reset();
}

void HealthMonitor::markRestarting(const std::string& backendId)
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return;

    auto& status = it->second;
    status.restartAttempts++;
    status.state = HealthState::Restarting;
    status.reason = std::format("restart attempt {}", status.restartAttempts);
}

void HealthMonitor::markRestartFailed(const std::string& backendId, std::string reason)
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return;

    auto& status = it->second;
    status.state = HealthState::Unresponsive;
    status.reason = std::format("restart attempt {} failed: {}", status.restartAttempts, reason);
    status.consecutiveSuccesses = 0;
    status.consecutiveFailures = std::max(status.consecutiveFailures, _config.failureThreshold);
    status.uptimeStart.reset();
}

void HealthMonitor::resetRestartAttempts(const std::string& backendId)
{
    auto const lock = std::scoped_lock(_mutex);
    if (auto const it = _statuses.find(backendId); it != _statuses.end())
        it->second.restartAttempts = 0;
}

void HealthMonitor::markHealthy(const std::string& backendId)
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return;

    auto& status = it->second;
    status.state = HealthState::Healthy;
    status.reason.clear();
    status.exitCode.reset();
    status.consecutiveFailures = 0;
    status.consecutiveSuccesses = 1;
    status.uptimeStart = std::chrono::system_clock::now();
}

auto HealthMonitor::shouldRestart(const std::string& backendId) const -> bool
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return false;

    auto const& status = it->second;
    switch (status.state)
    {
        case HealthState::Crashed: return true;
        case HealthState::Unresponsive: return status.consecutiveFailures >= _config.failureThreshold;
        default: return false;
    }
}

auto HealthMonitor::status(const std::string& backendId) const -> std::optional<HealthStatus>
{
    auto const lock = std::scoped_lock(_mutex);
    auto const it = _statuses.find(backendId);
    if (it == _statuses.end())
        return std::nullopt;
    return it->second;
}

auto HealthMonitor::snapshot() const -> std::map<std::string, HealthStatus>
{
    auto const lock = std::scoped_lock(_mutex);
    return { _statuses.begin(), _statuses.end() };
}

void HealthMonitor::shutdown()
{
    auto workers = std::vector<std::jthread> {};
    {
        auto const lock = std::scoped_lock(_workersMutex);
        for (auto& [id, worker]: _workers)
            workers.push_back(std::move(worker));
        _workers.clear();
    }

    for (auto& worker: workers)
        worker.request_stop();
    _wake.notify_all();

    for (auto& worker: workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

} // namespace mcpgate
