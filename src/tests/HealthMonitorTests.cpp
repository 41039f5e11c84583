// SPDX-License-Identifier: Apache-2.0
#include <gateway/HealthMonitor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace mcpgate;
using namespace std::chrono_literals;

namespace
{

auto manualConfig() -> HealthConfig
{
    auto config = HealthConfig {};
    config.enabled = false;
    config.failureThreshold = 3;
    config.recoveryThreshold = 2;
    config.maxRestartAttempts = 2;
    return config;
}

auto stateOf(const HealthMonitor& monitor, const std::string& id) -> HealthState
{
    return monitor.status(id).value().state;
}

} // namespace

TEST_CASE("HealthMonitor starts backends in Unknown", "[health]")
{
    auto monitor = HealthMonitor(manualConfig(), nullptr);
    monitor.registerBackend("memory");

    auto const status = monitor.status("memory");
    REQUIRE(status.has_value());
    CHECK(status->state == HealthState::Unknown);
    CHECK(!monitor.status("other").has_value());
    CHECK(!monitor.shouldRestart("memory"));
}

TEST_CASE("HealthMonitor degrades and recovers", "[health]")
{
    auto monitor = HealthMonitor(manualConfig(), nullptr);
    monitor.registerBackend("git");

    monitor.recordSuccess("git", 10ms);
    CHECK(stateOf(monitor, "git") == HealthState::Healthy);

    monitor.recordFailure("git", "ping timed out");
    CHECK(stateOf(monitor, "git") == HealthState::Degraded);
    CHECK(monitor.status("git")->reason == "ping timed out");

    monitor.recordSuccess("git", 30ms);
    CHECK(stateOf(monitor, "git") == HealthState::Degraded);

    monitor.recordSuccess("git", 20ms);
    auto const status = monitor.status("git").value();
    CHECK(status.state == HealthState::Healthy);
    CHECK(status.reason.empty());
    CHECK(status.totalChecks == 4);
    CHECK(status.successfulChecks == 3);
    CHECK(status.averageLatencyMs == 20.0);
}

TEST_CASE("HealthMonitor marks a backend unresponsive at the failure threshold", "[health]")
{
    auto monitor = HealthMonitor(manualConfig(), nullptr);
    monitor.registerBackend("slow");

    monitor.recordFailure("slow", "timeout");
    monitor.recordFailure("slow", "timeout");
    CHECK(stateOf(monitor, "slow") == HealthState::Degraded);
    CHECK(!monitor.shouldRestart("slow"));

    monitor.recordFailure("slow", "timeout");
    CHECK(stateOf(monitor, "slow") == HealthState::Unresponsive);
    CHECK(monitor.status("slow")->consecutiveFailures == 3);
    CHECK(monitor.shouldRestart("slow"));
}

TEST_CASE("HealthMonitor tracks crashes and restart attempts", "[health]")
{
    auto monitor = HealthMonitor(manualConfig(), nullptr);
    monitor.registerBackend("fs");
    monitor.recordSuccess("fs", 5ms);

    monitor.markCrashed("fs", 137);
    auto status = monitor.status("fs").value();
    CHECK(status.state == HealthState::Crashed);
    CHECK(status.exitCode == 137);
    CHECK(!status.uptimeStart.has_value());
    CHECK(monitor.shouldRestart("fs"));

    monitor.markRestarting("fs");
    CHECK(stateOf(monitor, "fs") == HealthState::Restarting);
    CHECK(!monitor.shouldRestart("fs"));

    monitor.markHealthy("fs");
    status = monitor.status("fs").value();
    CHECK(status.state == HealthState::Healthy);
    CHECK(status.consecutiveSuccesses == 1);
    CHECK(status.restartAttempts == 1);
    CHECK(!status.exitCode.has_value());

    monitor.markCrashed("fs", 1);
    monitor.markRestarting("fs");
    monitor.markCrashed("fs", 1);
    CHECK(monitor.status("fs")->restartAttempts == 2);

    // The restart budget is enforced when the restart is decided, not here.
    CHECK(monitor.shouldRestart("fs"));
}

TEST_CASE("HealthMonitor counts failures while a restart is in flight", "[health]")
{
    auto monitor = HealthMonitor(manualConfig(), nullptr);
    monitor.registerBackend("git");
    monitor.markRestarting("git");

    monitor.recordFailure("git", "no live session");
    monitor.recordFailure("git", "no live session");
    CHECK(stateOf(monitor, "git") == HealthState::Restarting);
    CHECK(!monitor.shouldRestart("git"));

    monitor.recordFailure("git", "no live session");
    CHECK(stateOf(monitor, "git") == HealthState::Unresponsive);
    CHECK(monitor.status("git")->reason == "no live session");
    CHECK(monitor.shouldRestart("git"));
}

TEST_CASE("HealthMonitor leaves a failed restart eligible for another one", "[health]")
{
    auto monitor = HealthMonitor(manualConfig(), nullptr);
    monitor.registerBackend("memory");

    monitor.markRestarting("memory");
    monitor.markRestartFailed("memory", "spawn failed");

    auto const status = monitor.status("memory").value();
    CHECK(status.state == HealthState::Unresponsive);
    CHECK(status.reason == "restart attempt 1 failed: spawn failed");
    CHECK(status.consecutiveFailures == 3);
    CHECK(status.restartAttempts == 1);
    CHECK(monitor.shouldRestart("memory"));

    monitor.resetRestartAttempts("memory");
    CHECK(monitor.status("memory")->restartAttempts == 0);
}

TEST_CASE("HealthMonitor checkNow applies the check and calls the restart handler", "[health]")
{
    auto outcome = CheckResult { .kind = CheckResult::Kind::Crashed, .latency = 0ms, .reason = {}, .exitCode = 2 };
    auto monitor = HealthMonitor(manualConfig(), [&](const std::string&, std::chrono::milliseconds) { return outcome; });

    auto restarted = std::vector<std::string> {};
    monitor.setRestartHandler([&](const std::string& id) { restarted.push_back(id); });
    monitor.registerBackend("memory");

    monitor.checkNow("memory");
    CHECK(stateOf(monitor, "memory") == HealthState::Crashed);
    CHECK(restarted == std::vector<std::string> { "memory" });

    outcome = CheckResult { .kind = CheckResult::Kind::Skipped };
    monitor.markHealthy("memory");
    monitor.checkNow("memory");
    CHECK(stateOf(monitor, "memory") == HealthState::Healthy);
    CHECK(restarted.size() == 1);
}

TEST_CASE("HealthMonitor checks periodically until shut down", "[health]")
{
    auto config = HealthConfig {};
    config.checkInterval = 20ms;
    config.checkTimeout = 10ms;

    auto checks = std::atomic<int> { 0 };
    auto monitor = HealthMonitor(config, [&](const std::string&, std::chrono::milliseconds) {
        ++checks;
        return CheckResult { .kind = CheckResult::Kind::Success, .latency = 1ms };
    });

    monitor.registerBackend("ticker");
    for (auto i = 0; i < 100 && checks < 3; ++i)
        std::this_thread::sleep_for(10ms);
    monitor.shutdown();

    CHECK(checks >= 3);
    CHECK(stateOf(monitor, "ticker") == HealthState::Healthy);

    auto const settled = checks.load();
    std::this_thread::sleep_for(60ms);
    CHECK(checks == settled);
}

TEST_CASE("HealthMonitor unregisterBackend forgets the backend", "[health]")
{
    auto monitor = HealthMonitor(manualConfig(), nullptr);
    monitor.registerBackend("gone");
    monitor.unregisterBackend("gone");
    CHECK(!monitor.status("gone").has_value());
    CHECK(monitor.snapshot().empty());
}

TEST_CASE("HealthStatus serializes to JSON", "[health]")
{
    auto status = HealthStatus {};
    status.state = HealthState::Crashed;
    status.exitCode = 3;
    status.reason = "exited with code 3";

    auto const json = status.toJson();
    CHECK(json["state"] == "crashed");
    CHECK(json["exitCode"] == 3);
    CHECK(json["reason"] == "exited with code 3");
    CHECK(!json.contains("uptimeSeconds"));
}
