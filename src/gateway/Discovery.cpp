// SPDX-License-Identifier: Apache-2.0
#include "Discovery.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <filesystem>
#include <format>

namespace mcpgate
{

namespace
{
    // Slack on top of a backend's own deadline before its task counts as hung.
    constexpr auto JoinGrace = std::chrono::milliseconds(50);

    auto isContainerCommand(const std::string& command) -> bool
    {
        auto const name = std::filesystem::path(command).filename().string();
        return name == "docker" || name == "podman";
    }

    auto elapsedSince(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }
} // namespace

auto DiscoveryReport::tools() const -> std::vector<Tool>
{
    auto result = std::vector<Tool> {};
    for (auto const& outcome: outcomes)
        result.insert(result.end(), outcome.tools.begin(), outcome.tools.end());
    return result;
}

auto DiscoveryReport::succeededCount() const -> size_t
{
    return static_cast<size_t>(std::ranges::count_if(outcomes, &DiscoveryOutcome::succeeded));
}

DiscoveryEngine::DiscoveryEngine(BackendDiscoverer discoverer, std::chrono::milliseconds defaultTimeout):
    _discoverer(std::move(discoverer)), _defaultTimeout(defaultTimeout)
{
}

DiscoveryEngine::~DiscoveryEngine()
{
    joinStragglers();
}

auto DiscoveryEngine::timeoutFor(const BackendDefinition& backend) const -> std::chrono::milliseconds
{
    if (backend.timeoutSeconds > 0)
        return std::chrono::seconds(backend.timeoutSeconds);
    if (backend.transport == TransportKind::Stdio && isContainerCommand(backend.command))
        return ContainerTimeout;
    return _defaultTimeout;
}

auto DiscoveryEngine::discoverAll(const std::vector<BackendDefinition>& backends) -> DiscoveryReport
{
    struct Task
    {
        const BackendDefinition* backend;
        std::chrono::steady_clock::time_point deadline;
        std::future<Result<std::vector<Tool>>> future;
    };

    auto const start = std::chrono::steady_clock::now();
    auto tasks = std::vector<Task> {};
    tasks.reserve(backends.size());

    for (auto const& backend: backends)
    {
        auto const timeout = timeoutFor(backend);
        log::debug("[{}] Discovering tools ({}ms allowance)", backend.id, timeout.count());
        tasks.push_back(Task {
            .backend = &backend,
            .deadline = start + timeout + JoinGrace,
            .future = std::async(std::launch::async, _discoverer, backend, timeout),
        });
    }

    auto report = DiscoveryReport {};
    for (auto& task: tasks)
    {
        auto outcome = DiscoveryOutcome { .backendId = task.backend->id };

        if (task.future.wait_until(task.deadline) != std::future_status::ready)
        {
            outcome.error = Error { ErrorCode::Timeout,
                                    std::format("Discovery did not finish within {}ms",
                                                timeoutFor(*task.backend).count()) };
            auto const lock = std::scoped_lock(_mutex);
            _stragglers.push_back(std::move(task.future));
        }
        else if (auto result = task.future.get(); result)
            outcome.tools = std::move(*result);
        else
            outcome.error = result.error();

        outcome.elapsed = elapsedSince(start);

        if (outcome.error)
            log::warning("[{}] Discovery failed after {}ms: {}", outcome.backendId, outcome.elapsed.count(), *outcome.error);
        else
            log::info("[{}] Discovered {} tools", outcome.backendId, outcome.tools.size());

        report.outcomes.push_back(std::move(outcome));
    }

    log::info("Discovery finished: {} of {} backends, {} tools in {}ms",
              report.succeededCount(),
              backends.size(),
              report.tools().size(),
              elapsedSince(start).count());
    return report;
}

void DiscoveryEngine::joinStragglers()
{
    auto stragglers = std::vector<std::future<Result<std::vector<Tool>>>> {};
    {
        auto const lock = std::scoped_lock(_mutex);
        stragglers.swap(_stragglers);
    }

    for (auto& future: stragglers)
    {
        if (future.valid())
            future.wait();
    }
}

} // namespace mcpgate
