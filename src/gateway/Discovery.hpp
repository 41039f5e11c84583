// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Performs the handshake with one backend and returns its tools.
/// Implementations must bound all I/O by the given timeout.
using BackendDiscoverer =
    std::function<Result<std::vector<Tool>>(const BackendDefinition& backend, std::chrono::milliseconds timeout)>;

/// @brief Discovery result for one backend.
struct DiscoveryOutcome
{
    std::string backendId;
    std::vector<Tool> tools;
    std::optional<Error> error;
    std::chrono::milliseconds elapsed { 0 };

    [[nodiscard]] auto succeeded() const -> bool { return !error.has_value(); }
};

/// @brief Results of a discovery pass, one outcome per backend in input order.
struct DiscoveryReport
{
    std::vector<DiscoveryOutcome> outcomes;

    /// @brief Returns the tools of every successful backend.
    [[nodiscard]] auto tools() const -> std::vector<Tool>;

    [[nodiscard]] auto succeededCount() const -> size_t;
};

/// @brief Runs discovery for all backends concurrently, each under its own deadline.
///
/// A backend that fails or misses its deadline contributes no tools and never
/// delays the others beyond its own deadline. Tasks that outlive their deadline
/// are joined later, at the latest on destruction.
class DiscoveryEngine
{
  public:
    static constexpr auto DefaultTimeout = std::chrono::milliseconds(45'000);
    static constexpr auto ContainerTimeout = std::chrono::milliseconds(90'000);

    explicit DiscoveryEngine(BackendDiscoverer discoverer, std::chrono::milliseconds defaultTimeout = DefaultTimeout);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /// @brief Returns the discovery allowance for a backend.
    ///
    /// An explicit per-backend timeout wins; container-launched backends
    /// (docker, podman) get a longer allowance than the default.
    [[nodiscard]] auto timeoutFor(const BackendDefinition& backend) const -> std::chrono::milliseconds;

    [[nodiscard]] auto discoverAll(const std::vector<BackendDefinition>& backends) -> DiscoveryReport;

    /// @brief Waits for tasks left running by earlier passes.
    void joinStragglers();

  private:
    BackendDiscoverer _discoverer;
    std::chrono::milliseconds _defaultTimeout;

    std::mutex _mutex;
    std::vector<std::future<Result<std::vector<Tool>>>> _stragglers;
};

} // namespace mcpgate
