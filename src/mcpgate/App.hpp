// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcpgate/Config.hpp>

#include <atomic>
#include <memory>
#include <string_view>

namespace mcpgate
{

/// @brief Wires configuration, gateway and stdio server together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    explicit App(GatewayConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Creates the gateway and runs discovery across all backends.
    /// @return Success, or an error if no backend is configured.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves JSON-RPC on stdin/stdout until end of input or a stop request.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(const std::atomic<bool>& stopRequested) -> int;

    /// @brief Writes the discovered catalog as JSON to the given file ("-" for stdout).
    [[nodiscard]] auto exportTools(std::string_view path) -> VoidResult;

    /// @brief Checks every backend once and prints the status snapshot to stdout.
    [[nodiscard]] auto printStatus() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
