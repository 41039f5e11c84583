// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <gateway/Gateway.hpp>
#include <mcpgate/StdioServer.hpp>

#include <format>
#include <fstream>
#include <print>

#include <unistd.h>

namespace mcpgate
{

struct App::Impl
{
    GatewayConfig config;
    std::unique_ptr<Gateway> gateway;
};

App::App(GatewayConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App()
{
    if (_impl->gateway)
        _impl->gateway->shutdown();
}

auto App::initialize() -> VoidResult
{
    auto const& config = _impl->config;
    if (config.backends.empty())
        log::warning("No backends configured{}",
                     config.sourcePath.empty() ? std::string {} : std::format(" in {}", config.sourcePath));

    log::info("Project directory: {}", config.options.projectDir);
    _impl->gateway = std::make_unique<Gateway>(config.backends, config.options);

    auto const report = _impl->gateway->start();
    log::info("{} of {} backends ready, {} tools in catalog",
              report.succeededCount(),
              report.outcomes.size(),
              _impl->gateway->catalog().size());
    return {};
}

auto App::run(const std::atomic<bool>& stopRequested) -> int
{
    if (!_impl->gateway)
        return 1;

    auto server = StdioServer(*_impl->gateway, STDIN_FILENO, STDOUT_FILENO);
    auto const exitCode = server.run(stopRequested);
    _impl->gateway->shutdown();
    return exitCode;
}

auto App::exportTools(std::string_view path) -> VoidResult
{
    if (!_impl->gateway)
        return makeError(ErrorCode::InvalidArgument, "Gateway is not initialized");

    auto const text = _impl->gateway->exportCatalog().dump(2);
    if (path == "-")
    {
        std::println("{}", text);
        return {};
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write tool export: {}", path));

    file << text << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed writing tool export: {}", path));

    log::info("Exported {} tools to {}", _impl->gateway->catalog().size(), path);
    return {};
}

auto App::printStatus() -> int
{
    if (!_impl->gateway)
        return 1;

    _impl->gateway->checkAll();
    std::println("{}", _impl->gateway->statusSnapshot().dump(2));
    return 0;
}

} // namespace mcpgate
