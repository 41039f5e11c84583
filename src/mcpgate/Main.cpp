// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpgate/App.hpp>
#include <mcpgate/Config.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <format>

namespace
{

std::atomic<bool> stopRequested = false;

void onStopSignal(int /*signal*/)
{
    stopRequested = true;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpgate - MCP gateway aggregating stdio, HTTP and SSE tool servers" };

    auto configPath = std::string {};
    auto projectDir = std::string {};
    auto exportPath = std::string {};
    auto logLevel = std::string {};
    auto showStatus = false;
    auto noHealth = false;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to servers-config.json");
    app.add_option("-p,--project-dir", projectDir, "Project directory backends work in");
    app.add_option("--export-tools", exportPath, "Discover tools, write the catalog to a file ('-' for stdout) and exit");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("--status", showStatus, "Discover and check all backends, print their status and exit");
    app.add_flag("--no-health", noHealth, "Disable periodic health monitoring");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        mcpgate::log::setLevel(mcpgate::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = mcpgate::log::parseLevel(logLevel);
        if (!level)
        {
            mcpgate::log::error("Unknown log level: {}", logLevel);
            return 2;
        }
        mcpgate::log::setLevel(*level);
    }

    auto const project = mcpgate::resolveProjectDir(projectDir);
    auto const path = mcpgate::locateConfig(configPath, project);

    auto configResult = path ? mcpgate::loadConfigFromFile(*path, project)
                             : mcpgate::parseConfig("{}", project);
    if (!configResult)
    {
        mcpgate::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }
    if (!path)
        mcpgate::log::warning("No servers-config.json found, starting without backends");

    auto& config = *configResult;
    if (noHealth || showStatus || !exportPath.empty())
        config.options.health.enabled = false;

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    auto application = mcpgate::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mcpgate::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    if (!exportPath.empty())
    {
        if (auto exported = application.exportTools(exportPath); !exported)
        {
            mcpgate::log::error("{}", exported.error());
            return 1;
        }
        return 0;
    }

    if (showStatus)
        return application.printStatus();

    return application.run(stopRequested);
}
