// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpgate
{

namespace
{
    constexpr auto ConfigFileName = std::string_view { "servers-config.json" };

    void replaceAll(std::string& text, std::string_view from, std::string_view to)
    {
        for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size()))
            text.replace(pos, from.size(), to);
    }

    auto secondsOr(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> std::chrono::milliseconds
    {
        auto const seconds = json::getDoubleOr(obj, key, -1.0);
        if (seconds < 0.0)
            return defaultValue;
        return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
    }

    auto millisOr(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> std::chrono::milliseconds
    {
        auto const millis = json::getIntOr(obj, key, -1);
        return millis < 0 ? defaultValue : std::chrono::milliseconds(millis);
    }

    auto parseHealth(const nlohmann::json& obj) -> HealthConfig
    {
        auto config = HealthConfig {};
        config.enabled = json::getBoolOr(obj, "enabled", config.enabled);
        config.checkInterval = secondsOr(obj, "checkIntervalSeconds", config.checkInterval);
        config.checkTimeout = secondsOr(obj, "checkTimeoutSeconds", config.checkTimeout);
        config.failureThreshold = json::getIntOr(obj, "failureThreshold", config.failureThreshold);
        config.recoveryThreshold = json::getIntOr(obj, "recoveryThreshold", config.recoveryThreshold);
        config.maxRestartAttempts = json::getIntOr(obj, "maxRestartAttempts", config.maxRestartAttempts);
        return config;
    }

    auto parseRecovery(const nlohmann::json& obj) -> RecoveryConfig
    {
        auto config = RecoveryConfig {};
        config.baseDelay = millisOr(obj, "baseDelayMs", config.baseDelay);
        config.maxDelay = millisOr(obj, "maxDelayMs", config.maxDelay);
        config.backoffMultiplier = json::getDoubleOr(obj, "backoffMultiplier", config.backoffMultiplier);
        config.circuitBreakerThreshold = json::getIntOr(obj, "circuitBreakerThreshold", config.circuitBreakerThreshold);
        config.circuitBreakerReset = secondsOr(obj, "circuitBreakerResetSeconds", config.circuitBreakerReset);
        config.restartTimeout = secondsOr(obj, "restartTimeoutSeconds", config.restartTimeout);
        return config;
    }

    auto parseBackend(const std::string& id, const nlohmann::json& obj, std::string_view projectDir)
        -> Result<BackendDefinition>
    {
        if (!obj.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' must be a JSON object", id));

        auto const transportName = json::getStringOr(obj, "transport", "stdio");
        auto const transport = transportKindFromString(transportName);
        if (!transport)
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}' has unknown transport '{}'", id, transportName));

        auto backend = BackendDefinition {
            .id = id,
            .name = json::getStringOr(obj, "name", id),
            .description = json::getStringOr(obj, "description", ""),
            .transport = *transport,
            .command = json::getStringOr(obj, "command", ""),
            .args = json::getStringArray(obj, "args"),
            .url = json::getStringOr(obj, "url", ""),
            .env = json::getStringMap(obj, "env"),
            .workingDirectory = resolveWorkingDirectory(json::getStringOr(obj, "workingDirectory", ""), projectDir),
            .timeoutSeconds = json::getIntOr(obj, "timeoutSeconds", 0),
        };

        for (auto& arg: backend.args)
            arg = substituteTemplates(arg, projectDir, backend.workingDirectory, id);
        for (auto& [key, value]: backend.env)
            value = substituteTemplates(value, projectDir, backend.workingDirectory, id);
        backend.url = substituteTemplates(backend.url, projectDir, backend.workingDirectory, id);

        if (backend.transport == TransportKind::Stdio && backend.command.empty())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' uses stdio but has no command", id));
        if (backend.transport != TransportKind::Stdio && backend.url.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}' uses {} but has no url",
                                         id,
                                         transportKindToString(backend.transport)));

        return backend;
    }
} // namespace

auto resolveWorkingDirectory(std::string_view value, std::string_view projectDir) -> std::string
{
    if (value.empty() || value == "project_root" || value == "project")
        return std::string(projectDir);

    auto const path = std::filesystem::path(value);
    if (path.is_absolute())
        return path.string();

    return (std::filesystem::path(projectDir) / path).lexically_normal().string();
}

auto substituteTemplates(std::string_view text,
                         std::string_view projectDir,
                         std::string_view workingDir,
                         std::string_view serverName) -> std::string
{
    auto result = std::string(text);
    if (result.find("{{") == std::string::npos)
        return result;

    replaceAll(result, "{{project_dir}}", projectDir);
    replaceAll(result, "{{working_dir}}", workingDir);
    replaceAll(result, "{{server_name}}", serverName);
    return result;
}

auto parseConfig(std::string_view content, std::string_view projectDir, const BackendExtensions& extensions)
    -> Result<GatewayConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = GatewayConfig {};
    config.options.projectDir = std::string(projectDir);

    // Gateway section
    if (auto const gateway = root.find("gateway"); gateway != root.end() && gateway->is_object())
    {
        auto& options = config.options;
        options.discoveryTimeout = secondsOr(*gateway, "discoveryTimeoutSeconds", options.discoveryTimeout);
        options.callTimeout = secondsOr(*gateway, "callTimeoutSeconds", options.callTimeout);
        options.handshakeTimeout = secondsOr(*gateway, "handshakeTimeoutSeconds", options.handshakeTimeout);
        options.injectProjectRoot = json::getBoolOr(*gateway, "injectProjectRoot", options.injectProjectRoot);

        if (auto const health = gateway->find("health"); health != gateway->end())
            options.health = parseHealth(*health);
        if (auto const recovery = gateway->find("recovery"); recovery != gateway->end())
            options.recovery = parseRecovery(*recovery);
    }

    // Servers section; std::map iteration keeps backends in ascending id order.
    auto const servers = root.find("servers");
    if (servers == root.end())
        return config;
    if (!servers->is_object())
        return makeError(ErrorCode::ConfigError, "'servers' must be a JSON object");

    auto ordered = std::map<std::string, nlohmann::json> {};
    for (auto const& [id, serverJson]: servers->items())
        ordered.emplace(id, serverJson);

    for (auto const& [id, serverJson]: ordered)
    {
        if (!json::getBoolOr(serverJson, "enabled", true))
        {
            log::debug("[{}] Disabled in configuration", id);
            continue;
        }

        auto backend = parseBackend(id, serverJson, projectDir);
        if (!backend)
            return std::unexpected(backend.error());

        extensions.apply(*backend);
        config.backends.push_back(std::move(*backend));
    }

    return config;
}

auto loadConfigFromFile(std::string_view path, std::string_view projectDir, const BackendExtensions& extensions)
    -> Result<GatewayConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str(), projectDir, extensions);
    if (!config)
        return makeError(config.error().code, std::format("{}: {}", path, config.error().message));

    config->sourcePath = std::string(path);
    log::info("Loaded {} backends from {}", config->backends.size(), path);
    return config;
}

auto locateConfig(std::string_view explicitPath, std::string_view projectDir) -> std::optional<std::string>
{
    if (!explicitPath.empty())
        return std::string(explicitPath);

    auto ec = std::error_code {};

    if (auto const* const fromEnv = std::getenv("MCPGATE_CONFIG"); fromEnv && *fromEnv)
    {
        if (std::filesystem::exists(fromEnv, ec))
            return std::string(fromEnv);
        log::warning("MCPGATE_CONFIG points to a missing file: {}", fromEnv);
    }

    if (!projectDir.empty())
    {
        auto const inProject = std::filesystem::path(projectDir) / ConfigFileName;
        if (std::filesystem::exists(inProject, ec))
            return inProject.string();
    }

    if (auto const userPath = defaultConfigPath(); std::filesystem::exists(userPath, ec))
        return userPath;

    return std::nullopt;
}

auto resolveProjectDir(std::string_view explicitDir) -> std::string
{
    auto ec = std::error_code {};

    if (!explicitDir.empty())
        return std::filesystem::absolute(explicitDir, ec).lexically_normal().string();

    if (auto const* const fromEnv = std::getenv("MCPGATE_PROJECT_DIR"); fromEnv && *fromEnv)
        return std::filesystem::absolute(fromEnv, ec).lexically_normal().string();

    auto current = std::filesystem::current_path(ec);
    return ec ? std::string(".") : current.string();
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcpgate";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpgate";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return std::format("{}/{}", defaultConfigDir(), ConfigFileName);
}

} // namespace mcpgate
