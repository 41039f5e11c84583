// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <gateway/BackendExtensions.hpp>
#include <gateway/Gateway.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Top-level gateway configuration.
struct GatewayConfig
{
    /// Backends in ascending id order, with working directories resolved and extensions applied.
    std::vector<BackendDefinition> backends;
    GatewayOptions options;

    /// Path the configuration was loaded from, empty for defaults.
    std::string sourcePath;
};

/// @brief Turns a symbolic working directory into a concrete one.
///
/// "", "project_root" and "project" name the project directory itself;
/// absolute paths are kept; relative paths are taken relative to the project.
[[nodiscard]] auto resolveWorkingDirectory(std::string_view value, std::string_view projectDir) -> std::string;

/// @brief Replaces {{project_dir}}, {{working_dir}} and {{server_name}} placeholders.
[[nodiscard]] auto substituteTemplates(std::string_view text,
                                       std::string_view projectDir,
                                       std::string_view workingDir,
                                       std::string_view serverName) -> std::string;

/// @brief Parses configuration JSON text.
/// @param content The JSON document.
/// @param projectDir Directory relative working directories are resolved against.
/// @param extensions Setup table applied to each backend after resolution.
/// @return The configuration, or ConfigError.
[[nodiscard]] auto parseConfig(std::string_view content,
                               std::string_view projectDir,
                               const BackendExtensions& extensions = BackendExtensions::builtin())
    -> Result<GatewayConfig>;

/// @brief Loads the configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path,
                                      std::string_view projectDir,
                                      const BackendExtensions& extensions = BackendExtensions::builtin())
    -> Result<GatewayConfig>;

/// @brief Finds the configuration file to use.
///
/// Checks, in order: the explicit path, $MCPGATE_CONFIG,
/// <projectDir>/servers-config.json, then the user config directory.
/// An explicit path is returned even if it does not exist.
/// @return The path, or std::nullopt if no candidate exists.
[[nodiscard]] auto locateConfig(std::string_view explicitPath, std::string_view projectDir)
    -> std::optional<std::string>;

/// @brief Returns the project directory: the explicit value, $MCPGATE_PROJECT_DIR, or the current directory.
[[nodiscard]] auto resolveProjectDir(std::string_view explicitDir) -> std::string;

/// @brief Returns the default config directory ($XDG_CONFIG_HOME/mcpgate or ~/.config/mcpgate).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path inside defaultConfigDir().
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcpgate
