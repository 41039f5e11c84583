// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief How the gateway reaches a backend.
enum class TransportKind
{
    Stdio,
    Http,
    Sse,
};

/// @brief Converts a TransportKind enum to its configuration string.
[[nodiscard]] constexpr auto transportKindToString(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
        case TransportKind::Sse: return "sse";
    }
    return "unknown";
}

/// @brief Parses a configuration string to a TransportKind.
/// "subprocess" is accepted as an alias for "stdio".
/// @return The kind, or std::nullopt for an unknown string.
[[nodiscard]] constexpr auto transportKindFromString(std::string_view str) -> std::optional<TransportKind>
{
    if (str == "stdio" || str == "subprocess")
        return TransportKind::Stdio;
    if (str == "http")
        return TransportKind::Http;
    if (str == "sse")
        return TransportKind::Sse;
    return std::nullopt;
}

/// @brief Static description of one backend, as loaded from configuration.
struct BackendDefinition
{
    std::string id;
    std::string name;
    std::string description;
    TransportKind transport = TransportKind::Stdio;
    std::string command;
    std::vector<std::string> args;
    std::string url;
    std::map<std::string, std::string> env;

    /// Concrete working directory, already resolved against the project directory.
    std::string workingDirectory;

    /// Discovery allowance override in seconds (0 = use the gateway default).
    int timeoutSeconds = 0;

    /// A directory-scoped backend is reopened whenever a caller supplies its own directory.
    bool directoryScoped = false;
};

/// @brief A capability discovered on a backend.
struct Tool
{
    /// Backend-native name, exactly as the backend reported it.
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    std::string backendId;
};

} // namespace mcpgate
