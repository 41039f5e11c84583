// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <gateway/ToolCatalog.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief The backend and backend-native tool name a client-visible name maps to.
struct ResolvedTool
{
    std::string backendId;
    std::string toolName;

    /// True when the tool name came from the catalog rather than the literal remainder.
    bool fromCatalog = false;
};

/// @brief Maps a client-visible tool name back to its backend and original tool name.
///
/// Underscore positions are scanned left to right; the first prefix equal to a
/// normalized known backend id selects the backend. The catalog then supplies the
/// tool name the backend actually expects. Without a catalog entry the literal
/// remainder is used.
///
/// @param name The client-visible name, e.g. "context7_resolve_library_id".
/// @param knownBackendIds Identifiers of all configured backends.
/// @param catalog The current tool catalog.
/// @return The resolved tool, EmptyToolName, or UnresolvableToolName.
[[nodiscard]] auto resolveToolName(std::string_view name,
                                   const std::vector<std::string>& knownBackendIds,
                                   const ToolCatalog& catalog) -> Result<ResolvedTool>;

} // namespace mcpgate
