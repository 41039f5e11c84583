// SPDX-License-Identifier: Apache-2.0
#include "ToolNameResolver.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcpgate
{

namespace
{
    auto joinIds(const std::vector<std::string>& ids) -> std::string
    {
        auto result = std::string {};
        for (auto const& id: ids)
        {
            if (!result.empty())
                result += ", ";
            result += id;
        }
        return result.empty() ? std::string("(none)") : result;
    }
} // namespace

auto resolveToolName(std::string_view name, const std::vector<std::string>& knownBackendIds, const ToolCatalog& catalog)
    -> Result<ResolvedTool>
{
    if (name.empty())
        return makeError(ErrorCode::EmptyToolName, "Tool name is empty");

    for (auto pos = name.find('_'); pos != std::string_view::npos; pos = name.find('_', pos + 1))
    {
        auto const prefix = name.substr(0, pos);

        for (auto const& backendId: knownBackendIds)
        {
            if (normalizeBackendId(backendId) != prefix)
                continue;

            if (auto const tool = catalog.find(name))
            {
                return ResolvedTool {
                    .backendId = tool->backendId,
                    .toolName = tool->name,
                    .fromCatalog = true,
                };
            }

            auto remainder = std::string(name.substr(pos + 1));
            if (remainder.empty())
                continue;

            log::warning("Tool '{}' is not in the catalog, forwarding '{}' to backend '{}' as-is",
                         name,
                         remainder,
                         backendId);
            return ResolvedTool {
                .backendId = backendId,
                .toolName = std::move(remainder),
                .fromCatalog = false,
            };
        }
    }

    return makeError(ErrorCode::UnresolvableToolName,
                     std::format("No matching backend found for tool '{}' among: {}", name, joinIds(knownBackendIds)));
}

} // namespace mcpgate
