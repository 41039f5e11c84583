// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <mutex>

namespace mcpgate
{

auto normalizeBackendId(std::string_view backendId) -> std::string
{
    auto result = std::string(backendId);
    std::ranges::replace_if(result, [](char c) { return c == '-' || c == '.' || c == ' ' || c == '/'; }, '_');
    return result;
}

auto makeCatalogKey(std::string_view backendId, std::string_view toolName) -> std::string
{
    return std::format("{}_{}", normalizeBackendId(backendId), toolName);
}

auto clientSanitizedKey(std::string_view key) -> std::string
{
    auto result = std::string(key);
    std::ranges::replace(result, '-', '_');
    return result;
}

void ToolCatalog::replaceAll(std::vector<Tool> tools)
{
    auto const lock = std::unique_lock(_mutex);
    rebuild(std::move(tools));
}

void ToolCatalog::replaceBackend(std::string_view backendId, std::vector<Tool> tools)
{
    auto const lock = std::unique_lock(_mutex);

    for (auto const& [key, tool]: _entries)
    {
        if (tool.backendId != backendId)
            tools.push_back(tool);
    }
    rebuild(std::move(tools));
}

void ToolCatalog::rebuild(std::vector<Tool> tools)
{
    std::ranges::stable_sort(tools, [](const Tool& a, const Tool& b) {
        return std::tie(a.backendId, a.name) < std::tie(b.backendId, b.name);
    });

    _entries.clear();
    _aliases.clear();

    for (auto& tool: tools)
    {
        auto key = makeCatalogKey(tool.backendId, tool.name);
        if (auto const it = _entries.find(key); it != _entries.end())
        {
            log::warning("Catalog key '{}' of backend '{}' replaces the tool registered by backend '{}'",
                         key,
                         tool.backendId,
                         it->second.backendId);
        }
        _entries.insert_or_assign(std::move(key), std::move(tool));
    }

    for (auto const& [key, tool]: _entries)
    {
        auto alias = clientSanitizedKey(key);
        if (alias != key && !_entries.contains(alias))
            _aliases.insert_or_assign(std::move(alias), key);
    }
}

auto ToolCatalog::find(std::string_view key) const -> std::optional<Tool>
{
    auto const lock = std::shared_lock(_mutex);

    if (auto const it = _entries.find(key); it != _entries.end())
        return it->second;

    if (auto const alias = _aliases.find(key); alias != _aliases.end())
    {
        if (auto const it = _entries.find(alias->second); it != _entries.end())
            return it->second;
    }

    return std::nullopt;
}

auto ToolCatalog::entries() const -> std::vector<std::pair<std::string, Tool>>
{
    auto const lock = std::shared_lock(_mutex);
    return { _entries.begin(), _entries.end() };
}

auto ToolCatalog::toolsFor(std::string_view backendId) const -> std::vector<Tool>
{
    auto const lock = std::shared_lock(_mutex);
    auto result = std::vector<Tool> {};
    for (auto const& [key, tool]: _entries)
    {
        if (tool.backendId == backendId)
            result.push_back(tool);
    }
    return result;
}

auto ToolCatalog::size() const -> size_t
{
    auto const lock = std::shared_lock(_mutex);
    return _entries.size();
}

auto ToolCatalog::empty() const -> bool
{
    return size() == 0;
}

auto ToolCatalog::toToolList() const -> nlohmann::json
{
    auto const lock = std::shared_lock(_mutex);
    auto tools = nlohmann::json::array();
    for (auto const& [key, tool]: _entries)
    {
        tools.push_back(nlohmann::json {
            { "name", key },
            { "description", tool.description },
            { "inputSchema", tool.inputSchema.is_null() ? nlohmann::json::object() : tool.inputSchema },
        });
    }
    return tools;
}

auto ToolCatalog::toExportJson() const -> nlohmann::json
{
    auto const lock = std::shared_lock(_mutex);
    auto tools = nlohmann::json::array();
    auto perBackend = nlohmann::json::object();

    for (auto const& [key, tool]: _entries)
    {
        tools.push_back(nlohmann::json {
            { "name", key },
            { "backend", tool.backendId },
            { "originalName", tool.name },
            { "description", tool.description },
            { "inputSchema", tool.inputSchema.is_null() ? nlohmann::json::object() : tool.inputSchema },
        });
        perBackend[tool.backendId] = perBackend.value(tool.backendId, 0) + 1;
    }

    return nlohmann::json {
        { "tools", std::move(tools) },
        { "backends", std::move(perBackend) },
        { "count", _entries.size() },
    };
}

} // namespace mcpgate
