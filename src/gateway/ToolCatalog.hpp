// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Replaces separator punctuation ('-', '.', ' ', '/') in a backend id with '_'.
[[nodiscard]] auto normalizeBackendId(std::string_view backendId) -> std::string;

/// @brief Builds the client-visible key "<normalized backend id>_<tool name>".
/// The tool name is kept exactly as the backend reported it.
[[nodiscard]] auto makeCatalogKey(std::string_view backendId, std::string_view toolName) -> std::string;

/// @brief Returns the key as clients that rewrite hyphens would send it back.
[[nodiscard]] auto clientSanitizedKey(std::string_view key) -> std::string;

/// @brief The aggregated client-visible tool catalog.
///
/// Many readers, one writer. Construction is deterministic: tools are
/// merged in ascending (backend id, tool name) order and when two tools
/// map to the same key the one merged last wins, with a warning.
class ToolCatalog
{
  public:
    /// @brief Replaces the whole catalog with the given tools.
    void replaceAll(std::vector<Tool> tools);

    /// @brief Replaces the tools of one backend, keeping every other backend's tools.
    void replaceBackend(std::string_view backendId, std::vector<Tool> tools);

    /// @brief Looks up a tool by client-visible key.
    ///
    /// Falls back to the hyphen-rewritten alias when the exact key is unknown,
    /// so "context7_resolve_library_id" finds "context7_resolve-library-id".
    [[nodiscard]] auto find(std::string_view key) const -> std::optional<Tool>;

    /// @brief Returns all entries ordered by key.
    [[nodiscard]] auto entries() const -> std::vector<std::pair<std::string, Tool>>;

    /// @brief Returns the tools owned by one backend.
    [[nodiscard]] auto toolsFor(std::string_view backendId) const -> std::vector<Tool>;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto empty() const -> bool;

    /// @brief Renders the catalog as the "tools" array of a tools/list result.
    [[nodiscard]] auto toToolList() const -> nlohmann::json;

    /// @brief Renders the catalog for export, including owning backends and native names.
    [[nodiscard]] auto toExportJson() const -> nlohmann::json;

  private:
    void rebuild(std::vector<Tool> tools);

    mutable std::shared_mutex _mutex;
    std::map<std::string, Tool, std::less<>> _entries;
    std::map<std::string, std::string, std::less<>> _aliases;
};

} // namespace mcpgate
