// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <functional>
#include <map>
#include <string>

namespace mcpgate
{

/// @brief Adjusts a backend definition once, after its working directory is resolved.
using BackendSetup = std::function<void(BackendDefinition&)>;

/// @brief Table of extra setup steps keyed by backend id.
class BackendExtensions
{
  public:
    /// @brief Returns the table with the built-in "memory" and "filesystem" entries.
    [[nodiscard]] static auto builtin() -> BackendExtensions;

    void add(std::string backendId, BackendSetup setup);

    [[nodiscard]] auto contains(const std::string& backendId) const -> bool;

    /// @brief Runs the setup registered for the backend's id, if any.
    void apply(BackendDefinition& backend) const;

  private:
    std::map<std::string, BackendSetup, std::less<>> _setups;
};

/// @brief Returns a copy of a directory-scoped backend bound to another directory.
///
/// The working directory and every argument that named the old directory are
/// replaced. Backends that are not directory-scoped are returned unchanged.
[[nodiscard]] auto scopeToDirectory(BackendDefinition backend, const std::string& directory) -> BackendDefinition;

} // namespace mcpgate
