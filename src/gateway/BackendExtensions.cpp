// SPDX-License-Identifier: Apache-2.0
#include "BackendExtensions.hpp"

#include <core/Log.hpp>

#include <filesystem>

namespace mcpgate
{

auto BackendExtensions::builtin() -> BackendExtensions
{
    auto extensions = BackendExtensions {};

    extensions.add("memory", [](BackendDefinition& backend) {
        if (!backend.env.contains("MEMORY_FILE_PATH"))
            backend.env["MEMORY_FILE_PATH"] = (std::filesystem::path(backend.workingDirectory) / "memory.json").string();
    });

    extensions.add("filesystem", [](BackendDefinition& backend) {
        backend.args.push_back(backend.workingDirectory);
        backend.directoryScoped = true;
    });

    return extensions;
}

void BackendExtensions::add(std::string backendId, BackendSetup setup)
{
    _setups.insert_or_assign(std::move(backendId), std::move(setup));
}

auto BackendExtensions::contains(const std::string& backendId) const -> bool
{
    return _setups.contains(backendId);
}

void BackendExtensions::apply(BackendDefinition& backend) const
{
    auto const it = _setups.find(backend.id);
    if (it == _setups.end())
        return;

    it->second(backend);
    log::debug("[{}] Applied backend extension", backend.id);
}

auto scopeToDirectory(BackendDefinition backend, const std::string& directory) -> BackendDefinition
{
    if (!backend.directoryScoped || directory.empty() || directory == backend.workingDirectory)
        return backend;

    for (auto& arg: backend.args)
    {
        if (arg == backend.workingDirectory)
            arg = directory;
    }
    backend.workingDirectory = directory;
    return backend;
}

} // namespace mcpgate
