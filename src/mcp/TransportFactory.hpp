// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

namespace mcpgate
{

/// @brief Opens stdio, HTTP or SSE transports according to the backend's transport kind.
class DefaultTransportFactory: public TransportFactory
{
  public:
    [[nodiscard]] auto open(const BackendDefinition& backend, std::chrono::milliseconds timeout)
        -> Result<std::unique_ptr<Transport>> override;
};

} // namespace mcpgate
