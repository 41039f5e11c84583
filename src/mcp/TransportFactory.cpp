// SPDX-License-Identifier: Apache-2.0
#include "TransportFactory.hpp"

#include <mcp/HttpTransport.hpp>
#include <mcp/SseTransport.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <format>

namespace mcpgate
{

namespace
{
    constexpr auto MaxSseHandshake = std::chrono::milliseconds(10'000);
} // namespace

auto DefaultTransportFactory::open(const BackendDefinition& backend, std::chrono::milliseconds timeout)
    -> Result<std::unique_ptr<Transport>>
{
    switch (backend.transport)
    {
        case TransportKind::Stdio: {
            auto transport = std::make_unique<StdioTransport>();
            auto config = StdioTransportConfig {
                .command = backend.command,
                .args = backend.args,
                .env = backend.env,
                .workingDirectory = backend.workingDirectory,
                .label = backend.id,
            };
            return transport->start(config).transform(
                [&]() -> std::unique_ptr<Transport> { return std::move(transport); });
        }
        case TransportKind::Http: {
            auto transport = std::make_unique<HttpTransport>();
            auto config = HttpTransportConfig {
                .url = backend.url,
                .headers = {},
                .requestTimeout = timeout,
                .label = backend.id,
            };
            return transport->start(std::move(config)).transform(
                [&]() -> std::unique_ptr<Transport> { return std::move(transport); });
        }
        case TransportKind::Sse: {
            auto transport = std::make_unique<SseTransport>();
            auto config = SseTransportConfig {
                .url = backend.url,
                .headers = {},
                .handshakeTimeout = std::min(timeout, MaxSseHandshake),
                .label = backend.id,
            };
            return transport->start(std::move(config)).transform(
                [&]() -> std::unique_ptr<Transport> { return std::move(transport); });
        }
    }

    return makeError(ErrorCode::ConfigError, std::format("Backend '{}' has an unknown transport", backend.id));
}

} // namespace mcpgate
