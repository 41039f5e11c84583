// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace mcpgate::http
{

/// @brief A completed HTTP exchange.
struct Response
{
    long status = 0;
    std::string contentType;
    std::string body;
};

/// @brief Extra request headers, name to value.
using Headers = std::map<std::string, std::string>;

/// @brief Performs process-wide libcurl initialization exactly once.
void ensureInitialized();

/// @brief POSTs a JSON body and collects the full response.
///
/// Connection failures map to BackendUnreachable, an expired timeout to
/// Timeout, a dropped connection to ConnectionClosed. Non-2xx statuses are
/// reported as BackendUnreachable with the status and body excerpt.
/// @param url Target URL.
/// @param body The request body (JSON text).
/// @param headers Additional headers.
/// @param timeout Upper bound for the whole transfer.
[[nodiscard]] auto postJson(const std::string& url,
                            const std::string& body,
                            const Headers& headers,
                            std::chrono::milliseconds timeout) -> Result<Response>;

/// @brief Extracts the JSON-RPC message from an HTTP reply body.
///
/// Bodies framed as an event stream (starting with "event:" or "data:")
/// yield the first "data:" line; anything else is parsed as plain JSON.
[[nodiscard]] auto parseReplyBody(std::string_view body) -> Result<nlohmann::json>;

} // namespace mcpgate::http
