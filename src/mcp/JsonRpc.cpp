// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpgate::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto isReply(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("id") && !message.contains("method")
           && (message.contains("result") || message.contains("error"));
}

auto isNotification(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("method") && !message.contains("id");
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC reply has neither result nor error");
    }

    return response;
}

auto parseRequest(const nlohmann::json& message) -> Result<Request>
{
    if (!message.is_object())
        return makeError(ErrorCode::InvalidArgument, "JSON-RPC request must be an object");

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::InvalidArgument, "Missing or unsupported jsonrpc version");

    if (!message.contains("method") || !message["method"].is_string())
        return makeError(ErrorCode::InvalidArgument, "Missing method");

    auto request = Request {
        .id = message.value("id", nlohmann::json {}),
        .method = message["method"].get<std::string>(),
        .params = message.value("params", nlohmann::json::object()),
    };

    if (!request.id.is_null() && !request.id.is_string() && !request.id.is_number_integer())
        return makeError(ErrorCode::InvalidArgument, "Request id must be a string or an integer");

    return request;
}

} // namespace mcpgate::jsonrpc
