// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Error codes for categorizing failures across the gateway.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProtocolError,
    ToolCallError,

    // Backend connection failures.
    BackendUnreachable,
    Timeout,
    ProtocolDesync,
    ConnectionClosed,

    // Routing failures.
    UnresolvableToolName,
    EmptyToolName,
    BackendNotFound,
    CircuitOpen,
};

/// @brief Returns the symbolic name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::ToolCallError: return "ToolCallError";
        case ErrorCode::BackendUnreachable: return "BackendUnreachable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ProtocolDesync: return "ProtocolDesync";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::UnresolvableToolName: return "UnresolvableToolName";
        case ErrorCode::EmptyToolName: return "EmptyToolName";
        case ErrorCode::BackendNotFound: return "BackendNotFound";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace mcpgate

template <>
struct std::formatter<mcpgate::Error>: std::formatter<std::string>
{
    auto format(const mcpgate::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpgate::errorCodeName(error.code), error.message), ctx);
    }
};
