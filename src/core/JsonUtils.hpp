// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcpgate::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns true if the text can be parsed as JSON, without building a document.
[[nodiscard]] inline auto looksLikeJson(std::string_view input) -> bool
{
    return nlohmann::json::accept(input);
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::InvalidArgument, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_number())
        return it->get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Extracts an array of strings. Non-string elements are skipped.
/// @return The strings, or an empty vector if the field is missing or not an array.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_array())
        return result;
    for (const auto& item: *it)
    {
        if (item.is_string())
            result.push_back(item.get<std::string>());
    }
    return result;
}

/// @brief Extracts an object of string values, e.g. an environment block.
/// Numbers and booleans are stringified, other values are skipped.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_object())
        return result;
    for (const auto& [name, value]: it->items())
    {
        if (value.is_string())
            result[name] = value.get<std::string>();
        else if (value.is_number() || value.is_boolean())
            result[name] = value.dump();
    }
    return result;
}

} // namespace mcpgate::json
