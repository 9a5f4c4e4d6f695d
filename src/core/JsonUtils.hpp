// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <format>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace toolbridge::json
{

/// @brief Parses a JSON string, returning a Result.
/// @tparam JsonValue nlohmann::json, or nlohmann::ordered_json to keep the document's key order.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or ErrorCode::ProtocolError.
template <typename JsonValue = nlohmann::json>
[[nodiscard]] auto parse(std::string_view input) -> Result<JsonValue>
{
    try
    {
        return JsonValue::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
template <typename JsonValue>
[[nodiscard]] auto getString(const JsonValue& obj, std::string_view key) -> Result<std::string>
{
    auto const keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj.at(keyStr).is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj.at(keyStr).template get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
template <typename JsonValue>
[[nodiscard]] auto getStringOr(const JsonValue& obj, std::string_view key, std::string_view defaultValue)
    -> std::string
{
    auto const keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj.at(keyStr).is_string())
        return obj.at(keyStr).template get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
template <typename JsonValue>
[[nodiscard]] auto getIntOr(const JsonValue& obj, std::string_view key, int defaultValue) -> int
{
    auto const keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj.at(keyStr).is_number_integer())
        return obj.at(keyStr).template get<int>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
template <typename JsonValue>
[[nodiscard]] auto getBoolOr(const JsonValue& obj, std::string_view key, bool defaultValue) -> bool
{
    auto const keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj.at(keyStr).is_boolean())
        return obj.at(keyStr).template get<bool>();
    return defaultValue;
}

} // namespace toolbridge::json
