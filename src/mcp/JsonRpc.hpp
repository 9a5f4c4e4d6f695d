// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace toolbridge::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error object.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief A parsed JSON-RPC 2.0 envelope: request, notification, or response.
struct Message
{
    /// @brief Request id normalized to a string. Absent for notifications.
    std::optional<std::string> id;
    std::string method;
    nlohmann::json params;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] auto isResponse() const -> bool { return result.has_value() || error.has_value(); }
    [[nodiscard]] auto isRequest() const -> bool { return !method.empty() && id.has_value(); }
    [[nodiscard]] auto isNotification() const -> bool { return !method.empty() && !id.has_value(); }

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value() && !error.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(std::string_view id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 success response.
[[nodiscard]] auto makeResult(std::string_view id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(std::string_view id, int code, std::string_view message) -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 envelope.
///
/// Numeric ids are normalized to their decimal string form.
/// @param message The JSON message to parse.
/// @return The parsed message or ErrorCode::ProtocolError.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

/// @brief Serializes a message as one newline-terminated frame.
[[nodiscard]] auto encodeFrame(const nlohmann::json& message) -> std::string;

} // namespace toolbridge::jsonrpc
