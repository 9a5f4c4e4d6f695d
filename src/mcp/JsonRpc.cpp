// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolbridge::jsonrpc
{

auto makeRequest(std::string_view id, std::string_view method, nlohmann::json params) -> nlohmann::json
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

auto makeResult(std::string_view id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(std::string_view id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto parsed = Message {};

    if (message.contains("id"))
    {
        auto const& id = message["id"];
        if (id.is_string())
            parsed.id = id.get<std::string>();
        else if (id.is_number_integer())
            parsed.id = std::format("{}", id.get<std::int64_t>());
        else if (!id.is_null())
            return makeError(ErrorCode::ProtocolError, std::format("Unsupported JSON-RPC id: {}", id.dump()));
    }

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC method must be a string");
        parsed.method = message["method"].get<std::string>();
        parsed.params = message.value("params", nlohmann::json {});
    }

    if (message.contains("result"))
    {
        parsed.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error must be an object");
        parsed.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (parsed.method.empty())
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return parsed;
}

auto encodeFrame(const nlohmann::json& message) -> std::string
{
    return message.dump() + "\n";
}

} // namespace toolbridge::jsonrpc
