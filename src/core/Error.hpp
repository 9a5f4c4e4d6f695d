// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Error codes for categorizing failures across the client engine.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ProtocolError,
    InvalidState,
    SpawnFailed,
    WriteFailed,
    Disconnected,
    HandshakeFailed,
    ServerError,
    ToolNotFound,
    MissingRequiredParameter,
    InvalidParameterType,
    UnsupportedServerType,
    ConfigNotFound,
    ConfigInvalid,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// @brief JSON-RPC error code, set for ErrorCode::ServerError.
    std::optional<int> rpcCode {};
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
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Returns the symbolic name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) noexcept -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::SpawnFailed: return "SpawnFailed";
        case ErrorCode::WriteFailed: return "WriteFailed";
        case ErrorCode::Disconnected: return "Disconnected";
        case ErrorCode::HandshakeFailed: return "HandshakeFailed";
        case ErrorCode::ServerError: return "ServerError";
        case ErrorCode::ToolNotFound: return "ToolNotFound";
        case ErrorCode::MissingRequiredParameter: return "MissingRequiredParameter";
        case ErrorCode::InvalidParameterType: return "InvalidParameterType";
        case ErrorCode::UnsupportedServerType: return "UnsupportedServerType";
        case ErrorCode::ConfigNotFound: return "ConfigNotFound";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
    }
    return "Unknown";
}

} // namespace toolbridge

template <>
struct std::formatter<toolbridge::Error>: std::formatter<std::string>
{
    auto format(const toolbridge::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolbridge::errorCodeName(error.code), error.message), ctx);
    }
};
