// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Abstract duplex byte channel to an MCP server.
///
/// Framing is not the transport's concern; RpcConnection splits the byte stream into messages.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Writes raw bytes to the server.
    /// @param bytes The bytes to write.
    /// @return Success or ErrorCode::WriteFailed.
    [[nodiscard]] virtual auto write(std::string_view bytes) -> VoidResult = 0;

    /// @brief Blocks until the next chunk of output is available.
    ///
    /// Repeated calls form the output stream. The stream ends with ErrorCode::Disconnected
    /// once the server exits, the pipe closes, or close() is called.
    /// @return A non-empty chunk of bytes or an error.
    [[nodiscard]] virtual auto read() -> Result<std::string> = 0;

    /// @brief Closes the transport. Idempotent and unblocks a pending read().
    virtual void close() noexcept = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolbridge
