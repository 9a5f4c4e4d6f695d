// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <future>
#include <memory>
#include <string_view>

namespace toolbridge
{

/// @brief Receives every incoming message that carries a method (notifications and server requests).
using MessageListener = std::function<void(const jsonrpc::Message& message)>;

/// @brief Invoked once when the transport stream ends without close() being called.
using ConnectionClosedCallback = std::function<void(const Error& reason)>;

/// @brief Request/response correlation over a newline-delimited JSON-RPC byte stream.
///
/// A reader thread drains the transport, splits the stream into frames and resolves the
/// pending request with the matching id. Responses may arrive in any order. Malformed frames
/// are logged and dropped. Listeners run on the reader thread.
class RpcConnection
{
  public:
    explicit RpcConnection(std::unique_ptr<Transport> transport);
    ~RpcConnection();

    RpcConnection(const RpcConnection&) = delete;
    RpcConnection& operator=(const RpcConnection&) = delete;

    /// @brief Starts the reader thread.
    void start();

    /// @brief Sends a request and returns a future for its response.
    ///
    /// The future holds the response envelope, which may carry a JSON-RPC error. It fails with
    /// ErrorCode::WriteFailed if the request could not be sent, and with ErrorCode::Disconnected
    /// if the connection goes away first. There is no timeout.
    [[nodiscard]] auto request(std::string_view method, nlohmann::json params = nullptr)
        -> std::future<Result<jsonrpc::Message>>;

    /// @brief Sends a notification. Nothing is awaited.
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Answers a request the server sent to us.
    [[nodiscard]] auto respond(std::string_view id, nlohmann::json result) -> VoidResult;

    /// @brief Rejects a request the server sent to us.
    [[nodiscard]] auto respondError(std::string_view id, int code, std::string_view message) -> VoidResult;

    void addListener(MessageListener listener);
    void setClosedCallback(ConnectionClosedCallback callback);

    /// @brief Appends received bytes and processes every complete frame.
    void handleIncoming(std::string_view bytes);

    /// @brief Fails all pending requests with ErrorCode::Disconnected and closes the transport.
    ///
    /// Idempotent. Must not be called while destroying the connection from one of its listeners.
    void close();

    [[nodiscard]] auto isOpen() const -> bool;
    [[nodiscard]] auto pendingCount() const -> size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
