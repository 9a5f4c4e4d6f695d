// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ToolRegistry.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Configuration for a single MCP server, as read from the configuration file.
struct McpServerConfig
{
    std::string name;

    /// @brief Only "stdio" is supported.
    std::string type = "stdio";
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Lifecycle of a client session.
enum class SessionState : std::uint8_t
{
    Disconnected,
    Connecting,
    Handshaking,
    Discovering,
    Ready,
    Error,
};

[[nodiscard]] auto sessionStateName(SessionState state) -> std::string_view;

struct SessionOptions
{
    std::string clientName = "toolbridge";
    std::string clientVersion = "1.0.0";
    std::string protocolVersion = "2024-11-05";

    /// @brief Upper bound for each request made while starting (initialize, tools/list) and for ping().
    std::chrono::milliseconds handshakeTimeout { 30000 };

    /// @brief Whether to call a help/list tool after listing tools.
    bool discoverHelpText = true;
};

/// @brief Host hooks. All are optional and may be invoked from the connection's reader thread.
struct SessionCallbacks
{
    std::function<void(SessionState state, std::string_view status)> onStateChanged;
    std::function<void(std::string_view message)> onProgress;
    std::function<void(const std::vector<std::string>& toolNames)> onToolsChanged;
};

/// @brief Drives one MCP server from spawn to ready and issues tool calls.
///
/// start() blocks through spawn, handshake and discovery. Discovered parameters are written to
/// the ToolRegistry passed at construction, which must outlive the session.
class McpClientSession
{
  public:
    explicit McpClientSession(ToolRegistry& registry, SessionOptions options = {}, SessionCallbacks callbacks = {});
    ~McpClientSession();

    McpClientSession(const McpClientSession&) = delete;
    McpClientSession& operator=(const McpClientSession&) = delete;

    /// @brief Spawns the configured server and runs handshake and discovery.
    /// @return Success once the session is ready, or the error that moved it to SessionState::Error.
    [[nodiscard]] auto start(const McpServerConfig& config) -> VoidResult;

    /// @brief Runs handshake and discovery over an already connected transport.
    /// @param serverName Fallback name used until the server reports its own.
    [[nodiscard]] auto start(std::string serverName, std::unique_ptr<Transport> transport) -> VoidResult;

    /// @brief Calls a tool with free-form input.
    ///
    /// The argument name comes from the registry and the value is converted to the parameter's
    /// declared type. Parameterless tools get an empty argument object. A registered sub-action
    /// is routed to its umbrella tool as "<action> <input>".
    [[nodiscard]] auto callTool(std::string_view name, std::string_view input) -> Result<ToolCallResult>;

    /// @brief Calls a tool with an explicit argument object, validated against its schema.
    [[nodiscard]] auto callToolWithArguments(std::string_view name, const nlohmann::json& arguments)
        -> Result<ToolCallResult>;

    /// @brief Sends a ping request and waits for the reply.
    [[nodiscard]] auto ping() -> VoidResult;

    /// @brief Sends a disconnect notification, stops the server and returns to SessionState::Disconnected.
    ///
    /// Idempotent.
    void stop();

    [[nodiscard]] auto state() const -> SessionState;
    [[nodiscard]] auto lastError() const -> std::optional<Error>;

    /// @brief Name reported by the server during the handshake, else the configured name.
    [[nodiscard]] auto serverName() const -> std::string;
    [[nodiscard]] auto serverVersion() const -> std::string;

    [[nodiscard]] auto tools() const -> std::vector<ToolDescriptor>;
    [[nodiscard]] auto registry() const -> const ToolRegistry&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Decodes the result object of a tools/call response.
[[nodiscard]] auto decodeToolCallResult(const nlohmann::json& result) -> ToolCallResult;

/// @brief Converts free-form text to a JSON value of the given schema type.
///
/// Values that cannot be converted stay strings.
[[nodiscard]] auto convertArgument(std::string_view type, std::string_view text) -> nlohmann::json;

} // namespace toolbridge
