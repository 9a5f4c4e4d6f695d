// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Configuration for spawning an MCP server process.
struct ProcessConfig
{
    /// @brief Label used for diagnostics (server stderr lines are prefixed with it).
    std::string name;
    std::string command;
    std::vector<std::string> args;

    /// @brief Overlaid on top of the parent environment.
    std::map<std::string, std::string> env;

    /// @brief How long stop() waits after SIGTERM before sending SIGKILL.
    std::chrono::milliseconds stopTimeout { 2000 };
};

/// @brief Returns @p currentPath extended with common package-manager install locations.
///
/// Existing entries keep their order; missing locations are appended once.
/// Locations below the home directory are only added when @p home is non-empty.
[[nodiscard]] auto extendedSearchPath(std::string_view currentPath, std::string_view home) -> std::string;

/// @brief Resolves @p command to an executable file.
///
/// A command containing a slash is taken as a path. Otherwise each directory of
/// @p searchPath is tried in order.
/// @return The resolved path or std::nullopt.
[[nodiscard]] auto resolveExecutable(std::string_view command, std::string_view searchPath)
    -> std::optional<std::string>;

/// @brief Transport that runs an MCP server as a child process and talks over its stdio pipes.
///
/// Standard error is drained on a separate thread and forwarded to the log, so it never
/// mixes with the protocol stream. A transport instance is started at most once.
class ProcessTransport: public Transport
{
  public:
    ProcessTransport();
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    /// @brief Spawns the server process.
    /// @param config The process configuration.
    /// @return Success, ErrorCode::SpawnFailed, or ErrorCode::InvalidState when already started.
    [[nodiscard]] auto start(const ProcessConfig& config) -> VoidResult;

    [[nodiscard]] auto write(std::string_view bytes) -> VoidResult override;
    [[nodiscard]] auto read() -> Result<std::string> override;
    void close() noexcept override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Terminates the process and releases the pipes.
    ///
    /// Closes the server's stdin, sends SIGTERM, and escalates to SIGKILL after the
    /// configured timeout. Safe to call repeatedly, or before start().
    void stop() noexcept;

    /// @brief Returns true while the child process has not exited.
    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Returns the child's process id, or -1 when no process is running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
