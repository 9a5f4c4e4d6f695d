// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/McpClientSession.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Client section of the configuration file.
struct ClientSettings
{
    std::string name = "toolbridge";
    std::string version = "1.0.0";
    std::chrono::milliseconds handshakeTimeout { 30000 };
    bool discoverHelpText = true;
    log::Level logLevel = log::Level::Info;

    /// @brief Server used when none is named on the command line. Empty selects the first one.
    std::string defaultServer;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ClientSettings client;

    /// @brief Configured servers in file order.
    std::vector<McpServerConfig> mcpServers;
};

/// @brief Session options derived from the client settings.
[[nodiscard]] auto sessionOptions(const ClientSettings& client) -> SessionOptions;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The configuration, ErrorCode::ConfigNotFound, or ErrorCode::ConfigInvalid.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses configuration text.
/// @param content The JSON document.
/// @param origin Used in error messages.
[[nodiscard]] auto parseConfig(std::string_view content, std::string_view origin = "<memory>") -> Result<AppConfig>;

/// @brief Picks the server to connect to.
///
/// An empty @p name selects the configured default server, else the first one in the file.
/// @return The server, ErrorCode::ConfigNotFound, or ErrorCode::UnsupportedServerType.
[[nodiscard]] auto selectServer(const AppConfig& config, std::string_view name) -> Result<McpServerConfig>;

/// @brief Writes a starter configuration. Never overwrites an existing file.
[[nodiscard]] auto writeTemplateConfig(std::string_view path) -> VoidResult;

/// @brief Returns the default config directory path.
///
/// $XDG_CONFIG_HOME/toolbridge, else ~/.config/toolbridge.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace toolbridge
