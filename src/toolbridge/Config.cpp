// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace toolbridge
{

namespace
{
    using OrderedJson = nlohmann::ordered_json;

    auto invalid(std::string_view origin, std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigInvalid, std::format("{}: {}", origin, what));
    }

    auto parseClient(const OrderedJson& client, std::string_view origin) -> Result<ClientSettings>
    {
        if (!client.is_object())
            return invalid(origin, "'client' must be an object");

        auto settings = ClientSettings {};
        settings.name = json::getStringOr(client, "name", settings.name);
        settings.version = json::getStringOr(client, "version", settings.version);
        settings.discoverHelpText = json::getBoolOr(client, "discoverHelpText", settings.discoverHelpText);
        settings.defaultServer = json::getStringOr(client, "defaultServer", "");

        auto const timeout = json::getIntOr(client, "handshakeTimeoutMs", 30000);
        if (timeout <= 0)
            return invalid(origin, "'handshakeTimeoutMs' must be positive");
        settings.handshakeTimeout = std::chrono::milliseconds(timeout);

        auto const levelText = json::getStringOr(client, "logLevel", log::levelName(ClientSettings {}.logLevel));
        auto const level = log::parseLevel(levelText);
        if (!level)
            return invalid(origin, std::format("unknown log level '{}'", levelText));
        settings.logLevel = *level;

        return settings;
    }

    auto parseServer(const std::string& name, const OrderedJson& serverJson, std::string_view origin)
        -> Result<McpServerConfig>
    {
        if (!serverJson.is_object())
            return invalid(origin, std::format("server '{}' must be an object", name));

        auto command = json::getString(serverJson, "command");
        if (!command)
            return invalid(origin, std::format("server '{}' has no command", name));

        auto server = McpServerConfig {
            .name = name,
            .type = json::getStringOr(serverJson, "type", "stdio"),
            .command = std::move(*command),
        };

        if (serverJson.contains("args"))
        {
            auto const& args = serverJson.at("args");
            if (!args.is_array())
                return invalid(origin, std::format("'args' of server '{}' must be an array", name));
            for (const auto& arg: args)
            {
                if (!arg.is_string())
                    return invalid(origin, std::format("'args' of server '{}' must contain strings", name));
                server.args.push_back(arg.get<std::string>());
            }
        }

        if (serverJson.contains("env"))
        {
            auto const& env = serverJson.at("env");
            if (!env.is_object())
                return invalid(origin, std::format("'env' of server '{}' must be an object", name));
            for (const auto& [key, value]: env.items())
            {
                if (!value.is_string())
                    return invalid(origin, std::format("env '{}' of server '{}' must be a string", key, name));
                server.env[key] = value.get<std::string>();
            }
        }

        return server;
    }

    auto templateConfig() -> OrderedJson
    {
        auto const defaults = ClientSettings {};
        auto root = OrderedJson::object();
        root["client"] = OrderedJson {
            { "name", defaults.name },
            { "version", defaults.version },
            { "handshakeTimeoutMs", defaults.handshakeTimeout.count() },
            { "discoverHelpText", defaults.discoverHelpText },
            { "logLevel", std::string(log::levelName(defaults.logLevel)) },
            { "defaultServer", "filesystem" },
        };

        auto servers = OrderedJson::object();
        servers["filesystem"] = OrderedJson {
            { "type", "stdio" },
            { "command", "npx" },
            { "args", OrderedJson::array({ "-y", "@modelcontextprotocol/server-filesystem", "/tmp" }) },
            { "env", OrderedJson::object() },
        };
        servers["xcf"] = OrderedJson {
            { "type", "stdio" },
            { "command", "xcf" },
            { "args", OrderedJson::array({ "server" }) },
            { "env", OrderedJson::object() },
        };
        root["mcpServers"] = std::move(servers);
        return root;
    }
} // namespace

auto sessionOptions(const ClientSettings& client) -> SessionOptions
{
    return SessionOptions {
        .clientName = client.name,
        .clientVersion = client.version,
        .handshakeTimeout = client.handshakeTimeout,
        .discoverHelpText = client.discoverHelpText,
    };
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/toolbridge";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/toolbridge";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content, std::string_view origin) -> Result<AppConfig>
{
    auto parsed = json::parse<OrderedJson>(content);
    if (!parsed)
        return invalid(origin, parsed.error().message);

    auto const& root = *parsed;
    if (!root.is_object())
        return invalid(origin, "the top level must be an object");

    auto config = AppConfig {};

    if (root.contains("client"))
    {
        auto client = parseClient(root.at("client"), origin);
        if (!client)
            return std::unexpected(client.error());
        config.client = std::move(*client);
    }

    if (!root.contains("mcpServers") || !root.at("mcpServers").is_object())
        return invalid(origin, "'mcpServers' must be an object");

    for (const auto& [name, serverJson]: root.at("mcpServers").items())
    {
        auto server = parseServer(name, serverJson, origin);
        if (!server)
            return std::unexpected(server.error());
        config.mcpServers.push_back(std::move(*server));
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    if (!std::filesystem::exists(path))
        return makeError(ErrorCode::ConfigNotFound, std::format("Config file not found: {}", path));

    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigInvalid, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return parseConfig(ss.str(), path);
}

auto loadConfig() -> Result<AppConfig>
{
    return loadConfigFromFile(defaultConfigPath());
}

auto selectServer(const AppConfig& config, std::string_view name) -> Result<McpServerConfig>
{
    if (config.mcpServers.empty())
        return makeError(ErrorCode::ConfigNotFound, "No MCP servers are configured");

    auto const wanted = name.empty() ? std::string_view(config.client.defaultServer) : name;

    auto server = config.mcpServers.front();
    if (!wanted.empty())
    {
        auto const it = std::ranges::find(config.mcpServers, wanted, &McpServerConfig::name);
        if (it == config.mcpServers.end())
            return makeError(ErrorCode::ConfigNotFound, std::format("No server named '{}' is configured", wanted));
        server = *it;
    }

    if (server.type != "stdio")
    {
        return makeError(ErrorCode::UnsupportedServerType,
                         std::format("Server '{}' has unsupported type '{}'", server.name, server.type));
    }
    return server;
}

auto writeTemplateConfig(std::string_view path) -> VoidResult
{
    if (std::filesystem::exists(path))
        return makeError(ErrorCode::IoError, std::format("Refusing to overwrite existing file: {}", path));

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
        }
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write config file: {}", path));

    file << templateConfig().dump(4) << '\n';
    return {};
}

} // namespace toolbridge
