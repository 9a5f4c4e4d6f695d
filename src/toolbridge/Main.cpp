// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolbridge/App.hpp>
#include <toolbridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolbridge - MCP client for tool servers over stdio" };

    auto configPath = std::string {};
    auto serverName = std::string {};
    auto listTools = false;
    auto callTool = std::string {};
    auto input = std::string {};
    auto argumentsJson = std::string {};
    auto initConfigPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-s,--server", serverName, "Server to connect to (default: configured default or first)");
    app.add_flag("--list-tools", listTools, "List discovered tools and exit");
    app.add_option("--call", callTool, "Call a tool and exit");
    app.add_option("--input", input, "Free-form input for --call");
    app.add_option("--args", argumentsJson, "JSON argument object for --call");
    app.add_option("--init-config", initConfigPath, "Write a starter config file and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (!initConfigPath.empty())
    {
        if (auto written = toolbridge::writeTemplateConfig(initConfigPath); !written)
        {
            toolbridge::log::error("{}", written.error());
            return 1;
        }
        std::println("Wrote {}", initConfigPath);
        return 0;
    }

    auto configResult = configPath.empty() ? toolbridge::loadConfig() : toolbridge::loadConfigFromFile(configPath);
    if (!configResult)
    {
        toolbridge::log::error("Failed to load config: {}", configResult.error());
        if (configResult.error().code == toolbridge::ErrorCode::ConfigNotFound)
            toolbridge::log::info("Create one with --init-config {}", toolbridge::defaultConfigPath());
        return 1;
    }

    auto& config = *configResult;
    toolbridge::log::setLevel(verbose ? toolbridge::log::Level::Debug : config.client.logLevel);

    auto application = toolbridge::App(std::move(config));
    if (auto initResult = application.initialize(serverName); !initResult)
    {
        toolbridge::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (!callTool.empty())
        return application.callOnce(callTool, input, argumentsJson);
    if (listTools)
        return application.listTools();
    return application.run();
}
