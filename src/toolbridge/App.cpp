// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/McpClientSession.hpp>
#include <mcp/ToolRegistry.hpp>

#include <cstdio>
#include <format>
#include <iostream>
#include <print>
#include <string>
#include <variant>

namespace toolbridge
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    auto describeContent(const ContentItem& item) -> std::string
    {
        return std::visit(Overloaded {
                              [](const TextContent& text) { return text.text; },
                              [](const ImageContent& image) {
                                  return std::format("[image {} ({} bytes base64)]", image.mimeType, image.data.size());
                              },
                              [](const AudioContent& audio) {
                                  return std::format("[audio {} ({} bytes base64)]", audio.mimeType, audio.data.size());
                              },
                              [](const ResourceContent& resource) {
                                  if (resource.text)
                                      return std::format("[resource {}]\n{}", resource.uri, *resource.text);
                                  return std::format("[resource {} {}]", resource.uri, resource.mimeType);
                              },
                              [](const UnknownContent& unknown) {
                                  return std::format("[{} content]", unknown.type.empty() ? "untyped" : unknown.type);
                              },
                          },
                          item);
    }

    void printResult(const ToolCallResult& result)
    {
        if (result.isError)
            std::println("\033[31mTool reported an error:\033[m");

        for (const auto& item: result.content)
            std::println("{}", describeContent(item));

        if (result.content.empty())
            std::println("\033[34mInfo:\033[m (empty result)");
    }

    void printHelp()
    {
        std::println("Commands:");
        std::println("  /tools           List discovered tools and their arguments");
        std::println("  /ping            Check that the server responds");
        std::println("  /status          Show the connection state");
        std::println("  /help            Show this help");
        std::println("  /quit            Exit");
        std::println("  <tool> [input]   Call a tool; input starting with '{{' is sent as the argument object");
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    ToolRegistry registry;
    McpClientSession session;

    explicit Impl(AppConfig c):
        config(std::move(c)),
        session(registry,
                sessionOptions(config.client),
                SessionCallbacks {
                    .onStateChanged =
                        [](SessionState state, std::string_view status) {
                            if (state == SessionState::Error)
                                std::println(stderr, "\033[31mError:\033[m {}", status);
                            else
                                log::debug("[{}] {}", sessionStateName(state), status);
                        },
                    .onProgress = [](std::string_view message) { log::debug("{}", message); },
                })
    {
    }

    void printTools() const
    {
        auto const tools = registry.tools();
        if (tools.empty())
        {
            std::println("\033[34mInfo:\033[m No tools available");
            return;
        }

        std::println("\033[34mInfo:\033[m {} tool(s) available:", tools.size());
        for (const auto& tool: tools)
        {
            if (registry.isParameterless(tool.name))
                std::println("  {}() - {}", tool.name, tool.description);
            else
                std::println("  {}({}) - {}  {}", tool.name, registry.resolveArgumentName(tool.name), tool.description,
                             registry.resolveProvenance(tool.name));

            if (auto const sub = registry.subTools(tool.name))
            {
                for (const auto& action: sub->actions)
                {
                    auto const it = sub->actionDescriptions.find(action);
                    std::println("      {} - {}", action, it != sub->actionDescriptions.end() ? it->second : "");
                }
            }
        }
    }

    void printStatus() const
    {
        std::println("Server:  {} {}", session.serverName(), session.serverVersion());
        std::println("State:   {}", sessionStateName(session.state()));
        std::println("Tools:   {}", registry.knownTools().size());
        if (auto const error = session.lastError())
            std::println("Last error: {}", *error);
    }

    auto call(std::string_view tool, std::string_view input) -> VoidResult
    {
        auto const trimmed = trim(input);
        auto result = Result<ToolCallResult> {};
        if (trimmed.starts_with('{'))
        {
            auto arguments = json::parse(trimmed);
            if (!arguments)
                return std::unexpected(arguments.error());
            result = session.callToolWithArguments(tool, *arguments);
        }
        else
        {
            result = session.callTool(tool, trimmed);
        }

        if (!result)
            return std::unexpected(result.error());
        printResult(*result);
        return {};
    }

    /// Returns false when the loop should end.
    auto handleLine(std::string_view line) -> bool
    {
        if (line == "/quit" || line == "/exit")
            return false;

        if (line == "/help")
        {
            printHelp();
            return true;
        }

        if (line == "/tools")
        {
            printTools();
            return true;
        }

        if (line == "/status")
        {
            printStatus();
            return true;
        }

        if (line == "/ping")
        {
            if (auto pong = session.ping(); pong)
                std::println("\033[34mInfo:\033[m {} is alive", session.serverName());
            else
                std::println(stderr, "\033[31mError:\033[m {}", pong.error());
            return true;
        }

        if (line.starts_with("/"))
        {
            std::println(stderr, "\033[31mError:\033[m Unknown command: {}", line);
            return true;
        }

        auto const space = line.find_first_of(" \t");
        auto const tool = line.substr(0, space);
        auto const input = space == std::string_view::npos ? std::string_view {} : line.substr(space + 1);

        if (auto called = call(tool, input); !called)
            std::println(stderr, "\033[31mError:\033[m {}", called.error());
        return true;
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    _impl->session.stop();
}

auto App::initialize(std::string_view serverName) -> VoidResult
{
    return selectServer(_impl->config, serverName).and_then([this](const McpServerConfig& server) -> VoidResult {
        log::info("Connecting to {} ({})", server.name, server.command);
        return _impl->session.start(server);
    });
}

auto App::listTools() -> int
{
    _impl->printTools();
    return 0;
}

auto App::callOnce(std::string_view tool, std::string_view input, std::string_view argumentsJson) -> int
{
    auto const called = _impl->call(tool, argumentsJson.empty() ? input : argumentsJson);
    if (!called)
    {
        std::println(stderr, "\033[31mError:\033[m {}", called.error());
        return 1;
    }
    return 0;
}

auto App::run() -> int
{
    std::println("Connected to {} {}. Type /help for commands.", _impl->session.serverName(),
                 _impl->session.serverVersion());

    auto line = std::string {};
    while (true)
    {
        std::print("> ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line))
            break;

        auto const trimmed = trim(line);
        if (trimmed.empty())
            continue;
        if (!_impl->handleLine(trimmed))
            break;
    }

    _impl->session.stop();
    return 0;
}

} // namespace toolbridge
