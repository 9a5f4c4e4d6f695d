// SPDX-License-Identifier: Apache-2.0
#include "McpClientSession.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/HelpTextInterpreter.hpp>
#include <mcp/ProcessTransport.hpp>
#include <mcp/RpcConnection.hpp>
#include <mcp/ToolSchemaInterpreter.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <future>
#include <mutex>

namespace toolbridge
{

namespace
{
    constexpr auto MethodNotFound = -32601;

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    /// Nested parameter names ("items.x", "oneOf[0].x") are not top-level argument keys.
    auto isTopLevelName(std::string_view name) -> bool
    {
        return name.find_first_of(".[") == std::string_view::npos;
    }

    auto matchesType(std::string_view type, const nlohmann::json& value) -> bool
    {
        if (type == "string")
            return value.is_string();
        if (type == "integer")
            return value.is_number_integer();
        if (type == "number")
            return value.is_number();
        if (type == "boolean")
            return value.is_boolean();
        if (type == "array" || type.starts_with("array<"))
            return value.is_array();
        if (type == "object")
            return value.is_object();
        return true;
    }

    auto decodeContentItem(const nlohmann::json& item) -> ContentItem
    {
        auto const type = json::getStringOr(item, "type", "");

        if (type == "text")
            return TextContent { .text = json::getStringOr(item, "text", "") };

        if (type == "image")
        {
            return ImageContent {
                .data = json::getStringOr(item, "data", ""),
                .mimeType = json::getStringOr(item, "mimeType", ""),
            };
        }

        if (type == "audio")
        {
            return AudioContent {
                .data = json::getStringOr(item, "data", ""),
                .mimeType = json::getStringOr(item, "mimeType", ""),
            };
        }

        if (type == "resource")
        {
            auto const& resource = item.contains("resource") ? item.at("resource") : item;
            auto content = ResourceContent {
                .uri = json::getStringOr(resource, "uri", ""),
                .mimeType = json::getStringOr(resource, "mimeType", ""),
            };
            if (resource.is_object() && resource.contains("text") && resource.at("text").is_string())
                content.text = resource.at("text").get<std::string>();
            return content;
        }

        return UnknownContent { .type = type, .raw = item };
    }
} // namespace

auto sessionStateName(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting: return "connecting";
        case SessionState::Handshaking: return "handshaking";
        case SessionState::Discovering: return "discovering";
        case SessionState::Ready: return "ready";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

auto decodeToolCallResult(const nlohmann::json& result) -> ToolCallResult
{
    auto decoded = ToolCallResult {};
    decoded.isError = json::getBoolOr(result, "isError", false);

    if (!result.is_object() || !result.contains("content") || !result.at("content").is_array())
        return decoded;

    auto haveText = false;
    for (const auto& item: result.at("content"))
    {
        if (!item.is_object())
            continue;

        auto content = decodeContentItem(item);
        if (auto const* text = std::get_if<TextContent>(&content); text && !haveText)
        {
            decoded.text = text->text;
            haveText = true;
        }
        decoded.content.push_back(std::move(content));
    }

    return decoded;
}

auto convertArgument(std::string_view type, std::string_view text) -> nlohmann::json
{
    auto const* const first = text.data();
    auto const* const last = text.data() + text.size();

    if (type == "integer")
    {
        auto value = std::int64_t {};
        auto const [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc {} && ptr == last && !text.empty())
            return value;
    }
    else if (type == "number")
    {
        auto value = double {};
        auto const [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc {} && ptr == last && !text.empty())
            return value;
    }
    else if (type == "boolean")
    {
        auto const lowered = toLower(text);
        if (lowered == "true" || lowered == "1" || lowered == "yes")
            return true;
        if (lowered == "false" || lowered == "0" || lowered == "no")
            return false;
    }
    else if (type == "object" || type == "array" || type.starts_with("array<"))
    {
        auto parsed = json::parse(text);
        if (parsed && matchesType(type, *parsed))
            return *parsed;
    }

    return std::string(text);
}

struct McpClientSession::Impl
{
    ToolRegistry& registry;
    SessionOptions options;
    SessionCallbacks callbacks;
    ToolSchemaInterpreter schemaInterpreter;
    HelpTextInterpreter helpInterpreter;

    mutable std::mutex mutex;
    SessionState state = SessionState::Disconnected;
    std::optional<Error> lastError;
    std::string serverName;
    std::string serverVersion;
    std::shared_ptr<RpcConnection> connection;

    /// Connection taken down by stop(). Kept alive until the next start() since stop() may run on its reader thread.
    std::shared_ptr<RpcConnection> retired;

    Impl(ToolRegistry& r, SessionOptions o, SessionCallbacks c):
        registry(r), options(std::move(o)), callbacks(std::move(c))
    {
    }

    void setState(SessionState next, std::string_view status)
    {
        {
            auto const lock = std::lock_guard(mutex);
            if (state == next && next == SessionState::Error)
                return;
            state = next;
        }
        announceState(next, status);
    }

    /// Moves to @p next unless stop() has taken the connection in the meantime.
    [[nodiscard]] auto advance(SessionState next, std::string_view status) -> bool
    {
        {
            auto const lock = std::lock_guard(mutex);
            if (!connection)
                return false;
            state = next;
        }
        announceState(next, status);
        return true;
    }

    void announceState(SessionState next, std::string_view status)
    {
        log::debug("Session {}: {}", sessionStateName(next), status);
        if (callbacks.onStateChanged)
            callbacks.onStateChanged(next, status);
    }

    [[nodiscard]] auto stoppedError() const -> std::unexpected<Error>
    {
        return makeError(ErrorCode::Disconnected, std::format("Session with {} was stopped", currentServerName()));
    }

    void progress(std::string_view message)
    {
        log::info("{}", message);
        if (callbacks.onProgress)
            callbacks.onProgress(message);
    }

    [[nodiscard]] auto currentState() const -> SessionState
    {
        auto const lock = std::lock_guard(mutex);
        return state;
    }

    [[nodiscard]] auto currentServerName() const -> std::string
    {
        auto const lock = std::lock_guard(mutex);
        return serverName;
    }

    [[nodiscard]] auto currentConnection() const -> std::shared_ptr<RpcConnection>
    {
        auto const lock = std::lock_guard(mutex);
        return connection;
    }

    /// Records @p error, closes the connection and enters SessionState::Error.
    auto fail(Error error) -> std::unexpected<Error>
    {
        log::error("{}", error);

        auto active = std::shared_ptr<RpcConnection> {};
        {
            auto const lock = std::lock_guard(mutex);
            lastError = error;
            active = connection;
        }
        if (active)
            active->close();

        setState(SessionState::Error, error.message);
        return std::unexpected(std::move(error));
    }

    [[nodiscard]] auto requireActive() const -> VoidResult
    {
        auto const current = currentState();
        if (current != SessionState::Ready && current != SessionState::Discovering)
        {
            return makeError(ErrorCode::InvalidState,
                             std::format("Session is not ready (state: {})", sessionStateName(current)));
        }
        return {};
    }

    /// Sends a request and unwraps its result. A JSON-RPC error becomes ErrorCode::ServerError.
    auto call(std::string_view method, nlohmann::json params, std::optional<std::chrono::milliseconds> timeout)
        -> Result<nlohmann::json>
    {
        auto active = currentConnection();
        if (!active)
            return makeError(ErrorCode::InvalidState, "Not connected");

        auto future = active->request(method, std::move(params));
        if (timeout && future.wait_for(*timeout) == std::future_status::timeout)
            return makeError(ErrorCode::IoError, std::format("'{}' timed out after {} ms", method, timeout->count()));

        return future.get().and_then([method](const jsonrpc::Message& response) -> Result<nlohmann::json> {
            if (response.error)
            {
                return std::unexpected(Error {
                    .code = ErrorCode::ServerError,
                    .message = std::format("'{}' failed: {} ({})", method, response.error->message,
                                           response.error->code),
                    .rpcCode = response.error->code,
                });
            }
            return response.result.value_or(nlohmann::json::object());
        });
    }

    auto run(std::string fallbackName, std::unique_ptr<Transport> transport) -> VoidResult
    {
        auto previous = std::shared_ptr<RpcConnection> {};
        {
            auto const lock = std::lock_guard(mutex);
            previous = std::move(retired);
        }
        previous.reset();

        registry.reset();

        auto created = std::make_shared<RpcConnection>(std::move(transport));
        auto* const raw = created.get();
        raw->addListener([this, raw](const jsonrpc::Message& message) { handleServerMessage(*raw, message); });
        raw->setClosedCallback([this](const Error& reason) { handleClosed(reason); });

        {
            auto const lock = std::lock_guard(mutex);
            lastError.reset();
            serverName = std::move(fallbackName);
            serverVersion.clear();
            connection = std::move(created);
        }
        raw->start();

        auto const stopped = [this, raw] {
            auto const lock = std::lock_guard(mutex);
            return connection.get() != raw;
        };

        if (auto handshaken = handshake(); !handshaken)
            return stopped() ? std::unexpected(handshaken.error()) : fail(handshaken.error());
        if (auto discovered = discover(); !discovered)
            return stopped() ? std::unexpected(discovered.error()) : fail(discovered.error());
        return {};
    }

    auto handshake() -> VoidResult
    {
        auto const fallbackName = currentServerName();
        if (!advance(SessionState::Handshaking, std::format("Initializing {}", fallbackName)))
            return stoppedError();

        auto params = nlohmann::json {
            { "protocolVersion", options.protocolVersion },
            { "capabilities", nlohmann::json::object() },
            { "clientInfo",
              nlohmann::json {
                  { "name", options.clientName },
                  { "version", options.clientVersion },
              } },
        };

        auto result = call("initialize", std::move(params), options.handshakeTimeout);
        if (!result)
        {
            return std::unexpected(Error {
                .code = ErrorCode::HandshakeFailed,
                .message = std::format("Handshake with {} failed: {}", fallbackName, result.error().message),
                .rpcCode = result.error().rpcCode,
            });
        }
        if (!result->is_object())
            return makeError(ErrorCode::HandshakeFailed, "Malformed initialize response");

        auto const serverInfo = result->value("serverInfo", nlohmann::json::object());
        auto name = json::getStringOr(serverInfo, "name", fallbackName);
        auto version = json::getStringOr(serverInfo, "version", "");
        log::debug("Server speaks protocol {}", json::getStringOr(*result, "protocolVersion", "unknown"));

        auto const active = currentConnection();
        if (!active)
            return stoppedError();
        if (auto notified = active->notify("notifications/initialized"); !notified)
        {
            return makeError(ErrorCode::HandshakeFailed,
                             std::format("Could not confirm initialization: {}", notified.error().message));
        }

        log::info("MCP server initialized: {} v{}", name, version);
        auto const lock = std::lock_guard(mutex);
        serverName = std::move(name);
        serverVersion = std::move(version);
        return {};
    }

    auto listTools() -> Result<std::vector<ToolDescriptor>>
    {
        auto tools = std::vector<ToolDescriptor> {};
        auto cursor = std::optional<std::string> {};

        do
        {
            auto params = cursor ? nlohmann::json { { "cursor", *cursor } } : nlohmann::json(nullptr);
            auto page = call("tools/list", std::move(params), options.handshakeTimeout);
            if (!page)
                return std::unexpected(page.error());

            if (page->is_object() && page->contains("tools") && page->at("tools").is_array())
            {
                for (const auto& toolJson: page->at("tools"))
                {
                    auto name = json::getString(toolJson, "name");
                    if (!name)
                    {
                        log::warning("Skipping tool without a name: {}", toolJson.dump());
                        continue;
                    }

                    auto tool = ToolDescriptor {
                        .name = std::move(*name),
                        .description = json::getStringOr(toolJson, "description", ""),
                    };
                    if (toolJson.contains("inputSchema") && !toolJson.at("inputSchema").is_null())
                        tool.rawSchema = SchemaValue::fromJson(toolJson.at("inputSchema"));
                    tools.push_back(std::move(tool));
                }
            }

            auto next = json::getStringOr(*page, "nextCursor", "");
            if (next.empty() || next == cursor)
                cursor.reset();
            else
                cursor = std::move(next);
        } while (cursor);

        return tools;
    }

    auto discover() -> VoidResult
    {
        if (!advance(SessionState::Discovering, "Discovering tools"))
            return stoppedError();

        auto tools = listTools();
        if (!tools)
            return std::unexpected(tools.error());

        for (const auto& tool: *tools)
        {
            registry.registerTool(tool);
            interpretSchema(tool);
        }
        progress(std::format("Discovered {} tools", tools->size()));

        if (options.discoverHelpText)
            discoverFromHelpText();

        if (callbacks.onToolsChanged)
            callbacks.onToolsChanged(registry.knownTools());

        if (!advance(SessionState::Ready,
                     std::format("Connected to {} ({} tools)", currentServerName(), registry.knownTools().size())))
            return stoppedError();
        return {};
    }

    /// Tools named after the server take the action argument of an umbrella tool.
    [[nodiscard]] auto expectsInput(std::string_view tool) const -> bool
    {
        if (HelpTextInterpreter::isKnownParameterless(tool))
            return false;
        auto const server = currentServerName();
        return tool == server || tool.starts_with(std::format("mcp_{}_", server));
    }

    void interpretSchema(const ToolDescriptor& tool)
    {
        auto const interpretation = schemaInterpreter.interpret(tool.rawSchema, expectsInput(tool.name));

        switch (interpretation.outcome)
        {
            case SchemaInterpretation::Outcome::Parameters: {
                auto schema = SchemaMap {};
                for (const auto& param: interpretation.parameters)
                    schema.emplace_back(param.name, param.type);

                registry.registerSchema(tool.name, std::move(schema), interpretation.source());
                registry.registerParameters(tool.name, interpretation.parameters, interpretation.source());
                log::debug("Tool '{}': {} parameters ({})", tool.name, interpretation.parameters.size(),
                           schemaStrategyName(*interpretation.strategy));
                break;
            }
            case SchemaInterpretation::Outcome::Parameterless:
                registry.markParameterless(tool.name, ParameterSource::Schema);
                break;
            case SchemaInterpretation::Outcome::Unknown:
                if (HelpTextInterpreter::isKnownParameterless(tool.name))
                    registry.markParameterless(tool.name, ParameterSource::HelpText);
                break;
        }
    }

    /// The tool whose argument selects a sub-action, if the server has one.
    [[nodiscard]] auto umbrellaTool() const -> std::optional<std::string>
    {
        auto const server = currentServerName();
        for (auto candidate: { server, std::format("mcp_{0}_{0}", server) })
        {
            if (registry.hasTool(candidate))
                return candidate;
        }
        return std::nullopt;
    }

    void discoverFromHelpText()
    {
        auto const server = currentServerName();
        auto const candidates = std::array<std::string, 4> {
            std::format("mcp_{}_help", server),
            "help",
            std::format("mcp_{}_list", server),
            "list",
        };

        for (const auto& candidate: candidates)
        {
            if (!registry.hasTool(candidate))
                continue;

            progress(std::format("Reading help from '{}'", candidate));
            auto result = callTool(candidate, "");
            if (!result)
            {
                log::warning("Help tool '{}' failed: {}", candidate, result.error());
                continue;
            }
            if (result->isError || result->text.empty())
                continue;

            if (applyHelpText(result->text))
                return;
        }
    }

    auto applyHelpText(std::string_view text) -> bool
    {
        auto const umbrella = umbrellaTool();
        auto const interpretation = helpInterpreter.interpret(text, umbrella.value_or(currentServerName()));
        if (interpretation.entries.empty())
            return false;

        auto actions = SubToolRegistration { .serverToolName = interpretation.registration.serverToolName };
        for (const auto& entry: interpretation.entries)
        {
            if (registry.hasTool(entry.name))
            {
                describeListedTool(entry);
                continue;
            }
            if (!umbrella)
                continue;
            actions.actions.push_back(entry.name);
            actions.actionDescriptions[entry.name] = entry.description;
        }

        if (umbrella && !actions.actions.empty())
        {
            registry.registerSubTools(actions);
            if (interpretation.umbrellaParameter)
            {
                auto const source =
                    interpretation.lowConfidence ? ParameterSource::Heuristic : ParameterSource::HelpText;
                registry.registerParameters(*umbrella, { *interpretation.umbrellaParameter }, source);
            }
            progress(std::format("'{}' exposes {} actions", *umbrella, actions.actions.size()));
        }
        return true;
    }

    /// Fills in a listed tool that the schema pass left without information.
    void describeListedTool(const HelpEntry& entry)
    {
        if (registry.source(entry.name) != ParameterSource::None)
            return;

        if (!entry.parameters.empty())
        {
            registry.registerParameters(entry.name, entry.parameters, ParameterSource::HelpText);
        }
        else if (auto name = HelpTextInterpreter::inferToolParameter(entry.description))
        {
            auto param = ParameterInfo { .name = std::move(*name), .isRequired = true };
            registry.registerParameters(entry.name, { std::move(param) }, ParameterSource::HelpText);
        }
        else if (HelpTextInterpreter::isKnownParameterless(entry.name))
        {
            registry.markParameterless(entry.name, ParameterSource::HelpText);
        }
    }

    [[nodiscard]] auto buildArguments(std::string_view tool, std::string_view input) const -> nlohmann::json
    {
        auto arguments = nlohmann::json::object();
        if (registry.isParameterless(tool))
            return arguments;

        auto const resolution = registry.resolve(tool);
        auto type = std::string("string");
        auto required = false;

        if (auto const entry = registry.snapshot(tool))
        {
            auto const param = std::ranges::find(entry->parameters, resolution.name, &ParameterInfo::name);
            if (param != entry->parameters.end())
            {
                type = param->type;
                required = param->isRequired;
            }
            else
            {
                auto const field = std::ranges::find(entry->schema, resolution.name,
                                                     &std::pair<std::string, std::string>::first);
                if (field != entry->schema.end())
                    type = field->second;
            }
        }

        if (input.empty() && !required)
            return arguments;

        log::debug("Argument for '{}' is '{}' {}", tool, resolution.name, registry.resolveProvenance(tool));
        arguments[resolution.name] = convertArgument(type, input);
        return arguments;
    }

    auto invoke(std::string_view tool, nlohmann::json arguments) -> Result<ToolCallResult>
    {
        auto params = nlohmann::json {
            { "name", tool },
            { "arguments", std::move(arguments) },
        };

        return call("tools/call", std::move(params), std::nullopt)
            .transform([tool](const nlohmann::json& result) {
                auto decoded = decodeToolCallResult(result);
                log::debug("Tool '{}' returned {} content items (isError: {})", tool, decoded.content.size(),
                           decoded.isError);
                return decoded;
            });
    }

    auto callTool(std::string_view name, std::string_view input) -> Result<ToolCallResult>
    {
        if (auto active = requireActive(); !active)
            return std::unexpected(active.error());

        auto target = std::string(name);
        auto text = std::string(input);

        if (!registry.hasTool(target))
        {
            auto const server = registry.serverForAction(target);
            if (!server)
                return makeError(ErrorCode::ToolNotFound, std::format("Unknown tool '{}'", name));

            text = input.empty() ? target : std::format("{} {}", name, input);
            log::debug("Routing action '{}' to '{}'", name, *server);
            target = *server;
        }

        return invoke(target, buildArguments(target, text));
    }

    auto callToolWithArguments(std::string_view name, const nlohmann::json& arguments) -> Result<ToolCallResult>
    {
        if (auto active = requireActive(); !active)
            return std::unexpected(active.error());

        if (!arguments.is_object())
            return makeError(ErrorCode::InvalidArgument, "Tool arguments must be a JSON object");
        if (!registry.hasTool(name))
            return makeError(ErrorCode::ToolNotFound, std::format("Unknown tool '{}'", name));

        auto const entry = registry.snapshot(name);
        if (entry && entry->source == ParameterSource::Schema)
        {
            for (const auto& param: entry->parameters)
            {
                if (!isTopLevelName(param.name))
                    continue;

                auto const it = arguments.find(param.name);
                if (it == arguments.end())
                {
                    if (param.isRequired)
                    {
                        return makeError(ErrorCode::MissingRequiredParameter,
                                         std::format("Tool '{}' requires '{}'", name, param.name));
                    }
                    continue;
                }
                if (!matchesType(param.type, *it))
                {
                    return makeError(ErrorCode::InvalidParameterType,
                                     std::format("'{}' of tool '{}' must be of type {}", param.name, name,
                                                 param.type));
                }
            }
        }

        return invoke(name, arguments);
    }

    void handleServerMessage(RpcConnection& rpc, const jsonrpc::Message& message)
    {
        if (message.isRequest())
        {
            auto const answered = message.method == "ping"
                                      ? rpc.respond(*message.id, nlohmann::json::object())
                                      : rpc.respondError(*message.id, MethodNotFound,
                                                         std::format("Method not found: {}", message.method));
            if (!answered)
                log::warning("Could not answer '{}': {}", message.method, answered.error().message);
            return;
        }

        if (message.method == "notifications/tools/list_changed")
            log::info("{} reported a changed tool list", currentServerName());
        else if (message.method == "notifications/message")
            log::info("[{}] {}", currentServerName(), message.params.value("data", nlohmann::json {}).dump());
        else
            log::debug("Notification {}", message.method);
    }

    void handleClosed(const Error& reason)
    {
        auto const status = std::format("Connection to {} lost: {}", currentServerName(), reason.message);
        {
            auto const lock = std::lock_guard(mutex);
            lastError = Error { .code = ErrorCode::Disconnected, .message = status };
        }
        setState(SessionState::Error, status);
    }

    void stop()
    {
        auto active = std::shared_ptr<RpcConnection> {};
        {
            auto const lock = std::lock_guard(mutex);
            if (!connection && state == SessionState::Disconnected)
                return;
            active = std::move(connection);
        }

        if (active)
        {
            if (active->isOpen())
            {
                if (auto sent = active->notify("notifications/disconnect"); !sent)
                    log::debug("Disconnect notification not sent: {}", sent.error().message);
            }
            active->close();

            auto const lock = std::lock_guard(mutex);
            std::swap(retired, active);
        }

        setState(SessionState::Disconnected, "Disconnected");
    }
};

McpClientSession::McpClientSession(ToolRegistry& registry, SessionOptions options, SessionCallbacks callbacks):
    _impl(std::make_unique<Impl>(registry, std::move(options), std::move(callbacks)))
{
}

McpClientSession::~McpClientSession()
{
    _impl->stop();
}

auto McpClientSession::start(const McpServerConfig& config) -> VoidResult
{
    if (config.type != "stdio")
    {
        return makeError(ErrorCode::UnsupportedServerType,
                         std::format("Server '{}' has unsupported type '{}'", config.name, config.type));
    }
    if (auto const current = state(); current != SessionState::Disconnected)
    {
        return makeError(ErrorCode::InvalidState,
                         std::format("Cannot start a session that is {}", sessionStateName(current)));
    }

    _impl->setState(SessionState::Connecting, std::format("Starting {}", config.name));

    auto transport = std::make_unique<ProcessTransport>();
    auto const processConfig = ProcessConfig {
        .name = config.name,
        .command = config.command,
        .args = config.args,
        .env = config.env,
    };
    if (auto started = transport->start(processConfig); !started)
        return _impl->fail(started.error());

    return _impl->run(config.name, std::move(transport));
}

auto McpClientSession::start(std::string serverName, std::unique_ptr<Transport> transport) -> VoidResult
{
    if (auto const current = state(); current != SessionState::Disconnected)
    {
        return makeError(ErrorCode::InvalidState,
                         std::format("Cannot start a session that is {}", sessionStateName(current)));
    }

    _impl->setState(SessionState::Connecting, std::format("Connecting to {}", serverName));
    return _impl->run(std::move(serverName), std::move(transport));
}

auto McpClientSession::callTool(std::string_view name, std::string_view input) -> Result<ToolCallResult>
{
    return _impl->callTool(name, input);
}

auto McpClientSession::callToolWithArguments(std::string_view name, const nlohmann::json& arguments)
    -> Result<ToolCallResult>
{
    return _impl->callToolWithArguments(name, arguments);
}

auto McpClientSession::ping() -> VoidResult
{
    if (auto active = _impl->requireActive(); !active)
        return active;

    return _impl->call("ping", nullptr, _impl->options.handshakeTimeout).transform([](const nlohmann::json&) {});
}

void McpClientSession::stop()
{
    _impl->stop();
}

auto McpClientSession::state() const -> SessionState
{
    return _impl->currentState();
}

auto McpClientSession::lastError() const -> std::optional<Error>
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->lastError;
}

auto McpClientSession::serverName() const -> std::string
{
    return _impl->currentServerName();
}

auto McpClientSession::serverVersion() const -> std::string
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->serverVersion;
}

auto McpClientSession::tools() const -> std::vector<ToolDescriptor>
{
    return _impl->registry.tools();
}

auto McpClientSession::registry() const -> const ToolRegistry&
{
    return _impl->registry;
}

} // namespace toolbridge
