// SPDX-License-Identifier: Apache-2.0
#include <toolbridge/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>

using namespace toolbridge;

namespace
{
    constexpr auto SampleConfig = std::string_view { R"({
        "client": {
            "name": "bridge-test",
            "version": "9.9",
            "handshakeTimeoutMs": 5000,
            "discoverHelpText": false,
            "logLevel": "debug",
            "defaultServer": "beta"
        },
        "mcpServers": {
            "zeta": { "command": "zeta-server" },
            "alpha": {
                "type": "stdio",
                "command": "npx",
                "args": ["-y", "@modelcontextprotocol/server-filesystem", "/tmp"],
                "env": { "TOKEN": "secret" }
            },
            "beta": { "command": "beta-server", "args": [] }
        }
    })" };

    auto parseError(std::string_view content) -> Error
    {
        auto result = parseConfig(content);
        REQUIRE(!result.has_value());
        return result.error();
    }

    /// Unique path below the temp directory, removed when the test ends.
    struct TempPath
    {
        std::filesystem::path path;

        explicit TempPath(std::string_view name):
            path(std::filesystem::temp_directory_path() / std::format("toolbridge_test_{}", name))
        {
            std::filesystem::remove_all(path);
        }

        ~TempPath() { std::filesystem::remove_all(path); }
    };
} // namespace

TEST_CASE("defaultConfigPath ends with config.json", "[config]")
{
    CHECK(!defaultConfigDir().empty());
    CHECK(defaultConfigPath().ends_with("/config.json"));
}

TEST_CASE("ClientSettings have expected defaults", "[config]")
{
    auto const settings = ClientSettings {};
    CHECK(settings.name == "toolbridge");
    CHECK(settings.handshakeTimeout == std::chrono::milliseconds(30000));
    CHECK(settings.discoverHelpText);
    CHECK(settings.logLevel == log::Level::Info);
    CHECK(settings.defaultServer.empty());
}

TEST_CASE("parseConfig reads client settings and servers", "[config]")
{
    auto result = parseConfig(SampleConfig);
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("client settings")
    {
        CHECK(config.client.name == "bridge-test");
        CHECK(config.client.version == "9.9");
        CHECK(config.client.handshakeTimeout == std::chrono::milliseconds(5000));
        CHECK(!config.client.discoverHelpText);
        CHECK(config.client.logLevel == log::Level::Debug);
        CHECK(config.client.defaultServer == "beta");
    }

    SECTION("servers keep file order")
    {
        REQUIRE(config.mcpServers.size() == 3);
        CHECK(config.mcpServers[0].name == "zeta");
        CHECK(config.mcpServers[1].name == "alpha");
        CHECK(config.mcpServers[2].name == "beta");
    }

    SECTION("server fields")
    {
        auto const& alpha = config.mcpServers[1];
        CHECK(alpha.type == "stdio");
        CHECK(alpha.command == "npx");
        CHECK(alpha.args == std::vector<std::string> { "-y", "@modelcontextprotocol/server-filesystem", "/tmp" });
        CHECK(alpha.env.at("TOKEN") == "secret");

        CHECK(config.mcpServers[0].type == "stdio");
        CHECK(config.mcpServers[0].args.empty());
    }

    SECTION("session options follow the client settings")
    {
        auto const options = sessionOptions(config.client);
        CHECK(options.clientName == "bridge-test");
        CHECK(options.clientVersion == "9.9");
        CHECK(options.protocolVersion == "2024-11-05");
        CHECK(options.handshakeTimeout == std::chrono::milliseconds(5000));
        CHECK(!options.discoverHelpText);
    }
}

TEST_CASE("parseConfig without a client section uses defaults", "[config]")
{
    auto result = parseConfig(R"({"mcpServers": {"only": {"command": "srv"}}})");
    REQUIRE(result.has_value());
    CHECK(result->client.name == "toolbridge");
    CHECK(result->client.logLevel == log::Level::Info);
    REQUIRE(result->mcpServers.size() == 1);
}

TEST_CASE("parseConfig rejects invalid documents", "[config]")
{
    CHECK(parseError("{ not json").code == ErrorCode::ConfigInvalid);
    CHECK(parseError("[]").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"client": {}})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"mcpServers": []})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"client": 1, "mcpServers": {}})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"client": {"handshakeTimeoutMs": 0}, "mcpServers": {}})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"mcpServers": {"a": "srv"}})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"mcpServers": {"a": {"args": []}}})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"mcpServers": {"a": {"command": "x", "args": "y"}}})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"mcpServers": {"a": {"command": "x", "args": [1]}}})").code == ErrorCode::ConfigInvalid);
    CHECK(parseError(R"({"mcpServers": {"a": {"command": "x", "env": {"K": 1}}}})").code == ErrorCode::ConfigInvalid);

    auto const level = parseError(R"({"client": {"logLevel": "loud"}, "mcpServers": {}})");
    CHECK(level.code == ErrorCode::ConfigInvalid);
    CHECK(level.message == "<memory>: unknown log level 'loud'");
}

TEST_CASE("selectServer picks the named, default or first server", "[config]")
{
    auto config = parseConfig(SampleConfig);
    REQUIRE(config.has_value());

    SECTION("named server")
    {
        auto server = selectServer(*config, "alpha");
        REQUIRE(server.has_value());
        CHECK(server->command == "npx");
    }

    SECTION("configured default")
    {
        auto server = selectServer(*config, "");
        REQUIRE(server.has_value());
        CHECK(server->name == "beta");
    }

    SECTION("first server when no default is configured")
    {
        config->client.defaultServer.clear();
        auto server = selectServer(*config, "");
        REQUIRE(server.has_value());
        CHECK(server->name == "zeta");
    }

    SECTION("unknown name")
    {
        auto server = selectServer(*config, "gamma");
        REQUIRE(!server.has_value());
        CHECK(server.error().code == ErrorCode::ConfigNotFound);
        CHECK(server.error().message == "No server named 'gamma' is configured");
    }
}

TEST_CASE("selectServer rejects unusable configurations", "[config]")
{
    auto const empty = selectServer(AppConfig {}, "");
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::ConfigNotFound);

    auto remote = parseConfig(R"({"mcpServers": {"web": {"type": "sse", "command": "x"}}})");
    REQUIRE(remote.has_value());
    auto const server = selectServer(*remote, "web");
    REQUIRE(!server.has_value());
    CHECK(server.error().code == ErrorCode::UnsupportedServerType);
}

TEST_CASE("loadConfigFromFile reads a file and reports a missing one", "[config]")
{
    auto const temp = TempPath("load");
    std::filesystem::create_directories(temp.path);
    auto const file = temp.path / "config.json";

    auto missing = loadConfigFromFile(file.string());
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ConfigNotFound);

    {
        auto out = std::ofstream(file);
        out << SampleConfig;
    }

    auto loaded = loadConfigFromFile(file.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->mcpServers.size() == 3);

    {
        auto out = std::ofstream(file);
        out << R"({"mcpServers": 5})";
    }

    auto invalid = loadConfigFromFile(file.string());
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::ConfigInvalid);
    CHECK(invalid.error().message.starts_with(file.string()));
}

TEST_CASE("writeTemplateConfig writes a loadable config and never overwrites", "[config]")
{
    auto const temp = TempPath("template");
    auto const file = temp.path / "nested" / "config.json";

    REQUIRE(writeTemplateConfig(file.string()).has_value());

    auto loaded = loadConfigFromFile(file.string());
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->mcpServers.size() == 2);
    CHECK(loaded->mcpServers[0].name == "filesystem");
    CHECK(loaded->mcpServers[1].name == "xcf");
    CHECK(loaded->client.defaultServer == "filesystem");

    auto again = writeTemplateConfig(file.string());
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::IoError);
}
