// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <utility>
#include <vector>

using namespace toolbridge;

namespace
{
    /// Routes log output into a vector for the lifetime of the object.
    struct CapturedLog
    {
        std::vector<std::pair<log::Level, std::string>> messages;
        log::ScopedCallback scope;

        explicit CapturedLog(log::Level level = log::Level::Info):
            scope(
                [this](log::Level messageLevel, std::string_view message) {
                    messages.emplace_back(messageLevel, std::string(message));
                },
                level)
        {
        }
    };
} // namespace

TEST_CASE("parseLevel accepts the level names", "[log]")
{
    CHECK(log::parseLevel("error") == log::Level::Error);
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("info") == log::Level::Info);
    CHECK(log::parseLevel("debug") == log::Level::Debug);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK(!log::parseLevel("verbose").has_value());
}

TEST_CASE("Messages above the level are dropped", "[log]")
{
    auto captured = CapturedLog(log::Level::Info);

    log::info("visible {}", 1);
    log::debug("hidden {}", 2);
    log::error("failure");

    REQUIRE(captured.messages.size() == 2);
    CHECK(captured.messages[0] == std::pair { log::Level::Info, std::string("visible 1") });
    CHECK(captured.messages[1].first == log::Level::Error);
}

TEST_CASE("Level names round-trip through parseLevel", "[log]")
{
    for (auto const level: { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug, log::Level::Trace })
        CHECK(log::parseLevel(log::levelName(level)) == level);
    CHECK(log::levelName(log::Level::Warning) == "warning");
}

TEST_CASE("A scoped callback restores the previous level", "[log]")
{
    auto const before = log::getLevel();
    {
        auto captured = CapturedLog(log::Level::Trace);
        CHECK(log::getLevel() == log::Level::Trace);
        CHECK(log::enabled(log::Level::Trace));
        log::trace("frame {}", 1);
        REQUIRE(captured.messages.size() == 1);
        CHECK(captured.messages[0].second == "frame 1");
    }
    CHECK(log::getLevel() == before);
}

TEST_CASE("Errors format with their code name", "[log]")
{
    auto const error = Error { .code = ErrorCode::ToolNotFound, .message = "Unknown tool 'x'" };
    CHECK(std::format("{}", error) == "[ToolNotFound] Unknown tool 'x'");
    CHECK(errorCodeName(ErrorCode::MissingRequiredParameter) == "MissingRequiredParameter");

    auto const unexpected = makeError(ErrorCode::Disconnected, "gone");
    CHECK(unexpected.error().code == ErrorCode::Disconnected);
    CHECK(!unexpected.error().rpcCode.has_value());
}

TEST_CASE("JSON helpers report missing and mistyped fields", "[log]")
{
    auto const parsed = json::parse(R"({"name": "x", "count": 3, "flag": true})");
    REQUIRE(parsed.has_value());

    CHECK(json::getString(*parsed, "name") == "x");
    CHECK(!json::getString(*parsed, "count").has_value());
    CHECK(json::getStringOr(*parsed, "missing", "fallback") == "fallback");
    CHECK(json::getIntOr(*parsed, "count", 0) == 3);
    CHECK(json::getIntOr(*parsed, "name", 7) == 7);
    CHECK(json::getBoolOr(*parsed, "flag", false));

    auto const broken = json::parse("{");
    REQUIRE(!broken.has_value());
    CHECK(broken.error().code == ErrorCode::ProtocolError);
}
