// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolbridge;

TEST_CASE("makeRequest creates a JSON-RPC 2.0 request with a string id", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest("1", "tools/list");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == "1");
    CHECK(request["method"] == "tools/list");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest("42", "tools/call", { { "name", "echo" } });

    REQUIRE(request.contains("params"));
    CHECK(request["params"]["name"] == "echo");
}

TEST_CASE("makeNotification carries no id", "[jsonrpc]")
{
    auto notification = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notification["jsonrpc"] == "2.0");
    CHECK(!notification.contains("id"));
    CHECK(notification["method"] == "notifications/initialized");
}

TEST_CASE("makeResult and makeErrorResponse answer a server request", "[jsonrpc]")
{
    auto const result = jsonrpc::makeResult("7", nlohmann::json::object());
    CHECK(result["id"] == "7");
    CHECK(result["result"].is_object());

    auto const error = jsonrpc::makeErrorResponse("8", -32601, "Method not found");
    CHECK(error["id"] == "8");
    CHECK(error["error"]["code"] == -32601);
    CHECK(error["error"]["message"] == "Method not found");
}

TEST_CASE("parseMessage handles a success response", "[jsonrpc]")
{
    auto const msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", "3" },
        { "result", { { "status", "ok" } } },
    };

    auto parsed = jsonrpc::parseMessage(msg);
    REQUIRE(parsed.has_value());
    CHECK(parsed->isResponse());
    CHECK(parsed->isSuccess());
    CHECK(parsed->id == "3");
    CHECK(parsed->result->at("status") == "ok");
}

TEST_CASE("parseMessage normalizes integer ids to strings", "[jsonrpc]")
{
    auto const msg = nlohmann::json { { "jsonrpc", "2.0" }, { "id", 12 }, { "result", nullptr } };

    auto parsed = jsonrpc::parseMessage(msg);
    REQUIRE(parsed.has_value());
    CHECK(parsed->id == "12");
    CHECK(parsed->isResponse());
}

TEST_CASE("parseMessage handles an error response", "[jsonrpc]")
{
    auto const msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", "1" },
        { "error", { { "code", -32602 }, { "message", "Invalid params" } } },
    };

    auto parsed = jsonrpc::parseMessage(msg);
    REQUIRE(parsed.has_value());
    CHECK(parsed->isResponse());
    CHECK(!parsed->isSuccess());
    REQUIRE(parsed->error.has_value());
    CHECK(parsed->error->code == -32602);
    CHECK(parsed->error->message == "Invalid params");
}

TEST_CASE("parseMessage distinguishes notifications from server requests", "[jsonrpc]")
{
    auto notification = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "method", "notifications/message" } });
    REQUIRE(notification.has_value());
    CHECK(notification->isNotification());
    CHECK(!notification->isRequest());

    auto request = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", 5 }, { "method", "ping" } });
    REQUIRE(request.has_value());
    CHECK(request->isRequest());
    CHECK(request->id == "5");
    CHECK(!request->isResponse());
}

TEST_CASE("parseMessage rejects invalid envelopes", "[jsonrpc]")
{
    SECTION("wrong version")
    {
        auto parsed = jsonrpc::parseMessage({ { "jsonrpc", "1.0" }, { "id", 1 }, { "result", 1 } });
        REQUIRE(!parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::ProtocolError);
    }

    SECTION("not an object")
    {
        auto parsed = jsonrpc::parseMessage(nlohmann::json::array({ 1, 2 }));
        REQUIRE(!parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::ProtocolError);
    }

    SECTION("neither result, error nor method")
    {
        auto parsed = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", 1 } });
        REQUIRE(!parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("encodeFrame terminates a message with a single newline", "[jsonrpc]")
{
    auto const frame = jsonrpc::encodeFrame(jsonrpc::makeRequest("1", "ping"));

    REQUIRE(!frame.empty());
    CHECK(frame.back() == '\n');
    CHECK(frame.find('\n') == frame.size() - 1);
}
