// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge::test
{

/// @brief In-memory transport. Frames written by the client are recorded and may be answered
///        by a responder; bytes pushed by the test are returned by read().
class MockTransport: public Transport
{
  public:
    using Responder = std::function<std::vector<nlohmann::json>(const nlohmann::json& message)>;

    explicit MockTransport(Responder responder = {}): _responder(std::move(responder)) {}

    auto write(std::string_view bytes) -> VoidResult override
    {
        auto messages = std::vector<nlohmann::json> {};
        {
            auto const lock = std::lock_guard(_mutex);
            if (_closed || _ended || _failWrites)
                return makeError(ErrorCode::WriteFailed, "Mock transport cannot write");

            _pendingWrite.append(bytes);
            auto newline = _pendingWrite.find('\n');
            while (newline != std::string::npos)
            {
                auto message = nlohmann::json::parse(_pendingWrite.substr(0, newline));
                _sent.push_back(message);
                messages.push_back(std::move(message));
                _pendingWrite.erase(0, newline + 1);
                newline = _pendingWrite.find('\n');
            }
        }
        _cv.notify_all();

        if (_responder)
        {
            for (const auto& message: messages)
            {
                for (const auto& reply: _responder(message))
                    pushMessage(reply);
            }
        }
        return {};
    }

    auto read() -> Result<std::string> override
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, [this] { return !_incoming.empty() || _closed || _ended; });
        if (!_incoming.empty())
        {
            auto chunk = std::move(_incoming.front());
            _incoming.pop_front();
            return chunk;
        }
        return makeError(ErrorCode::Disconnected, "Mock stream ended");
    }

    void close() noexcept override
    {
        {
            auto const lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto isConnected() const -> bool override
    {
        auto const lock = std::lock_guard(_mutex);
        return !_closed && !_ended;
    }

    /// @brief Queues raw bytes for read().
    void push(std::string bytes)
    {
        {
            auto const lock = std::lock_guard(_mutex);
            _incoming.push_back(std::move(bytes));
        }
        _cv.notify_all();
    }

    void pushMessage(const nlohmann::json& message) { push(message.dump() + "\n"); }

    /// @brief Simulates the server going away: read() reports the end of the stream.
    void endStream()
    {
        {
            auto const lock = std::lock_guard(_mutex);
            _ended = true;
        }
        _cv.notify_all();
    }

    void failWrites()
    {
        auto const lock = std::lock_guard(_mutex);
        _failWrites = true;
    }

    [[nodiscard]] auto sent() const -> std::vector<nlohmann::json>
    {
        auto const lock = std::lock_guard(_mutex);
        return _sent;
    }

    [[nodiscard]] auto sentWithMethod(std::string_view method) const -> std::vector<nlohmann::json>
    {
        auto const lock = std::lock_guard(_mutex);
        auto matching = std::vector<nlohmann::json> {};
        for (const auto& message: _sent)
        {
            if (message.value("method", "") == method)
                matching.push_back(message);
        }
        return matching;
    }

    /// @brief Waits until at least @p count frames have been written.
    auto waitForSent(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _cv.wait_for(lock, timeout, [this, count] { return _sent.size() >= count; });
    }

  private:
    Responder _responder;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<std::string> _incoming;
    std::vector<nlohmann::json> _sent;
    std::string _pendingWrite;
    bool _closed = false;
    bool _ended = false;
    bool _failWrites = false;
};

/// @brief Scripted MCP server answering initialize, tools/list, tools/call and ping.
struct FakeServer
{
    std::string name = "fake";
    std::string version = "2.1.0";
    nlohmann::json tools = nlohmann::json::array();

    /// @brief Produces the tools/call result. Defaults to echoing the arguments as text.
    std::function<nlohmann::json(const std::string& tool, const nlohmann::json& arguments)> onCall;

    /// @brief When set, initialize is answered with this error code.
    std::optional<int> initializeError;

    /// @brief When set, every tools/call is answered with this error code.
    std::optional<int> callError;

    /// @brief When non-empty, tools/list is served in these pages instead of from `tools`.
    std::vector<nlohmann::json> toolPages;

    static auto textResult(std::string_view text, bool isError = false) -> nlohmann::json
    {
        return nlohmann::json {
            { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
            { "isError", isError },
        };
    }

    /// @brief Methods of every request and notification received, in order.
    [[nodiscard]] auto receivedMethods() const -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _received;
    }

    auto respond(const nlohmann::json& message) -> std::vector<nlohmann::json>
    {
        if (message.contains("method"))
        {
            auto const lock = std::lock_guard(_mutex);
            _received.push_back(message["method"].get<std::string>());
        }

        if (!message.contains("id") || !message.contains("method"))
            return {};

        auto const& id = message["id"];
        auto const method = message["method"].get<std::string>();
        auto const params = message.value("params", nlohmann::json::object());

        auto reply = [&id](nlohmann::json result) {
            return nlohmann::json { { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(result) } };
        };
        auto fail = [&id](int code, std::string_view text) {
            return nlohmann::json {
                { "jsonrpc", "2.0" },
                { "id", id },
                { "error", { { "code", code }, { "message", text } } },
            };
        };

        if (method == "initialize")
        {
            if (initializeError)
                return { fail(*initializeError, "initialize rejected") };
            return { reply({
                { "protocolVersion", "2024-11-05" },
                { "serverInfo", { { "name", name }, { "version", version } } },
                { "capabilities", { { "tools", nlohmann::json::object() } } },
            }) };
        }
        if (method == "tools/list")
        {
            if (toolPages.empty())
                return { reply({ { "tools", tools } }) };

            auto const cursor = params.value("cursor", "0");
            auto const index = static_cast<size_t>(std::stoul(cursor));
            auto page = nlohmann::json { { "tools", toolPages.at(index) } };
            if (index + 1 < toolPages.size())
                page["nextCursor"] = std::to_string(index + 1);
            return { reply(std::move(page)) };
        }
        if (method == "ping")
            return { reply(nlohmann::json::object()) };
        if (method == "tools/call")
        {
            auto const tool = params.value("name", "");
            auto const arguments = params.value("arguments", nlohmann::json::object());
            if (callError)
                return { fail(*callError, "Invalid params") };
            if (onCall)
                return { reply(onCall(tool, arguments)) };
            return { reply(textResult(arguments.dump())) };
        }
        return { fail(-32601, "Method not found") };
    }

    auto responder() -> MockTransport::Responder
    {
        return [this](const nlohmann::json& message) { return respond(message); };
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::string> _received;
};

} // namespace toolbridge::test
