// SPDX-License-Identifier: Apache-2.0
#include "RpcConnection.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge
{

using PendingMap = std::map<std::string, std::promise<Result<jsonrpc::Message>>>;

struct RpcConnection::Impl
{
    std::unique_ptr<Transport> transport;

    std::mutex writeMutex;

    mutable std::mutex pendingMutex;
    PendingMap pending;
    std::uint64_t nextId = 0;
    bool closed = false;

    std::mutex bufferMutex;
    std::string buffer;

    std::mutex listenerMutex;
    std::vector<MessageListener> listeners;
    ConnectionClosedCallback closedCallback;

    std::atomic<bool> closing = false;
    std::jthread reader;

    explicit Impl(std::unique_ptr<Transport> t): transport(std::move(t)) {}

    auto send(const nlohmann::json& message) -> VoidResult
    {
        auto const frame = jsonrpc::encodeFrame(message);
        log::trace("-> {}", std::string_view(frame).substr(0, frame.size() - 1));

        auto const lock = std::lock_guard(writeMutex);
        return transport->write(frame);
    }

    /// Resolves every pending request with @p reason. Returns false if already closed.
    auto failPending(const Error& reason) -> bool
    {
        auto orphaned = PendingMap {};
        {
            auto const lock = std::lock_guard(pendingMutex);
            if (closed)
                return false;
            closed = true;
            orphaned.swap(pending);
        }

        for (auto& [id, promise]: orphaned)
        {
            log::debug("Request {} abandoned: {}", id, reason.message);
            promise.set_value(std::unexpected(reason));
        }
        return true;
    }

    void dispatch(const jsonrpc::Message& message)
    {
        auto snapshot = std::vector<MessageListener> {};
        {
            auto const lock = std::lock_guard(listenerMutex);
            snapshot = listeners;
        }

        for (const auto& listener: snapshot)
            listener(message);
    }

    void processFrame(std::string_view frame)
    {
        log::trace("<- {}", frame);

        auto parsed = json::parse(frame).and_then(
            [](const nlohmann::json& value) -> Result<jsonrpc::Message> { return jsonrpc::parseMessage(value); });
        if (!parsed)
        {
            log::warning("Discarding malformed frame: {}", parsed.error().message);
            return;
        }

        auto& message = *parsed;

        if (message.id && message.isResponse())
        {
            auto promise = std::optional<std::promise<Result<jsonrpc::Message>>> {};
            {
                auto const lock = std::lock_guard(pendingMutex);
                auto const it = pending.find(*message.id);
                if (it != pending.end())
                {
                    promise = std::move(it->second);
                    pending.erase(it);
                }
            }

            if (promise)
                promise->set_value(std::move(message));
            else
                log::debug("Dropping response for unknown request id {}", *message.id);
            return;
        }

        if (!message.method.empty())
            dispatch(message);
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto chunk = transport->read();
            if (!chunk)
            {
                onStreamEnd(chunk.error());
                return;
            }
            feed(*chunk);
        }
    }

    void feed(std::string_view bytes)
    {
        auto frames = std::vector<std::string> {};
        {
            auto const lock = std::lock_guard(bufferMutex);
            buffer.append(bytes);

            auto start = size_t { 0 };
            auto newlinePos = buffer.find('\n', start);
            while (newlinePos != std::string::npos)
            {
                auto line = std::string_view(buffer).substr(start, newlinePos - start);
                if (!line.empty() && line.back() == '\r')
                    line.remove_suffix(1);
                if (!line.empty())
                    frames.emplace_back(line);
                start = newlinePos + 1;
                newlinePos = buffer.find('\n', start);
            }
            buffer.erase(0, start);
        }

        for (const auto& frame: frames)
            processFrame(frame);
    }

    void onStreamEnd(const Error& error)
    {
        if (closing)
            return;

        auto const reason = Error { .code = ErrorCode::Disconnected, .message = error.message };
        if (!failPending(reason))
            return;

        log::warning("Connection lost: {}", reason.message);

        auto callback = ConnectionClosedCallback {};
        {
            auto const lock = std::lock_guard(listenerMutex);
            callback = closedCallback;
        }
        if (callback)
            callback(reason);
    }
};

RpcConnection::RpcConnection(std::unique_ptr<Transport> transport):
    _impl(std::make_unique<Impl>(std::move(transport)))
{
}

RpcConnection::~RpcConnection()
{
    close();
}

void RpcConnection::start()
{
    if (_impl->reader.joinable())
        return;

    _impl->reader = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });
}

auto RpcConnection::request(std::string_view method, nlohmann::json params) -> std::future<Result<jsonrpc::Message>>
{
    auto promise = std::promise<Result<jsonrpc::Message>> {};
    auto future = promise.get_future();

    auto id = std::string {};
    {
        auto const lock = std::lock_guard(_impl->pendingMutex);
        if (_impl->closed)
        {
            promise.set_value(makeError(ErrorCode::Disconnected, "Connection is closed"));
            return future;
        }
        id = std::format("{}", ++_impl->nextId);
        _impl->pending.emplace(id, std::move(promise));
    }

    auto sent = _impl->send(jsonrpc::makeRequest(id, method, std::move(params)));
    if (!sent)
    {
        auto failed = std::optional<std::promise<Result<jsonrpc::Message>>> {};
        {
            auto const lock = std::lock_guard(_impl->pendingMutex);
            auto const it = _impl->pending.find(id);
            if (it != _impl->pending.end())
            {
                failed = std::move(it->second);
                _impl->pending.erase(it);
            }
        }
        // Otherwise close() already resolved it.
        if (failed)
            failed->set_value(std::unexpected(sent.error()));
    }

    return future;
}

auto RpcConnection::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    if (!isOpen())
        return makeError(ErrorCode::Disconnected, "Connection is closed");
    return _impl->send(jsonrpc::makeNotification(method, std::move(params)));
}

auto RpcConnection::respond(std::string_view id, nlohmann::json result) -> VoidResult
{
    if (!isOpen())
        return makeError(ErrorCode::Disconnected, "Connection is closed");
    return _impl->send(jsonrpc::makeResult(id, std::move(result)));
}

auto RpcConnection::respondError(std::string_view id, int code, std::string_view message) -> VoidResult
{
    if (!isOpen())
        return makeError(ErrorCode::Disconnected, "Connection is closed");
    return _impl->send(jsonrpc::makeErrorResponse(id, code, message));
}

void RpcConnection::addListener(MessageListener listener)
{
    auto const lock = std::lock_guard(_impl->listenerMutex);
    _impl->listeners.push_back(std::move(listener));
}

void RpcConnection::setClosedCallback(ConnectionClosedCallback callback)
{
    auto const lock = std::lock_guard(_impl->listenerMutex);
    _impl->closedCallback = std::move(callback);
}

void RpcConnection::handleIncoming(std::string_view bytes)
{
    _impl->feed(bytes);
}

void RpcConnection::close()
{
    _impl->closing = true;
    _impl->failPending(Error { .code = ErrorCode::Disconnected, .message = "Connection closed" });
    _impl->transport->close();

    if (_impl->reader.joinable() && _impl->reader.get_id() != std::this_thread::get_id())
    {
        _impl->reader.request_stop();
        _impl->reader.join();
    }
}

auto RpcConnection::isOpen() const -> bool
{
    auto const lock = std::lock_guard(_impl->pendingMutex);
    return !_impl->closed;
}

auto RpcConnection::pendingCount() const -> size_t
{
    auto const lock = std::lock_guard(_impl->pendingMutex);
    return _impl->pending.size();
}

} // namespace toolbridge
