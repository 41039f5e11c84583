// SPDX-License-Identifier: Apache-2.0
#include "LocalHttpServer.hpp"

#include <mcp/JsonRpc.hpp>
#include <mcp/SseTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace mcpgate;
using namespace mcpgate::testing;
using namespace std::chrono_literals;

namespace
{

/// @brief SSE backend on a loopback socket.
///
/// GET /sse opens the event stream and sends the greeting. Each POST to
/// /message is answered with 202, and the reply to a request is pushed
/// over the stream as a "message" event echoing the request's method.
class SseBackend
{
  public:
    SseBackend():
        server([this](const HttpRequest& request, HttpConnection& connection, const std::stop_token& token) {
            handle(request, connection, token);
        })
    {
    }

    /// First bytes of the event stream.
    std::string greeting = "event: endpoint\ndata: /message?sessionId=abc123\n\n";

    /// Holds replies until two are due, then pushes them newest first.
    bool replyInReverse = false;

    /// Accepts requests without ever replying.
    bool dropReplies = false;

    /// Pushes a reply with this id ahead of every real reply.
    std::optional<int> strayReplyId;

    void endStream()
    {
        auto const lock = std::scoped_lock(_mutex);
        _streamEnded = true;
        _changed.notify_all();
    }

    [[nodiscard]] auto postedTargets() -> std::vector<std::string>
    {
        auto const lock = std::scoped_lock(_mutex);
        return _postedTargets;
    }

    [[nodiscard]] auto streamUrl() const -> std::string { return server.url("/sse"); }

    [[nodiscard]] auto config(std::chrono::milliseconds handshakeTimeout = 2s) const -> SseTransportConfig
    {
        return SseTransportConfig { .url = streamUrl(), .headers = {}, .handshakeTimeout = handshakeTimeout, .label = "sse" };
    }

  private:
    void handle(const HttpRequest& request, HttpConnection& connection, const std::stop_token& token)
    {
        if (request.method == "GET" && request.target == "/sse")
        {
            stream(connection, token);
            return;
        }

        if (request.method == "POST" && request.target.starts_with("/message"))
        {
            if (!connection.write(httpResponse(202, "Accepted", "text/plain", "")))
                return;
            accept(nlohmann::json::parse(request.body, nullptr, false), request.target);
            return;
        }

        connection.write(httpResponse(404, "Not Found", "text/plain", "no such endpoint"));
    }

    void stream(HttpConnection& connection, const std::stop_token& token)
    {
        if (!connection.write(EventStreamHead) || !connection.write(greeting))
            return;

        auto lock = std::unique_lock(_mutex);
        while (!token.stop_requested())
        {
            _changed.wait(lock, token, [this] { return !_outbox.empty() || _streamEnded; });
            while (!_outbox.empty())
            {
                auto frame = std::move(_outbox.front());
                _outbox.pop_front();
                if (!connection.write(frame))
                    return;
            }
            if (_streamEnded)
                return;
        }
    }

    void accept(const nlohmann::json& message, const std::string& target)
    {
        auto const lock = std::scoped_lock(_mutex);
        _postedTargets.push_back(target);

        if (dropReplies || !message.is_object() || !message.contains("id"))
            return;

        if (strayReplyId)
            push(jsonrpc::makeResult(*strayReplyId, { { "echo", "stray" } }));

        auto reply = jsonrpc::makeResult(message["id"], { { "echo", message.value("method", "") } });
        if (!replyInReverse)
        {
            push(reply);
            return;
        }

        _held.push_back(std::move(reply));
        if (_held.size() < 2)
            return;
        for (auto it = _held.rbegin(); it != _held.rend(); ++it)
            push(*it);
        _held.clear();
    }

    void push(const nlohmann::json& reply)
    {
        _outbox.push_back(std::format("event: message\ndata: {}\n\n", reply.dump()));
        _changed.notify_all();
    }

    std::mutex _mutex;
    std::condition_variable_any _changed;
    std::deque<std::string> _outbox;
    std::vector<nlohmann::json> _held;
    std::vector<std::string> _postedTargets;
    bool _streamEnded = false;

  public:
    // Last member: stops its connection threads before the state above goes away.
    LocalHttpServer server;
};

} // namespace

TEST_CASE("SseTransport reads the session id from the live stream", "[sse]")
{
    auto backend = SseBackend();
    REQUIRE(backend.server.ready());

    auto transport = SseTransport();
    REQUIRE(transport.start(backend.config()).has_value());
    CHECK(transport.isConnected());
    CHECK(transport.sessionId() == "abc123");
    CHECK(transport.messageUrl() == backend.server.url("/message?sessionId=abc123"));

    auto reply = transport.exchange(jsonrpc::makeRequest(1, "ping"), 5s);
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 1);
    CHECK((*reply)["result"]["echo"] == "ping");
    CHECK(backend.postedTargets() == std::vector<std::string> { "/message?sessionId=abc123" });
}

TEST_CASE("SseTransport takes the session id from an absolute endpoint URL", "[sse]")
{
    auto backend = SseBackend();
    REQUIRE(backend.server.ready());
    backend.greeting = std::format("event: endpoint\ndata: {}\n\n", backend.server.url("/message?sessionId=xyz"));

    auto transport = SseTransport();
    REQUIRE(transport.start(backend.config()).has_value());
    CHECK(transport.sessionId() == "xyz");
    CHECK(transport.messageUrl() == backend.server.url("/message?sessionId=xyz"));

    auto reply = transport.exchange(jsonrpc::makeRequest(7, "tools/list"), 5s);
    REQUIRE(reply.has_value());
    CHECK((*reply)["result"]["echo"] == "tools/list");
}

TEST_CASE("SseTransport gives up on a handshake without a session id", "[sse]")
{
    auto backend = SseBackend();
    REQUIRE(backend.server.ready());
    backend.greeting.clear();
    for (auto i = 0; i < 100; ++i)
        backend.greeting += ": padding padding padding padding padding padding\n";
    REQUIRE(backend.greeting.size() > 4096);

    auto transport = SseTransport();
    auto started = transport.start(backend.config(5s));
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::ProtocolDesync);
    CHECK(!transport.isConnected());
}

TEST_CASE("SseTransport times out when no endpoint is announced", "[sse]")
{
    auto backend = SseBackend();
    REQUIRE(backend.server.ready());
    backend.greeting = ": connected\n\n";

    auto transport = SseTransport();
    auto started = transport.start(backend.config(300ms));
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::Timeout);
}

TEST_CASE("SseTransport reports an unreachable stream", "[sse]")
{
    auto transport = SseTransport();
    auto started = transport.start(SseTransportConfig { .url = "http://127.0.0.1:9/sse",
                                                        .headers = {},
                                                        .handshakeTimeout = 2s,
                                                        .label = "nowhere" });
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::BackendUnreachable);
}

TEST_CASE("SseTransport matches replies arriving out of order by id", "[sse]")
{
    auto backend = SseBackend();
    REQUIRE(backend.server.ready());
    backend.replyInReverse = true;

    auto transport = SseTransport();
    REQUIRE(transport.start(backend.config()).has_value());

    auto first = std::async(std::launch::async, [&] { return transport.exchange(jsonrpc::makeRequest(1, "tools/list"), 5s); });
    auto second = std::async(std::launch::async, [&] { return transport.exchange(jsonrpc::makeRequest(2, "ping"), 5s); });

    auto firstReply = first.get();
    auto secondReply = second.get();
    REQUIRE(firstReply.has_value());
    REQUIRE(secondReply.has_value());
    CHECK((*firstReply)["id"] == 1);
    CHECK((*firstReply)["result"]["echo"] == "tools/list");
    CHECK((*secondReply)["id"] == 2);
    CHECK((*secondReply)["result"]["echo"] == "ping");
}

TEST_CASE("SseTransport hands replies nobody waits for to receive", "[sse]")
{
    auto backend = SseBackend();
    REQUIRE(backend.server.ready());
    backend.strayReplyId = 999;

    auto transport = SseTransport();
    REQUIRE(transport.start(backend.config()).has_value());

    auto reply = transport.exchange(jsonrpc::makeRequest(5, "ping"), 5s);
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 5);

    auto stray = transport.receive(2s);
    REQUIRE(stray.has_value());
    CHECK((*stray)["id"] == 999);
    CHECK((*stray)["result"]["echo"] == "stray");
}

TEST_CASE("SseTransport fails waiting requests when the stream ends", "[sse]")
{
    auto backend = SseBackend();
    REQUIRE(backend.server.ready());
    backend.dropReplies = true;

    auto transport = SseTransport();
    REQUIRE(transport.start(backend.config()).has_value());

    auto pending = std::async(std::launch::async, [&] { return transport.exchange(jsonrpc::makeRequest(3, "ping"), 10s); });
    std::this_thread::sleep_for(200ms);
    backend.endStream();

    auto const begin = std::chrono::steady_clock::now();
    auto reply = pending.get();
    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::ConnectionClosed);
    CHECK(std::chrono::steady_clock::now() - begin < 5s);

    CHECK(!transport.isConnected());
    auto next = transport.receive(100ms);
    REQUIRE(!next.has_value());
    CHECK(next.error().code == ErrorCode::ConnectionClosed);

    auto late = transport.exchange(jsonrpc::makeRequest(4, "ping"), 1s);
    REQUIRE(!late.has_value());
    CHECK(late.error().code == ErrorCode::ConnectionClosed);
}
