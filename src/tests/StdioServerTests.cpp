// SPDX-License-Identifier: Apache-2.0
#include "FakeBackend.hpp"

#include <mcpgate/StdioServer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <atomic>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace mcpgate;
using namespace mcpgate::testing;
using namespace std::chrono_literals;

namespace
{

struct Pipe
{
    int readEnd = -1;
    int writeEnd = -1;

    Pipe()
    {
        int fds[2] = { -1, -1 };
        REQUIRE(::pipe(fds) == 0);
        readEnd = fds[0];
        writeEnd = fds[1];
    }

    ~Pipe()
    {
        closeWrite();
        if (readEnd >= 0)
            ::close(readEnd);
    }

    void closeWrite()
    {
        if (writeEnd >= 0)
            ::close(std::exchange(writeEnd, -1));
    }

    void write(std::string_view text) const
    {
        REQUIRE(::write(writeEnd, text.data(), text.size()) == static_cast<ssize_t>(text.size()));
    }

    auto readAll() const -> std::string
    {
        auto result = std::string {};
        auto buf = std::array<char, 4096> {};
        while (true)
        {
            auto const n = ::read(readEnd, buf.data(), buf.size());
            if (n <= 0)
                break;
            result.append(buf.data(), static_cast<size_t>(n));
        }
        return result;
    }
};

auto makeGateway(std::shared_ptr<FakeTransportFactory> factory, std::chrono::milliseconds replyDelay = 0ms)
    -> std::unique_ptr<Gateway>
{
    auto behavior = FakeBehavior {};
    behavior.tools = nlohmann::json::array({ makeToolJson("read_graph") });
    behavior.replyDelay = replyDelay;
    factory->setBehavior("memory", behavior);

    auto backend = BackendDefinition {};
    backend.id = "memory";
    backend.command = "fake-server";

    auto options = GatewayOptions {};
    options.callTimeout = 1s;
    options.handshakeTimeout = 1s;
    options.health.enabled = false;

    auto gateway = std::make_unique<Gateway>(std::vector<BackendDefinition> { backend }, options, std::move(factory));
    gateway->start();
    return gateway;
}

auto repliesById(const std::string& output) -> std::map<std::string, nlohmann::json>
{
    auto replies = std::map<std::string, nlohmann::json> {};
    auto start = size_t { 0 };
    for (auto pos = output.find('\n'); pos != std::string::npos; pos = output.find('\n', start))
    {
        auto const reply = nlohmann::json::parse(output.substr(start, pos - start));
        replies[reply["id"].dump()] = reply;
        start = pos + 1;
    }
    return replies;
}

auto replyIds(const std::string& output) -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    auto start = size_t { 0 };
    for (auto pos = output.find('\n'); pos != std::string::npos; pos = output.find('\n', start))
    {
        ids.push_back(nlohmann::json::parse(output.substr(start, pos - start))["id"].dump());
        start = pos + 1;
    }
    return ids;
}

} // namespace

TEST_CASE("StdioServer answers every request line until end of input", "[server]")
{
    auto gateway = makeGateway(std::make_shared<FakeTransportFactory>());
    auto input = Pipe {};
    auto output = Pipe {};

    input.write(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
                "\n"
                R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
                "\n"
                "\n"
                R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
                "\r\n"
                R"({"jsonrpc":"2.0","id":"c1","method":"tools/call","params":{"name":"memory_read_graph","arguments":{}}})"
                "\n"
                R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
    input.closeWrite();

    auto stop = std::atomic<bool> { false };
    {
        auto server = StdioServer(*gateway, input.readEnd, output.writeEnd);
        CHECK(server.run(stop) == 0);
    }
    output.closeWrite();

    auto const replies = repliesById(output.readAll());
    REQUIRE(replies.size() == 4);
    CHECK(replies.at("1")["result"]["serverInfo"]["name"] == "mcpgate");
    CHECK(replies.at("2")["result"]["tools"].size() == 2);
    CHECK(replies.at("\"c1\"")["result"]["tool"] == "read_graph");
    CHECK(replies.at("3")["result"] == nlohmann::json::object());
}

TEST_CASE("StdioServer replies to unparsable lines with a parse error", "[server]")
{
    auto gateway = makeGateway(std::make_shared<FakeTransportFactory>());
    auto input = Pipe {};
    auto output = Pipe {};

    input.write("garbage\n");
    input.closeWrite();

    auto stop = std::atomic<bool> { false };
    {
        auto server = StdioServer(*gateway, input.readEnd, output.writeEnd);
        CHECK(server.run(stop) == 0);
    }
    output.closeWrite();

    auto const replies = repliesById(output.readAll());
    REQUIRE(replies.size() == 1);
    CHECK(replies.at("null")["error"]["code"] == -32700);
}

TEST_CASE("StdioServer recognizes tool calls by their method field", "[server]")
{
    auto gateway = makeGateway(std::make_shared<FakeTransportFactory>(), 300ms);
    auto input = Pipe {};
    auto output = Pipe {};

    // The escaped slash still spells tools/call, and the ping merely mentions it.
    input.write(R"({"jsonrpc":"2.0","id":"slow","method":"tools\/call","params":{"name":"memory_read_graph","arguments":{}}})"
                "\n"
                R"({"jsonrpc":"2.0","id":2,"method":"ping","params":{"note":"tools/call"}})"
                "\n");
    input.closeWrite();

    auto stop = std::atomic<bool> { false };
    {
        auto server = StdioServer(*gateway, input.readEnd, output.writeEnd);
        CHECK(server.run(stop) == 0);
    }
    output.closeWrite();

    // The tool call runs beside the reader, so the ping is answered first.
    auto const ids = replyIds(output.readAll());
    CHECK(ids == std::vector<std::string> { "2", "\"slow\"" });
}

TEST_CASE("StdioServer stops when asked to", "[server]")
{
    auto gateway = makeGateway(std::make_shared<FakeTransportFactory>());
    auto input = Pipe {};
    auto output = Pipe {};

    auto stop = std::atomic<bool> { true };
    auto server = StdioServer(*gateway, input.readEnd, output.writeEnd);
    CHECK(server.run(stop) == 0);
}
