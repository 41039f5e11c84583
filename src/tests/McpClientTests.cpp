// SPDX-License-Identifier: Apache-2.0
#include "FakeBackend.hpp"

#include <mcp/McpClient.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpgate;
using namespace mcpgate::testing;
using namespace std::chrono_literals;

namespace
{

auto makeClient(FakeBehavior behavior, FakeMcpTransport** fake = nullptr) -> std::unique_ptr<McpClient>
{
    auto transport = std::make_unique<FakeMcpTransport>(std::move(behavior));
    if (fake)
        *fake = transport.get();
    return std::make_unique<McpClient>("files", std::move(transport));
}

} // namespace

TEST_CASE("McpClient initialize handshake", "[mcp]")
{
    auto* fake = static_cast<FakeMcpTransport*>(nullptr);
    auto client = makeClient(FakeBehavior {}, &fake);

    auto result = client->initialize(1s);
    REQUIRE(result.has_value());
    CHECK(result->serverName == "fake");
    CHECK(result->serverVersion == "1.0");
    CHECK(result->protocolVersion == "2024-11-05");
    CHECK(result->hasTools);
    CHECK(!result->hasResources);
    CHECK(client->state() == HandshakeState::Initialized);

    REQUIRE(fake->sent.size() == 2);
    CHECK(fake->sent[0]["method"] == "initialize");
    CHECK(fake->sent[0]["params"]["protocolVersion"] == "2024-11-05");
    CHECK(fake->sent[0]["params"]["clientInfo"]["name"] == "mcpgate");
    CHECK(fake->sent[1]["method"] == "notifications/initialized");
    CHECK(!fake->sent[1].contains("id"));
}

TEST_CASE("McpClient handshake lists tools tagged with the backend id", "[mcp]")
{
    auto behavior = FakeBehavior {};
    behavior.tools = nlohmann::json::array({
        makeToolJson("read_file", "Read a file"),
        makeToolJson("write-file", "Write a file"),
        nlohmann::json { { "description", "nameless" } },
    });

    auto* fake = static_cast<FakeMcpTransport*>(nullptr);
    auto client = makeClient(behavior, &fake);

    auto tools = client->handshake(1s);
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[0].name == "read_file");
    CHECK((*tools)[0].description == "Read a file");
    CHECK((*tools)[0].backendId == "files");
    CHECK((*tools)[1].name == "write-file");
    CHECK(client->isReady());
    CHECK(client->tools().size() == 2);

    // Request ids increase within the session.
    CHECK(fake->sent[0]["id"] == 1);
    CHECK(fake->sent[2]["method"] == "tools/list");
    CHECK(fake->sent[2]["id"] == 2);
}

TEST_CASE("McpClient callTool returns the backend result", "[mcp]")
{
    auto client = makeClient(FakeBehavior {});
    REQUIRE(client->handshake(1s).has_value());

    auto result = client->callTool("read_file", { { "path", "/tmp/test.txt" } }, 1s);
    REQUIRE(result.has_value());
    CHECK((*result)["tool"] == "read_file");
    CHECK((*result)["content"][0]["text"] == R"({"path":"/tmp/test.txt"})");
    CHECK((*result)["isError"] == false);
}

TEST_CASE("McpClient maps RPC errors of a tool call", "[mcp]")
{
    auto behavior = FakeBehavior {};
    behavior.failCalls = true;
    auto client = makeClient(behavior);
    REQUIRE(client->handshake(1s).has_value());

    auto result = client->callTool("anything", nlohmann::json::object(), 1s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolCallError);
    CHECK(client->isReady());
}

TEST_CASE("McpClient rejects operations before initialization", "[mcp]")
{
    auto client = makeClient(FakeBehavior {});

    auto toolsResult = client->listTools(1s);
    REQUIRE(!toolsResult.has_value());
    CHECK(toolsResult.error().code == ErrorCode::ProtocolError);

    auto callResult = client->callTool("test", nlohmann::json::object(), 1s);
    REQUIRE(!callResult.has_value());
    CHECK(callResult.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("McpClient handshake fails on a silent backend", "[mcp]")
{
    auto behavior = FakeBehavior {};
    behavior.hang = true;
    auto client = makeClient(behavior);

    auto result = client->handshake(150ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(client->state() == HandshakeState::Failed);
    CHECK(!client->failureReason().empty());
}

TEST_CASE("McpClient ping succeeds on a live backend and fails after a crash", "[mcp]")
{
    auto* fake = static_cast<FakeMcpTransport*>(nullptr);
    auto client = makeClient(FakeBehavior {}, &fake);
    REQUIRE(client->handshake(1s).has_value());

    CHECK(client->ping(1s).has_value());

    fake->crash(1);
    auto const ping = client->ping(1s);
    REQUIRE(!ping.has_value());
    CHECK(ping.error().code == ErrorCode::ConnectionClosed);
}
