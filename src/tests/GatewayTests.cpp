// SPDX-License-Identifier: Apache-2.0
#include "FakeBackend.hpp"

#include <gateway/Gateway.hpp>
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <thread>

using namespace mcpgate;
using namespace mcpgate::testing;
using namespace std::chrono_literals;

namespace
{

auto stdioBackend(std::string id) -> BackendDefinition
{
    auto backend = BackendDefinition {};
    backend.id = std::move(id);
    backend.command = "fake-server";
    backend.workingDirectory = "/work/project";
    return backend;
}

auto httpBackend(std::string id) -> BackendDefinition
{
    auto backend = BackendDefinition {};
    backend.id = std::move(id);
    backend.transport = TransportKind::Http;
    backend.url = "http://localhost:9999/mcp";
    return backend;
}

auto quietOptions() -> GatewayOptions
{
    auto options = GatewayOptions {};
    options.discoveryTimeout = 500ms;
    options.callTimeout = 1s;
    options.handshakeTimeout = 1s;
    options.projectDir = "/work/project";
    options.health.enabled = false;
    options.recovery.baseDelay = 20ms;
    return options;
}

struct GatewayFixture
{
    std::shared_ptr<FakeTransportFactory> factory = std::make_shared<FakeTransportFactory>();
    std::unique_ptr<Gateway> gateway;

    explicit GatewayFixture(GatewayOptions options = quietOptions())
    {
        auto memory = FakeBehavior {};
        memory.tools = nlohmann::json::array({ makeToolJson("read_graph"), makeToolJson("search_nodes") });
        factory->setBehavior("memory", memory);

        auto context7 = FakeBehavior {};
        context7.tools = nlohmann::json::array({ makeToolJson("resolve-library-id"), makeToolJson("get-library-docs") });
        factory->setBehavior("context7", context7);

        gateway = std::make_unique<Gateway>(
            std::vector<BackendDefinition> { httpBackend("context7"), stdioBackend("memory") }, options, factory);
    }

    auto request(int64_t id, std::string_view method, nlohmann::json params = nullptr) -> nlohmann::json
    {
        auto reply = gateway->handleMessage(jsonrpc::makeRequest(id, method, std::move(params)));
        REQUIRE(reply.has_value());
        return *reply;
    }

    auto callTool(std::string_view name, nlohmann::json arguments = nlohmann::json::object()) -> nlohmann::json
    {
        auto const reply = request(42, "tools/call", { { "name", std::string(name) }, { "arguments", arguments } });
        REQUIRE(reply.contains("result"));
        return reply["result"];
    }
};

auto firstText(const nlohmann::json& result) -> std::string
{
    return result["content"][0]["text"].get<std::string>();
}

} // namespace

TEST_CASE("Gateway discovery publishes the aggregated catalog", "[gateway]")
{
    auto fixture = GatewayFixture {};
    auto const report = fixture.gateway->start();

    CHECK(report.succeededCount() == 2);
    CHECK(fixture.gateway->catalog().size() == 4);
    CHECK(fixture.gateway->catalog().find("context7_resolve-library-id").has_value());
    CHECK(fixture.gateway->catalog().find("memory_read_graph").has_value());
    CHECK(fixture.gateway->registry().list() == std::vector<std::string> { "memory" });

    auto const exported = fixture.gateway->exportCatalog();
    CHECK(exported["count"] == 4);
    CHECK(exported["backends"]["memory"] == 2);
}

TEST_CASE("Gateway answers initialize and ping", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();

    auto const init = fixture.request(1,
                                      "initialize",
                                      { { "protocolVersion", "2024-11-05" },
                                        { "clientInfo", { { "name", "test-client" }, { "version", "1" } } } });
    CHECK(init["id"] == 1);
    CHECK(init["result"]["protocolVersion"] == "2024-11-05");
    CHECK(init["result"]["serverInfo"]["name"] == "mcpgate");
    CHECK(init["result"]["capabilities"].contains("tools"));

    auto const ping = fixture.request(2, "ping");
    CHECK(ping["result"] == nlohmann::json::object());
}

TEST_CASE("Gateway tools/list includes the status tool", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();

    auto const reply = fixture.request(3, "tools/list");
    auto const& tools = reply["result"]["tools"];
    REQUIRE(tools.size() == 5);

    auto names = std::vector<std::string> {};
    for (auto const& tool: tools)
        names.push_back(tool["name"].get<std::string>());
    CHECK(std::ranges::find(names, "context7_get-library-docs") != names.end());
    CHECK(std::ranges::find(names, "memory_search_nodes") != names.end());
    CHECK(names.back() == "mcpgate_status");
}

TEST_CASE("Gateway forwards calls under client-rewritten names", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();

    auto const result = fixture.callTool("context7_resolve_library_id", { { "libraryName", "react" } });
    CHECK(result["isError"] == false);
    CHECK(result["tool"] == "resolve-library-id");
    CHECK(nlohmann::json::parse(firstText(result))["libraryName"] == "react");

    auto const memory = fixture.callTool("memory_read_graph");
    CHECK(memory["tool"] == "read_graph");
    CHECK(fixture.factory->opens("memory") == 1);
}

TEST_CASE("Gateway injects projectRoot when enabled", "[gateway]")
{
    auto options = quietOptions();
    options.injectProjectRoot = true;
    auto fixture = GatewayFixture(options);
    fixture.gateway->start();

    auto const result = fixture.callTool("memory_read_graph");
    CHECK(nlohmann::json::parse(firstText(result))["projectRoot"] == "/work/project");
}

TEST_CASE("Gateway reports unroutable calls as tool errors", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();

    auto const result = fixture.callTool("weather_forecast");
    CHECK(result["isError"] == true);
    auto const text = firstText(result);
    CHECK(text.find("UnresolvableToolName") != std::string::npos);
    CHECK(text.find("Available backends: context7, memory") != std::string::npos);

    auto const empty = fixture.callTool("");
    CHECK(empty["isError"] == true);
    CHECK(firstText(empty).find("EmptyToolName") != std::string::npos);
}

TEST_CASE("Gateway maps protocol errors to JSON-RPC error codes", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();

    SECTION("parse error")
    {
        auto const reply = fixture.gateway->handleLine("{ this is not json");
        REQUIRE(reply.has_value());
        CHECK((*reply)["error"]["code"] == jsonrpc::codes::ParseError);
        CHECK((*reply)["id"].is_null());
    }

    SECTION("invalid request keeps the id")
    {
        auto const reply = fixture.gateway->handleMessage({ { "id", 5 }, { "method", "tools/list" } });
        REQUIRE(reply.has_value());
        CHECK((*reply)["error"]["code"] == jsonrpc::codes::InvalidRequest);
        CHECK((*reply)["id"] == 5);
    }

    SECTION("unknown method")
    {
        auto const reply = fixture.request(6, "resources/list");
        CHECK(reply["error"]["code"] == jsonrpc::codes::MethodNotFound);
    }

    SECTION("tools/call without a name")
    {
        auto const reply = fixture.request(7, "tools/call", { { "arguments", nlohmann::json::object() } });
        CHECK(reply["error"]["code"] == jsonrpc::codes::InvalidParams);
    }

    SECTION("tools/call with non-object arguments")
    {
        auto const reply =
            fixture.request(8, "tools/call", { { "name", "memory_read_graph" }, { "arguments", { 1, 2 } } });
        CHECK(reply["error"]["code"] == jsonrpc::codes::InvalidParams);
    }
}

TEST_CASE("Gateway does not answer notifications", "[gateway]")
{
    auto fixture = GatewayFixture {};
    CHECK(!fixture.gateway->handleMessage(jsonrpc::makeNotification("notifications/initialized")).has_value());
    CHECK(!fixture.gateway->handleLine(R"({"jsonrpc":"2.0","method":"notifications/cancelled"})").has_value());
}

TEST_CASE("Gateway status tool reports every backend", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();

    auto const result = fixture.callTool("mcpgate_status");
    CHECK(result["isError"] == false);

    auto const status = nlohmann::json::parse(firstText(result));
    CHECK(status["toolCount"] == 4);
    CHECK(status["healthMonitoring"] == false);
    CHECK(status["backends"]["memory"]["connected"] == true);
    CHECK(status["backends"]["memory"]["tools"] == 2);
    CHECK(status["backends"]["context7"]["transport"] == "http");
    CHECK(status["backends"]["context7"]["circuitBreaker"]["open"] == false);
}

TEST_CASE("Gateway keeps serving when one backend fails discovery", "[gateway]")
{
    auto fixture = GatewayFixture {};
    auto broken = FakeBehavior {};
    broken.unreachable = true;
    fixture.factory->setBehavior("context7", broken);

    auto const report = fixture.gateway->start();
    CHECK(report.succeededCount() == 1);
    CHECK(fixture.gateway->catalog().size() == 2);

    auto const result = fixture.callTool("memory_search_nodes");
    CHECK(result["isError"] == false);
}

TEST_CASE("Gateway health checks restart a subprocess backend that failed discovery", "[gateway]")
{
    auto fixture = GatewayFixture {};
    auto broken = FakeBehavior {};
    broken.unreachable = true;
    fixture.factory->setBehavior("memory", broken);
    fixture.gateway->start();
    REQUIRE(!fixture.gateway->catalog().find("memory_read_graph").has_value());

    auto memory = FakeBehavior {};
    memory.tools = nlohmann::json::array({ makeToolJson("read_graph") });
    fixture.factory->setBehavior("memory", memory);

    for (auto i = 0; i < 3; ++i)
        fixture.gateway->checkAll();
    CHECK(fixture.gateway->recovery().isRestartPending("memory"));

    for (auto i = 0; i < 200 && fixture.gateway->recovery().isRestartPending("memory"); ++i)
        std::this_thread::sleep_for(10ms);

    CHECK(fixture.factory->opens("memory") == 2);
    CHECK(fixture.gateway->health().status("memory")->state == HealthState::Healthy);
    CHECK(fixture.gateway->catalog().find("memory_read_graph").has_value());
}

TEST_CASE("Gateway checkAll marks live backends healthy", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();

    fixture.gateway->checkAll();
    CHECK(fixture.gateway->health().status("memory")->state == HealthState::Healthy);
    CHECK(fixture.gateway->health().status("context7")->state == HealthState::Healthy);
}

TEST_CASE("Gateway restarts a backend that crashed during a call", "[gateway]")
{
    auto fixture = GatewayFixture {};
    auto memory = FakeBehavior {};
    memory.tools = nlohmann::json::array({ makeToolJson("read_graph") });
    memory.crashOnCall = 1;
    fixture.factory->setBehavior("memory", memory);
    fixture.gateway->start();

    auto const failed = fixture.callTool("memory_read_graph");
    CHECK(failed["isError"] == true);
    CHECK(firstText(failed).find("ConnectionClosed") != std::string::npos);

    for (auto i = 0; i < 200 && fixture.factory->opens("memory") < 2; ++i)
        std::this_thread::sleep_for(10ms);
    for (auto i = 0; i < 200 && fixture.gateway->recovery().isRestartPending("memory"); ++i)
        std::this_thread::sleep_for(10ms);

    CHECK(fixture.factory->opens("memory") == 2);
    CHECK(fixture.gateway->health().status("memory")->state == HealthState::Healthy);
    CHECK(fixture.gateway->catalog().find("memory_read_graph").has_value());
}

TEST_CASE("Gateway refuses calls after shutdown", "[gateway]")
{
    auto fixture = GatewayFixture {};
    fixture.gateway->start();
    fixture.gateway->shutdown();

    auto const result = fixture.callTool("memory_read_graph");
    CHECK(result["isError"] == true);
    CHECK(fixture.gateway->registry().list().empty());
}
