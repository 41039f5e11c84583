// SPDX-License-Identifier: Apache-2.0
#include "FakeBackend.hpp"

#include <gateway/BackendExtensions.hpp>
#include <gateway/CallForwarder.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpgate;
using namespace mcpgate::testing;
using namespace std::chrono_literals;

namespace
{

auto makeBackend(std::string id, TransportKind transport) -> BackendDefinition
{
    auto backend = BackendDefinition {};
    backend.id = std::move(id);
    backend.transport = transport;
    backend.command = "fake-server";
    backend.url = "http://localhost:9999/mcp";
    backend.workingDirectory = "/srv/default";
    return backend;
}

struct ForwarderFixture
{
    std::map<std::string, BackendDefinition> backends;
    FakeTransportFactory factory;
    ConnectionRegistry registry;
    CallForwarder forwarder;
    std::vector<CallOutcome> outcomes;

    explicit ForwarderFixture(std::vector<BackendDefinition> definitions):
        backends(toMap(std::move(definitions))),
        registry([this](const std::string& id, const std::string& directory) { return open(id, directory); }),
        forwarder(backends, registry, factory, CallForwarder::Timeouts { .call = 1s, .handshake = 1s })
    {
        forwarder.setOutcomeListener([this](const CallOutcome& outcome) { outcomes.push_back(outcome); });
    }

    static auto toMap(std::vector<BackendDefinition> definitions) -> std::map<std::string, BackendDefinition>
    {
        auto result = std::map<std::string, BackendDefinition> {};
        for (auto& definition: definitions)
            result.emplace(definition.id, std::move(definition));
        return result;
    }

    auto open(const std::string& id, const std::string& directory) -> Result<std::shared_ptr<McpClient>>
    {
        auto const definition = scopeToDirectory(backends.at(id), directory);
        auto transport = factory.open(definition, 1s);
        if (!transport)
            return std::unexpected(transport.error());

        auto client = std::make_shared<McpClient>(id, std::move(*transport));
        return client->handshake(1s).transform([&](auto&&) { return client; });
    }
};

auto echoedArguments(const nlohmann::json& result) -> nlohmann::json
{
    return nlohmann::json::parse(result["content"][0]["text"].get<std::string>());
}

} // namespace

TEST_CASE("CallForwarder rejects unknown backends", "[forwarder]")
{
    auto fixture = ForwarderFixture({ makeBackend("memory", TransportKind::Stdio) });

    auto const result = fixture.forwarder.call("nope", "read_graph", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::BackendNotFound);
    CHECK(fixture.factory.opens("nope") == 0);
}

TEST_CASE("CallForwarder reuses the subprocess session", "[forwarder]")
{
    auto fixture = ForwarderFixture({ makeBackend("memory", TransportKind::Stdio) });

    auto const first = fixture.forwarder.call("memory", "read_graph", { { "depth", 1 } });
    REQUIRE(first.has_value());
    CHECK((*first)["tool"] == "read_graph");
    CHECK(echoedArguments(*first)["depth"] == 1);

    auto const second = fixture.forwarder.call("memory", "search_nodes", nullptr);
    REQUIRE(second.has_value());
    CHECK(echoedArguments(*second) == nlohmann::json::object());

    CHECK(fixture.factory.opens("memory") == 1);
    REQUIRE(fixture.outcomes.size() == 2);
    CHECK(!fixture.outcomes[0].error.has_value());
}

TEST_CASE("CallForwarder drops a session whose backend died", "[forwarder]")
{
    auto fixture = ForwarderFixture({ makeBackend("memory", TransportKind::Stdio) });
    auto behavior = FakeBehavior {};
    behavior.crashOnCall = 9;
    fixture.factory.setBehavior("memory", behavior);

    auto const failed = fixture.forwarder.call("memory", "read_graph", {});
    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::ConnectionClosed);
    REQUIRE(fixture.outcomes.size() == 1);
    CHECK(fixture.outcomes[0].exitCode == 9);
    CHECK(fixture.registry.get("memory") == nullptr);

    fixture.factory.setBehavior("memory", FakeBehavior {});
    CHECK(fixture.forwarder.call("memory", "read_graph", {}).has_value());
    CHECK(fixture.factory.opens("memory") == 2);
}

TEST_CASE("CallForwarder applies argument injectors", "[forwarder]")
{
    auto fixture = ForwarderFixture({
        makeBackend("memory", TransportKind::Stdio),
        makeBackend("git", TransportKind::Stdio),
    });
    fixture.forwarder.setDefaultInjector(projectRootInjector("/home/user/project"));
    fixture.forwarder.setInjector("git", [](nlohmann::json& arguments, const CallContext&, const BackendDefinition& backend) {
        arguments["repo_path"] = backend.workingDirectory;
    });

    SECTION("default injector fills projectRoot")
    {
        auto const result = fixture.forwarder.call("memory", "read_graph", {});
        REQUIRE(result.has_value());
        CHECK(echoedArguments(*result)["projectRoot"] == "/home/user/project");
    }

    SECTION("caller directory wins over the project directory")
    {
        auto const result =
            fixture.forwarder.call("memory", "read_graph", {}, CallContext { .workingDirectory = "/tmp/other" });
        REQUIRE(result.has_value());
        CHECK(echoedArguments(*result)["projectRoot"] == "/tmp/other");
    }

    SECTION("explicit projectRoot is kept")
    {
        auto const result = fixture.forwarder.call("memory", "read_graph", { { "projectRoot", "/mine" } });
        REQUIRE(result.has_value());
        CHECK(echoedArguments(*result)["projectRoot"] == "/mine");
    }

    SECTION("per-backend injector replaces the default")
    {
        auto const result = fixture.forwarder.call("git", "git_status", {});
        REQUIRE(result.has_value());
        auto const arguments = echoedArguments(*result);
        CHECK(arguments["repo_path"] == "/srv/default");
        CHECK(!arguments.contains("projectRoot"));
    }
}

TEST_CASE("CallForwarder reopens directory-scoped backends in the caller's directory", "[forwarder]")
{
    auto backend = makeBackend("filesystem", TransportKind::Stdio);
    backend.args = { "-y", "server-filesystem", "/srv/default" };
    backend.directoryScoped = true;
    auto fixture = ForwarderFixture({ backend });

    REQUIRE(fixture.forwarder.call("filesystem", "list_directory", {}).has_value());
    REQUIRE(
        fixture.forwarder.call("filesystem", "list_directory", {}, CallContext { .workingDirectory = "/work/a" })
            .has_value());

    auto const opened = fixture.factory.openedDefinitions();
    REQUIRE(opened.size() == 2);
    CHECK(opened[0].args.back() == "/srv/default");
    CHECK(opened[1].args.back() == "/work/a");
    CHECK(opened[1].workingDirectory == "/work/a");
}

TEST_CASE("CallForwarder posts HTTP calls on a fresh connection", "[forwarder]")
{
    auto fixture = ForwarderFixture({ makeBackend("remote", TransportKind::Http) });

    auto const result = fixture.forwarder.call("remote", "search", { { "q", "mcp" } });
    REQUIRE(result.has_value());
    CHECK((*result)["tool"] == "search");
    CHECK(echoedArguments(*result)["q"] == "mcp");

    REQUIRE(fixture.forwarder.call("remote", "search", {}).has_value());
    CHECK(fixture.factory.opens("remote") == 2);
    CHECK(fixture.registry.list().empty());
}

TEST_CASE("CallForwarder maps HTTP RPC errors to tool call errors", "[forwarder]")
{
    auto fixture = ForwarderFixture({ makeBackend("remote", TransportKind::Http) });
    auto behavior = FakeBehavior {};
    behavior.failCalls = true;
    fixture.factory.setBehavior("remote", behavior);

    auto const result = fixture.forwarder.call("remote", "search", {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolCallError);
    REQUIRE(fixture.outcomes.size() == 1);
    CHECK(fixture.outcomes[0].error.has_value());
}

TEST_CASE("CallForwarder runs a full handshake for SSE calls", "[forwarder]")
{
    auto fixture = ForwarderFixture({ makeBackend("events", TransportKind::Sse) });

    auto const result = fixture.forwarder.call("events", "subscribe", {});
    REQUIRE(result.has_value());
    CHECK((*result)["tool"] == "subscribe");
    CHECK(fixture.factory.opens("events") == 1);
}

TEST_CASE("CallForwarder reports unreachable backends", "[forwarder]")
{
    auto fixture = ForwarderFixture({ makeBackend("memory", TransportKind::Stdio) });
    auto behavior = FakeBehavior {};
    behavior.unreachable = true;
    fixture.factory.setBehavior("memory", behavior);

    auto const result = fixture.forwarder.call("memory", "read_graph", {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::BackendUnreachable);
    REQUIRE(fixture.outcomes.size() == 1);
    CHECK(fixture.outcomes[0].error->code == ErrorCode::BackendUnreachable);
}
