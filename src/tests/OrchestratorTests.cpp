// SPDX-License-Identifier: Apache-2.0
#include "ScriptedModel.hpp"
#include "ScriptedTransport.hpp"

#include <agent/Orchestrator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <map>
#include <set>

using namespace mcpagent;
using namespace mcpagent::test;
using namespace std::chrono_literals;

namespace
{

auto makeDescriptor(std::string name, std::filesystem::path directory, std::set<std::string> tags = {})
    -> ServerDescriptor
{
    return ServerDescriptor {
        .name = std::move(name),
        .workingDirectory = std::move(directory),
        .launchCommand = { "unused" },
        .env = {},
        .description = {},
        .capabilityTags = std::move(tags),
    };
}

/// @brief Scripted servers keyed by name, handed out by the session factory.
struct ScriptedFleet
{
    std::map<std::string, std::shared_ptr<ScriptedServer>> servers;

    void add(const std::string& name, nlohmann::json tools)
    {
        servers[name] = std::make_shared<ScriptedServer>(handshakeHandler(
            std::move(tools), [name](const nlohmann::json& message, ScriptedServer& srv) {
                srv.respond(message, textContent(nlohmann::json { { "server", name } }.dump()));
            }));
    }

    void addUnreachable(const std::string& name)
    {
        servers[name] = std::make_shared<ScriptedServer>();
        servers[name]->failStart(std::format("Server path not found: ../{}-mcp", name));
    }

    [[nodiscard]] auto factory() const -> SessionFactory
    {
        return [servers = servers](const ServerDescriptor& descriptor) -> std::unique_ptr<McpSession> {
            auto const it = servers.find(descriptor.name);
            if (it == servers.end())
                return nullptr;
            return std::make_unique<McpSession>(descriptor, std::make_unique<ScriptedTransport>(it->second));
        };
    }
};

auto twoServerCatalog() -> ServerCatalog
{
    return {
        { "a", makeDescriptor("a", "/srv/a", { "genes" }) },
        { "b", makeDescriptor("b", "/srv/b", { "drugs" }) },
    };
}

} // namespace

TEST_CASE("Orchestrator skips servers that fail to connect", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes"), toolJson("get_gene", "Get") }));
    fleet.addUnreachable("b");

    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, fleet.factory());

    CHECK(orchestrator.connect({ "a", "b" }) == 1);
    CHECK(orchestrator.connectedServers() == std::vector<std::string> { "a" });

    auto const tools = orchestrator.listAllTools();
    REQUIRE(tools.size() == 1);
    REQUIRE(tools.contains("a"));
    CHECK(tools.at("a").size() == 2);
    CHECK(orchestrator.registry().size() == 2);
}

TEST_CASE("Orchestrator connects the whole catalog by default", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));
    fleet.add("b", nlohmann::json::array({ toolJson("get_drug", "Fetch a drug") }));

    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, fleet.factory());

    CHECK(orchestrator.connect() == 2);
    CHECK(orchestrator.connectedServers() == std::vector<std::string> { "a", "b" });
    CHECK(orchestrator.registry().size() == 2);
}

TEST_CASE("Orchestrator ignores unknown server names", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));

    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, fleet.factory());

    CHECK(orchestrator.connect({ "a", "zzz" }) == 1);
    CHECK(orchestrator.connectedServers() == std::vector<std::string> { "a" });
}

TEST_CASE("Orchestrator does not reconnect a connected server", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));

    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, fleet.factory());
    REQUIRE(orchestrator.connect({ "a" }) == 1);
    REQUIRE(orchestrator.connect({ "a" }) == 1);

    CHECK(fleet.servers.at("a")->startCount() == 1);
}

TEST_CASE("Orchestrator connects a server listed twice only once", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));

    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, fleet.factory());
    REQUIRE(orchestrator.connect({ "a", "a" }) == 1);

    CHECK(fleet.servers.at("a")->startCount() == 1);
    CHECK(orchestrator.registry().size() == 1);

    auto result = orchestrator.callTool("a.query_genes", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK((*result)["server"] == "a");
    CHECK(orchestrator.findToolsByCapability("genes") == std::set<std::string> { "a.query_genes" });
}

TEST_CASE("Orchestrator routes tool calls and capability searches", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));
    fleet.add("b", nlohmann::json::array({ toolJson("get_drug", "Fetch a drug") }));

    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, fleet.factory());
    REQUIRE(orchestrator.connect() == 2);

    auto result = orchestrator.callTool("b.get_drug", { { "id", "CHEMBL25" } });
    REQUIRE(result.has_value());
    CHECK((*result)["server"] == "b");

    auto unknown = orchestrator.callTool("b.nothing", nlohmann::json::object());
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::UnknownToolError);

    CHECK(orchestrator.findToolsByCapability("drugs") == std::set<std::string> { "b.get_drug" });
    CHECK(orchestrator.findToolsByCapability("GENES") == std::set<std::string> { "a.query_genes" });
}

TEST_CASE("Orchestrator disconnect empties the registry", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));
    fleet.add("b", nlohmann::json::array({ toolJson("get_drug", "Fetch a drug") }));

    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, fleet.factory());
    REQUIRE(orchestrator.connect() == 2);

    orchestrator.disconnect();

    CHECK(orchestrator.connectedServers().empty());
    CHECK(orchestrator.registry().empty());
    CHECK(fleet.servers.at("a")->closeCount() >= 1);
    CHECK(fleet.servers.at("b")->closeCount() >= 1);

    auto result = orchestrator.callTool("a.query_genes", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::UnknownToolError);
}

TEST_CASE("Orchestrator reasons over the connected tools", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));

    auto model = ScriptedModel({
        R"({"thought": "search", "action": {"tool": "a.query_genes", "arguments": {"q": "TP53"}}, "is_final": false})",
        R"({"answer": "found on a", "is_final": true})",
    });

    auto config = OrchestratorConfig {};
    config.reasoning.maxSteps = 5;
    auto orchestrator = Orchestrator(twoServerCatalog(), &model, config, fleet.factory());
    REQUIRE(orchestrator.connect({ "a" }) == 1);

    auto const result = orchestrator.reasonAndAct("Where is TP53?");
    CHECK(result.outcome == ReasoningOutcome::Final);
    CHECK(result.answer == "found on a");
    CHECK(model.transcripts()[0][0].content.contains("a.query_genes"));
}

TEST_CASE("Orchestrator honours a per-call step budget", "[orchestrator]")
{
    auto fleet = ScriptedFleet {};
    fleet.add("a", nlohmann::json::array({ toolJson("query_genes", "Search genes") }));

    auto model = ScriptedModel({
        R"({"action": {"tool": "a.query_genes", "arguments": {}}, "is_final": false})",
    });
    auto orchestrator = Orchestrator(twoServerCatalog(), &model, {}, fleet.factory());
    REQUIRE(orchestrator.connect({ "a" }) == 1);

    auto const result = orchestrator.reasonAndAct("loop forever", 2);
    CHECK(result.outcome == ReasoningOutcome::Exhausted);
    CHECK(model.callCount() == 2);
}

TEST_CASE("Orchestrator without a model reports an aborted reasoning call", "[orchestrator]")
{
    auto orchestrator = Orchestrator(twoServerCatalog(), nullptr, {}, ScriptedFleet {}.factory());

    auto const result = orchestrator.reasonAndAct("anything");
    CHECK(result.outcome == ReasoningOutcome::Aborted);
    CHECK(result.steps.empty());
    CHECK(result.answer.starts_with("Error during processing"));
}

TEST_CASE("Orchestrator with stdio sessions skips servers with missing paths", "[orchestrator]")
{
    auto catalog = ServerCatalog {
        { "missing", makeDescriptor("missing", "/nonexistent/mcpagent/missing-mcp") },
    };
    catalog["missing"].launchCommand = { "cat" };

    auto config = OrchestratorConfig {};
    config.session.requestTimeout = 500ms;
    auto orchestrator = Orchestrator(std::move(catalog), nullptr, config);

    CHECK(orchestrator.connect() == 0);
    CHECK(orchestrator.listAllTools().empty());
}
