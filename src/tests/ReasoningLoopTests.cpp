// SPDX-License-Identifier: Apache-2.0
#include "ScriptedModel.hpp"
#include "ScriptedTransport.hpp"

#include <agent/Prompt.hpp>
#include <agent/ReasoningLoop.hpp>
#include <agent/ToolRegistry.hpp>
#include <mcp/McpSession.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpagent;
using namespace mcpagent::test;

namespace
{

/// @brief A connected "mygene" server with one search tool, registered in a registry.
struct GeneServerFixture
{
    std::shared_ptr<ScriptedServer> server;
    std::unique_ptr<McpSession> session;
    ToolRegistry registry;

    GeneServerFixture()
    {
        auto tools = nlohmann::json::array({
            toolJson("query_genes",
                     "Search genes by symbol or name",
                     { { "q", { { "type", "string" }, { "description", "Query string" } } },
                       { "size", { { "type", "integer" }, { "default", 10 } } } },
                     { "q" }),
        });
        server = std::make_shared<ScriptedServer>(
            handshakeHandler(std::move(tools), [](const nlohmann::json& message, ScriptedServer& srv) {
                srv.respond(message, textContent(R"({"hits": [{"symbol": "CDK2", "entrezgene": 1017}]})"));
            }));

        auto descriptor = ServerDescriptor {
            .name = "mygene",
            .workingDirectory = {},
            .launchCommand = {},
            .env = {},
            .description = "Gene annotations",
            .capabilityTags = { "genes" },
        };
        session = std::make_unique<McpSession>(std::move(descriptor), std::make_unique<ScriptedTransport>(server));
        REQUIRE(session->connect().has_value());
        registry.registerSession("mygene", *session);
    }
};

constexpr auto SearchAction =
    R"({"thought": "Look up CDK2", "action": {"tool": "mygene.query_genes", "arguments": {"q": "CDK2"}}, "is_final": false})";

} // namespace

TEST_CASE("ReasoningLoop returns an immediate final answer", "[reasoning]")
{
    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({ R"({"answer": "X", "is_final": true})" });
    auto loop = ReasoningLoop(model, fixture.registry);

    auto const result = loop.run("What is X?");

    CHECK(result.query == "What is X?");
    CHECK(result.answer == "X");
    CHECK(result.outcome == ReasoningOutcome::Final);
    REQUIRE(result.steps.size() == 1);
    REQUIRE(std::holds_alternative<FinalStep>(result.steps[0]));
    CHECK(std::get<FinalStep>(result.steps[0]).answer == "X");
    CHECK(model.callCount() == 1);
}

TEST_CASE("ReasoningLoop records the thought before the final answer", "[reasoning]")
{
    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({ R"({"thought": "I already know", "answer": "Y", "is_final": true})" });
    auto loop = ReasoningLoop(model, fixture.registry);

    auto const result = loop.run("question");

    REQUIRE(result.steps.size() == 2);
    REQUIRE(std::holds_alternative<ThoughtStep>(result.steps[0]));
    CHECK(std::get<ThoughtStep>(result.steps[0]).text == "I already know");
    CHECK(std::holds_alternative<FinalStep>(result.steps[1]));
}

TEST_CASE("ReasoningLoop degrades gracefully on unparsable output", "[reasoning]")
{
    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({ "I am not going to answer in JSON." });
    auto loop = ReasoningLoop(model, fixture.registry);

    auto const result = loop.run("question");

    CHECK(result.answer == ParseFailureAnswer);
    CHECK(result.outcome == ReasoningOutcome::Final);
    REQUIRE(result.steps.size() == 1);
    CHECK(std::get<FinalStep>(result.steps[0]).answer == ParseFailureAnswer);
    CHECK(model.callCount() == 1);
}

TEST_CASE("ReasoningLoop invokes tools and feeds observations back", "[reasoning]")
{
    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({
        SearchAction,
        R"({"thought": "Found it", "answer": "CDK2 has Entrez id 1017", "is_final": true})",
    });
    auto loop = ReasoningLoop(model, fixture.registry);

    auto const result = loop.run("What is the Entrez id of CDK2?");

    CHECK(result.outcome == ReasoningOutcome::Final);
    CHECK(result.answer == "CDK2 has Entrez id 1017");

    // Thought, Action, Observation, Thought, Final
    REQUIRE(result.steps.size() == 5);
    auto const& action = std::get<ActionStep>(result.steps[1]);
    CHECK(action.toolId == "mygene.query_genes");
    CHECK(action.arguments == nlohmann::json { { "q", "CDK2" } });

    auto const& observation = std::get<ObservationStep>(result.steps[2]);
    CHECK(!observation.isError());
    REQUIRE(observation.result.has_value());
    CHECK((*observation.result)["hits"][0]["entrezgene"] == 1017);

    auto const sent = fixture.server->sent().back();
    CHECK(sent["method"] == "tools/call");
    CHECK(sent["params"]["name"] == "query_genes");
    CHECK(sent["params"]["arguments"]["q"] == "CDK2");

    REQUIRE(model.callCount() == 2);
    auto const& second = model.transcripts()[1];
    REQUIRE(second.size() == 4);
    CHECK(second[2].role == Role::Assistant);
    CHECK(second[3].role == Role::User);
    CHECK(second[3].content.starts_with("Observation: "));
    CHECK(second[3].content.contains("1017"));
}

TEST_CASE("ReasoningLoop stops at the step budget", "[reasoning]")
{
    constexpr auto MaxSteps = 3;

    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({
        R"({"thought": "try", "action": {"tool": "nowhere.tool", "arguments": {}}, "is_final": false})",
    });
    auto loop = ReasoningLoop(model, fixture.registry);

    auto const result = loop.run("question", MaxSteps);

    CHECK(result.outcome == ReasoningOutcome::Exhausted);
    CHECK(result.answer == StepBudgetExhaustedAnswer);
    CHECK(model.callCount() == MaxSteps);

    auto actions = 0;
    auto observations = 0;
    for (const auto& step: result.steps)
    {
        if (std::holds_alternative<ActionStep>(step))
            ++actions;
        if (auto const* observation = std::get_if<ObservationStep>(&step))
        {
            ++observations;
            REQUIRE(observation->error.has_value());
            CHECK(*observation->error == "[UnknownToolError] Unknown tool: nowhere.tool");
        }
    }
    CHECK(actions == MaxSteps);
    CHECK(observations == MaxSteps);
    CHECK(!std::holds_alternative<FinalStep>(result.steps.back()));
}

TEST_CASE("ReasoningLoop asks the model to fix malformed actions", "[reasoning]")
{
    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({
        R"({"thought": "oops", "action": {"tool": "mygene.query_genes"}, "is_final": false})",
        R"({"answer": "done", "is_final": true})",
    });
    auto loop = ReasoningLoop(model, fixture.registry);

    auto const result = loop.run("question");

    CHECK(result.outcome == ReasoningOutcome::Final);
    CHECK(result.answer == "done");

    // Thought, Observation(format error), Final
    REQUIRE(result.steps.size() == 3);
    auto const& observation = std::get<ObservationStep>(result.steps[1]);
    REQUIRE(observation.error.has_value());
    CHECK(*observation.error == InvalidActionFormatMessage);
    CHECK(observation.toolId.empty());

    REQUIRE(model.callCount() == 2);
    CHECK(model.transcripts()[1].back().content.starts_with("Error: Invalid action format"));
    CHECK(fixture.server->sentMethods().back() == "tools/list");
}

TEST_CASE("ReasoningLoop aborts when the model fails", "[reasoning]")
{
    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({ makeError(ErrorCode::InferenceError, "Failed to decode prompt") });
    auto loop = ReasoningLoop(model, fixture.registry);

    auto const result = loop.run("question");

    CHECK(result.outcome == ReasoningOutcome::Aborted);
    CHECK(result.answer == "Error during processing: Failed to decode prompt");
    CHECK(result.steps.empty());
}

TEST_CASE("ReasoningLoop uses the configured step budget", "[reasoning]")
{
    auto fixture = GeneServerFixture {};
    auto model = ScriptedModel({ SearchAction });
    auto loop = ReasoningLoop(model, fixture.registry, ReasoningConfig { .maxSteps = 2, .systemPreamble = "Be brief." });

    auto const result = loop.run("question");

    CHECK(result.outcome == ReasoningOutcome::Exhausted);
    CHECK(model.callCount() == 2);
    CHECK(model.transcripts()[0][0].content.starts_with("Be brief."));
}

TEST_CASE("System prompt describes every registered tool", "[reasoning]")
{
    auto fixture = GeneServerFixture {};

    auto const prompt = buildSystemPrompt(DefaultSystemPreamble, fixture.registry);

    CHECK(prompt.starts_with(DefaultSystemPreamble));
    CHECK(prompt.contains("mygene tools:"));
    CHECK(prompt.contains("  mygene.query_genes:"));
    CHECK(prompt.contains("Description: Search genes by symbol or name"));
    CHECK(prompt.contains("- q (string, REQUIRED): Query string"));
    CHECK(prompt.contains("- size (integer, optional, default: 10): No description"));
    CHECK(prompt.contains(R"("is_final": true)"));
}

TEST_CASE("System prompt notes when no tools are available", "[reasoning]")
{
    auto const registry = ToolRegistry {};
    auto const prompt = buildSystemPrompt("Preamble", registry);

    CHECK(prompt.contains("(no tools are currently available)"));
}

TEST_CASE("Reasoning traces serialize to JSON", "[reasoning]")
{
    auto const result = ReasoningResult {
        .query = "q",
        .answer = "a",
        .steps = {
            ThoughtStep { .text = "think" },
            ActionStep { .toolId = "s.t", .arguments = { { "x", 1 } } },
            ObservationStep { .toolId = "s.t", .result = std::nullopt, .error = "boom" },
            FinalStep { .answer = "a" },
        },
        .outcome = ReasoningOutcome::Final,
    };

    auto const json = resultToJson(result);

    CHECK(json["query"] == "q");
    CHECK(json["answer"] == "a");
    CHECK(json["outcome"] == outcomeToString(ReasoningOutcome::Final));
    REQUIRE(json["steps"].size() == 4);
    CHECK(json["steps"][0] == nlohmann::json { { "type", "thought" }, { "text", "think" } });
    CHECK(json["steps"][1]["arguments"]["x"] == 1);
    CHECK(json["steps"][2]["error"] == "boom");
    CHECK(!json["steps"][2].contains("result"));
    CHECK(json["steps"][3]["type"] == "final");
}
