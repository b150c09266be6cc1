// SPDX-License-Identifier: Apache-2.0
#include <agent/Transcript.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpagent;

TEST_CASE("Transcript starts with the system prompt", "[reasoning]")
{
    auto transcript = Transcript("You are a research assistant.");

    REQUIRE(transcript.size() == 1);
    CHECK(transcript.messages()[0].role == Role::System);
    CHECK(transcript.messages()[0].content == "You are a research assistant.");
}

TEST_CASE("Transcript appends user and assistant turns in order", "[reasoning]")
{
    auto transcript = Transcript("system");

    transcript.addUserMessage("What is TP53?");
    transcript.addAssistantMessage(R"({"is_final": true, "answer": "A gene"})");

    REQUIRE(transcript.size() == 3);
    CHECK(transcript.messages()[1].role == Role::User);
    CHECK(transcript.messages()[1].content == "What is TP53?");
    CHECK(transcript.messages()[2].role == Role::Assistant);
}

TEST_CASE("Transcript feeds observations back as user turns", "[reasoning]")
{
    auto transcript = Transcript("system");

    transcript.addObservation({ { "tool", "mygene.query_genes" }, { "result", { { "total", 1 } } } });

    REQUIRE(transcript.size() == 2);
    CHECK(transcript.messages()[1].role == Role::User);
    CHECK(transcript.messages()[1].content == R"(Observation: {"result":{"total":1},"tool":"mygene.query_genes"})");
}

TEST_CASE("Transcript replaces invalid UTF-8 in observations", "[reasoning]")
{
    auto transcript = Transcript("system");

    transcript.addObservation({ { "result", std::string("bad \xff byte") } });

    CHECK(transcript.messages().back().content.starts_with("Observation: "));
}

TEST_CASE("Transcript formats format errors", "[reasoning]")
{
    auto transcript = Transcript("system");

    transcript.addFormatError("Invalid action format");

    CHECK(transcript.messages().back().content == "Error: Invalid action format. Please use the correct format.");
}
