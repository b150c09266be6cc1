// SPDX-License-Identifier: Apache-2.0
#include "Step.hpp"

namespace mcpagent
{

namespace
{

    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

} // namespace

auto observationToJson(const ObservationStep& observation) -> nlohmann::json
{
    auto json = nlohmann::json::object();
    if (!observation.toolId.empty())
        json["tool"] = observation.toolId;
    if (observation.error)
        json["error"] = *observation.error;
    else
        json["result"] = observation.result.value_or(nlohmann::json {});
    return json;
}

auto stepToJson(const Step& step) -> nlohmann::json
{
    return std::visit(
        Overloaded {
            [](const ThoughtStep& thought) -> nlohmann::json {
                return { { "type", "thought" }, { "text", thought.text } };
            },
            [](const ActionStep& action) -> nlohmann::json {
                return { { "type", "action" }, { "tool", action.toolId }, { "arguments", action.arguments } };
            },
            [](const ObservationStep& observation) -> nlohmann::json {
                auto json = observationToJson(observation);
                json["type"] = "observation";
                return json;
            },
            [](const FinalStep& finalStep) -> nlohmann::json {
                return { { "type", "final" }, { "answer", finalStep.answer } };
            },
        },
        step);
}

auto resultToJson(const ReasoningResult& result) -> nlohmann::json
{
    auto steps = nlohmann::json::array();
    for (const auto& step: result.steps)
        steps.push_back(stepToJson(step));

    return {
        { "query", result.query },
        { "answer", result.answer },
        { "outcome", outcomeToString(result.outcome) },
        { "steps", std::move(steps) },
    };
}

} // namespace mcpagent
