// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcpagent
{

/// @brief The model's free-text reasoning for one step.
struct ThoughtStep
{
    std::string text;
};

/// @brief A tool invocation requested by the model.
struct ActionStep
{
    std::string toolId;
    nlohmann::json arguments;
};

/// @brief What came back from an action: a result or an error message.
struct ObservationStep
{
    std::string toolId; // empty for format errors
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;

    [[nodiscard]] auto isError() const -> bool { return error.has_value(); }
};

/// @brief The answer the reasoning call ended with.
struct FinalStep
{
    std::string answer;
};

/// @brief One recorded unit of a reasoning trace.
using Step = std::variant<ThoughtStep, ActionStep, ObservationStep, FinalStep>;

/// @brief How a reasoning call ended.
enum class ReasoningOutcome
{
    Final,     ///< The model produced a final answer (or its output could not be parsed).
    Exhausted, ///< The step budget ran out.
    Aborted,   ///< An unexpected failure stopped the loop.
};

[[nodiscard]] constexpr auto outcomeToString(ReasoningOutcome outcome) -> std::string_view
{
    switch (outcome)
    {
        case ReasoningOutcome::Final: return "final";
        case ReasoningOutcome::Exhausted: return "exhausted";
        case ReasoningOutcome::Aborted: return "aborted";
    }
    return "unknown";
}

/// @brief The outcome of one reasonAndAct() call, including its complete trace.
struct ReasoningResult
{
    std::string query;
    std::string answer;
    std::vector<Step> steps;
    ReasoningOutcome outcome = ReasoningOutcome::Final;
};

/// @brief Serializes an observation the way it is shown to the model.
[[nodiscard]] auto observationToJson(const ObservationStep& observation) -> nlohmann::json;

/// @brief Serializes one step as a tagged JSON object ({"type": "thought", ...}).
[[nodiscard]] auto stepToJson(const Step& step) -> nlohmann::json;

/// @brief Serializes a reasoning result with its full trace.
[[nodiscard]] auto resultToJson(const ReasoningResult& result) -> nlohmann::json;

} // namespace mcpagent
