// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Prompt.hpp>
#include <agent/Step.hpp>
#include <agent/ToolRegistry.hpp>
#include <llm/LanguageModel.hpp>

#include <string>
#include <string_view>

namespace mcpagent
{

/// @brief Answer used when the step budget runs out.
constexpr auto StepBudgetExhaustedAnswer = std::string_view { "step budget exhausted" };

/// @brief Answer used when a completion cannot be parsed.
constexpr auto ParseFailureAnswer =
    std::string_view { "I apologize, I had trouble processing the response. Please try again." };

/// @brief Configuration for the reasoning loop.
struct ReasoningConfig
{
    int maxSteps = 10;
    std::string systemPreamble = std::string(DefaultSystemPreamble);
};

/// @brief Implements the bounded think / act / observe cycle.
///
/// Each step asks the model for one completion, parses it into an action or a final
/// answer, executes the action through the tool registry and feeds the observation back
/// into the transcript. Tool failures become observations; the model gets to see them and
/// choose differently. The loop never fails: every exit is a ReasoningResult.
class ReasoningLoop
{
  public:
    /// @brief Constructs a ReasoningLoop.
    /// @param model The language model backend.
    /// @param registry The tools available to the model.
    /// @param config Loop configuration.
    ReasoningLoop(LanguageModel& model, const ToolRegistry& registry, ReasoningConfig config = {});

    /// @brief Runs one reasoning call.
    /// @param query The user's question.
    /// @param maxSteps Step budget (number of model calls).
    /// @return The answer and the complete step trace.
    [[nodiscard]] auto run(std::string_view query, int maxSteps) -> ReasoningResult;

    /// @brief Runs one reasoning call with the configured step budget.
    [[nodiscard]] auto run(std::string_view query) -> ReasoningResult;

    /// @brief Returns the loop configuration.
    [[nodiscard]] auto config() const -> const ReasoningConfig&;

  private:
    LanguageModel& _model;
    const ToolRegistry& _registry;
    ReasoningConfig _config;
};

} // namespace mcpagent
