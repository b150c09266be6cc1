// SPDX-License-Identifier: Apache-2.0
#include "ReasoningLoop.hpp"

#include <agent/CompletionParser.hpp>
#include <agent/Transcript.hpp>
#include <core/Log.hpp>

#include <exception>
#include <format>

namespace mcpagent
{

namespace
{

    auto dumpForModel(const nlohmann::json& value) -> std::string
    {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    void recordThought(ReasoningResult& result, const std::string& thought)
    {
        if (!thought.empty())
            result.steps.emplace_back(ThoughtStep { .text = thought });
    }

    auto finish(ReasoningResult& result, std::string answer, ReasoningOutcome outcome) -> ReasoningResult
    {
        result.answer = std::move(answer);
        result.outcome = outcome;
        log::info("Reasoning finished ({}) after {} steps", outcomeToString(outcome), result.steps.size());
        return std::move(result);
    }

} // namespace

ReasoningLoop::ReasoningLoop(LanguageModel& model, const ToolRegistry& registry, ReasoningConfig config):
    _model(model), _registry(registry), _config(std::move(config))
{
}

auto ReasoningLoop::run(std::string_view query) -> ReasoningResult
{
    return run(query, _config.maxSteps);
}

auto ReasoningLoop::run(std::string_view query, int maxSteps) -> ReasoningResult
{
    auto result = ReasoningResult {
        .query = std::string(query),
        .answer = {},
        .steps = {},
        .outcome = ReasoningOutcome::Exhausted,
    };

    auto transcript = Transcript(buildSystemPrompt(_config.systemPreamble, _registry));
    transcript.addUserMessage(std::string(query));

    for (auto step = 0; step < maxSteps; ++step)
    {
        log::debug("Reasoning step {}/{}", step + 1, maxSteps);

        try
        {
            auto completion = _model.complete(transcript.messages());
            if (!completion)
            {
                log::error("Language model failed: {}", completion.error().message);
                return finish(result,
                              std::format("Error during processing: {}", completion.error().message),
                              ReasoningOutcome::Aborted);
            }

            auto parsed = parseCompletion(*completion);

            if (auto const* failure = std::get_if<ParseFailure>(&parsed))
            {
                log::error("Failed to parse model output: {}. Content: {}", failure->reason, *completion);
                result.steps.emplace_back(FinalStep { .answer = std::string(ParseFailureAnswer) });
                return finish(result, std::string(ParseFailureAnswer), ReasoningOutcome::Final);
            }

            if (auto* finalAnswer = std::get_if<ParsedFinal>(&parsed))
            {
                recordThought(result, finalAnswer->thought);
                result.steps.emplace_back(FinalStep { .answer = finalAnswer->answer });
                return finish(result, std::move(finalAnswer->answer), ReasoningOutcome::Final);
            }

            if (auto* action = std::get_if<ParsedAction>(&parsed))
            {
                recordThought(result, action->thought);
                result.steps.emplace_back(ActionStep { .toolId = action->toolId, .arguments = action->arguments });

                auto observation = ObservationStep { .toolId = action->toolId, .result = {}, .error = {} };
                auto toolResult = _registry.invoke(action->toolId, action->arguments);
                if (toolResult)
                {
                    observation.result = std::move(*toolResult);
                }
                else
                {
                    log::warning("Tool {} failed: {}", action->toolId, toolResult.error().message);
                    observation.error = std::format("{}", toolResult.error());
                }

                transcript.addAssistantMessage(dumpForModel(action->raw));
                transcript.addObservation(observationToJson(observation));
                result.steps.emplace_back(std::move(observation));
                continue;
            }

            auto& malformed = std::get<ParsedMalformedAction>(parsed);
            log::warning("Model produced an unusable action: {}", malformed.reason);
            recordThought(result, malformed.thought);
            result.steps.emplace_back(ObservationStep {
                .toolId = {},
                .result = {},
                .error = std::string(InvalidActionFormatMessage),
            });
            transcript.addAssistantMessage(dumpForModel(malformed.raw));
            transcript.addFormatError(InvalidActionFormatMessage);
        }
        catch (const std::exception& e)
        {
            log::error("Error in reasoning step {}: {}", step + 1, e.what());
            return finish(result, std::format("Error during processing: {}", e.what()), ReasoningOutcome::Aborted);
        }
    }

    log::warning("Reasoning reached the step budget ({}) without a final answer", maxSteps);
    return finish(result, std::string(StepBudgetExhaustedAnswer), ReasoningOutcome::Exhausted);
}

auto ReasoningLoop::config() const -> const ReasoningConfig&
{
    return _config;
}

} // namespace mcpagent
