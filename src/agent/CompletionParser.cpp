// SPDX-License-Identifier: Apache-2.0
#include "CompletionParser.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpagent
{

auto extractJsonObject(std::string_view text) -> Result<nlohmann::json>
{
    auto const start = text.find('{');
    auto const end = text.rfind('}');
    if (start == std::string_view::npos || end == std::string_view::npos || end < start)
        return makeError(ErrorCode::ReasoningParseError, "No JSON found in response");

    auto parsed = json::tryParse(text.substr(start, end - start + 1));
    if (!parsed)
        return makeError(ErrorCode::ReasoningParseError, "Response contains malformed JSON");
    if (!parsed->is_object())
        return makeError(ErrorCode::ReasoningParseError, "Response JSON is not an object");

    return std::move(*parsed);
}

auto parseCompletion(std::string_view text) -> ParsedCompletion
{
    auto extracted = extractJsonObject(text);
    if (!extracted)
        return ParseFailure { .reason = extracted.error().message };

    auto& object = *extracted;
    auto thought = json::getStringOr(object, "thought", "");

    if (object.contains("is_final") && json::isTruthy(object["is_final"]))
    {
        auto answer = std::string {};
        if (object.contains("answer"))
            answer = json::toDisplayString(object["answer"]);
        return ParsedFinal { .thought = std::move(thought), .answer = std::move(answer), .raw = std::move(object) };
    }

    if (!object.contains("action") || !object["action"].is_object())
        return ParsedMalformedAction {
            .thought = std::move(thought),
            .reason = "Response declares neither a final answer nor an action",
            .raw = std::move(object),
        };

    auto const& action = object["action"];
    auto toolId = json::getStringOr(action, "tool", "");
    if (toolId.empty() || !action.contains("arguments") || !action["arguments"].is_object())
        return ParsedMalformedAction {
            .thought = std::move(thought),
            .reason = std::format("Action is missing \"tool\" or \"arguments\": {}", action.dump()),
            .raw = std::move(object),
        };

    auto arguments = action["arguments"];
    return ParsedAction {
        .thought = std::move(thought),
        .toolId = std::move(toolId),
        .arguments = std::move(arguments),
        .raw = std::move(object),
    };
}

} // namespace mcpagent
