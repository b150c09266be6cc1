// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace mcpagent
{

/// @brief The model declared a final answer.
struct ParsedFinal
{
    std::string thought;
    std::string answer;
    nlohmann::json raw;
};

/// @brief The model requested a tool invocation.
struct ParsedAction
{
    std::string thought;
    std::string toolId;
    nlohmann::json arguments;
    nlohmann::json raw;
};

/// @brief The model produced structured output, but no usable action.
struct ParsedMalformedAction
{
    std::string thought;
    std::string reason;
    nlohmann::json raw;
};

/// @brief No structured output could be extracted at all.
struct ParseFailure
{
    std::string reason;
};

/// @brief Result of interpreting one model completion.
using ParsedCompletion = std::variant<ParsedFinal, ParsedAction, ParsedMalformedAction, ParseFailure>;

/// @brief Message fed back to the model when an action lacks its required fields.
constexpr auto InvalidActionFormatMessage =
    std::string_view { R"(Invalid action format. Expected {"tool": "...", "arguments": {...}})" };

/// @brief Extracts the JSON object spanning from the first '{' to the last '}' of a text.
/// @return The parsed object or a ReasoningParseError.
[[nodiscard]] auto extractJsonObject(std::string_view text) -> Result<nlohmann::json>;

/// @brief Interprets a model completion as a final answer or an action.
///
/// Expected shapes:
///   {"thought": "...", "action": {"tool": "server.tool", "arguments": {...}}, "is_final": false}
///   {"thought": "...", "answer": "...", "is_final": true}
[[nodiscard]] auto parseCompletion(std::string_view text) -> ParsedCompletion;

} // namespace mcpagent
