// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ToolRegistry.hpp>

#include <string>
#include <string_view>

namespace mcpagent
{

/// @brief Default text placed before the tool listing in the system prompt.
constexpr auto DefaultSystemPreamble = std::string_view {
    "You are a research assistant with access to multiple specialized tool servers."
};

/// @brief Describes every registered tool with its full parameter schema, grouped by server.
///
/// Required parameters come first, each with type and description; optional parameters
/// follow with their declared default.
[[nodiscard]] auto describeTools(const ToolRegistry& registry) -> std::string;

/// @brief Builds the system prompt: preamble, tool listing and the response format contract.
[[nodiscard]] auto buildSystemPrompt(std::string_view preamble, const ToolRegistry& registry) -> std::string;

} // namespace mcpagent
