// SPDX-License-Identifier: Apache-2.0
#include "Prompt.hpp"

#include <core/JsonUtils.hpp>

#include <format>
#include <map>
#include <vector>

namespace mcpagent
{

namespace
{

    constexpr auto ResponseFormatInstructions = std::string_view { R"(Important guidelines:
1. Use the EXACT tool names and parameter names as shown above
2. Pay attention to required vs optional parameters
3. Use identifiers returned by one tool as input to the next when needed

You must respond in valid JSON format:
{
  "thought": "your reasoning",
  "action": {
    "tool": "server.tool_name",
    "arguments": {"param_name": "value"}
  },
  "is_final": false
}

Or for final answer:
{
  "thought": "your reasoning",
  "answer": "your final answer",
  "is_final": true
}
)" };

    void describeParameters(std::string& out, const ToolDescriptor& tool)
    {
        if (tool.parameters.empty())
            return;

        out += "    Parameters:\n";
        for (const auto& param: tool.parameters)
        {
            if (param.required)
                out += std::format("      - {} ({}, REQUIRED): {}\n", param.name, param.type, param.description);
        }
        for (const auto& param: tool.parameters)
        {
            if (param.required)
                continue;
            auto const defaultText = param.defaultValue ? json::toDisplayString(*param.defaultValue) : "N/A";
            out += std::format("      - {} ({}, optional, default: {}): {}\n",
                               param.name,
                               param.type,
                               defaultText,
                               param.description);
        }
    }

} // namespace

auto describeTools(const ToolRegistry& registry) -> std::string
{
    auto byServer = std::map<std::string, std::vector<const RegistryEntry*>> {};
    for (const auto* entry: registry.entries())
        byServer[entry->serverName].push_back(entry);

    auto out = std::string {};
    for (const auto& [server, entries]: byServer)
    {
        out += std::format("\n{} tools:\n", server);
        for (const auto* entry: entries)
        {
            auto const& description = entry->descriptor.description;
            out += std::format("\n  {}:\n", entry->toolId);
            out += std::format("    Description: {}\n", description.empty() ? "N/A" : description);
            describeParameters(out, entry->descriptor);
        }
    }
    return out;
}

auto buildSystemPrompt(std::string_view preamble, const ToolRegistry& registry) -> std::string
{
    auto tools = describeTools(registry);
    if (tools.empty())
        tools = "\n(no tools are currently available)\n";

    return std::format(
        "{}\n\nAvailable tools with their exact parameters:\n{}\n{}", preamble, tools, ResponseFormatInstructions);
}

} // namespace mcpagent
