// SPDX-License-Identifier: Apache-2.0
#include "ToolSchema.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>

namespace mcpagent
{

auto parametersFromSchema(const nlohmann::json& inputSchema) -> std::vector<ToolParameter>
{
    auto parameters = std::vector<ToolParameter> {};
    if (!inputSchema.is_object() || !inputSchema.contains("properties")
        || !inputSchema["properties"].is_object())
        return parameters;

    auto const required = json::getStringList(inputSchema, "required");

    for (const auto& [name, property]: inputSchema["properties"].items())
    {
        auto parameter = ToolParameter {
            .name = name,
            .type = json::getStringOr(property, "type", "string"),
            .description = json::getStringOr(property, "description", "No description"),
            .required = std::ranges::find(required, name) != required.end(),
            .defaultValue = std::nullopt,
        };

        if (property.is_object() && property.contains("default"))
            parameter.defaultValue = property["default"];

        parameters.push_back(std::move(parameter));
    }

    return parameters;
}

auto parseToolDescriptor(const nlohmann::json& toolJson) -> Result<ToolDescriptor>
{
    auto name = json::getString(toolJson, "name");
    if (!name)
        return makeError(ErrorCode::ProtocolError, std::format("Malformed tool entry: {}", toolJson.dump()));

    auto inputSchema = nlohmann::json::object();
    if (toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object())
        inputSchema = toolJson["inputSchema"];

    auto descriptor = ToolDescriptor {
        .name = std::move(*name),
        .description = json::getStringOr(toolJson, "description", ""),
        .inputSchema = inputSchema,
        .parameters = parametersFromSchema(inputSchema),
    };
    return descriptor;
}

auto parseToolList(const nlohmann::json& listResult) -> Result<std::vector<ToolDescriptor>>
{
    auto tools = std::vector<ToolDescriptor> {};

    if (!listResult.is_object())
        return makeError(ErrorCode::ProtocolError, "tools/list result is not an object");

    if (!listResult.contains("tools"))
        return tools;

    if (!listResult["tools"].is_array())
        return makeError(ErrorCode::ProtocolError, "tools/list result has a non-array \"tools\" member");

    for (const auto& toolJson: listResult["tools"])
    {
        auto tool = parseToolDescriptor(toolJson);
        if (!tool)
            return std::unexpected(tool.error());
        tools.push_back(std::move(*tool));
    }

    return tools;
}

} // namespace mcpagent
