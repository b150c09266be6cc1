// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace mcpagent
{

namespace
{

    auto toLower(std::string_view text) -> std::string
    {
        auto lowered = std::string(text);
        std::ranges::transform(
            lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    auto containsIgnoreCase(std::string_view haystack, std::string_view loweredNeedle) -> bool
    {
        return toLower(haystack).find(loweredNeedle) != std::string::npos;
    }

} // namespace

auto ToolRegistry::makeToolId(std::string_view serverName, std::string_view toolName) -> std::string
{
    return std::format("{}.{}", serverName, toolName);
}

auto ToolRegistry::registerSession(std::string_view serverName, McpSession& session) -> size_t
{
    for (const auto& tool: session.tools())
    {
        auto toolId = makeToolId(serverName, tool.name);

        if (_entries.contains(toolId))
            log::warning("Tool {} registered twice; keeping the latest", toolId);
        else
            _order.push_back(toolId);

        _entries.insert_or_assign(toolId,
                                  RegistryEntry {
                                      .toolId = toolId,
                                      .serverName = std::string(serverName),
                                      .session = &session,
                                      .descriptor = tool,
                                  });
        log::debug("  Tool registered: {}", toolId);
    }

    log::info("Registered {} tools from {}", session.tools().size(), serverName);
    return session.tools().size();
}

void ToolRegistry::clear()
{
    _entries.clear();
    _order.clear();
}

auto ToolRegistry::resolve(std::string_view toolId) const -> Result<const RegistryEntry*>
{
    auto const it = _entries.find(toolId);
    if (it == _entries.end())
        return makeError(ErrorCode::UnknownToolError, std::format("Unknown tool: {}", toolId));
    return &it->second;
}

auto ToolRegistry::invoke(std::string_view toolId, const nlohmann::json& arguments) const -> Result<nlohmann::json>
{
    return resolve(toolId).and_then([&](const RegistryEntry* entry) -> Result<nlohmann::json> {
        log::info("Calling tool {}", entry->toolId);
        return entry->session->callTool(entry->descriptor.name, arguments);
    });
}

auto ToolRegistry::listGrouped() const -> std::map<std::string, std::vector<ToolSummary>>
{
    auto grouped = std::map<std::string, std::vector<ToolSummary>> {};
    for (const auto* entry: entries())
    {
        grouped[entry->serverName].push_back(ToolSummary {
            .toolId = entry->toolId,
            .name = entry->descriptor.name,
            .description = entry->descriptor.description,
        });
    }
    return grouped;
}

auto ToolRegistry::search(std::string_view keyword) const -> std::set<std::string>
{
    auto const needle = toLower(keyword);
    auto matches = std::set<std::string> {};

    for (const auto& [toolId, entry]: _entries)
    {
        if (containsIgnoreCase(entry.descriptor.name, needle)
            || containsIgnoreCase(entry.descriptor.description, needle))
        {
            matches.insert(toolId);
            continue;
        }

        auto const& tags = entry.session->descriptor().capabilityTags;
        if (std::ranges::any_of(tags, [&](const std::string& tag) { return containsIgnoreCase(tag, needle); }))
            matches.insert(toolId);
    }

    return matches;
}

auto ToolRegistry::entries() const -> std::vector<const RegistryEntry*>
{
    auto ordered = std::vector<const RegistryEntry*> {};
    ordered.reserve(_order.size());
    for (const auto& toolId: _order)
        ordered.push_back(&_entries.find(toolId)->second);
    return ordered;
}

auto ToolRegistry::size() const -> size_t
{
    return _entries.size();
}

auto ToolRegistry::empty() const -> bool
{
    return _entries.empty();
}

} // namespace mcpagent
