// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpagent
{

/// @brief The role of a message in a reasoning transcript.
enum class Role
{
    System,
    User,
    Assistant,
};

/// @brief Converts a Role enum to its string representation.
/// @param role The role to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

/// @brief A single message in a reasoning transcript.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;
};

/// @brief One declared input parameter of a tool, derived from its JSON schema.
struct ToolParameter
{
    std::string name;
    std::string type = "string";
    std::string description = "No description";
    bool required = false;
    std::optional<nlohmann::json> defaultValue;
};

/// @brief A tool as advertised by a server in its tools/list response.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
    std::vector<ToolParameter> parameters;
};

/// @brief Static description of one tool server and how to launch it.
struct ServerDescriptor
{
    std::string name;
    std::filesystem::path workingDirectory;
    std::vector<std::string> launchCommand;
    std::map<std::string, std::string> env;
    std::string description;
    std::set<std::string> capabilityTags;
};

/// @brief Immutable table of all known servers, keyed by server name.
using ServerCatalog = std::map<std::string, ServerDescriptor>;

} // namespace mcpagent
