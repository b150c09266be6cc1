// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpSession.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpagent
{

/// @brief A tool addressable through the registry as "<server>.<tool>".
struct RegistryEntry
{
    std::string toolId;
    std::string serverName;
    McpSession* session = nullptr; // non-owning
    ToolDescriptor descriptor;
};

/// @brief Short listing of a registered tool.
struct ToolSummary
{
    std::string toolId;
    std::string name;
    std::string description;
};

/// @brief Flat namespace over the tool catalogs of all Ready sessions.
///
/// Filled once per session right after it becomes Ready; read-only afterwards.
class ToolRegistry
{
  public:
    /// @brief Builds the registry key of a tool.
    [[nodiscard]] static auto makeToolId(std::string_view serverName, std::string_view toolName) -> std::string;

    /// @brief Registers every tool in the session's catalog under "<serverName>.<toolName>".
    /// @return The number of tools registered.
    auto registerSession(std::string_view serverName, McpSession& session) -> size_t;

    /// @brief Removes all entries.
    void clear();

    /// @brief Looks up a tool by id.
    /// @return The entry, or an UnknownToolError.
    [[nodiscard]] auto resolve(std::string_view toolId) const -> Result<const RegistryEntry*>;

    /// @brief Resolves a tool and invokes it on its owning session.
    [[nodiscard]] auto invoke(std::string_view toolId, const nlohmann::json& arguments) const
        -> Result<nlohmann::json>;

    /// @brief Lists tools grouped by server, each group in catalog order.
    [[nodiscard]] auto listGrouped() const -> std::map<std::string, std::vector<ToolSummary>>;

    /// @brief Case-insensitive substring search over tool names, descriptions and the
    ///        owning server's capability tags.
    [[nodiscard]] auto search(std::string_view keyword) const -> std::set<std::string>;

    /// @brief All entries in registration order.
    [[nodiscard]] auto entries() const -> std::vector<const RegistryEntry*>;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto empty() const -> bool;

  private:
    std::map<std::string, RegistryEntry, std::less<>> _entries;
    std::vector<std::string> _order;
};

} // namespace mcpagent
