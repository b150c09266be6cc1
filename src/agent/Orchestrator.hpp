// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ReasoningLoop.hpp>
#include <agent/Step.hpp>
#include <agent/ToolRegistry.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/LanguageModel.hpp>
#include <mcp/McpSession.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpagent
{

/// @brief Creates an (unconnected) session for a server.
using SessionFactory = std::function<std::unique_ptr<McpSession>(const ServerDescriptor& descriptor)>;

/// @brief Configuration for the orchestrator.
struct OrchestratorConfig
{
    SessionOptions session;
    ReasoningConfig reasoning;

    /// @brief Time a server gets to exit after SIGTERM on disconnect.
    std::chrono::milliseconds shutdownGrace { 100 };
};

/// @brief Returns a factory that launches each server as a subprocess speaking over stdio.
[[nodiscard]] auto makeStdioSessionFactory(SessionOptions options, std::chrono::milliseconds shutdownGrace)
    -> SessionFactory;

/// @brief Connects tool servers, aggregates their tools and runs reasoning calls over them.
///
/// This is the public surface used by front-ends.
class Orchestrator
{
  public:
    /// @brief Constructs an Orchestrator.
    /// @param catalog All known servers.
    /// @param model The language model; may be nullptr if reasonAndAct() is never used.
    /// @param config Orchestrator configuration.
    /// @param sessionFactory Session factory; defaults to makeStdioSessionFactory().
    Orchestrator(ServerCatalog catalog,
                 LanguageModel* model,
                 OrchestratorConfig config = {},
                 SessionFactory sessionFactory = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Connects the named servers in parallel and registers the tools of each one that
    ///        becomes Ready.
    ///
    /// Failures are logged per server and never abort the others.
    /// @param serverNames Servers to connect; empty means every server in the catalog.
    /// @return The number of connected servers afterwards.
    auto connect(const std::vector<std::string>& serverNames = {}) -> size_t;

    /// @brief Disconnects all servers and empties the registry.
    void disconnect();

    /// @brief Lists all tools grouped by server.
    [[nodiscard]] auto listAllTools() const -> std::map<std::string, std::vector<ToolSummary>>;

    /// @brief Finds tools whose name, description or server capabilities match a keyword.
    [[nodiscard]] auto findToolsByCapability(std::string_view keyword) const -> std::set<std::string>;

    /// @brief Calls a tool by its full id ("<server>.<tool>").
    [[nodiscard]] auto callTool(std::string_view toolId, const nlohmann::json& arguments)
        -> Result<nlohmann::json>;

    /// @brief Lets the language model answer a query using the registered tools.
    /// @param query The question.
    /// @param maxSteps Step budget; defaults to the configured one.
    /// @return The answer and the complete trace. Never fails.
    [[nodiscard]] auto reasonAndAct(std::string_view query, std::optional<int> maxSteps = std::nullopt)
        -> ReasoningResult;

    /// @brief Names of the servers currently connected.
    [[nodiscard]] auto connectedServers() const -> std::vector<std::string>;

    [[nodiscard]] auto catalog() const -> const ServerCatalog&;
    [[nodiscard]] auto registry() const -> const ToolRegistry&;

  private:
    ServerCatalog _catalog;
    LanguageModel* _model;
    OrchestratorConfig _config;
    SessionFactory _sessionFactory;
    std::map<std::string, std::unique_ptr<McpSession>> _sessions;
    ToolRegistry _registry;
};

} // namespace mcpagent
