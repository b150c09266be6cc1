// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Orchestrator.hpp>
#include <agent/Prompt.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpagent
{

/// @brief Language model configuration section.
struct LlmConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1;
    int threads = 0;
    float temperature = 0.0f;
};

/// @brief Agent configuration section.
struct AgentConfig
{
    int maxSteps = 10;
    int requestTimeoutMs = 30'000;
    int shutdownGraceMs = 100;
    std::string systemPrompt = std::string(DefaultSystemPreamble);
};

/// @brief Configuration for a single tool server.
///
/// An empty path means "../<name>-mcp".
struct ServerConfig
{
    std::string name;
    std::string path;
    std::vector<std::string> command;
    std::map<std::string, std::string> env;
    std::string description;
    std::vector<std::string> capabilities;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlmConfig llm;
    AgentConfig agent;
    std::map<std::string, ServerConfig> servers = builtinServers();

    /// @brief The servers that ship with the agent.
    [[nodiscard]] static auto builtinServers() -> std::map<std::string, ServerConfig>;
};

/// @brief Looks up an environment variable; std::nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief EnvLookup backed by the process environment.
[[nodiscard]] auto processEnvironment() -> EnvLookup;

/// @brief Name of the variable overriding a server's path: "<NAME>_MCP_PATH".
[[nodiscard]] auto serverPathVariable(std::string_view serverName) -> std::string;

/// @brief Resolves the configured servers into the immutable catalog used by the orchestrator.
///
/// A server's path is taken from "<NAME>_MCP_PATH" if set, then from its configuration,
/// and defaults to "../<name>-mcp".
[[nodiscard]] auto resolveServerCatalog(const AppConfig& config, const EnvLookup& env) -> ServerCatalog;

/// @brief Derives the orchestrator configuration from the agent section.
[[nodiscard]] auto orchestratorConfig(const AppConfig& config) -> OrchestratorConfig;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcpagent
