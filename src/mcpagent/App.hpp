// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcpagent/Config.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpagent
{

/// @brief Command-line front-end wiring configuration, language model and orchestrator together.
///
/// Every command returns a process exit code.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Prints every known server with its path status.
    [[nodiscard]] auto listServers() -> int;

    /// @brief Connects the servers and prints their tools, optionally filtered by a keyword.
    [[nodiscard]] auto listTools(const std::vector<std::string>& servers, const std::string& capability) -> int;

    /// @brief Answers a single question.
    /// @param question The question.
    /// @param servers Servers to connect; empty means all.
    /// @param maxSteps Step budget override.
    /// @param showSteps Print the reasoning trace after the answer.
    [[nodiscard]] auto query(const std::string& question,
                             const std::vector<std::string>& servers,
                             std::optional<int> maxSteps,
                             bool showSteps) -> int;

    /// @brief Calls one tool directly with JSON arguments.
    [[nodiscard]] auto callTool(const std::string& toolId,
                                const std::string& arguments,
                                const std::vector<std::string>& servers) -> int;

    /// @brief Runs the interactive chat loop on stdin.
    [[nodiscard]] auto chat(const std::vector<std::string>& servers) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpagent
