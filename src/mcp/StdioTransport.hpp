// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpagent
{

/// @brief Configuration for spawning a tool server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief Directory the process is started in. Empty means the current directory.
    std::filesystem::path workingDirectory;

    /// @brief Time the process gets to exit after SIGTERM before it is killed.
    std::chrono::milliseconds shutdownGrace { 100 };

    /// @brief Longest time send() waits for the process to drain its stdin.
    std::chrono::milliseconds writeTimeout { 30'000 };
};

/// @brief Transport that communicates with a tool server via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout. The child's stderr
/// is inherited. POSIX only.
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto start() -> VoidResult override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receiveLine() -> Result<std::string> override;
    void interrupt() override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the configuration this transport was created with.
    [[nodiscard]] auto config() const -> const StdioTransportConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpagent
