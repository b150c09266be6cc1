// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpagent
{

/// @brief Lifecycle state of a protocol session.
enum class SessionState
{
    Unconnected,
    Initializing,
    Ready,
    Disconnected,
    Failed,
};

/// @brief Converts a SessionState to its display name.
[[nodiscard]] constexpr auto sessionStateToString(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Unconnected: return "unconnected";
        case SessionState::Initializing: return "initializing";
        case SessionState::Ready: return "ready";
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Server identity reported in the initialize response.
struct ServerInfo
{
    std::string name = "unknown";
    std::string version = "unknown";
    std::string protocolVersion;
};

/// @brief Tunables of a protocol session.
struct SessionOptions
{
    /// @brief Deadline for every request, the handshake requests included.
    std::chrono::milliseconds requestTimeout { 30'000 };
    std::string clientName = "mcpagent";
    std::string clientVersion = "0.1.0";
};

/// @brief Protocol version announced during the handshake.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief Unwraps the result of a tools/call request.
///
/// If the first content item carries a "text" payload, it is parsed as JSON when possible
/// and returned verbatim as a string otherwise. Without usable content the raw result is
/// returned. A result flagged with "isError" yields a ToolInvocationError.
[[nodiscard]] auto unwrapToolResult(const nlohmann::json& result) -> Result<nlohmann::json>;

/// @brief A JSON-RPC session with one tool server.
///
/// Owns the transport (and thus the server process). A background reader thread
/// correlates responses with pending requests by id, so any number of threads may have
/// requests in flight concurrently. Responses may arrive in any order. Responses for
/// unknown, timed-out or already answered ids are dropped.
class McpSession
{
  public:
    /// @brief Constructs an unconnected session.
    /// @param descriptor The static server description.
    /// @param transport The transport to the server; started by connect().
    /// @param options Session tunables.
    McpSession(ServerDescriptor descriptor, std::unique_ptr<Transport> transport, SessionOptions options = {});
    ~McpSession();

    McpSession(const McpSession&) = delete;
    McpSession& operator=(const McpSession&) = delete;

    /// @brief Starts the transport and performs the initialize / initialized / tools/list handshake.
    ///
    /// On failure the session is left in the Failed state with an empty tool catalog.
    /// @return Success or a ConnectionError.
    [[nodiscard]] auto connect() -> VoidResult;

    /// @brief Sends a request and blocks until its response arrives or the timeout elapses.
    /// @param method The method name.
    /// @param params The request parameters.
    /// @param timeout Overrides the session's request timeout.
    /// @return The response's result, or ProtocolError / TimeoutError / ConnectionError.
    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params = nlohmann::json::object(),
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Sends a notification; no response is expected.
    [[nodiscard]] auto sendNotification(std::string_view method, nlohmann::json params = nullptr)
        -> VoidResult;

    /// @brief Invokes a tool on the server and unwraps its result (see unwrapToolResult()).
    /// @param name The tool name as advertised by the server.
    /// @param arguments The tool arguments.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<nlohmann::json>;

    /// @brief Stops the reader, terminates the server process and fails all pending requests.
    ///
    /// Idempotent; safe to call in any state.
    void disconnect();

    [[nodiscard]] auto state() const -> SessionState;
    [[nodiscard]] auto descriptor() const -> const ServerDescriptor&;
    [[nodiscard]] auto name() const -> const std::string&;

    /// @brief The tool catalog fetched during the handshake (empty unless Ready).
    [[nodiscard]] auto tools() const -> const std::vector<ToolDescriptor>&;

    [[nodiscard]] auto serverInfo() const -> const ServerInfo&;

    /// @brief Number of requests awaiting a response.
    [[nodiscard]] auto pendingCount() const -> size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpagent
