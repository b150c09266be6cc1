// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace mcpagent
{

/// @brief Abstract line-oriented transport to one tool server.
///
/// Every outgoing message is serialized as a single newline-terminated line.
/// Incoming data is delivered line by line, unparsed, so the caller decides what is
/// protocol traffic and what is diagnostic noise.
///
/// send() and receiveLine() may be called concurrently from different threads,
/// but neither is reentrant on its own.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Opens the underlying channel (e.g. spawns the server process).
    /// @return Success or an error.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Sends a JSON message as one line.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next line from the server (blocking), without its line terminator.
    /// @return The raw line, or an error on stream closure or interruption.
    [[nodiscard]] virtual auto receiveLine() -> Result<std::string> = 0;

    /// @brief Wakes up a blocked receiveLine(), which then fails. Callable from any thread.
    virtual void interrupt() = 0;

    /// @brief Closes the transport and releases the server process.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcpagent
