// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcpagent::jsonrpc
{

/// @brief Protocol version string carried in every envelope.
constexpr auto Version = "2.0";

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response does not carry an error.
    [[nodiscard]] auto isSuccess() const -> bool { return !error.has_value(); }

    /// @brief Returns the id as an integer, if it is one.
    [[nodiscard]] auto integerId() const -> std::optional<int64_t>
    {
        if (id.is_number_integer())
            return id.get<int64_t>();
        return std::nullopt;
    }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
///
/// Requests and notifications sent by the server (anything carrying a "method") are
/// rejected, as are envelopes without an id. A response with neither "result" nor
/// "error" is accepted with an empty result.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Formats an RPC error for logs and error messages.
[[nodiscard]] auto describe(const RpcError& error) -> std::string;

} // namespace mcpagent::jsonrpc
