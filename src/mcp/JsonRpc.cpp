// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpagent::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", Version },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", Version },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != Version)
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (message.contains("method"))
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is a request or notification");

    if (!message.contains("id") || message["id"].is_null())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response has no id");

    auto response = Response {};
    response.id = message["id"];

    if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (err.is_object())
        {
            response.error = RpcError {
                .code = json::getIntOr(err, "code", 0),
                .message = json::getStringOr(err, "message", "Unknown error"),
                .data = err.contains("data") ? err["data"] : nlohmann::json {},
            };
        }
        else
        {
            response.error = RpcError {
                .code = 0,
                .message = err.is_string() ? err.get<std::string>() : err.dump(),
                .data = {},
            };
        }
    }
    else if (message.contains("result"))
    {
        response.result = message["result"];
    }

    return response;
}

auto describe(const RpcError& error) -> std::string
{
    if (error.data.is_null())
        return std::format("RPC error {}: {}", error.code, error.message);
    return std::format("RPC error {}: {} ({})", error.code, error.message, error.data.dump());
}

} // namespace mcpagent::jsonrpc
