// SPDX-License-Identifier: Apache-2.0
#include "McpSession.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ToolSchema.hpp>

#include <atomic>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <thread>

namespace mcpagent
{

namespace
{

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

} // namespace

auto unwrapToolResult(const nlohmann::json& result) -> Result<nlohmann::json>
{
    if (!result.is_object() || !result.contains("content"))
        return result;

    auto const& content = result["content"];
    auto const* text = static_cast<const nlohmann::json*>(nullptr);
    if (content.is_array() && !content.empty() && content.front().is_object()
        && content.front().contains("text") && content.front()["text"].is_string())
        text = &content.front()["text"];

    if (json::getBoolOr(result, "isError", false))
        return makeError(ErrorCode::ToolInvocationError,
                         text ? text->get<std::string>() : std::string("Tool reported an error"));

    if (!text)
        return result;

    auto const& payload = text->get_ref<const std::string&>();
    if (auto parsed = json::tryParse(payload))
        return std::move(*parsed);
    return nlohmann::json(payload);
}

struct McpSession::Impl
{
    ServerDescriptor descriptor;
    std::unique_ptr<Transport> transport;
    SessionOptions options;

    std::atomic<SessionState> state = SessionState::Unconnected;
    std::atomic<int64_t> nextId = 1;

    mutable std::mutex pendingMutex;
    std::map<int64_t, std::promise<Result<nlohmann::json>>> pending;
    bool streamClosed = false;

    std::mutex writeMutex;
    std::jthread reader;

    std::vector<ToolDescriptor> tools;
    ServerInfo serverInfo;

    /// @brief Reader thread body: consumes lines until the stream ends or a stop is requested.
    void readLoop(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto line = transport->receiveLine();
            if (!line)
            {
                if (!stopToken.stop_requested())
                    log::info("[{}] Output stream ended: {}", descriptor.name, line.error().message);
                break;
            }
            handleLine(*line);
        }

        failAllPending(Error { ErrorCode::ConnectionError,
                               std::format("Connection to '{}' closed", descriptor.name) });
    }

    void handleLine(std::string_view rawLine)
    {
        auto const line = trim(rawLine);
        if (line.empty())
            return;

        log::trace("[{}] <- {}", descriptor.name, line);

        // Servers print diagnostics to stdout as well; only objects can be envelopes.
        if (line.front() != '{')
            return;

        auto message = json::tryParse(line);
        if (!message)
        {
            log::debug("[{}] Dropping unparsable line", descriptor.name);
            return;
        }

        auto response = jsonrpc::parseResponse(*message);
        if (!response)
        {
            log::debug("[{}] Ignoring message: {}", descriptor.name, response.error().message);
            return;
        }

        auto const id = response->integerId();
        if (!id)
        {
            log::debug("[{}] Ignoring response with non-integer id {}", descriptor.name, response->id.dump());
            return;
        }

        if (response->error)
            resolve(*id, makeError(ErrorCode::ProtocolError, jsonrpc::describe(*response->error)));
        else
            resolve(*id, response->result.value_or(nlohmann::json::object()));
    }

    void resolve(int64_t id, Result<nlohmann::json> result)
    {
        auto promise = std::promise<Result<nlohmann::json>> {};
        {
            auto lock = std::lock_guard(pendingMutex);
            auto const it = pending.find(id);
            if (it == pending.end())
            {
                log::debug("[{}] Dropping orphaned or duplicate response for id {}", descriptor.name, id);
                return;
            }
            promise = std::move(it->second);
            pending.erase(it);
        }
        promise.set_value(std::move(result));
    }

    void failAllPending(const Error& error)
    {
        auto orphans = std::map<int64_t, std::promise<Result<nlohmann::json>>> {};
        {
            auto lock = std::lock_guard(pendingMutex);
            streamClosed = true;
            orphans.swap(pending);
        }
        for (auto& [id, promise]: orphans)
            promise.set_value(std::unexpected(error));
    }

    auto writeMessage(const nlohmann::json& message) -> VoidResult
    {
        auto lock = std::lock_guard(writeMutex);
        log::debug("[{}] -> {}", descriptor.name, message.dump());
        return transport->send(message);
    }

    /// @brief Stops the reader thread, then closes the transport.
    void shutdownChannel()
    {
        if (reader.joinable())
        {
            reader.request_stop();
            transport->interrupt();
            reader.join();
        }
        transport->close();
        failAllPending(Error { ErrorCode::ConnectionError,
                               std::format("Session '{}' disconnected", descriptor.name) });
    }
};

McpSession::McpSession(ServerDescriptor descriptor, std::unique_ptr<Transport> transport, SessionOptions options):
    _impl(std::make_unique<Impl>())
{
    _impl->descriptor = std::move(descriptor);
    _impl->transport = std::move(transport);
    _impl->options = std::move(options);
}

McpSession::~McpSession()
{
    disconnect();
}

auto McpSession::connect() -> VoidResult
{
    auto const& name = _impl->descriptor.name;

    if (_impl->state != SessionState::Unconnected)
        return makeError(ErrorCode::ConnectionError,
                         std::format("Session '{}' cannot connect from state {}",
                                     name,
                                     sessionStateToString(_impl->state)));

    _impl->state = SessionState::Initializing;
    log::debug("[{}] Connecting", name);

    auto const fail = [this, &name](const Error& cause) -> VoidResult {
        _impl->shutdownChannel();
        _impl->tools.clear();
        _impl->state = SessionState::Failed;
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to connect to '{}': {}", name, cause.message));
    };

    if (auto started = _impl->transport->start(); !started)
        return fail(started.error());

    _impl->reader = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->readLoop(token); });

    // Step 1: initialize
    auto initParams = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", { { "tools", nlohmann::json::object() } } },
        { "clientInfo",
          {
              { "name", _impl->options.clientName },
              { "version", _impl->options.clientVersion },
          } },
    };

    auto initResult = sendRequest("initialize", std::move(initParams));
    if (!initResult)
        return fail(initResult.error());
    if (!initResult->is_object())
        return fail(Error { ErrorCode::ProtocolError, "Malformed initialize response" });

    auto const serverInfoJson = initResult->value("serverInfo", nlohmann::json::object());
    _impl->serverInfo = ServerInfo {
        .name = json::getStringOr(serverInfoJson, "name", "unknown"),
        .version = json::getStringOr(serverInfoJson, "version", "unknown"),
        .protocolVersion = json::getStringOr(*initResult, "protocolVersion", ""),
    };
    log::debug("[{}] Initialize response: {}", name, initResult->dump());

    // Step 2: initialized notification
    if (auto notified = sendNotification("notifications/initialized"); !notified)
        return fail(notified.error());

    // Step 3: tool catalog
    auto listResult = sendRequest("tools/list");
    if (!listResult)
        return fail(listResult.error());

    auto tools = parseToolList(*listResult);
    if (!tools)
        return fail(tools.error());

    _impl->tools = std::move(*tools);
    _impl->state = SessionState::Ready;

    log::info("Connected to {} ({} v{}) with {} tools",
              name,
              _impl->serverInfo.name,
              _impl->serverInfo.version,
              _impl->tools.size());
    return {};
}

auto McpSession::sendRequest(std::string_view method,
                             nlohmann::json params,
                             std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    auto const state = _impl->state.load();
    if (state != SessionState::Initializing && state != SessionState::Ready)
        return makeError(ErrorCode::ConnectionError,
                         std::format("Session '{}' is {}", _impl->descriptor.name, sessionStateToString(state)));

    auto const id = _impl->nextId++;
    auto future = std::future<Result<nlohmann::json>> {};
    {
        auto lock = std::lock_guard(_impl->pendingMutex);
        if (_impl->streamClosed)
            return makeError(ErrorCode::ConnectionError,
                             std::format("Connection to '{}' closed", _impl->descriptor.name));
        future = _impl->pending[id].get_future();
    }

    if (auto sent = _impl->writeMessage(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
    {
        auto lock = std::lock_guard(_impl->pendingMutex);
        _impl->pending.erase(id);
        return makeError(ErrorCode::ConnectionError, sent.error().message);
    }

    auto const deadline = timeout.value_or(_impl->options.requestTimeout);
    if (future.wait_for(deadline) == std::future_status::timeout)
    {
        auto lock = std::lock_guard(_impl->pendingMutex);
        if (_impl->pending.erase(id) > 0)
        {
            log::warning("[{}] Timeout waiting for response to {} (id {})", _impl->descriptor.name, method, id);
            return makeError(ErrorCode::TimeoutError, std::format("Timeout waiting for response to {}", method));
        }
        // Resolved between the timeout and taking the lock; the value is ready.
    }

    return future.get();
}

auto McpSession::sendNotification(std::string_view method, nlohmann::json params) -> VoidResult
{
    auto const state = _impl->state.load();
    if (state != SessionState::Initializing && state != SessionState::Ready)
        return makeError(ErrorCode::ConnectionError,
                         std::format("Session '{}' is {}", _impl->descriptor.name, sessionStateToString(state)));

    if (auto sent = _impl->writeMessage(jsonrpc::makeNotification(method, std::move(params))); !sent)
        return makeError(ErrorCode::ConnectionError, sent.error().message);
    return {};
}

auto McpSession::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    if (_impl->state != SessionState::Ready)
        return makeError(ErrorCode::ConnectionError, std::format("Session '{}' is not ready", _impl->descriptor.name));

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto result = sendRequest("tools/call", std::move(params));
    if (!result)
    {
        if (result.error().code == ErrorCode::ProtocolError)
            return makeError(ErrorCode::ToolInvocationError,
                             std::format("Tool '{}' failed: {}", name, result.error().message));
        return std::unexpected(result.error());
    }

    log::debug("[{}] Tool '{}' returned: {}", _impl->descriptor.name, name, result->dump());
    return unwrapToolResult(*result);
}

void McpSession::disconnect()
{
    auto const previous = _impl->state.load();
    if (previous == SessionState::Disconnected)
        return;

    _impl->shutdownChannel();

    if (previous != SessionState::Failed)
        _impl->state = SessionState::Disconnected;

    if (previous == SessionState::Ready || previous == SessionState::Initializing)
        log::info("Disconnected from {}", _impl->descriptor.name);
}

auto McpSession::state() const -> SessionState
{
    return _impl->state;
}

auto McpSession::descriptor() const -> const ServerDescriptor&
{
    return _impl->descriptor;
}

auto McpSession::name() const -> const std::string&
{
    return _impl->descriptor.name;
}

auto McpSession::tools() const -> const std::vector<ToolDescriptor>&
{
    return _impl->tools;
}

auto McpSession::serverInfo() const -> const ServerInfo&
{
    return _impl->serverInfo;
}

auto McpSession::pendingCount() const -> size_t
{
    auto lock = std::lock_guard(_impl->pendingMutex);
    return _impl->pending.size();
}

} // namespace mcpagent
