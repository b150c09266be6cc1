// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <core/Log.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>
#include <future>
#include <set>
#include <utility>

namespace mcpagent
{

auto makeStdioSessionFactory(SessionOptions options, std::chrono::milliseconds shutdownGrace) -> SessionFactory
{
    return [options = std::move(options), shutdownGrace](const ServerDescriptor& descriptor) {
        auto config = StdioTransportConfig {
            .command = descriptor.launchCommand.empty() ? std::string {} : descriptor.launchCommand.front(),
            .args = {},
            .env = descriptor.env,
            .workingDirectory = descriptor.workingDirectory,
            .shutdownGrace = shutdownGrace,
            .writeTimeout = options.requestTimeout,
        };
        if (descriptor.launchCommand.size() > 1)
            config.args.assign(descriptor.launchCommand.begin() + 1, descriptor.launchCommand.end());

        return std::make_unique<McpSession>(descriptor, std::make_unique<StdioTransport>(std::move(config)), options);
    };
}

Orchestrator::Orchestrator(ServerCatalog catalog,
                           LanguageModel* model,
                           OrchestratorConfig config,
                           SessionFactory sessionFactory):
    _catalog(std::move(catalog)),
    _model(model),
    _config(std::move(config)),
    _sessionFactory(std::move(sessionFactory))
{
    if (!_sessionFactory)
        _sessionFactory = makeStdioSessionFactory(_config.session, _config.shutdownGrace);
}

Orchestrator::~Orchestrator()
{
    disconnect();
}

auto Orchestrator::connect(const std::vector<std::string>& serverNames) -> size_t
{
    auto names = serverNames;
    if (names.empty())
    {
        for (const auto& [name, _]: _catalog)
            names.push_back(name);
    }

    auto attempts = std::vector<std::pair<std::string, std::future<std::unique_ptr<McpSession>>>> {};
    auto queued = std::set<std::string> {};

    for (const auto& name: names)
    {
        if (_sessions.contains(name))
        {
            log::debug("Server {} is already connected", name);
            continue;
        }

        if (!queued.insert(name).second)
        {
            log::debug("Server {} is listed more than once", name);
            continue;
        }

        auto const it = _catalog.find(name);
        if (it == _catalog.end())
        {
            log::warning("Unknown server: {}", name);
            continue;
        }

        auto const& descriptor = it->second;
        attempts.emplace_back(name, std::async(std::launch::async, [this, &descriptor] {
                                  auto session = _sessionFactory(descriptor);
                                  if (!session)
                                  {
                                      log::error("No session could be created for {}", descriptor.name);
                                      return session;
                                  }
                                  if (auto connected = session->connect(); !connected)
                                  {
                                      log::error("Failed to connect to {}: {}",
                                                 descriptor.name,
                                                 connected.error().message);
                                      return std::unique_ptr<McpSession> {};
                                  }
                                  return session;
                              }));
    }

    for (auto& [name, attempt]: attempts)
    {
        auto session = attempt.get();
        if (!session)
            continue;

        auto const [it, inserted] = _sessions.try_emplace(name, std::move(session));
        if (inserted)
            _registry.registerSession(name, *it->second);
    }

    log::info("Connected to {} MCP servers", _sessions.size());
    return _sessions.size();
}

void Orchestrator::disconnect()
{
    _registry.clear();

    auto shutdowns = std::vector<std::future<void>> {};
    for (auto& [name, session]: _sessions)
        shutdowns.push_back(std::async(std::launch::async, [s = session.get()] { s->disconnect(); }));
    for (auto& shutdown: shutdowns)
        shutdown.get();

    _sessions.clear();
}

auto Orchestrator::listAllTools() const -> std::map<std::string, std::vector<ToolSummary>>
{
    return _registry.listGrouped();
}

auto Orchestrator::findToolsByCapability(std::string_view keyword) const -> std::set<std::string>
{
    return _registry.search(keyword);
}

auto Orchestrator::callTool(std::string_view toolId, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    return _registry.invoke(toolId, arguments);
}

auto Orchestrator::reasonAndAct(std::string_view query, std::optional<int> maxSteps) -> ReasoningResult
{
    if (!_model)
    {
        return ReasoningResult {
            .query = std::string(query),
            .answer = "Error during processing: no language model configured",
            .steps = {},
            .outcome = ReasoningOutcome::Aborted,
        };
    }

    auto loop = ReasoningLoop(*_model, _registry, _config.reasoning);
    return loop.run(query, maxSteps.value_or(_config.reasoning.maxSteps));
}

auto Orchestrator::connectedServers() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (const auto& [name, session]: _sessions)
    {
        if (session->state() == SessionState::Ready)
            names.push_back(name);
    }
    return names;
}

auto Orchestrator::catalog() const -> const ServerCatalog&
{
    return _catalog;
}

auto Orchestrator::registry() const -> const ToolRegistry&
{
    return _registry;
}

} // namespace mcpagent
