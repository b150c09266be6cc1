// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/Orchestrator.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/LlamaLanguageModel.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <format>
#include <iostream>
#include <print>
#include <ranges>
#include <set>
#include <string_view>

namespace mcpagent
{

namespace
{

    constexpr auto MaxCapabilitiesShown = size_t { 5 };
    constexpr auto MaxToolsShownPerServer = size_t { 10 };
    constexpr auto MaxDescriptionWidth = size_t { 80 };

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    auto truncate(std::string_view text, size_t width) -> std::string
    {
        if (text.size() <= width)
            return std::string(text);
        return std::format("{}...", text.substr(0, width));
    }

    auto formatCapabilities(const std::set<std::string>& tags) -> std::string
    {
        auto shown = std::string {};
        auto count = size_t { 0 };
        for (const auto& tag: tags)
        {
            if (count == MaxCapabilitiesShown)
                break;
            if (count > 0)
                shown += ", ";
            shown += tag;
            ++count;
        }
        if (tags.size() > MaxCapabilitiesShown)
            shown += std::format(" (+{} more)", tags.size() - MaxCapabilitiesShown);
        return shown;
    }

    void printSteps(const ReasoningResult& result)
    {
        std::println("\nReasoning steps:");
        for (auto i = size_t { 0 }; i < result.steps.size(); ++i)
        {
            auto const text = stepToJson(result.steps[i]).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
            std::println("\nStep {}:\n{}", i + 1, text);
        }
    }

    void printChatHelp()
    {
        std::println("\nCommands:");
        std::println("  exit/quit/bye - Exit chat");
        std::println("  help - Show this help");
        std::println("  tools - List available tools");
        std::println("  servers - Show connected servers");
        std::println("\nTips:");
        std::println("  - Ask about drugs, diseases, genes, or variants");
        std::println("  - Use specific IDs when known (ENSG, CHEMBL, EFO)");
        std::println("  - Questions can span multiple databases\n");
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    ServerCatalog catalog;
    LlamaLanguageModel model;

    explicit Impl(AppConfig cfg): config(std::move(cfg)), catalog(resolveServerCatalog(config, processEnvironment()))
    {
    }

    auto loadModel() -> VoidResult
    {
        if (model.isLoaded())
            return {};

        if (config.llm.modelPath.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("No model configured; set llm.modelPath in {} or pass --model",
                                         defaultConfigPath()));

        auto modelConfig = LlamaModelConfig {
            .modelPath = config.llm.modelPath,
            .contextSize = config.llm.contextSize,
            .gpuLayers = config.llm.gpuLayers,
            .threads = config.llm.threads,
            .sampler = SamplerConfig { .temperature = config.llm.temperature },
        };
        return model.load(modelConfig);
    }

    auto makeOrchestrator(LanguageModel* languageModel) -> std::unique_ptr<Orchestrator>
    {
        return std::make_unique<Orchestrator>(catalog, languageModel, orchestratorConfig(config));
    }

    static auto connect(Orchestrator& orchestrator, const std::vector<std::string>& servers) -> bool
    {
        std::println(stderr, "Connecting to tool servers...");
        auto const connected = orchestrator.connect(servers);
        if (connected == 0)
        {
            log::error("No tool server could be connected");
            return false;
        }
        return true;
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::listServers() -> int
{
    std::println("{:<15} {:<10} {}", "Server", "Status", "Description");
    for (const auto& [name, descriptor]: _impl->catalog)
    {
        auto const found = std::filesystem::is_directory(descriptor.workingDirectory);
        std::println("{:<15} {:<10} {}", name, found ? "Found" : "Missing", descriptor.description);
        std::println("{:<15} {:<10} path: {}", "", "", descriptor.workingDirectory.string());
        if (!descriptor.capabilityTags.empty())
            std::println("{:<15} {:<10} capabilities: {}", "", "", formatCapabilities(descriptor.capabilityTags));
    }
    return 0;
}

auto App::listTools(const std::vector<std::string>& servers, const std::string& capability) -> int
{
    auto orchestrator = _impl->makeOrchestrator(nullptr);
    if (!Impl::connect(*orchestrator, servers))
        return 1;

    if (!capability.empty())
    {
        auto const matches = orchestrator->findToolsByCapability(capability);
        std::println("\nTools matching '{}': ({} found)", capability, matches.size());
        for (const auto& toolId: matches)
        {
            auto const entry = orchestrator->registry().resolve(toolId);
            if (entry)
                std::println("  {}: {}", toolId, (*entry)->descriptor.description);
        }
        return 0;
    }

    for (const auto& [server, tools]: orchestrator->listAllTools())
    {
        std::println("\n{} ({} tools)", server, tools.size());
        for (const auto& tool: tools | std::views::take(MaxToolsShownPerServer))
            std::println("  {:<45} {}", tool.toolId, truncate(tool.description, MaxDescriptionWidth));
        if (tools.size() > MaxToolsShownPerServer)
            std::println("  ... and {} more tools", tools.size() - MaxToolsShownPerServer);
    }
    return 0;
}

auto App::query(const std::string& question,
                const std::vector<std::string>& servers,
                std::optional<int> maxSteps,
                bool showSteps) -> int
{
    if (auto loadResult = _impl->loadModel(); !loadResult)
    {
        log::error("Failed to load model: {}", loadResult.error());
        return 1;
    }

    auto orchestrator = _impl->makeOrchestrator(&_impl->model);
    if (!Impl::connect(*orchestrator, servers))
        return 1;

    std::println("Question: {}", question);
    auto const result = orchestrator->reasonAndAct(question, maxSteps);
    std::println("\nAnswer:\n{}", result.answer);

    if (showSteps)
        printSteps(result);

    return result.outcome == ReasoningOutcome::Aborted ? 1 : 0;
}

auto App::callTool(const std::string& toolId, const std::string& arguments, const std::vector<std::string>& servers)
    -> int
{
    auto const parsedArguments = json::tryParse(arguments);
    if (!parsedArguments || !parsedArguments->is_object())
    {
        log::error("Invalid JSON arguments: {}", arguments);
        return 1;
    }

    auto orchestrator = _impl->makeOrchestrator(nullptr);
    if (!Impl::connect(*orchestrator, servers))
        return 1;

    std::println("Calling tool: {}", toolId);
    std::println("Arguments: {}", parsedArguments->dump(2));

    auto result = orchestrator->callTool(toolId, *parsedArguments);
    if (!result)
    {
        log::error("{}", result.error());
        return 1;
    }

    std::println("\nResult:\n{}", result->dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    return 0;
}

auto App::chat(const std::vector<std::string>& servers) -> int
{
    if (auto loadResult = _impl->loadModel(); !loadResult)
    {
        log::error("Failed to load model: {}", loadResult.error());
        return 1;
    }

    auto orchestrator = _impl->makeOrchestrator(&_impl->model);
    if (!Impl::connect(*orchestrator, servers))
        return 1;

    auto const summary = orchestrator->listAllTools();
    auto totalTools = size_t { 0 };
    for (const auto& [_, tools]: summary)
        totalTools += tools.size();
    std::println("Connected! {} tools available from {} servers.", totalTools, summary.size());
    std::println("Type 'exit' to quit, 'help' for commands.\n");

    auto line = std::string {};
    while (true)
    {
        std::print("You: ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line))
            break;

        auto const input = trim(line);
        if (input.empty())
            continue;

        auto const command = toLower(input);
        if (command == "exit" || command == "quit" || command == "bye")
            break;

        if (command == "help")
        {
            printChatHelp();
            continue;
        }

        if (command == "tools")
        {
            std::println("\nAvailable tools ({} total):", totalTools);
            for (const auto& [server, tools]: summary)
                std::println("  {}: {} tools", server, tools.size());
            std::println("\nUse 'list-tools' for details.\n");
            continue;
        }

        if (command == "servers")
        {
            std::println("\nConnected servers:");
            for (const auto& server: orchestrator->connectedServers())
                std::println("  - {}", server);
            std::println("");
            continue;
        }

        auto const result = orchestrator->reasonAndAct(input);
        std::println("\nAgent: {}\n", result.answer);

        for (const auto& step: result.steps)
        {
            if (auto const* observation = std::get_if<ObservationStep>(&step); observation && observation->error)
                log::debug("Tool error: {}", *observation->error);
        }
    }

    std::println("\nGoodbye!");
    return 0;
}

} // namespace mcpagent
