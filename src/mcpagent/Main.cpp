// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpagent/App.hpp>
#include <mcpagent/Config.hpp>

#include <CLI/CLI.hpp>

#include <optional>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpagent - research agent reasoning over MCP tool servers" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto modelPath = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-m,--model", modelPath, "Path to GGUF model file");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto servers = std::vector<std::string> {};
    auto capability = std::string {};
    auto question = std::string {};
    auto maxSteps = 0;
    auto showSteps = false;
    auto toolId = std::string {};
    auto toolArguments = std::string {};

    auto* listServersCmd = app.add_subcommand("list-servers", "List all known tool servers and their status");

    auto* listToolsCmd = app.add_subcommand("list-tools", "Connect to tool servers and list their tools");
    listToolsCmd->add_option("-s,--server", servers, "Specific servers to connect to");
    listToolsCmd->add_option("--capability", capability, "Filter tools by capability keyword");

    auto* queryCmd = app.add_subcommand("query", "Ask a question and let the agent find the answer");
    queryCmd->add_option("question", question, "Your question")->required();
    queryCmd->add_option("-s,--server", servers, "Specific servers to use");
    queryCmd->add_option("--max-steps", maxSteps, "Maximum reasoning steps")->check(CLI::PositiveNumber);
    queryCmd->add_flag("--steps", showSteps, "Print the reasoning steps");

    auto* callCmd = app.add_subcommand("call", "Call a specific tool directly");
    callCmd->add_option("tool", toolId, "Tool id, e.g. 'opentargets.search_entities'")->required();
    callCmd->add_option("arguments", toolArguments, "Tool arguments as a JSON object")->required();
    callCmd->add_option("-s,--server", servers, "Specific servers to use");

    auto* chatCmd = app.add_subcommand("chat", "Interactive chat mode");
    chatCmd->add_option("-s,--server", servers, "Specific servers to use");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        mcpagent::log::setLevel(mcpagent::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = mcpagent::log::levelFromString(logLevel);
        if (!level)
        {
            mcpagent::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        mcpagent::log::setLevel(*level);
    }

    auto configResult =
        configPath.empty() ? mcpagent::loadConfig() : mcpagent::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcpagent::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (!modelPath.empty())
        config.llm.modelPath = modelPath;

    auto application = mcpagent::App(std::move(config));

    if (listServersCmd->parsed())
        return application.listServers();
    if (listToolsCmd->parsed())
        return application.listTools(servers, capability);
    if (queryCmd->parsed())
        return application.query(
            question, servers, maxSteps > 0 ? std::optional<int> { maxSteps } : std::nullopt, showSteps);
    if (callCmd->parsed())
        return application.callTool(toolId, toolArguments, servers);
    if (chatCmd->parsed())
        return application.chat(servers);

    return 0;
}
