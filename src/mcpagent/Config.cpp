// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <vector>

namespace mcpagent
{

namespace
{

    struct BuiltinServer
    {
        std::string_view name;
        std::string_view module;
        std::string_view description;
        std::vector<std::string_view> capabilities;
    };

    auto pythonModuleCommand(std::string_view module) -> std::vector<std::string>
    {
        return { "uv", "run", "python", "-m", std::string(module) };
    }

    auto parseServerConfig(const std::string& name, const nlohmann::json& serverJson, ServerConfig base)
        -> ServerConfig
    {
        base.name = name;
        base.path = json::getStringOr(serverJson, "path", base.path);
        base.description = json::getStringOr(serverJson, "description", base.description);

        if (serverJson.contains("module") && serverJson["module"].is_string())
            base.command = pythonModuleCommand(serverJson["module"].get<std::string>());
        if (serverJson.contains("command") && serverJson["command"].is_array())
            base.command = json::getStringList(serverJson, "command");
        if (serverJson.contains("capabilities") && serverJson["capabilities"].is_array())
            base.capabilities = json::getStringList(serverJson, "capabilities");

        if (serverJson.contains("env") && serverJson["env"].is_object())
        {
            for (const auto& [key, value]: serverJson["env"].items())
            {
                if (value.is_string())
                    base.env[key] = value.get<std::string>();
            }
        }

        return base;
    }

} // namespace

auto AppConfig::builtinServers() -> std::map<std::string, ServerConfig>
{
    auto const builtins = std::vector<BuiltinServer> {
        {
            .name = "opentargets",
            .module = "opentargets_mcp.server",
            .description = "Open Targets Platform - comprehensive drug target, disease, and evidence data",
            .capabilities = { "targets", "diseases", "drugs", "evidence", "variants", "studies",
                              "genetic_associations", "pathways", "expression", "protein_interactions",
                              "tractability", "safety", "mouse_phenotypes", "chemical_probes", "literature",
                              "clinical_trials", "biomarkers" },
        },
        {
            .name = "monarch",
            .module = "monarch_mcp.server",
            .description = "Monarch Initiative - phenotype associations, disease models, and semantic similarity",
            .capabilities = { "phenotypes", "diseases", "genes", "genotype_phenotype", "disease_phenotype",
                              "gene_phenotype", "model_organisms", "semantic_similarity", "hpo_terms",
                              "disease_models" },
        },
        {
            .name = "mychem",
            .module = "mychem_mcp.server",
            .description = "MyChem.info - comprehensive chemical and drug information",
            .capabilities = { "chemicals", "drugs", "compounds", "structures", "identifiers", "drugbank",
                              "chembl", "pubchem", "pharmgkb", "drug_interactions", "mechanisms", "targets",
                              "indications", "side_effects" },
        },
        {
            .name = "mydisease",
            .module = "mydisease_mcp.server",
            .description = "MyDisease.info - disease annotations from multiple sources",
            .capabilities = { "diseases", "symptoms", "phenotypes", "genetics", "drugs", "mondo", "omim",
                              "orphanet", "mesh", "umls", "hpo", "disgenet", "ctd", "clinical_trials" },
        },
        {
            .name = "mygene",
            .module = "mygene_mcp.server",
            .description = "MyGene.info - gene annotation data aggregator",
            .capabilities = { "genes", "transcripts", "proteins", "variants", "homologs", "pathways",
                              "interactions", "expression", "ontology", "entrez", "ensembl", "uniprot",
                              "refseq", "go_terms" },
        },
    };

    auto servers = std::map<std::string, ServerConfig> {};
    for (const auto& builtin: builtins)
    {
        auto server = ServerConfig {
            .name = std::string(builtin.name),
            .path = {},
            .command = pythonModuleCommand(builtin.module),
            .env = {},
            .description = std::string(builtin.description),
            .capabilities = {},
        };
        for (auto const capability: builtin.capabilities)
            server.capabilities.emplace_back(capability);
        servers.emplace(server.name, std::move(server));
    }
    return servers;
}

auto processEnvironment() -> EnvLookup
{
    return [](std::string_view name) -> std::optional<std::string> {
        auto const* const value = std::getenv(std::string(name).c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

auto serverPathVariable(std::string_view serverName) -> std::string
{
    auto variable = std::string(serverName);
    std::ranges::transform(variable, variable.begin(), [](unsigned char c) { return std::toupper(c); });
    return variable + "_MCP_PATH";
}

auto resolveServerCatalog(const AppConfig& config, const EnvLookup& env) -> ServerCatalog
{
    auto catalog = ServerCatalog {};

    for (const auto& [name, server]: config.servers)
    {
        auto path = std::string {};
        if (auto fromEnv = env ? env(serverPathVariable(name)) : std::nullopt; fromEnv && !fromEnv->empty())
            path = std::move(*fromEnv);
        else if (!server.path.empty())
            path = server.path;
        else
            path = std::format("../{}-mcp", name);

        catalog.emplace(name,
                        ServerDescriptor {
                            .name = name,
                            .workingDirectory = path,
                            .launchCommand = server.command,
                            .env = server.env,
                            .description = server.description,
                            .capabilityTags = { server.capabilities.begin(), server.capabilities.end() },
                        });
    }

    return catalog;
}

auto orchestratorConfig(const AppConfig& config) -> OrchestratorConfig
{
    auto result = OrchestratorConfig {};
    result.session.requestTimeout = std::chrono::milliseconds { config.agent.requestTimeoutMs };
    result.reasoning.maxSteps = config.agent.maxSteps;
    result.reasoning.systemPreamble = config.agent.systemPrompt;
    result.shutdownGrace = std::chrono::milliseconds { config.agent.shutdownGraceMs };
    return result;
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcpagent";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpagent";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain an object", path));

    auto config = AppConfig {};

    // LLM section
    if (root.contains("llm"))
    {
        auto const& llm = root["llm"];
        config.llm.modelPath = json::getStringOr(llm, "modelPath", "");
        config.llm.contextSize = json::getIntOr(llm, "contextSize", 8192);
        config.llm.gpuLayers = json::getIntOr(llm, "gpuLayers", -1);
        config.llm.threads = json::getIntOr(llm, "threads", 0);
        config.llm.temperature = json::getFloatOr(llm, "temperature", 0.0f);
    }

    // Agent section
    if (root.contains("agent"))
    {
        auto const& agent = root["agent"];
        config.agent.maxSteps = json::getIntOr(agent, "maxSteps", 10);
        config.agent.requestTimeoutMs = json::getIntOr(agent, "requestTimeoutMs", 30'000);
        config.agent.shutdownGraceMs = json::getIntOr(agent, "shutdownGraceMs", 100);
        config.agent.systemPrompt = json::getStringOr(agent, "systemPrompt", config.agent.systemPrompt);

        if (config.agent.maxSteps < 1)
            return makeError(ErrorCode::ConfigError, "agent.maxSteps must be at least 1");
        if (config.agent.requestTimeoutMs < 1)
            return makeError(ErrorCode::ConfigError, "agent.requestTimeoutMs must be positive");
    }

    // Servers section; entries override or extend the built-in servers
    if (root.contains("servers"))
    {
        if (!root["servers"].is_object())
            return makeError(ErrorCode::ConfigError, "\"servers\" must be an object");

        for (const auto& [name, serverJson]: root["servers"].items())
        {
            if (!serverJson.is_object())
                return makeError(ErrorCode::ConfigError, std::format("Server entry '{}' must be an object", name));

            auto base = ServerConfig {};
            if (auto const it = config.servers.find(name); it != config.servers.end())
                base = it->second;

            auto server = parseServerConfig(name, serverJson, std::move(base));
            if (server.command.empty())
                return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no command", name));

            config.servers[name] = std::move(server);
        }
    }

    return config;
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    log::debug("Loading config from {}", path);
    return loadConfigFromFile(path);
}

} // namespace mcpagent
