// SPDX-License-Identifier: Apache-2.0
#include "LlamaLanguageModel.hpp"

#include <core/Log.hpp>

#include <llama.h>

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpagent
{

struct LlamaLanguageModel::Impl
{
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    LlamaModelConfig config;

    ~Impl()
    {
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
    }
};

namespace
{

    /// @brief Line buffer for llama.cpp log continuation messages.
    auto llamaLineBuffer = std::string {};

    /// @brief Maps ggml_log_level to mcpagent::log::Level.
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            // llama.cpp is chatty at info level; keep it out of the agent's own info output.
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards llama.cpp log output, line by line, into mcpagent::log.
    void llamaLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        llamaLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = llamaLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = llamaLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos)
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            llamaLineBuffer.erase(0, nlPos + 1);
        }
    }

    /// @brief Builds the sampler chain for one completion. The caller frees it.
    auto makeSampler(const SamplerConfig& sampler) -> llama_sampler*
    {
        auto* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
        if (sampler.temperature <= 0.0f)
        {
            llama_sampler_chain_add(chain, llama_sampler_init_greedy());
            return chain;
        }

        llama_sampler_chain_add(chain, llama_sampler_init_top_k(sampler.topK));
        llama_sampler_chain_add(chain, llama_sampler_init_top_p(sampler.topP, 1));
        llama_sampler_chain_add(chain, llama_sampler_init_temp(sampler.temperature));
        llama_sampler_chain_add(
            chain,
            llama_sampler_init_dist(sampler.seed < 0 ? LLAMA_DEFAULT_SEED : static_cast<uint32_t>(sampler.seed)));
        return chain;
    }

} // namespace

LlamaLanguageModel::LlamaLanguageModel(): _impl(std::make_unique<Impl>())
{
}

LlamaLanguageModel::~LlamaLanguageModel() = default;

auto LlamaLanguageModel::load(const LlamaModelConfig& config) -> VoidResult
{
    if (config.modelPath.empty())
        return makeError(ErrorCode::ModelLoadError, "No model path configured");

    log::info("Loading model: {}", config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);
    llama_backend_init();

    auto modelParams = llama_model_default_params();
    modelParams.n_gpu_layers = config.gpuLayers >= 0 ? config.gpuLayers : 999;

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load model: {}", config.modelPath));

    auto ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config.contextSize);
    ctxParams.n_batch = ctxParams.n_ctx;
    ctxParams.n_threads = config.threads > 0 ? config.threads
                                             : static_cast<int32_t>(std::thread::hardware_concurrency());
    ctxParams.n_threads_batch = ctxParams.n_threads;

    auto* ctx = llama_init_from_model(model, ctxParams);
    if (!ctx)
    {
        llama_model_free(model);
        return makeError(ErrorCode::ModelLoadError, "Failed to create llama context");
    }

    _impl->model = model;
    _impl->ctx = ctx;
    _impl->config = config;

    log::info("Model loaded (context size: {})", config.contextSize);
    return {};
}

auto LlamaLanguageModel::complete(std::span<const ChatMessage> transcript) -> Result<std::string>
{
    if (!isLoaded())
        return makeError(ErrorCode::InferenceError, "No model loaded");

    auto const* tmpl = llama_model_chat_template(_impl->model, nullptr);
    auto const chatTemplate = tmpl ? std::string(tmpl) : std::string("chatml");

    auto llamaMsgs = std::vector<llama_chat_message> {};
    llamaMsgs.reserve(transcript.size());
    for (const auto& msg: transcript)
    {
        llamaMsgs.push_back(llama_chat_message {
            .role = roleToString(msg.role).data(),
            .content = msg.content.c_str(),
        });
    }

    auto buf = std::vector<char>(static_cast<size_t>(_impl->config.contextSize) * 4);
    auto len = llama_chat_apply_template(chatTemplate.c_str(),
                                         llamaMsgs.data(),
                                         llamaMsgs.size(),
                                         true,
                                         buf.data(),
                                         static_cast<int32_t>(buf.size()));
    if (len > static_cast<int32_t>(buf.size()))
    {
        buf.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(chatTemplate.c_str(),
                                        llamaMsgs.data(),
                                        llamaMsgs.size(),
                                        true,
                                        buf.data(),
                                        static_cast<int32_t>(buf.size()));
    }
    if (len < 0)
        return makeError(ErrorCode::InferenceError, "Failed to apply chat template");

    auto const prompt = std::string(buf.data(), static_cast<size_t>(len));

    auto const* vocab = llama_model_get_vocab(_impl->model);
    auto tokens = std::vector<llama_token>(static_cast<size_t>(_impl->config.contextSize));
    auto const nTokens = llama_tokenize(vocab,
                                        prompt.c_str(),
                                        static_cast<int32_t>(prompt.size()),
                                        tokens.data(),
                                        static_cast<int32_t>(tokens.size()),
                                        true,
                                        true);
    if (nTokens < 0)
        return makeError(ErrorCode::InferenceError,
                         std::format("Transcript does not fit the context window ({} tokens needed)", -nTokens));
    tokens.resize(static_cast<size_t>(nTokens));

    if (auto* mem = llama_get_memory(_impl->ctx))
        llama_memory_clear(mem, true);

    if (llama_decode(_impl->ctx, llama_batch_get_one(tokens.data(), nTokens)) != 0)
        return makeError(ErrorCode::InferenceError, "Failed to decode prompt");

    auto* sampler = makeSampler(_impl->config.sampler);
    auto text = std::string {};
    auto const budget = std::min(_impl->config.sampler.maxTokens, _impl->config.contextSize - nTokens);

    for (auto i = 0; i < budget; ++i)
    {
        auto newTokenId = llama_sampler_sample(sampler, _impl->ctx, -1);
        if (llama_vocab_is_eog(vocab, newTokenId))
            break;

        auto piece = std::array<char, 256> {};
        auto const pieceLen =
            llama_token_to_piece(vocab, newTokenId, piece.data(), static_cast<int32_t>(piece.size()), 0, true);
        if (pieceLen > 0)
            text.append(piece.data(), static_cast<size_t>(pieceLen));

        if (llama_decode(_impl->ctx, llama_batch_get_one(&newTokenId, 1)) != 0)
        {
            llama_sampler_free(sampler);
            return makeError(ErrorCode::InferenceError, "Failed to decode generated token");
        }
    }

    llama_sampler_free(sampler);
    log::debug("Model completion ({} prompt tokens): {}", nTokens, text);
    return text;
}

auto LlamaLanguageModel::isLoaded() const -> bool
{
    return _impl->model != nullptr && _impl->ctx != nullptr;
}

} // namespace mcpagent
