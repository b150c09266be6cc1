// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/LanguageModel.hpp>
#include <llm/Sampler.hpp>

#include <memory>
#include <span>
#include <string>

struct llama_model;
struct llama_context;

namespace mcpagent
{

/// @brief Configuration for the llama.cpp backend.
struct LlamaModelConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto
    SamplerConfig sampler;
};

/// @brief Local language model backed by llama.cpp.
///
/// Renders the transcript with the model's chat template and generates one completion
/// per call. The KV cache is cleared between calls, so each completion sees exactly the
/// transcript it was given.
class LlamaLanguageModel: public LanguageModel
{
  public:
    LlamaLanguageModel();
    ~LlamaLanguageModel() override;

    LlamaLanguageModel(const LlamaLanguageModel&) = delete;
    LlamaLanguageModel& operator=(const LlamaLanguageModel&) = delete;

    /// @brief Loads a GGUF model from disk.
    /// @param config The model configuration including its path.
    /// @return Success or an error.
    [[nodiscard]] auto load(const LlamaModelConfig& config) -> VoidResult;

    [[nodiscard]] auto complete(std::span<const ChatMessage> transcript) -> Result<std::string> override;

    /// @brief Returns true if a model is currently loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpagent
