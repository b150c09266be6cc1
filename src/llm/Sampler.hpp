// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace mcpagent
{

/// @brief Configuration for LLM token sampling.
///
/// A temperature of zero or below selects greedy decoding.
struct SamplerConfig
{
    float temperature = 0.0f;
    float topP = 0.9f;
    int topK = 40;
    int seed = -1; // -1 means random
    int maxTokens = 2048;
};

} // namespace mcpagent
