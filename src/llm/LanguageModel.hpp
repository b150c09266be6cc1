// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <span>
#include <string>

namespace mcpagent
{

/// @brief A language-model backend: turns a transcript into one completion.
class LanguageModel
{
  public:
    virtual ~LanguageModel() = default;

    /// @brief Produces the next assistant message for the given transcript.
    /// @param transcript The ordered, role-tagged conversation so far.
    /// @return The completion text or an error.
    [[nodiscard]] virtual auto complete(std::span<const ChatMessage> transcript) -> Result<std::string> = 0;
};

} // namespace mcpagent
