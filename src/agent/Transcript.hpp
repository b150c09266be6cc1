// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcpagent
{

/// @brief Append-only conversation history of a single reasoning call.
///
/// The first message is always the system prompt. Observations and format errors are
/// fed back to the model as user messages.
class Transcript
{
  public:
    /// @brief Constructs a transcript starting with the given system prompt.
    explicit Transcript(std::string systemPrompt);

    /// @brief Adds a user message to the conversation.
    void addUserMessage(std::string content);

    /// @brief Adds an assistant message to the conversation.
    void addAssistantMessage(std::string content);

    /// @brief Adds an observation ("Observation: <json>") as a user message.
    void addObservation(const nlohmann::json& observation);

    /// @brief Tells the model its last output was not a usable action.
    void addFormatError(std::string_view message);

    /// @brief Returns all messages, including the system prompt.
    [[nodiscard]] auto messages() const -> const std::vector<ChatMessage>&;

    [[nodiscard]] auto size() const -> size_t;

  private:
    std::vector<ChatMessage> _messages;
};

} // namespace mcpagent
