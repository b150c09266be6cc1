// SPDX-License-Identifier: Apache-2.0
#include "Transcript.hpp"

#include <format>
#include <utility>

namespace mcpagent
{

Transcript::Transcript(std::string systemPrompt)
{
    _messages.push_back(ChatMessage { .role = Role::System, .content = std::move(systemPrompt) });
}

void Transcript::addUserMessage(std::string content)
{
    _messages.push_back(ChatMessage { .role = Role::User, .content = std::move(content) });
}

void Transcript::addAssistantMessage(std::string content)
{
    _messages.push_back(ChatMessage { .role = Role::Assistant, .content = std::move(content) });
}

void Transcript::addObservation(const nlohmann::json& observation)
{
    auto const text = observation.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    addUserMessage(std::format("Observation: {}", text));
}

void Transcript::addFormatError(std::string_view message)
{
    addUserMessage(std::format("Error: {}. Please use the correct format.", message));
}

auto Transcript::messages() const -> const std::vector<ChatMessage>&
{
    return _messages;
}

auto Transcript::size() const -> size_t
{
    return _messages.size();
}

} // namespace mcpagent
