// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace mcpagent
{

/// @brief Derives the parameter list from a tool's JSON input schema.
///
/// Reads "properties" and "required". Missing types default to "string",
/// missing descriptions to "No description".
[[nodiscard]] auto parametersFromSchema(const nlohmann::json& inputSchema) -> std::vector<ToolParameter>;

/// @brief Parses one entry of a tools/list "tools" array.
/// @return The descriptor, or a ProtocolError if the entry has no name.
[[nodiscard]] auto parseToolDescriptor(const nlohmann::json& toolJson) -> Result<ToolDescriptor>;

/// @brief Parses the result of a tools/list request.
///
/// A missing "tools" member yields an empty catalog; a "tools" member that is not an
/// array, or an entry without a name, is a ProtocolError.
[[nodiscard]] auto parseToolList(const nlohmann::json& listResult) -> Result<std::vector<ToolDescriptor>>;

} // namespace mcpagent
