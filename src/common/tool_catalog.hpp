#pragma once

#include "common/tool.hpp"

#include <string>
#include <vector>

namespace tools {

inline constexpr const char* EXEC_SHELL = "exec_shell";
inline constexpr const char* INVESTIGATE_ENVIRONMENT = "investigate_environment";
inline constexpr const char* USAGE_INSTRUCTIONS = "usage_instructions";

// Worker tools as advertised to callers. `invoke` is left empty; the worker
// binds local handlers and the relay binds forwarders.
std::vector<ToolDescriptor> catalog();

// Names listed under the schema's "required" key.
std::vector<std::string> required_arguments(const nlohmann::json& schema);

} // namespace tools
