#pragma once

#include "common/config.hpp"
#include "common/tool.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tools {

// Worker-side handlers for every entry of tools::catalog().
ToolRegistry make_builtin_tools(const Config& config, const std::string& dir);

// Runs `/bin/sh -c command` in `dir`, stdout and stderr merged.
ToolResult exec_shell(const std::string& command, const std::string& dir, std::chrono::seconds timeout);

ToolResult usage_instructions(const std::string& usage_file);

std::string environment_report(const std::string& dir, std::chrono::steady_clock::time_point started,
                               const std::vector<std::string>& tool_names);

} // namespace tools
