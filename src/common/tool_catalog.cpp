#include "common/tool_catalog.hpp"

using json = nlohmann::json;

namespace tools {

std::vector<ToolDescriptor> catalog() {
    std::vector<ToolDescriptor> list;

    list.push_back({
        .name = USAGE_INSTRUCTIONS,
        .description = "Get instructions for working with the project's toolsock worker: "
                       "what each tool does, conventions for shell commands, and etiquette "
                       "for a worker shared between several agents.",
        .input_schema = no_parameters(),
        .invoke = {},
    });

    list.push_back({
        .name = EXEC_SHELL,
        .description = "Run a shell command inside the project's long-lived worker.\n\n"
                       "**PREREQUISITE**: call `usage_instructions` once before using this tool.\n\n"
                       "The command runs with /bin/sh in the directory the worker serves. The "
                       "result is the combined stdout and stderr text, followed by the exit "
                       "status when it is not zero.",
        .input_schema = text_parameter("command",
                                       "Shell command to run (e.g. 'make -j8' or 'git status --short')"),
        .invoke = {},
    });

    list.push_back({
        .name = INVESTIGATE_ENVIRONMENT,
        .description = "Describe the worker's environment: working directory, served directory, "
                       "process id, user, host name, uptime and the tools it offers.",
        .input_schema = no_parameters(),
        .invoke = {},
    });

    return list;
}

std::vector<std::string> required_arguments(const json& schema) {
    std::vector<std::string> names;
    if (!schema.is_object() || !schema.contains("required")) return names;
    for (const auto& n : schema["required"]) {
        if (n.is_string()) names.push_back(n.get<std::string>());
    }
    return names;
}

} // namespace tools
