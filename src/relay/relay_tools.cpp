#include "relay/relay_tools.hpp"

#include "common/tool_catalog.hpp"

#include <string>
#include <vector>

using json = nlohmann::json;

namespace tools {

namespace {

constexpr const char* PROJECT_DIR = "project_dir";

bool has_text(const json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key)) return false;
    const auto& v = args[key];
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    return !v.is_null();
}

} // namespace

ToolDescriptor make_forwarding_tool(ToolDescriptor worker_tool, Forwarder& forwarder) {
    auto required = required_arguments(worker_tool.input_schema);

    json schema = worker_tool.input_schema.is_object() ? worker_tool.input_schema : no_parameters();
    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        schema["properties"] = json::object();
    }
    schema["properties"][PROJECT_DIR] = {
        {"type", "string"},
        {"description", "Directory of the project whose worker should run the call "
                        "(the worker is found by searching this directory and its parents)"},
    };
    json required_list = json::array({PROJECT_DIR});
    for (const auto& r : required) required_list.push_back(r);
    schema["required"] = std::move(required_list);

    worker_tool.input_schema = std::move(schema);
    worker_tool.invoke = [name = worker_tool.name, required, &forwarder](const json& args) -> ToolResult {
        if (!has_text(args, PROJECT_DIR) || !args[PROJECT_DIR].is_string()) {
            return std::string("Error: project_dir parameter is required");
        }
        for (const auto& r : required) {
            if (!has_text(args, r)) return "Error: " + r + " parameter is required";
        }

        auto project_dir = args[PROJECT_DIR].get<std::string>();
        json forwarded = args;
        forwarded.erase(PROJECT_DIR);
        return forwarder.call(name, project_dir, forwarded);
    };
    return worker_tool;
}

ToolRegistry make_relay_tools(Forwarder& forwarder) {
    ToolRegistry registry;
    for (auto& entry : catalog()) {
        registry.add(make_forwarding_tool(std::move(entry), forwarder));
    }
    return registry;
}

} // namespace tools
