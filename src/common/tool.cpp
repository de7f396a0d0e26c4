#include "common/tool.hpp"

#include <algorithm>
#include <print>

using json = nlohmann::json;

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools) {
    tools_.reserve(tools.size());
    for (auto& t : tools) {
        add(std::move(t));
    }
}

bool ToolRegistry::add(ToolDescriptor tool) {
    if (find(tool.name)) {
        std::println(stderr, "tools: duplicate tool name '{}' ignored", tool.name);
        return false;
    }
    tools_.push_back(std::move(tool));
    return true;
}

const ToolDescriptor* ToolRegistry::find(std::string_view name) const {
    auto it = std::ranges::find_if(tools_, [name](const ToolDescriptor& t) { return t.name == name; });
    return it != tools_.end() ? &*it : nullptr;
}

namespace tools {

json text_parameter(const std::string& name, const std::string& description, bool required) {
    json schema = {
        {"type", "object"},
        {"properties", {{name, {{"type", "string"}, {"description", description}}}}},
    };
    if (required) {
        schema["required"] = json::array({name});
    }
    return schema;
}

json no_parameters() {
    return {
        {"type", "object"},
        {"properties", json::object()},
        {"required", json::array()},
    };
}

} // namespace tools
