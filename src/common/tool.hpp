#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

struct ToolError {
    std::string message;
};

using ToolResult = std::expected<std::string, ToolError>;

// A named capability. The core never looks inside `invoke`.
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    std::function<ToolResult(const nlohmann::json& args)> invoke;
};

// Name -> tool, iterated in registration order.
class ToolRegistry {
public:
    ToolRegistry() = default;
    explicit ToolRegistry(std::vector<ToolDescriptor> tools);

    // Returns false (and keeps the first registration) on a duplicate name.
    bool add(ToolDescriptor tool);

    const ToolDescriptor* find(std::string_view name) const;
    const std::vector<ToolDescriptor>& tools() const { return tools_; }
    size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

private:
    std::vector<ToolDescriptor> tools_;
};

namespace tools {

// Object schema with a single string property.
nlohmann::json text_parameter(const std::string& name, const std::string& description,
                              bool required = true);

// Object schema without properties.
nlohmann::json no_parameters();

} // namespace tools
