#include "common/protocol.hpp"

#include <exception>

using json = nlohmann::json;

namespace rpc {

json make_result(const json& id, json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

json text_content(const std::string& text) {
    return {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

std::string serialize(const json& doc) {
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace rpc

ProtocolEngine::ProtocolEngine(ToolRegistry tools, ServerIdentity identity)
    : tools_(std::move(tools)), identity_(std::move(identity)) {}

std::optional<json> ProtocolEngine::handle(const json& request) const {
    if (!request.is_object()) {
        return rpc::make_error(0, rpc::INVALID_REQUEST, "Invalid Request - expected a JSON object");
    }

    if (!request.contains("method")) {
        return rpc::make_error(request.contains("id") ? request["id"] : json(0), rpc::INVALID_REQUEST,
                               "Invalid Request - missing method field");
    }

    json id = request.contains("id") ? request["id"] : json(nullptr);

    const auto& method_field = request["method"];
    if (!method_field.is_string()) {
        return rpc::make_error(id, rpc::INVALID_REQUEST, "Invalid Request - method must be a string");
    }
    const auto& method = method_field.get_ref<const std::string&>();

    if (method == "initialize") return handle_initialize(id);
    if (method == "notifications/initialized") return std::nullopt;
    if (method == "tools/list") return handle_tools_list(id);
    if (method == "tools/call") return handle_tools_call(id, request);

    return rpc::make_error(id, rpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

json ProtocolEngine::handle_initialize(const json& id) const {
    return rpc::make_result(id, {
        {"protocolVersion", rpc::PROTOCOL_VERSION},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", identity_.name}, {"version", identity_.version}}},
    });
}

json ProtocolEngine::handle_tools_list(const json& id) const {
    json list = json::array();
    for (const auto& tool : tools_.tools()) {
        list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema},
        });
    }
    return rpc::make_result(id, {{"tools", std::move(list)}});
}

json ProtocolEngine::handle_tools_call(const json& id, const json& request) const {
    json params = request.value("params", json::object());
    if (!params.is_object()) {
        return rpc::make_error(id, rpc::INVALID_PARAMS, "Invalid params - expected an object");
    }

    std::string name;
    if (params.contains("name") && params["name"].is_string()) {
        name = params["name"].get<std::string>();
    }

    const auto* tool = tools_.find(name);
    if (!tool) {
        return rpc::make_error(id, rpc::INVALID_PARAMS, "Tool not found: " + name);
    }

    json args = params.value("arguments", json::object());

    // A failing tool is reported on the wire; it must not take the session down.
    try {
        auto result = tool->invoke(args);
        if (!result) {
            return rpc::make_error(id, rpc::INTERNAL_ERROR,
                                   "Tool execution error: " + result.error().message);
        }
        return rpc::make_result(id, rpc::text_content(*result));
    } catch (const std::exception& e) {
        return rpc::make_error(id, rpc::INTERNAL_ERROR, std::string("Tool execution error: ") + e.what());
    }
}
