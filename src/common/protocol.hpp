#pragma once

#include "common/tool.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace rpc {

inline constexpr int PARSE_ERROR = -32700;
inline constexpr int INVALID_REQUEST = -32600;
inline constexpr int METHOD_NOT_FOUND = -32601;
inline constexpr int INVALID_PARAMS = -32602;
inline constexpr int INTERNAL_ERROR = -32603;

inline constexpr const char* PROTOCOL_VERSION = "2024-11-05";

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

// Text payload of a tools/call result.
nlohmann::json text_content(const std::string& text);

// Compact wire form. Invalid UTF-8 in strings (tool output, echoed parser
// messages) becomes U+FFFD instead of throwing.
std::string serialize(const nlohmann::json& doc);

} // namespace rpc

struct ServerIdentity {
    std::string name;
    std::string version = "1.0.0";
};

// Maps one parsed JSON-RPC request to its response. Performs no I/O.
class ProtocolEngine {
public:
    ProtocolEngine(ToolRegistry tools, ServerIdentity identity);

    // std::nullopt for notifications, which get no reply.
    std::optional<nlohmann::json> handle(const nlohmann::json& request) const;

    const ToolRegistry& tools() const { return tools_; }
    const ServerIdentity& identity() const { return identity_; }

private:
    nlohmann::json handle_initialize(const nlohmann::json& id) const;
    nlohmann::json handle_tools_list(const nlohmann::json& id) const;
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& request) const;

    ToolRegistry tools_;
    ServerIdentity identity_;
};
