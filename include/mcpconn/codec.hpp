#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpconn {

class Codec {
public:
    /// Parse one JSON-RPC message (one framed line).
    /// Throws ParseError on invalid JSON or an unrecognisable message shape.
    /// Responses may omit `jsonrpc`; requests and notifications may not.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to a single-line JSON string (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
    static JsonRpcResponse parse_response(const nlohmann::json& j);
};

} // namespace mcpconn
