#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace clinmcp {

/// Converts frame bodies to JSON-RPC messages and back. Knows nothing about
/// framing; a body here is exactly the bytes between frame boundaries.
class Codec {
public:
    /// Parse one message. Throws ParseError when the body is not JSON, and
    /// ProtocolError(InvalidRequest) when it is JSON but not a JSON-RPC 2.0
    /// envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw bytes into a JSON value (simdjson backed). Throws ParseError.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Best-effort recovery of the "id" member from a body that failed to
    /// parse or validate, so an error response can still be correlated.
    [[nodiscard]] static std::optional<RequestId> salvage_id(std::string_view raw);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace clinmcp
