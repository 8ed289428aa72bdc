#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace clinmcp {

/// Caller-chosen request id. JSON-RPC allows strings and numbers. Integers
/// above INT64_MAX keep their unsigned value and fractional ids stay doubles,
/// so every id is echoed back exactly as it arrived.
using RequestId = std::variant<int64_t, uint64_t, double, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            id = static_cast<int64_t>(v);
        } else {
            id = v;
        }
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_number_float()) {
        id = j.get<double>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("Request id must be a number or a string");
    }
}

/// Human readable form of an id, for logs.
std::string to_string(const RequestId& id);

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result / error is set on every response the server emits.
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }

    static JsonRpcResponse success(RequestId id, nlohmann::json result);
    static JsonRpcResponse failure(RequestId id, int code, std::string message,
                                   std::optional<nlohmann::json> data = std::nullopt);
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace clinmcp
