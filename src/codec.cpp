#include "clinmcp/codec.hpp"
#include "clinmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace clinmcp {

namespace {

// simdjson on-demand value -> nlohmann::json, recursively.
nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            switch (val.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(int64_t(val.get_int64()));
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(uint64_t(val.get_uint64()));
                default:
                    return nlohmann::json(double(val.get_double()));
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        default:
            return nlohmann::json(nullptr);
    }
}

bool valid_id(const nlohmann::json& id) {
    return id.is_string() || id.is_number();
}

// Raw text of the value of the top-level "id" member of a possibly truncated
// object. Members of nested objects and arrays are skipped.
std::optional<std::string_view> top_level_id_text(std::string_view body) {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    size_t i = 0;
    while (i < body.size() && is_space(body[i])) ++i;
    if (i == body.size() || body[i] != '{') return std::nullopt;

    // Returns the index just past the closing quote, or npos if unterminated.
    auto skip_string = [&](size_t start) {
        for (size_t k = start + 1; k < body.size(); ++k) {
            if (body[k] == '\\') {
                ++k;
            } else if (body[k] == '"') {
                return k + 1;
            }
        }
        return std::string_view::npos;
    };

    int depth = 0;
    while (i < body.size()) {
        char c = body[i];
        if (c == '"') {
            size_t end = skip_string(i);
            if (end == std::string_view::npos) return std::nullopt;
            std::string_view key = body.substr(i + 1, end - i - 2);
            i = end;
            if (depth != 1 || key != "id") continue;

            size_t k = i;
            while (k < body.size() && is_space(body[k])) ++k;
            if (k == body.size() || body[k] != ':') continue;
            ++k;
            while (k < body.size() && is_space(body[k])) ++k;
            if (k == body.size()) return std::nullopt;
            if (body[k] == '"') {
                size_t value_end = skip_string(k);
                if (value_end == std::string_view::npos) return std::nullopt;
                return body.substr(k, value_end - k);
            }
            size_t value_end = k;
            while (value_end < body.size() &&
                   std::string_view("+-0123456789.eE").find(body[value_end]) != std::string_view::npos) {
                ++value_end;
            }
            // A number running into the end of the body may be truncated.
            if (value_end == k || value_end == body.size()) return std::nullopt;
            return body.substr(k, value_end - k);
        }
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            if (--depth == 0) return std::nullopt;
        }
        ++i;
    }
    return std::nullopt;
}

RequestId id_from(const nlohmann::json& j) {
    RequestId id;
    from_json(j, id);
    return id;
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty message body");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());
    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    simdjson::ondemand::json_type type;
    if ((err = doc.type().get(type))) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    // The on-demand API does not expose scalar documents as values.
    if (type != simdjson::ondemand::json_type::object &&
        type != simdjson::ondemand::json_type::array) {
        auto j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded()) throw ParseError("JSON parse error: invalid scalar document");
        return j;
    }

    nlohmann::json j;
    try {
        j = to_nlohmann(doc.get_value());
        if (!doc.at_end()) throw ParseError("JSON parse error: trailing content");
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
    return j;
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto invalid = [](const std::string& why) {
        return ProtocolError(error::InvalidRequest, "Invalid Request: " + why);
    };

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() ||
        version->get<std::string>() != JSONRPC_VERSION) {
        throw invalid("'jsonrpc' must be \"2.0\"");
    }

    auto id = j.find("id");
    auto method = j.find("method");

    if (id != j.end() && !valid_id(*id)) {
        throw invalid("'id' must be a string or a number");
    }

    if (method != j.end()) {
        if (!method->is_string()) throw invalid("'method' must be a string");
        std::optional<nlohmann::json> params;
        if (auto p = j.find("params"); p != j.end()) {
            if (!p->is_object() && !p->is_array() && !p->is_null()) {
                throw invalid("'params' must be an object or an array");
            }
            if (!p->is_null()) params = *p;
        }
        if (id != j.end()) {
            return JsonRpcRequest{id_from(*id), method->get<std::string>(), std::move(params)};
        }
        return JsonRpcNotification{method->get<std::string>(), std::move(params)};
    }

    if (id != j.end()) {
        bool has_result = j.contains("result");
        bool has_error = j.contains("error");
        if (has_result == has_error) {
            throw invalid("a response needs exactly one of 'result' or 'error'");
        }
        JsonRpcResponse resp;
        resp.id = id_from(*id);
        if (has_result) resp.result = j.at("result");
        if (has_error) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception&) {
                throw invalid("malformed 'error' object");
            }
        }
        return resp;
    }

    throw invalid("missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw ProtocolError(error::InvalidRequest, "Invalid Request: message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Replace invalid UTF-8 coming out of tool payloads instead of throwing.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<RequestId> Codec::salvage_id(std::string_view raw) {
    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (!j.is_discarded()) {
        if (j.is_object()) {
            auto id = j.find("id");
            if (id != j.end() && valid_id(*id)) return id_from(*id);
        }
        return std::nullopt;
    }

    // Unparseable body: read the top-level "id" member textually.
    auto text = top_level_id_text(raw);
    if (!text) return std::nullopt;
    auto value = nlohmann::json::parse(*text, nullptr, false);
    if (value.is_discarded() || !valid_id(value)) return std::nullopt;
    return id_from(value);
}

} // namespace clinmcp
