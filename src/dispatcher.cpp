#include "clinmcp/dispatcher.hpp"
#include "clinmcp/error.hpp"
#include "clinmcp/log.hpp"

namespace clinmcp {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ToolNotFound:          return "ToolNotFound";
        case ErrorKind::SchemaValidationError: return "SchemaValidationError";
        case ErrorKind::ToolExecutionError:    return "ToolExecutionError";
    }
    return "Unknown";
}

InvocationResult InvocationResult::success(nlohmann::json payload) {
    InvocationResult r;
    r.ok = true;
    r.payload = std::move(payload);
    return r;
}

InvocationResult InvocationResult::failure(ErrorKind kind, std::string message,
                                           nlohmann::json details) {
    InvocationResult r;
    r.ok = false;
    r.error = InvocationError{kind, std::move(message), std::move(details)};
    return r;
}

void to_json(nlohmann::json& j, const InvocationResult& r) {
    if (r.ok) {
        j = nlohmann::json{{"ok", true}, {"payload", r.payload}};
        return;
    }
    nlohmann::json err = r.error->details.is_object() ? r.error->details : nlohmann::json::object();
    err["kind"] = std::string(to_string(r.error->kind));
    err["message"] = r.error->message;
    j = nlohmann::json{{"ok", false}, {"error", std::move(err)}};
}

// ---------- Argument preparation ----------

namespace {

// Converts "42" / "0.5" / "true" when the schema asks for that type.
std::optional<nlohmann::json> coerce_string(const std::string& value, const std::string& type) {
    auto parsed = nlohmann::json::parse(value, nullptr, false);
    if (parsed.is_discarded()) return std::nullopt;
    if (type == "integer" && parsed.is_number_integer()) return parsed;
    if (type == "number" && parsed.is_number()) return parsed;
    if (type == "boolean" && parsed.is_boolean()) return parsed;
    return std::nullopt;
}

} // namespace

nlohmann::json Dispatcher::prepare_arguments(const nlohmann::json& schema,
                                             nlohmann::json arguments,
                                             bool apply_defaults) {
    if (!schema.is_object() || !arguments.is_object()) return arguments;
    auto props = schema.find("properties");
    if (props == schema.end() || !props->is_object()) return arguments;

    for (auto p = props->begin(); p != props->end(); ++p) {
        const std::string& name = p.key();
        const nlohmann::json& prop = p.value();
        if (!prop.is_object()) continue;
        auto it = arguments.find(name);
        if (it == arguments.end()) {
            if (apply_defaults && prop.contains("default")) {
                arguments[name] = prop.at("default");
            }
            continue;
        }
        if (it->is_string() && prop.contains("type") && prop.at("type").is_string()) {
            if (auto v = coerce_string(it->get<std::string>(), prop.at("type").get<std::string>())) {
                *it = std::move(*v);
            }
        }
    }
    return arguments;
}

std::vector<std::string> Dispatcher::missing_required(const nlohmann::json& schema,
                                                      const nlohmann::json& arguments) {
    std::vector<std::string> missing;
    if (!schema.is_object()) return missing;
    auto req = schema.find("required");
    if (req == schema.end() || !req->is_array()) return missing;
    for (const auto& field : *req) {
        if (!field.is_string()) continue;
        const auto& name = field.get_ref<const std::string&>();
        if (!arguments.is_object() || !arguments.contains(name)) missing.push_back(name);
    }
    return missing;
}

// ---------- Dispatcher ----------

InvocationResult Dispatcher::invoke(const std::string& name, const nlohmann::json& arguments) const {
    const ToolDescriptor* tool = registry_.find(name);
    if (!tool) {
        return InvocationResult::failure(ErrorKind::ToolNotFound, ToolNotFound(name).what());
    }

    nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!args.is_object()) {
        return InvocationResult::failure(ErrorKind::SchemaValidationError,
                                         "Arguments for tool '" + name + "' must be a JSON object",
                                         nlohmann::json{{"missing", nlohmann::json::array()}});
    }

    args = prepare_arguments(tool->input_schema, std::move(args), opts_.apply_defaults);

    if (opts_.validate_required) {
        auto missing = missing_required(tool->input_schema, args);
        if (!missing.empty()) {
            std::string list;
            for (const auto& m : missing) {
                if (!list.empty()) list += ", ";
                list += m;
            }
            return InvocationResult::failure(ErrorKind::SchemaValidationError,
                                             "Missing required argument(s): " + list,
                                             nlohmann::json{{"missing", missing}});
        }
    }

    CLINMCP_DEBUG("Invoking tool '{}'", name);
    try {
        return InvocationResult::success(tool->handler(args));
    } catch (const std::exception& e) {
        CLINMCP_ERROR("Tool '{}' raised: {}", name, e.what());
        return InvocationResult::failure(ErrorKind::ToolExecutionError, e.what());
    } catch (...) {
        CLINMCP_ERROR("Tool '{}' raised a non-standard exception", name);
        return InvocationResult::failure(ErrorKind::ToolExecutionError,
                                         "Tool raised a non-standard exception");
    }
}

} // namespace clinmcp
