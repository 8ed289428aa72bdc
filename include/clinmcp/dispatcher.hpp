#pragma once
#include "registry.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace clinmcp {

enum class ErrorKind {
    ToolNotFound,
    SchemaValidationError,
    ToolExecutionError
};

std::string_view to_string(ErrorKind kind);

struct InvocationError {
    ErrorKind kind;
    std::string message;
    /// Kind-specific extras, e.g. {"missing": [...]} for schema failures.
    nlohmann::json details = nlohmann::json::object();
};

/// Outcome of one tool call, shared by both transports. payload is set when
/// ok, error otherwise.
struct InvocationResult {
    bool ok = false;
    nlohmann::json payload;
    std::optional<InvocationError> error;

    static InvocationResult success(nlohmann::json payload);
    static InvocationResult failure(ErrorKind kind, std::string message,
                                    nlohmann::json details = nlohmann::json::object());
};

void to_json(nlohmann::json& j, const InvocationResult& r);

/// Resolves, validates and invokes tools. invoke() never throws for
/// anything a tool does.
class Dispatcher {
public:
    struct Options {
        /// Reject calls missing required arguments before invoking.
        bool validate_required = true;
        /// Fill absent arguments from documented defaults.
        bool apply_defaults = true;
    };

    explicit Dispatcher(const ToolRegistry& registry) : Dispatcher(registry, Options{}) {}
    Dispatcher(const ToolRegistry& registry, Options opts)
        : registry_(registry), opts_(opts) {}

    InvocationResult invoke(const std::string& name, const nlohmann::json& arguments) const;

    [[nodiscard]] const ToolRegistry& registry() const { return registry_; }

    /// Applies defaults and string -> number/boolean coercion using the
    /// schema's properties.
    static nlohmann::json prepare_arguments(const nlohmann::json& schema,
                                            nlohmann::json arguments,
                                            bool apply_defaults);

    static std::vector<std::string> missing_required(const nlohmann::json& schema,
                                                     const nlohmann::json& arguments);

private:
    const ToolRegistry& registry_;
    Options opts_;
};

} // namespace clinmcp
