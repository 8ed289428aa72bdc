#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace clinmcp {

/// A tool body: one structured input value in, one structured output value out.
using ToolEntryPoint = std::function<nlohmann::json(const nlohmann::json& input)>;

struct ToolParameter {
    std::string name;
    /// JSON schema type name, or "any" when the documented type is unknown.
    std::string type = "any";
    std::string description;
    bool required = true;
    std::optional<nlohmann::json> default_value;

    bool operator==(const ToolParameter& o) const {
        return name == o.name && type == o.type && description == o.description
               && required == o.required && default_value == o.default_value;
    }
};

/// One compiled-in tool source file, before discovery.
struct ToolModule {
    /// File stem the tool name is derived from.
    std::string stem;
    /// Summary / Example / Parameters documentation.
    std::string docstring;
    /// Resolves the entry point. Throwing means the module failed to load;
    /// returning an empty function means it has no entry point.
    std::function<ToolEntryPoint()> load;
    /// Takes precedence over the schema inferred from the docstring.
    std::optional<nlohmann::json> input_schema;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    std::optional<std::string> example;
    ToolEntryPoint handler;
    std::vector<ToolParameter> parameters;
};

/// The public listing form: name, description, inputSchema and example.
void to_json(nlohmann::json& j, const ToolDescriptor& t);

} // namespace clinmcp
