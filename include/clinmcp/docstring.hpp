#pragma once
#include "tool.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clinmcp {

struct ToolDoc {
    std::string summary;
    /// Whole Example block, dedented.
    std::optional<std::string> example;
    std::optional<std::string> example_input;
    std::optional<std::string> example_output;
    std::vector<ToolParameter> parameters;
};

/// Best-effort importer for the tool documentation convention:
///
///     One-line summary.
///
///     Example:
///         Input: narrative
///         Output: narrative
///
///     Parameters:
///         name : type[, optional]
///             Description (default: value)
///
/// Never throws on malformed text; entries it cannot read are dropped.
class DocstringParser {
public:
    static ToolDoc parse(std::string_view docstring);

    /// Maps a documented type token (str, int, List[float], ...) to a JSON
    /// schema type name, or "any".
    static std::string map_type(std::string_view token);

    /// Converts a default literal to JSON: numbers, True/False/None, quoted
    /// strings. Anything else is kept as a string.
    static nlohmann::json parse_default(std::string_view literal);

    /// {"type":"object","properties":{...},"required":[...]}, or the
    /// permissive schema when there are no parameters.
    static nlohmann::json to_input_schema(const std::vector<ToolParameter>& params);

    static nlohmann::json permissive_schema();
};

} // namespace clinmcp
