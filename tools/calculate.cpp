#include "clinmcp/tool.hpp"
#include <string>

namespace clinmcp {
namespace tools {

ToolModule calculate_module() {
    ToolModule m;
    m.stem = "calculate";
    m.docstring = R"(
        Perform basic arithmetic operations.

        Example:
            Input: {"operation": "multiply", "a": 6, "b": 7}
            Output: {"result": 42, "operation": "multiply"}
    )";
    m.input_schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "operation": {
                "type": "string",
                "enum": ["add", "subtract", "multiply", "divide"],
                "description": "The operation to perform"
            },
            "a": {"type": "number", "description": "First operand"},
            "b": {"type": "number", "description": "Second operand"}
        },
        "required": ["operation", "a", "b"]
    })");
    m.load = [] {
        return ToolEntryPoint([](const nlohmann::json& input) {
            std::string op = input.value("operation", std::string("add"));
            double a = input.value("a", 0.0);
            double b = input.value("b", 0.0);

            nlohmann::json result;
            if (op == "add") {
                result = a + b;
            } else if (op == "subtract") {
                result = a - b;
            } else if (op == "multiply") {
                result = a * b;
            } else if (op == "divide") {
                if (b == 0.0) {
                    result = "Error: Division by zero";
                } else {
                    result = a / b;
                }
            } else {
                result = "Unknown operation";
            }
            return nlohmann::json{{"result", result}, {"operation", op}};
        });
    };
    return m;
}

} // namespace tools
} // namespace clinmcp
