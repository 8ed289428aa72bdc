#include "clinmcp/tool.hpp"

namespace clinmcp {

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = nlohmann::json{
        {"name", t.name},
        {"description", t.description},
        {"inputSchema", t.input_schema}
    };
    if (t.example) j["example"] = *t.example;
}

} // namespace clinmcp
