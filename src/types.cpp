#include "clinmcp/types.hpp"

namespace clinmcp {

void to_json(nlohmann::json& j, const Implementation& i) {
    j = nlohmann::json{{"name", i.name}, {"version", i.version}};
}

void to_json(nlohmann::json& j, const ResourceDescriptor& r) {
    j = nlohmann::json{{"uri", r.uri}, {"name", r.name}, {"mimeType", r.mime_type}};
    if (!r.description.empty()) j["description"] = r.description;
}

void to_json(nlohmann::json& j, const ResourceContent& c) {
    j = nlohmann::json{{"uri", c.uri}, {"mimeType", c.mime_type}, {"text", c.text}};
}

} // namespace clinmcp
