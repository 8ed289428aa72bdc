#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace clinmcp {

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "text/plain";

    bool operator==(const ResourceDescriptor& o) const {
        return uri == o.uri && name == o.name && description == o.description
               && mime_type == o.mime_type;
    }
};

struct ResourceContent {
    std::string uri;
    std::string mime_type = "text/plain";
    std::string text;

    bool operator==(const ResourceContent& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text;
    }
};

void to_json(nlohmann::json& j, const Implementation& i);
void to_json(nlohmann::json& j, const ResourceDescriptor& r);
void to_json(nlohmann::json& j, const ResourceContent& c);

} // namespace clinmcp
