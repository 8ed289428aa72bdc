#include "clinmcp/resources.hpp"
#include "clinmcp/error.hpp"
#include <fstream>
#include <sstream>

namespace clinmcp {

StaticResourceProvider::StaticResourceProvider(std::vector<Entry> entries)
    : entries_(std::move(entries)) {}

std::vector<ResourceDescriptor> StaticResourceProvider::list() const {
    std::vector<ResourceDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.descriptor);
    return out;
}

ResourceContent StaticResourceProvider::read(const std::string& uri) const {
    for (const auto& e : entries_) {
        if (e.descriptor.uri != uri) continue;

        ResourceContent content;
        content.uri = uri;
        content.mime_type = e.descriptor.mime_type;
        if (e.text) {
            content.text = *e.text;
        } else if (e.file) {
            std::ifstream in(*e.file, std::ios::binary);
            if (!in) {
                throw Error("Cannot read resource file '" + *e.file + "' for " + uri);
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            content.text = ss.str();
        }
        return content;
    }
    throw ResourceNotFound(uri);
}

} // namespace clinmcp
