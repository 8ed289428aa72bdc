#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clinmcp {

class ResourceProvider {
public:
    virtual ~ResourceProvider() = default;

    virtual std::vector<ResourceDescriptor> list() const = 0;
    /// Throws ResourceNotFound for an unknown uri.
    virtual ResourceContent read(const std::string& uri) const = 0;
};

/// Resources declared in configuration: inline text, or a file read on
/// every read() call.
class StaticResourceProvider : public ResourceProvider {
public:
    struct Entry {
        ResourceDescriptor descriptor;
        std::optional<std::string> text;
        std::optional<std::string> file;
    };

    explicit StaticResourceProvider(std::vector<Entry> entries);

    std::vector<ResourceDescriptor> list() const override;
    ResourceContent read(const std::string& uri) const override;

private:
    std::vector<Entry> entries_;
};

} // namespace clinmcp
