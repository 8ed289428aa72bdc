#include "clinmcp/registry.hpp"
#include "clinmcp/log.hpp"
#include <algorithm>

namespace clinmcp {

// ---------- ToolRegistry::Builder ----------

bool ToolRegistry::Builder::add(ToolDescriptor descriptor) {
    auto taken = std::any_of(tools_.begin(), tools_.end(),
                             [&](const ToolDescriptor& t) { return t.name == descriptor.name; });
    if (taken) {
        CLINMCP_WARN("Duplicate tool name '{}'; keeping the first registration", descriptor.name);
        return false;
    }
    CLINMCP_INFO("Registered tool '{}'", descriptor.name);
    tools_.push_back(std::move(descriptor));
    return true;
}

ToolRegistry ToolRegistry::Builder::build() && {
    return ToolRegistry(std::move(tools_));
}

// ---------- ToolRegistry ----------

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools)
    : tools_(std::move(tools)) {
    for (size_t i = 0; i < tools_.size(); ++i) {
        index_.emplace(tools_[i].name, i);
    }
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &tools_[it->second];
}

nlohmann::json ToolRegistry::list() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : tools_) arr.push_back(t);
    return arr;
}

} // namespace clinmcp
