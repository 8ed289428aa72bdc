#pragma once
#include "tool.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace clinmcp {

/// Name -> ToolDescriptor, fixed at construction. Owned by the executable and
/// passed by reference to the protocol engine and the REST adapter.
class ToolRegistry {
public:
    class Builder {
    public:
        /// Returns false (and logs) when the name is already taken; the first
        /// registration is kept.
        bool add(ToolDescriptor descriptor);

        [[nodiscard]] size_t size() const { return tools_.size(); }

        ToolRegistry build() &&;

    private:
        std::vector<ToolDescriptor> tools_;
    };

    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    /// nullptr when absent.
    [[nodiscard]] const ToolDescriptor* find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// In registration order.
    [[nodiscard]] const std::vector<ToolDescriptor>& tools() const { return tools_; }
    [[nodiscard]] size_t size() const { return tools_.size(); }

    /// Array of {name, description, inputSchema, example?}, as served by
    /// tools/list and GET /tools.
    [[nodiscard]] nlohmann::json list() const;

private:
    explicit ToolRegistry(std::vector<ToolDescriptor> tools);

    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace clinmcp
