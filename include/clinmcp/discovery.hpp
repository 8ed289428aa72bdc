#pragma once
#include "registry.hpp"
#include "tool.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace clinmcp {

struct DiscoveryReport {
    struct Skipped {
        std::string module;
        std::string reason;
    };
    std::vector<std::string> loaded;
    std::vector<Skipped> skipped;
};

/// Turns tool modules into a registry. A module that fails to load, has no
/// entry point or whose name is taken is skipped; discovery carries on.
class ToolDiscovery {
public:
    struct Options {
        /// Empty means every module.
        std::vector<std::string> include;
        std::vector<std::string> exclude;
    };

    ToolDiscovery() = default;
    explicit ToolDiscovery(Options opts) : opts_(std::move(opts)) {}

    ToolRegistry discover(const std::vector<ToolModule>& modules,
                          DiscoveryReport* report = nullptr) const;

    /// Builds the descriptor for one module. Throws when the module cannot
    /// be loaded or has no entry point.
    static ToolDescriptor describe(const ToolModule& module);

    /// Lower case, with '-', ' ' and '.' mapped to '_'.
    static std::string normalize_name(std::string_view stem);

private:
    bool selected(const std::string& name) const;

    Options opts_;
};

} // namespace clinmcp
