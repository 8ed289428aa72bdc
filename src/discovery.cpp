#include "clinmcp/discovery.hpp"
#include "clinmcp/docstring.hpp"
#include "clinmcp/error.hpp"
#include "clinmcp/log.hpp"
#include <algorithm>
#include <cctype>

namespace clinmcp {

std::string ToolDiscovery::normalize_name(std::string_view stem) {
    std::string name;
    name.reserve(stem.size());
    for (char c : stem) {
        if (c == '-' || c == ' ' || c == '.') {
            name.push_back('_');
        } else {
            name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return name;
}

ToolDescriptor ToolDiscovery::describe(const ToolModule& module) {
    if (!module.load) {
        throw Error("module has no loader");
    }
    ToolEntryPoint entry = module.load();
    if (!entry) {
        throw Error("module has no entry point");
    }

    ToolDescriptor d;
    d.name = normalize_name(module.stem);
    d.handler = std::move(entry);

    ToolDoc doc;
    try {
        doc = DocstringParser::parse(module.docstring);
    } catch (const std::exception& e) {
        CLINMCP_WARN("Tool '{}': unreadable documentation ({}); using a permissive schema",
                     d.name, e.what());
    }

    d.description = doc.summary.empty() ? "Tool: " + d.name : doc.summary;
    d.example = doc.example;
    d.input_schema = module.input_schema ? *module.input_schema
                                         : DocstringParser::to_input_schema(doc.parameters);
    d.parameters = std::move(doc.parameters);
    return d;
}

bool ToolDiscovery::selected(const std::string& name) const {
    auto listed = [&](const std::vector<std::string>& names) {
        return std::find(names.begin(), names.end(), name) != names.end();
    };
    if (!opts_.include.empty() && !listed(opts_.include)) return false;
    return !listed(opts_.exclude);
}

ToolRegistry ToolDiscovery::discover(const std::vector<ToolModule>& modules,
                                     DiscoveryReport* report) const {
    ToolRegistry::Builder builder;
    auto skip = [&](const std::string& module, const std::string& reason) {
        CLINMCP_WARN("Skipping tool module '{}': {}", module, reason);
        if (report) report->skipped.push_back({module, reason});
    };

    for (const auto& module : modules) {
        std::string name = normalize_name(module.stem);
        if (!selected(name)) {
            CLINMCP_DEBUG("Tool module '{}' not selected", module.stem);
            continue;
        }

        ToolDescriptor descriptor;
        try {
            descriptor = describe(module);
        } catch (const std::exception& e) {
            skip(module.stem, e.what());
            continue;
        }

        if (!builder.add(std::move(descriptor))) {
            if (report) report->skipped.push_back({module.stem, "duplicate tool name '" + name + "'"});
            continue;
        }
        if (report) report->loaded.push_back(name);
    }

    CLINMCP_INFO("Discovered {} tool(s) from {} module(s)", builder.size(), modules.size());
    return std::move(builder).build();
}

} // namespace clinmcp
