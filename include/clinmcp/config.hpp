#pragma once
#include "discovery.hpp"
#include "dispatcher.hpp"
#include "framing.hpp"
#include "log.hpp"
#include "resources.hpp"
#include "rest_adapter.hpp"
#include "server.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clinmcp {

/// Everything an executable needs, from YAML and then the command line.
struct ServerConfig {
    Implementation server_info{"clinmcp", std::string(LIBRARY_VERSION)};
    std::optional<std::string> instructions;
    FrameReader::Options framing;
    bool strict_lifecycle = false;
    ToolDiscovery::Options tools;
    Dispatcher::Options dispatch;
    std::vector<StaticResourceProvider::Entry> resources;
    RestAdapter::Options rest;
    log::Options logging;

    [[nodiscard]] McpServer::Options server_options() const;

    /// nullptr when no resources are configured.
    [[nodiscard]] std::shared_ptr<const ResourceProvider> resource_provider() const;
};

/// Both throw ConfigError for unreadable YAML or invalid values.
ServerConfig load_config_file(const std::string& path);
ServerConfig load_config_string(const std::string& yaml);

/// Applies the YAML document on top of `config`.
void apply_config_string(const std::string& yaml, ServerConfig& config);

struct StdioCli {
    ServerConfig config;
    /// Print the discovered tools and exit.
    bool list = false;
    /// Run one tool through the dispatcher and exit.
    std::optional<std::string> test_tool;
    std::string test_args = "{}";
};

/// Parse clinmcp-stdio arguments. Throws ConfigError.
StdioCli parse_stdio_cli(int argc, const char* const* argv);

/// Parse clinmcp-rest arguments. Throws ConfigError.
ServerConfig parse_rest_cli(int argc, const char* const* argv);

} // namespace clinmcp
