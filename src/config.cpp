#include "clinmcp/config.hpp"
#include "clinmcp/error.hpp"
#include "clinmcp/version.hpp"

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <sstream>

namespace clinmcp {

namespace {

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto b = item.find_first_not_of(" \t");
        auto e = item.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

std::vector<std::string> string_list(const YAML::Node& node, const char* key) {
    std::vector<std::string> out;
    if (!node.IsSequence()) {
        throw ConfigError(std::string("'") + key + "' must be a list");
    }
    for (const auto& item : node) out.push_back(item.as<std::string>());
    return out;
}

uint16_t checked_port(int port) {
    if (port < 0 || port > 65535) {
        throw ConfigError("Port out of range: " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

StaticResourceProvider::Entry parse_resource(const YAML::Node& node) {
    if (!node["uri"] || !node["name"]) {
        throw ConfigError("Resource entry needs 'uri' and 'name'");
    }
    StaticResourceProvider::Entry entry;
    entry.descriptor.uri = node["uri"].as<std::string>();
    entry.descriptor.name = node["name"].as<std::string>();
    if (node["description"]) entry.descriptor.description = node["description"].as<std::string>();
    if (node["mime_type"]) entry.descriptor.mime_type = node["mime_type"].as<std::string>();
    if (node["text"]) entry.text = node["text"].as<std::string>();
    if (node["file"]) entry.file = node["file"].as<std::string>();
    if (entry.text.has_value() == entry.file.has_value()) {
        throw ConfigError("Resource '" + entry.descriptor.uri + "' needs exactly one of 'text' or 'file'");
    }
    return entry;
}

void apply_yaml(const YAML::Node& root, ServerConfig& config) {
    if (!root || root.IsNull()) return;
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    // -- Server --
    if (const auto server = root["server"]) {
        if (server["name"]) config.server_info.name = server["name"].as<std::string>();
        if (server["version"]) config.server_info.version = server["version"].as<std::string>();
        if (server["instructions"]) config.instructions = server["instructions"].as<std::string>();
    }

    // -- Protocol --
    if (const auto protocol = root["protocol"]) {
        if (protocol["framing"]) {
            config.framing.framing = parse_framing(protocol["framing"].as<std::string>());
        }
        if (protocol["strict_lifecycle"]) {
            config.strict_lifecycle = protocol["strict_lifecycle"].as<bool>();
        }
        if (protocol["max_frame_bytes"]) {
            config.framing.max_frame_bytes = protocol["max_frame_bytes"].as<size_t>();
        }
    }

    // -- Tools --
    if (const auto tools = root["tools"]) {
        if (tools["include"]) config.tools.include = string_list(tools["include"], "tools.include");
        if (tools["exclude"]) config.tools.exclude = string_list(tools["exclude"], "tools.exclude");
    }

    // -- Dispatch --
    if (const auto dispatch = root["dispatch"]) {
        if (dispatch["validate_required"]) {
            config.dispatch.validate_required = dispatch["validate_required"].as<bool>();
        }
        if (dispatch["apply_defaults"]) {
            config.dispatch.apply_defaults = dispatch["apply_defaults"].as<bool>();
        }
    }

    // -- Resources --
    if (const auto resources = root["resources"]) {
        if (!resources.IsSequence()) {
            throw ConfigError("'resources' must be a list");
        }
        config.resources.clear();
        for (const auto& node : resources) {
            config.resources.push_back(parse_resource(node));
        }
    }

    // -- REST --
    if (const auto rest = root["rest"]) {
        if (rest["host"]) config.rest.host = rest["host"].as<std::string>();
        if (rest["port"]) config.rest.port = checked_port(rest["port"].as<int>());
        if (rest["max_body_bytes"]) config.rest.max_body_bytes = rest["max_body_bytes"].as<size_t>();
        if (rest["threads"]) config.rest.threads = rest["threads"].as<int>();
    }

    // -- Logging --
    if (const auto logging = root["logging"]) {
        if (logging["level"]) config.logging.level = logging["level"].as<std::string>();
        if (logging["file"]) config.logging.file = logging["file"].as<std::string>();
        if (logging["max_file_bytes"]) config.logging.max_file_bytes = logging["max_file_bytes"].as<size_t>();
        if (logging["max_files"]) config.logging.max_files = logging["max_files"].as<size_t>();
    }
}

void validate(const ServerConfig& config) {
    log::parse_level(config.logging.level);
    if (config.server_info.name.empty()) {
        throw ConfigError("server.name must not be empty");
    }
    if (config.framing.max_frame_bytes == 0) {
        throw ConfigError("protocol.max_frame_bytes must be positive");
    }
    if (config.rest.threads <= 0) {
        throw ConfigError("rest.threads must be positive");
    }
}

void add_common_arguments(argparse::ArgumentParser& program) {
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("trace, debug, info, warn, error, critical or off");
    program.add_argument("--log-file")
        .help("Rotating log file, in addition to stderr");
}

// Loads --config, then applies the shared flags on top.
ServerConfig load_common(const argparse::ArgumentParser& program) {
    ServerConfig config;
    if (auto path = program.present("--config")) {
        config = load_config_file(*path);
    }
    if (auto val = program.present("--log-level")) {
        config.logging.level = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.logging.file = *val;
    }
    return config;
}

void parse_or_throw(argparse::ArgumentParser& program, int argc, const char* const* argv) {
    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        // runtime_error for unknown or missing arguments, invalid_argument from scan<>
        throw ConfigError("CLI parse error: " + std::string(e.what()));
    }
}

} // namespace

// ---------------------------------------------------------------------------
// ServerConfig
// ---------------------------------------------------------------------------
McpServer::Options ServerConfig::server_options() const {
    McpServer::Options opts;
    opts.server_info = server_info;
    opts.instructions = instructions;
    opts.strict_lifecycle = strict_lifecycle;
    opts.dispatch = dispatch;
    return opts;
}

std::shared_ptr<const ResourceProvider> ServerConfig::resource_provider() const {
    if (resources.empty()) return nullptr;
    return std::make_shared<StaticResourceProvider>(resources);
}

// ---------------------------------------------------------------------------
// YAML
// ---------------------------------------------------------------------------
void apply_config_string(const std::string& yaml, ServerConfig& config) {
    try {
        apply_yaml(YAML::Load(yaml), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML config: " + std::string(e.what()));
    }
    validate(config);
}

ServerConfig load_config_string(const std::string& yaml) {
    ServerConfig config;
    apply_config_string(yaml, config);
    return config;
}

ServerConfig load_config_file(const std::string& path) {
    ServerConfig config;
    try {
        apply_yaml(YAML::LoadFile(path), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + path + "': " + std::string(e.what()));
    }
    validate(config);
    return config;
}

// ---------------------------------------------------------------------------
// Command lines
// ---------------------------------------------------------------------------
StdioCli parse_stdio_cli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("clinmcp-stdio", std::string(LIBRARY_VERSION));
    add_common_arguments(program);

    program.add_argument("--name")
        .help("Server name reported in initialize");
    program.add_argument("--framing")
        .help("content-length or auto");
    program.add_argument("--strict-lifecycle")
        .help("Wait for the initialized notification before accepting tool calls")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--include")
        .help("Comma separated tool names to load (default: all)");
    program.add_argument("--list")
        .help("Print the discovered tools and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--test")
        .help("Run one tool and print its result");
    program.add_argument("--test-args")
        .help("JSON arguments for --test")
        .default_value(std::string("{}"));

    parse_or_throw(program, argc, argv);

    StdioCli cli;
    cli.config = load_common(program);
    if (auto val = program.present("--name")) {
        cli.config.server_info.name = *val;
    }
    if (auto val = program.present("--framing")) {
        cli.config.framing.framing = parse_framing(*val);
    }
    if (program.get<bool>("--strict-lifecycle")) {
        cli.config.strict_lifecycle = true;
    }
    if (auto val = program.present("--include")) {
        cli.config.tools.include = split_list(*val);
    }
    cli.list = program.get<bool>("--list");
    if (auto val = program.present("--test")) {
        cli.test_tool = *val;
    }
    cli.test_args = program.get<std::string>("--test-args");

    validate(cli.config);
    return cli;
}

ServerConfig parse_rest_cli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("clinmcp-rest", std::string(LIBRARY_VERSION));
    add_common_arguments(program);

    program.add_argument("--host")
        .help("Listen address");
    program.add_argument("--port")
        .help("Listen port")
        .scan<'i', int>();

    parse_or_throw(program, argc, argv);

    ServerConfig config = load_common(program);
    if (auto val = program.present("--host")) {
        config.rest.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        config.rest.port = checked_port(*val);
    }

    validate(config);
    return config;
}

} // namespace clinmcp
