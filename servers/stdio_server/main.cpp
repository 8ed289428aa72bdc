/// clinmcp-stdio: MCP tool server over stdin/stdout.
/// Usage: clinmcp-stdio [--config server.yaml] [--list] [--test NAME --test-args JSON]
/// Diagnostics go to stderr; stdout carries Content-Length framed JSON-RPC.

#include <clinmcp/clinmcp.hpp>
#include <csignal>
#include <iostream>
#include <sstream>

namespace {

int list_tools(const clinmcp::ToolRegistry& registry) {
    for (const auto& tool : registry.tools()) {
        std::cout << tool.name << "\n  " << tool.description << "\n";
        if (tool.example) {
            std::cout << "  Example:\n";
            std::istringstream lines(*tool.example);
            std::string line;
            while (std::getline(lines, line)) std::cout << "    " << line << "\n";
        }
    }
    std::cout << registry.size() << " tool(s)" << std::endl;
    return 0;
}

int test_tool(const clinmcp::ToolRegistry& registry, const clinmcp::ServerConfig& config,
              const std::string& name, const std::string& args_text) {
    nlohmann::json args;
    try {
        args = clinmcp::Codec::parse_json(args_text);
    } catch (const clinmcp::ParseError& e) {
        std::cerr << "Invalid --test-args: " << e.what() << std::endl;
        return 2;
    }
    clinmcp::Dispatcher dispatcher(registry, config.dispatch);
    auto result = dispatcher.invoke(name, args);
    std::cout << nlohmann::json(result).dump(2) << std::endl;
    return result.ok ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    clinmcp::StdioCli cli;
    try {
        cli = clinmcp::parse_stdio_cli(argc, argv);
        clinmcp::log::init(cli.config.logging);
    } catch (const clinmcp::ConfigError& e) {
        CLINMCP_ERROR("{}", e.what());
        return 2;
    }

    // A client that goes away mid-write must surface as a write error, not a signal.
    std::signal(SIGPIPE, SIG_IGN);

    clinmcp::ToolDiscovery discovery(cli.config.tools);
    clinmcp::ToolRegistry registry = discovery.discover(clinmcp::builtin_tool_modules());

    if (cli.list) return list_tools(registry);
    if (cli.test_tool) return test_tool(registry, cli.config, *cli.test_tool, cli.test_args);

    clinmcp::McpServer server(cli.config.server_options(), registry,
                              cli.config.resource_provider());
    return server.serve_stdio(cli.config.framing);
}
