/// clinmcp-rest: the tool registry over HTTP.
/// Usage: clinmcp-rest [--config server.yaml] [--host 0.0.0.0] [--port 8210]

#include <clinmcp/clinmcp.hpp>
#include <csignal>

int main(int argc, char** argv) {
    clinmcp::ServerConfig config;
    try {
        config = clinmcp::parse_rest_cli(argc, argv);
        clinmcp::log::init(config.logging);
    } catch (const clinmcp::ConfigError& e) {
        CLINMCP_ERROR("{}", e.what());
        return 2;
    }

    clinmcp::ToolDiscovery discovery(config.tools);
    clinmcp::ToolRegistry registry = discovery.discover(clinmcp::builtin_tool_modules());

    clinmcp::RestAdapter adapter(config.rest, registry, config.dispatch);
    try {
        adapter.serve_until_signal({SIGINT, SIGTERM});
    } catch (const clinmcp::TransportError& e) {
        CLINMCP_ERROR("{}", e.what());
        return 1;
    }
    CLINMCP_INFO("REST adapter stopped");
    return 0;
}
