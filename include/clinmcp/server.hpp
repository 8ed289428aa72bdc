#pragma once
#include "dispatcher.hpp"
#include "registry.hpp"
#include "resources.hpp"
#include "session.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace clinmcp {

/// JSON-RPC 2.0 / MCP engine for one client connection. Reads a frame,
/// dispatches it and writes the reply, strictly in order on the calling
/// thread.
class McpServer {
public:
    struct Options {
        Implementation server_info{"clinmcp", std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        /// Enter Ready only on the client's initialized notification instead
        /// of straight after the initialize response.
        bool strict_lifecycle = false;
        Dispatcher::Options dispatch;
    };

    McpServer(Options opts, const ToolRegistry& registry,
              std::shared_ptr<const ResourceProvider> resources = nullptr);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Handles one frame body. Returns the serialized response, or nothing
    /// for notifications and for garbage that carries no recoverable id.
    std::optional<std::string> handle_message(std::string_view body);

    /// Runs until end of stream, shutdown, exit or a framing error. Returns
    /// the process exit status: 0 for a clean end, 1 for a broken stream.
    int serve(ITransport& transport);
    int serve_stdio(StdioTransport::Options opts = {});

    [[nodiscard]] SessionState state() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace clinmcp
