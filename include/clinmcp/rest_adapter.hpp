#pragma once
#include "dispatcher.hpp"
#include "registry.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
}

namespace clinmcp {

/// HTTP surface over the same registry and dispatcher the stdio engine uses:
///   GET  /health
///   GET  /tools
///   POST /run_tool/<name>
class RestAdapter {
public:
    struct Options {
        std::string host = "0.0.0.0";
        /// 0 picks a free port at bind().
        uint16_t port = 8210;
        size_t max_body_bytes = 8 * 1024 * 1024;
        int threads = 8;
    };

    /// Status code and JSON body of one HTTP reply.
    struct Reply {
        int status = 200;
        nlohmann::json body;
    };

    RestAdapter(Options opts, const ToolRegistry& registry,
                Dispatcher::Options dispatch = {});
    ~RestAdapter();

    RestAdapter(const RestAdapter&) = delete;
    RestAdapter& operator=(const RestAdapter&) = delete;

    Reply health() const;
    Reply list_tools() const;

    /// The whole POST /run_tool/<name> contract, without the HTTP server.
    Reply run_tool(const std::string& name, const std::string& content_type,
                   const std::string& body) const;

    /// Binds the listening socket. Throws TransportError.
    void bind();

    /// Blocks serving requests until stop(). Binds first if needed.
    void serve();

    /// Like serve(), but also stops when one of `signals` arrives. The
    /// signals are blocked in the calling thread and taken with sigwait() on
    /// a helper thread, so stop() never runs in signal context. Threads the
    /// caller started earlier must block them as well.
    /// Returns the signal received, or 0 if serving ended on its own.
    int serve_until_signal(const std::vector<int>& signals);

    void stop();

    [[nodiscard]] bool is_running() const;

    /// The bound port, once bind() has run.
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    static Reply error_reply(int status, const std::string& message);
    static bool is_valid_tool_name(const std::string& name);
    static bool is_json_content_type(const std::string& content_type);

private:
    void setup_routes();

    Options opts_;
    const ToolRegistry& registry_;
    Dispatcher dispatcher_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> bound_{false};
    uint16_t bound_port_ = 0;
};

} // namespace clinmcp
