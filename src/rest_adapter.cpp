#include "clinmcp/rest_adapter.hpp"
#include "clinmcp/codec.hpp"
#include "clinmcp/error.hpp"
#include "clinmcp/log.hpp"

#include <httplib.h>

#include <pthread.h>
#include <signal.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace clinmcp {

namespace {

constexpr const char* kJson = "application/json";

void write_reply(httplib::Response& res, const RestAdapter::Reply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), kJson);
}

} // namespace

// ---------- RestAdapter ----------

RestAdapter::RestAdapter(Options opts, const ToolRegistry& registry,
                         Dispatcher::Options dispatch)
    : opts_(std::move(opts))
    , registry_(registry)
    , dispatcher_(registry, dispatch)
    , server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

RestAdapter::~RestAdapter() {
    stop();
}

RestAdapter::Reply RestAdapter::error_reply(int status, const std::string& message) {
    return Reply{status, nlohmann::json{{"error", message}, {"status", status}}};
}

bool RestAdapter::is_valid_tool_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

bool RestAdapter::is_json_content_type(const std::string& content_type) {
    std::string media = content_type.substr(0, content_type.find(';'));
    media.erase(std::remove_if(media.begin(), media.end(),
                               [](unsigned char c) { return std::isspace(c); }),
                media.end());
    std::transform(media.begin(), media.end(), media.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (media == kJson) return true;
    return media.size() > 5 && media.compare(media.size() - 5, 5, "+json") == 0;
}

RestAdapter::Reply RestAdapter::health() const {
    return Reply{200, nlohmann::json{{"status", "ok"}}};
}

RestAdapter::Reply RestAdapter::list_tools() const {
    return Reply{200, nlohmann::json{{"tools", registry_.list()}}};
}

RestAdapter::Reply RestAdapter::run_tool(const std::string& name,
                                         const std::string& content_type,
                                         const std::string& body) const {
    if (!is_valid_tool_name(name)) {
        return error_reply(400, "Invalid tool name");
    }
    if (!registry_.contains(name)) {
        return error_reply(404, ToolNotFound(name).what());
    }
    if (body.empty()) {
        return error_reply(400, "Request must contain a JSON payload.");
    }
    if (!is_json_content_type(content_type)) {
        return error_reply(415, "Content-Type must be application/json");
    }

    nlohmann::json arguments;
    try {
        arguments = Codec::parse_json(body);
    } catch (const ParseError& e) {
        return error_reply(400, std::string("Invalid JSON payload: ") + e.what());
    }
    if (!arguments.is_object()) {
        return error_reply(400, "JSON payload must be an object");
    }

    auto result = dispatcher_.invoke(name, arguments);
    if (result.ok) {
        return Reply{200, std::move(result.payload)};
    }

    const auto& err = *result.error;
    switch (err.kind) {
        case ErrorKind::ToolNotFound:
            return error_reply(404, err.message);
        case ErrorKind::SchemaValidationError: {
            auto reply = error_reply(400, err.message);
            reply.body["missing"] = err.details.value("missing", nlohmann::json::array());
            return reply;
        }
        case ErrorKind::ToolExecutionError:
            break;
    }
    return error_reply(500, "An internal error occurred in tool '" + name + "': " + err.message);
}

void RestAdapter::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        write_reply(res, health());
    });

    server_->Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
        write_reply(res, list_tools());
    });

    server_->Post(R"(/run_tool/(.*))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string name = req.matches[1];
        write_reply(res, run_tool(name, req.get_header_value("Content-Type"), req.body));
    });

    // Fills in bodies for statuses httplib produces itself (404, 413, ...).
    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        std::string message;
        switch (res.status) {
            case 404: message = "Not found: " + req.path; break;
            case 405: message = "Method not allowed"; break;
            case 413: message = "Request body too large"; break;
            default:  message = "HTTP error"; break;
        }
        write_reply(res, error_reply(res.status, message));
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                      std::exception_ptr ep) {
        std::string message = "Internal server error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        }
        CLINMCP_ERROR("Unhandled error on {} {}: {}", req.method, req.path, message);
        write_reply(res, error_reply(500, message));
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        CLINMCP_INFO("{} {} -> {}", req.method, req.path, res.status);
    });

    server_->set_payload_max_length(opts_.max_body_bytes);

    int threads = std::max(1, opts_.threads);
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
}

void RestAdapter::bind() {
    if (bound_) return;
    if (opts_.port == 0) {
        int port = server_->bind_to_any_port(opts_.host);
        if (port <= 0) {
            throw TransportError("Cannot bind to " + opts_.host + " on any port");
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else {
        if (!server_->bind_to_port(opts_.host, opts_.port)) {
            throw TransportError("Cannot bind to " + opts_.host + ":" + std::to_string(opts_.port));
        }
        bound_port_ = opts_.port;
    }
    bound_ = true;
    CLINMCP_INFO("REST adapter bound to {}:{}", opts_.host, bound_port_);
}

void RestAdapter::serve() {
    bind();
    CLINMCP_INFO("Serving {} tool(s) over HTTP", registry_.size());
    if (!server_->listen_after_bind()) {
        throw TransportError("HTTP server stopped unexpectedly");
    }
}

int RestAdapter::serve_until_signal(const std::vector<int>& signals) {
    if (signals.empty()) {
        serve();
        return 0;
    }

    sigset_t set;
    sigemptyset(&set);
    for (int sig : signals) sigaddset(&set, sig);
    sigset_t previous;
    pthread_sigmask(SIG_BLOCK, &set, &previous);

    std::atomic<bool> serving{true};
    std::atomic<int> received{0};
    std::thread waiter([this, &set, &serving, &received] {
        int sig = 0;
        if (sigwait(&set, &sig) != 0 || !serving) return;
        received = sig;
        CLINMCP_INFO("Received signal {}, stopping", sig);
        // stop() does nothing until the listen loop is running.
        while (serving) {
            stop();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });

    // Ends the waiter on every path out of serve(), including a throw.
    struct WaiterGuard {
        std::thread& waiter;
        std::atomic<bool>& serving;
        int wake;
        const sigset_t& previous;
        ~WaiterGuard() {
            serving = false;
            pthread_kill(waiter.native_handle(), wake);
            waiter.join();
            pthread_sigmask(SIG_SETMASK, &previous, nullptr);
        }
    } guard{waiter, serving, signals.front(), previous};

    serve();
    return received;
}

void RestAdapter::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

bool RestAdapter::is_running() const {
    return server_ && server_->is_running();
}

} // namespace clinmcp
