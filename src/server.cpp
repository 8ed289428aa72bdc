#include "clinmcp/server.hpp"
#include "clinmcp/codec.hpp"
#include "clinmcp/error.hpp"
#include "clinmcp/log.hpp"
#include "clinmcp/router.hpp"

namespace clinmcp {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    const ToolRegistry& registry;
    std::shared_ptr<const ResourceProvider> resources;
    Dispatcher dispatcher;
    Session session;
    Router router;

    Impl(Options o, const ToolRegistry& reg, std::shared_ptr<const ResourceProvider> res)
        : opts(std::move(o)),
          registry(reg),
          resources(std::move(res)),
          dispatcher(reg, opts.dispatch) {}

    void enter(SessionState next) {
        if (session.state() == next) return;
        CLINMCP_INFO("Session {} -> {}", to_string(session.state()), to_string(next));
        session.transition(next);
    }

    nlohmann::json build_capabilities() const {
        nlohmann::json caps = nlohmann::json::object();
        caps["tools"] = nlohmann::json::object();
        if (resources) caps["resources"] = nlohmann::json::object();
        caps["logging"] = nlohmann::json::object();
        return caps;
    }

    static nlohmann::json tool_result(const nlohmann::json& payload) {
        std::string text = payload.is_string()
            ? payload.get<std::string>()
            : payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        nlohmann::json item = {{"type", "text"}, {"text", std::move(text)}};
        nlohmann::json content = nlohmann::json::array();
        content.push_back(std::move(item));

        nlohmann::json result = {{"content", std::move(content)}, {"isError", false}};
        if (payload.is_object()) result["structuredContent"] = payload;
        return result;
    }

    static JsonRpcError tool_error(const std::string& name, const InvocationError& err) {
        nlohmann::json data = err.details.is_object() ? err.details : nlohmann::json::object();
        data["kind"] = std::string(to_string(err.kind));
        data["tool"] = name;
        switch (err.kind) {
            case ErrorKind::ToolNotFound:
                return JsonRpcError{error::MethodNotFound, err.message, std::move(data)};
            case ErrorKind::SchemaValidationError:
                return JsonRpcError{error::InvalidParams, err.message, std::move(data)};
            case ErrorKind::ToolExecutionError:
                break;
        }
        return JsonRpcError{error::ToolExecutionFailed, err.message, std::move(data)};
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            if (session.state() != SessionState::Uninitialized) {
                return JsonRpcError{error::InvalidRequest, "Server already initialized", std::nullopt};
            }
            nlohmann::json client_info = nlohmann::json::object();
            nlohmann::json client_caps = nlohmann::json::object();
            std::string client_proto(PROTOCOL_VERSION);
            if (params.is_object()) {
                client_info = params.value("clientInfo", nlohmann::json::object());
                client_caps = params.value("capabilities", nlohmann::json::object());
                client_proto = params.value("protocolVersion", client_proto);
            }
            CLINMCP_INFO("Client {} requested protocol {}",
                         client_info.value("name", std::string("<unnamed>")), client_proto);
            session.set_client(std::move(client_info), std::move(client_caps), client_proto);

            enter(SessionState::Initializing);
            if (!opts.strict_lifecycle) enter(SessionState::Ready);

            nlohmann::json result = {
                {"protocolVersion", std::string(PROTOCOL_VERSION)},
                {"serverInfo", opts.server_info},
                {"capabilities", build_capabilities()}
            };
            if (opts.instructions) result["instructions"] = *opts.instructions;
            return result;
        });

        // initialized, under both the old and the namespaced name
        auto on_initialized = [this](const nlohmann::json&) {
            if (session.state() == SessionState::Initializing) {
                enter(SessionState::Ready);
            } else {
                CLINMCP_DEBUG("initialized received in state {}", to_string(session.state()));
            }
        };
        router.on_notification("initialized", on_initialized);
        router.on_notification("notifications/initialized", on_initialized);

        // exit
        router.on_notification("exit", [this](const nlohmann::json&) {
            enter(SessionState::Closed);
        });

        // ping
        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json{{"pong", true}};
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json{{"tools", registry.list()}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
                return JsonRpcError{error::InvalidParams,
                                    "tools/call requires a string 'name'", std::nullopt};
            }
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
            if (!arguments.is_object() && !arguments.is_null()) {
                return JsonRpcError{error::InvalidParams,
                                    "tools/call 'arguments' must be an object", std::nullopt};
            }

            auto result = dispatcher.invoke(name, arguments);
            if (result.ok) return tool_result(result.payload);
            return tool_error(name, *result.error);
        });
        router.require_ready("tools/call");

        // resources/list
        router.on_request("resources/list", [this](const nlohmann::json&) -> HandlerResult {
            nlohmann::json list = nlohmann::json::array();
            if (resources) list = resources->list();
            return nlohmann::json{{"resources", std::move(list)}};
        });
        router.require_ready("resources/list");

        // resources/read
        router.on_request("resources/read", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.is_object() || !params.contains("uri") || !params.at("uri").is_string()) {
                return JsonRpcError{error::InvalidParams,
                                    "resources/read requires a string 'uri'", std::nullopt};
            }
            std::string uri = params.at("uri").get<std::string>();
            try {
                if (!resources) throw ResourceNotFound(uri);
                nlohmann::json contents = nlohmann::json::array();
                contents.push_back(nlohmann::json(resources->read(uri)));
                return nlohmann::json{{"contents", std::move(contents)}};
            } catch (const ResourceNotFound& e) {
                return JsonRpcError{error::ResourceNotFound, e.what(), nlohmann::json{{"uri", uri}}};
            }
        });
        router.require_ready("resources/read");

        // shutdown
        router.on_request("shutdown", [this](const nlohmann::json&) -> HandlerResult {
            if (session.state() == SessionState::Uninitialized) {
                return JsonRpcError{error::NotInitialized, "Server not initialized", std::nullopt};
            }
            enter(SessionState::ShuttingDown);
            return nlohmann::json::object();
        });
    }

    std::optional<std::string> reply_without_envelope(std::string_view body, int code,
                                                      const std::string& message) {
        auto id = Codec::salvage_id(body);
        if (!id) {
            CLINMCP_WARN("Dropping unreadable message without id: {}", message);
            return std::nullopt;
        }
        return Codec::serialize(JsonRpcResponse::failure(*id, code, message));
    }

    std::optional<std::string> on_message(std::string_view body) {
        JsonRpcMessage msg;
        try {
            msg = Codec::parse(body);
        } catch (const ParseError& e) {
            return reply_without_envelope(body, error::ParseError, std::string("Parse error: ") + e.what());
        } catch (const ProtocolError& e) {
            return reply_without_envelope(body, e.code, e.what());
        }

        if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            CLINMCP_DEBUG("<- {} (id {})", req->method, to_string(req->id));
            if (session.is_closing()) {
                return Codec::serialize(JsonRpcResponse::failure(
                    req->id, error::InvalidRequest, "Server is shutting down"));
            }
        } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            CLINMCP_DEBUG("<- {} (notification)", notif->method);
        }

        auto response = router.dispatch(msg, &session);
        if (!response) return std::nullopt;
        return Codec::serialize(*response);
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts, const ToolRegistry& registry,
                     std::shared_ptr<const ResourceProvider> resources)
    : impl_(std::make_unique<Impl>(std::move(opts), registry, std::move(resources))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

std::optional<std::string> McpServer::handle_message(std::string_view body) {
    return impl_->on_message(body);
}

SessionState McpServer::state() const {
    return impl_->session.state();
}

int McpServer::serve(ITransport& transport) {
    CLINMCP_INFO("Serving {} tool(s) as {} {}", impl_->registry.size(),
                 impl_->opts.server_info.name, impl_->opts.server_info.version);

    while (true) {
        std::optional<std::string> frame;
        try {
            frame = transport.receive();
        } catch (const FramingError& e) {
            CLINMCP_ERROR("Framing error, closing session: {}", e.what());
            impl_->enter(SessionState::Closed);
            return 1;
        } catch (const TransportError& e) {
            CLINMCP_ERROR("Transport error, closing session: {}", e.what());
            impl_->enter(SessionState::Closed);
            return 1;
        }

        if (!frame) {
            CLINMCP_INFO("Client closed the stream");
            impl_->enter(SessionState::Closed);
            return 0;
        }

        auto reply = handle_message(*frame);
        if (reply) {
            try {
                transport.send(*reply);
            } catch (const TransportError& e) {
                CLINMCP_ERROR("Cannot write response, closing session: {}", e.what());
                impl_->enter(SessionState::Closed);
                return 1;
            }
        }

        if (impl_->session.state() == SessionState::ShuttingDown) {
            impl_->enter(SessionState::Closed);
            transport.close();
            return 0;
        }
        if (impl_->session.state() == SessionState::Closed) {
            transport.close();
            return 0;
        }
    }
}

int McpServer::serve_stdio(StdioTransport::Options opts) {
    StdioTransport transport(opts);
    return serve(transport);
}

} // namespace clinmcp
