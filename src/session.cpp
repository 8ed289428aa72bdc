#include "clinmcp/session.hpp"
#include "clinmcp/error.hpp"

namespace clinmcp {

std::string_view to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
        case SessionState::ShuttingDown:  return "shutting-down";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

void Session::transition(SessionState next) {
    if (next == SessionState::Closed) {
        state_ = next;
        return;
    }
    if (static_cast<int>(next) <= static_cast<int>(state_)) {
        throw ProtocolError(error::InvalidRequest,
                            "Invalid session transition from " + std::string(to_string(state_)) +
                            " to " + std::string(to_string(next)));
    }
    state_ = next;
}

void Session::set_client(nlohmann::json info, nlohmann::json capabilities,
                         std::string protocol_version) {
    client_info_ = std::move(info);
    client_caps_ = std::move(capabilities);
    protocol_version_ = std::move(protocol_version);
}

} // namespace clinmcp
