#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace clinmcp {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Closed
};

std::string_view to_string(SessionState s);

/// Lifecycle of one stdio connection. States only move forward; any state
/// may drop straight to Closed.
class Session {
public:
    Session() = default;

    [[nodiscard]] SessionState state() const noexcept { return state_; }

    /// Throws ProtocolError(InvalidRequest) for a backwards move.
    /// Closed -> Closed is a no-op.
    void transition(SessionState next);

    [[nodiscard]] bool is_ready() const noexcept { return state_ == SessionState::Ready; }
    [[nodiscard]] bool is_closing() const noexcept {
        return state_ == SessionState::ShuttingDown || state_ == SessionState::Closed;
    }

    /// Recorded from the client's initialize request.
    void set_client(nlohmann::json info, nlohmann::json capabilities, std::string protocol_version);
    [[nodiscard]] const nlohmann::json& client_info() const noexcept { return client_info_; }
    [[nodiscard]] const nlohmann::json& client_capabilities() const noexcept { return client_caps_; }
    [[nodiscard]] const std::string& protocol_version() const noexcept { return protocol_version_; }

private:
    SessionState state_{SessionState::Uninitialized};
    nlohmann::json client_info_ = nlohmann::json::object();
    nlohmann::json client_caps_ = nlohmann::json::object();
    std::string protocol_version_;
};

} // namespace clinmcp
