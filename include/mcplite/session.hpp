#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcplite {

/// One-way lifecycle: there is no path back to Uninitialized.
enum class SessionState {
    Uninitialized,
    Initialized
};

std::string session_state_to_string(SessionState state);

/// Per-server protocol session. Not synchronised; concurrent first requests
/// may both initialise, which converges on the same state.
class Session {
public:
    Session() = default;

    SessionState state() const { return state_; }
    bool is_initialized() const { return state_ == SessionState::Initialized; }

    /// Returns true when this call performed the transition.
    bool mark_initialized();

    /// Record what the client sent with "initialize".
    void record_client(const nlohmann::json& initialize_params);

    const std::optional<nlohmann::json>& client_info() const { return client_info_; }
    const std::optional<nlohmann::json>& client_capabilities() const { return client_caps_; }
    const std::optional<std::string>& client_protocol_version() const { return client_protocol_; }

private:
    SessionState state_{SessionState::Uninitialized};
    std::optional<nlohmann::json> client_info_;
    std::optional<nlohmann::json> client_caps_;
    std::optional<std::string> client_protocol_;
};

} // namespace mcplite
