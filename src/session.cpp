#include "mcplite/session.hpp"

namespace mcplite {

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initialized:   return "initialized";
        default:                          return "uninitialized";
    }
}

bool Session::mark_initialized() {
    if (state_ == SessionState::Initialized) return false;
    state_ = SessionState::Initialized;
    return true;
}

void Session::record_client(const nlohmann::json& initialize_params) {
    if (!initialize_params.is_object()) return;
    if (initialize_params.contains("clientInfo")) {
        client_info_ = initialize_params.at("clientInfo");
    }
    if (initialize_params.contains("capabilities")) {
        client_caps_ = initialize_params.at("capabilities");
    }
    auto it = initialize_params.find("protocolVersion");
    if (it != initialize_params.end() && it->is_string()) {
        client_protocol_ = it->get<std::string>();
    }
}

} // namespace mcplite
