#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcplite {

/// Request ids are echoed verbatim (string or number). An absent or null id
/// is represented by std::nullopt and never written back.
using RequestId = std::optional<nlohmann::json>;

/// Normalise a raw "id" member: null becomes std::nullopt.
inline RequestId request_id_from_json(const nlohmann::json& j) {
    if (j.is_null()) return std::nullopt;
    return j;
}

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Encodes a request the way a client sends it. The server reads envelopes
/// itself, so there is no matching from_json.
void to_json(nlohmann::json& j, const JsonRpcRequest& r);

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
/// Decodes a response envelope on the receiving side.
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

} // namespace mcplite
