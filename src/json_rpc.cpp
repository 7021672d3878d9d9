#include "mcplite/json_rpc.hpp"
#include "mcplite/version.hpp"

namespace mcplite {

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = r.method;
    j["params"] = r.params;
    if (r.id && !r.id->is_null()) j["id"] = *r.id;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
    if (r.id && !r.id->is_null()) j["id"] = *r.id;
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    r.id = j.contains("id") ? request_id_from_json(j.at("id")) : std::nullopt;
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

} // namespace mcplite
