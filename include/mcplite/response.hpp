#pragma once
#include "json_rpc.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace mcplite {

/// Builds JSON-RPC 2.0 response envelopes. The "id" member is written only
/// when the id is present and not null.
class ResponseBuilder {
public:
    /// {"jsonrpc":"2.0","result":result[,"id":id]}
    [[nodiscard]] static nlohmann::json success(const RequestId& id, nlohmann::json result);

    /// {"jsonrpc":"2.0","error":{"code","message"[,"data"]}[,"id":id]}.
    /// Falsy data (null, false, 0, "", [] or {}) is omitted.
    [[nodiscard]] static nlohmann::json error(const RequestId& id, int code,
                                              const std::string& message,
                                              const nlohmann::json& data = nullptr);

    [[nodiscard]] static bool is_truthy(const nlohmann::json& value);
};

} // namespace mcplite
