#include "mcplite/response.hpp"

namespace mcplite {

bool ResponseBuilder::is_truthy(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<int64_t>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return value.get<uint64_t>() != 0;
        case nlohmann::json::value_t::number_float:
            return value.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case nlohmann::json::value_t::binary:
            return !value.get_binary().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            return !value.empty();
    }
    return false;
}

nlohmann::json ResponseBuilder::success(const RequestId& id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.result = std::move(result);

    nlohmann::json j;
    to_json(j, resp);
    return j;
}

nlohmann::json ResponseBuilder::error(const RequestId& id, int code,
                                      const std::string& message,
                                      const nlohmann::json& data) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = JsonRpcError{code, message, std::nullopt};
    if (is_truthy(data)) resp.error->data = data;

    nlohmann::json j;
    to_json(j, resp);
    return j;
}

} // namespace mcplite
