#include "mcplite/router.hpp"
#include "mcplite/error.hpp"

namespace mcplite {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_unhandled(FallbackHandler handler) {
    fallback_ = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0;
}

HandlerResult Router::invoke(const std::string& method, const nlohmann::json& params) const {
    auto it = request_handlers_.find(method);
    if (it != request_handlers_.end()) {
        return it->second(params);
    }
    if (fallback_) {
        return fallback_(method, params);
    }
    return JsonRpcError{error::MethodNotFound, "Method not found",
                        nlohmann::json("Method '" + method + "' not found")};
}

HandlerResult Router::dispatch(const JsonRpcRequest& req) const {
    try {
        return invoke(req.method, req.params);
    } catch (const std::exception& e) {
        return JsonRpcError{error::InternalError, "Internal error",
                            nlohmann::json(std::string(kExecutionErrorPrefix) + e.what())};
    } catch (...) {
        return JsonRpcError{error::InternalError, "Internal error",
                            nlohmann::json(std::string(kExecutionErrorPrefix) + "unknown error")};
    }
}

} // namespace mcplite
