#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>

namespace mcplite {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
/// Receives requests whose method has no registered handler.
using FallbackHandler = std::function<HandlerResult(const std::string& method,
                                                    const nlohmann::json& params)>;

/// Prefix of the "data" member of every Internal error.
inline constexpr const char* kExecutionErrorPrefix = "An error occurred during tool execution: ";

class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Handler for every other method.
    void on_unhandled(FallbackHandler handler);

    /// Dispatch a request. Any exception thrown by a handler becomes an
    /// Internal error carrying the exception message as data; a thrown
    /// non-std::exception value is reported as "unknown error".
    [[nodiscard]] HandlerResult dispatch(const JsonRpcRequest& req) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    HandlerResult invoke(const std::string& method, const nlohmann::json& params) const;

    std::unordered_map<std::string, RequestHandler> request_handlers_;
    FallbackHandler fallback_;
};

} // namespace mcplite
