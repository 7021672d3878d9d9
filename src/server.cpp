#include "mcplite/server.hpp"
#include "mcplite/codec.hpp"
#include "mcplite/error.hpp"
#include "mcplite/response.hpp"
#include "mcplite/router.hpp"
#include "mcplite/session.hpp"
#include "mcplite/version.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

namespace mcplite {

namespace {

using Clock = std::chrono::steady_clock;

std::string logger_name(const std::string& server_name) {
    std::string name = server_name;
    std::replace(name.begin(), name.end(), ' ', '_');
    return "MCP." + name;
}

std::string elapsed_ms(Clock::time_point start) {
    std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fms", elapsed.count());
    return buf;
}

/// Invalid UTF-8 in strings is replaced rather than thrown on.
std::string safe_dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string id_to_string(const RequestId& id) {
    return id ? safe_dump(*id) : "null";
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

/// Text shown for a tool result inside a "content" block.
std::string display_text(const nlohmann::json& result) {
    if (result.is_string()) return result.get<std::string>();
    return safe_dump(result);
}

JsonRpcError missing_params_error(const std::vector<std::string>& missing) {
    return JsonRpcError{error::InvalidParams, "Invalid params",
                        nlohmann::json("Missing required parameters: " + join(missing, ", "))};
}

JsonRpcError tool_not_found_error(const std::string& name) {
    return JsonRpcError{error::MethodNotFound, "Method not found",
                        nlohmann::json("Tool '" + name + "' not found")};
}

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Logger logger;
    Session session;
    Router router;
    ToolRegistry tools;
    SchemaInference inference;

    explicit Impl(Options o)
        : opts(std::move(o)),
          logger(logger_name(opts.server_info.name), opts.log_level,
                 opts.enable_logging, opts.log_sink) {}

    InitializeResult initialize(const nlohmann::json& params) {
        logger.info("Initializing MCP server '" + opts.server_info.name + "' v"
                    + opts.server_info.version);
        if (params.is_object() && !params.empty()) {
            logger.debug("Initialize params: " + safe_dump(params));
            session.record_client(params);
        }

        session.mark_initialized();

        InitializeResult result;
        result.protocol_version = std::string(PROTOCOL_VERSION);
        result.capabilities.tools = nlohmann::json{{"listChanged", false}};
        result.server_info = opts.server_info;
        result.instructions = opts.instructions;

        logger.info("MCP server initialized successfully. Available tools: "
                    + std::to_string(tools.size()));
        return result;
    }

    nlohmann::json call_tool(const ToolRecord& tool, const nlohmann::json& arguments,
                             const char* via) {
        logger.info(std::string("Executing tool") + via + ": " + tool.name);
        if (logger.should_log(LogLevel::Debug)) {
            logger.debug("Arguments for " + tool.name + ": " + safe_dump(arguments));
        }
        nlohmann::json result = tool.invoke(arguments);
        if (logger.should_log(LogLevel::Debug)) {
            logger.debug("Tool result for " + tool.name + ": " + safe_dump(result));
        }
        return result;
    }

    void ensure_initialized() {
        if (!session.is_initialized()) {
            logger.info("Auto-initializing MCP server for tool execution");
            initialize(nlohmann::json::object());
        }
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            nlohmann::json j;
            to_json(j, initialize(params));
            return j;
        });

        // Client confirmation; the state is already settled by "initialize".
        auto confirm = [this](const nlohmann::json&) -> HandlerResult {
            logger.info("Initialization confirmed");
            return nlohmann::json::object();
        };
        router.on_request("initialized", confirm);
        router.on_request("notifications/initialized", confirm);

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& record : tools.records()) {
                list.push_back(record);
            }
            logger.info("Tools list - Count: " + std::to_string(list.size()));
            return nlohmann::json{{"tools", list}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.is_object()) {
                throw McpToolError("params must be an object");
            }

            auto name_it = params.find("name");
            if (name_it == params.end() || !name_it->is_string()
                || name_it->get_ref<const std::string&>().empty()) {
                logger.error("Missing tool name in tools/call");
                return JsonRpcError{error::InvalidParams, "Invalid params",
                                    nlohmann::json("Missing tool name in tools/call")};
            }
            const std::string& name = name_it->get_ref<const std::string&>();

            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
            if (arguments.is_null()) arguments = nlohmann::json::object();

            const ToolRecord* tool = tools.find(name);
            if (!tool) {
                logger.error("Tool not found in tools/call: " + name);
                return tool_not_found_error(name);
            }

            auto missing = tool->missing_required(arguments);
            if (!missing.empty()) {
                logger.error("Missing parameters for " + name + ": " + join(missing, ", "));
                return missing_params_error(missing);
            }

            nlohmann::json result = call_tool(*tool, arguments, " via tools/call");

            CallToolResult wrapped;
            wrapped.content.push_back(TextContent{display_text(result)});
            nlohmann::json j;
            to_json(j, wrapped);
            return j;
        });

        // Any other method names a tool directly; its result is returned unwrapped.
        router.on_unhandled([this](const std::string& method,
                                   const nlohmann::json& params) -> HandlerResult {
            ensure_initialized();

            const ToolRecord* tool = tools.find(method);
            if (!tool) {
                logger.error("Tool not found: " + method);
                return tool_not_found_error(method);
            }

            auto missing = tool->missing_required(params);
            if (!missing.empty()) {
                logger.error("Missing parameters for " + method + ": " + join(missing, ", "));
                return missing_params_error(missing);
            }

            return call_tool(*tool, params, "");
        });
    }

    nlohmann::json handle_envelope(const nlohmann::json& request, Clock::time_point start) {
        if (!request.is_object()) {
            logger.warning("Request is not a JSON object");
            return ResponseBuilder::error(std::nullopt, error::InvalidRequest, "Invalid Request",
                                          "Request must be a JSON object");
        }

        auto version = request.find("jsonrpc");
        if (version == request.end() || *version != std::string(JSONRPC_VERSION)) {
            logger.warning("Invalid JSON-RPC version in request");
            return ResponseBuilder::error(std::nullopt, error::InvalidRequest, "Invalid Request",
                                          "Missing or invalid jsonrpc version");
        }

        JsonRpcRequest req;
        try {
            auto id_it = request.find("id");
            if (id_it != request.end()) req.id = request_id_from_json(*id_it);

            auto method_it = request.find("method");
            if (method_it == request.end() || !ResponseBuilder::is_truthy(*method_it)) {
                logger.error("Missing method in request ID: " + id_to_string(req.id));
                return ResponseBuilder::error(req.id, error::InvalidRequest, "Invalid Request",
                                              "Missing method");
            }
            // A non-string method can name neither a builtin nor a tool, so it
            // takes the direct-call path and is reported by its JSON text.
            if (!method_it->is_string()) {
                std::string rendered = safe_dump(*method_it);
                logger.info("Processing request - Method: " + rendered + ", ID: "
                            + id_to_string(req.id));
                ensure_initialized();
                logger.error("Tool not found: " + rendered);
                JsonRpcError err = tool_not_found_error(rendered);
                return ResponseBuilder::error(req.id, err.code, err.message, *err.data);
            }
            req.method = method_it->get<std::string>();

            auto params_it = request.find("params");
            if (params_it != request.end() && !params_it->is_null()) {
                req.params = *params_it;
            }
        } catch (const std::exception& e) {
            logger.error(std::string("Internal error while reading request: ") + e.what());
            return ResponseBuilder::error(req.id, error::InternalError, "Internal error",
                                          std::string(kExecutionErrorPrefix) + e.what());
        }

        logger.info("Processing request - Method: " + req.method + ", ID: " + id_to_string(req.id));

        HandlerResult result = router.dispatch(req);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            const nlohmann::json data = err->data ? *err->data : nlohmann::json();
            if (err->code == error::InternalError) {
                logger.error("Internal error - Method: " + req.method + ", ID: "
                             + id_to_string(req.id) + ", Time: " + elapsed_ms(start)
                             + ", Error: " + display_text(data));
            }
            return ResponseBuilder::error(req.id, err->code, err->message, data);
        }

        logger.info("Request completed - Method: " + req.method + ", ID: "
                    + id_to_string(req.id) + ", Time: " + elapsed_ms(start));
        return ResponseBuilder::success(req.id, std::move(std::get<nlohmann::json>(result)));
    }
};

// ----------- McpServer -----------

McpServer::McpServer() : McpServer(Options{}) {}

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

void McpServer::add_tool(ToolRecord record) {
    if (record.name.empty()) {
        throw McpToolError("Tool name must not be empty");
    }
    if (!record.invoke) {
        throw McpToolError("Tool '" + record.name + "' has no invoker");
    }
    for (const auto& name : record.required) {
        bool declared = std::any_of(record.parameters.begin(), record.parameters.end(),
            [&name](const ParameterSpec& p) { return p.name == name; });
        if (!declared) {
            throw McpToolError("Required parameter '" + name + "' is not declared by tool '"
                               + record.name + "'");
        }
    }

    std::string name = record.name;
    std::string description = record.description.empty() ? "No description" : record.description;
    if (impl_->tools.add(std::move(record))) {
        impl_->logger.info("Replaced tool: " + name + " - " + description);
    } else {
        impl_->logger.info("Registered tool: " + name + " - " + description);
    }
}

std::vector<std::string> McpServer::list_tools() const {
    return impl_->tools.names();
}

const ToolRegistry& McpServer::registry() const {
    return impl_->tools;
}

SchemaInference& McpServer::schema_inference() {
    return impl_->inference;
}

nlohmann::json McpServer::handle(const nlohmann::json& request) {
    if (request.is_string()) {
        return handle_text(request.get_ref<const std::string&>());
    }
    auto start = Clock::now();
    if (impl_->logger.should_log(LogLevel::Debug)) {
        impl_->logger.debug("Incoming request: " + safe_dump(request));
    }
    return impl_->handle_envelope(request, start);
}

nlohmann::json McpServer::handle_text(std::string_view raw) {
    auto start = Clock::now();
    impl_->logger.debug("Incoming request: " + std::string(raw));

    nlohmann::json envelope;
    try {
        envelope = Codec::parse(raw);
    } catch (const McpParseError& e) {
        impl_->logger.error(std::string("JSON parse error: ") + e.what());
        return ResponseBuilder::error(std::nullopt, error::ParseError, "Parse error",
                                      std::string("Invalid JSON: ") + e.what());
    }
    return impl_->handle_envelope(envelope, start);
}

InitializeResult McpServer::initialize(const nlohmann::json& params) {
    return impl_->initialize(params);
}

bool McpServer::is_initialized() const {
    return impl_->session.is_initialized();
}

const Implementation& McpServer::server_info() const {
    return impl_->opts.server_info;
}

Logger& McpServer::logger() {
    return impl_->logger;
}

void McpServer::set_log_level(LogLevel level) {
    impl_->logger.set_level(level);
}

void McpServer::set_logging_enabled(bool enabled) {
    impl_->logger.set_enabled(enabled);
}

} // namespace mcplite
