#pragma once
#include "logger.hpp"
#include "registry.hpp"
#include "schema.hpp"
#include "tool.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplite {

/// Exposes registered callables as MCP tools over JSON-RPC 2.0.
///
/// handle() is synchronous and never throws: every failure is returned as an
/// error envelope. The server does no locking. Register every tool before
/// serving requests, and serialise calls to handle() when the tool bodies or
/// the caller need it; a blocking tool blocks the calling thread.
class McpServer {
public:
    struct Options {
        Implementation server_info{"MCP Server", std::nullopt, "1.0.0"};
        std::optional<std::string> instructions;
        LogLevel log_level = LogLevel::Info;
        bool enable_logging = true;
        /// Defaults to Logger::stderr_sink.
        LogSink log_sink;
    };

    McpServer();
    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration ----

    /// Register `func` as tool `name`, one Arg per parameter in declaration
    /// order. Parameter types and descriptions are inferred from the C++
    /// signature and `info.doc`. Returns `func` unchanged.
    template <typename Func>
    Func add_tool(const std::string& name, ToolInfo info, Func func,
                  std::vector<Arg> params = {});

    /// Register a prepared record. A record with the same name is replaced.
    void add_tool(ToolRecord record);

    /// Names in registration order.
    [[nodiscard]] std::vector<std::string> list_tools() const;
    [[nodiscard]] const ToolRegistry& registry() const;

    /// Type table and heuristics used by add_tool.
    SchemaInference& schema_inference();

    // ---- Request handling ----

    /// Handle one request envelope. A JSON string value is treated as
    /// serialized text and parsed first.
    [[nodiscard]] nlohmann::json handle(const nlohmann::json& request);

    /// Handle one serialized request envelope.
    [[nodiscard]] nlohmann::json handle_text(std::string_view raw);

    /// The "initialize" result; marks the session initialized.
    InitializeResult initialize(const nlohmann::json& params = nlohmann::json::object());

    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] const Implementation& server_info() const;

    // ---- Logging ----
    Logger& logger();
    void set_log_level(LogLevel level);
    void set_logging_enabled(bool enabled);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

template <typename Func>
Func McpServer::add_tool(const std::string& name, ToolInfo info, Func func,
                         std::vector<Arg> params) {
    BoundTool bound = bind_tool(name, func, std::move(params));
    auto [specs, required] = schema_inference().infer_all(bound.parameters, info.doc);

    ToolRecord record;
    record.name = name;
    record.title = std::move(info.title);
    record.description = std::move(info.description);
    record.parameters = std::move(specs);
    record.required = std::move(required);
    record.invoke = std::move(bound.invoke);
    add_tool(std::move(record));
    return func;
}

} // namespace mcplite
