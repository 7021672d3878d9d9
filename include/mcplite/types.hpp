#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcplite {

// ---------- Parameter schema ----------

/// JSON Schema primitive types a tool parameter can be advertised as.
enum class ParamType {
    String, Integer, Number, Boolean, Array, Object
};

std::string param_type_to_string(ParamType type);
/// Inverse of param_type_to_string. Throws std::invalid_argument on an
/// unknown name.
ParamType param_type_from_string(const std::string& s);

struct ParameterSpec {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;

    bool operator==(const ParameterSpec& o) const {
        return name == o.name && type == o.type && description == o.description;
    }
};

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct CallToolResult {
    std::vector<TextContent> content;

    bool operator==(const CallToolResult& o) const { return content == o.content; }
};

// ---------- Capabilities ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;

    bool operator==(const ServerCapabilities& o) const { return tools == o.tools; }
};

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info && instructions == o.instructions;
    }
};

// ---------- Logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
/// Parses a lowercase syslog level name such as "warning". Throws
/// std::invalid_argument on an unknown name.
LogLevel log_level_from_string(const std::string& s);

// ---------- JSON serialization ----------

// The server only encodes these types. The from_json overloads are public so
// that callers holding a response (clients, tests, tooling) can decode it with
// j.get<CallToolResult>() and friends; they throw nlohmann::json::exception
// on a malformed shape.

void to_json(nlohmann::json& j, ParamType type);
void from_json(const nlohmann::json& j, ParamType& type);

/// Serialises the schema fragment {"type", "description"}; the name is the
/// key of the enclosing "properties" object.
void to_json(nlohmann::json& j, const ParameterSpec& p);

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

} // namespace mcplite
