#include "mcplite/types.hpp"
#include <array>
#include <stdexcept>

namespace mcplite {

// ---------- ParamType ----------

std::string param_type_to_string(ParamType type) {
    switch (type) {
        case ParamType::String:  return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number:  return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Array:   return "array";
        case ParamType::Object:  return "object";
        default:                 return "string";
    }
}

ParamType param_type_from_string(const std::string& s) {
    if (s == "string")  return ParamType::String;
    if (s == "integer") return ParamType::Integer;
    if (s == "number")  return ParamType::Number;
    if (s == "boolean") return ParamType::Boolean;
    if (s == "array")   return ParamType::Array;
    if (s == "object")  return ParamType::Object;
    throw std::invalid_argument("Unknown parameter type: " + s);
}

void to_json(nlohmann::json& j, ParamType type) {
    j = param_type_to_string(type);
}

void from_json(const nlohmann::json& j, ParamType& type) {
    type = param_type_from_string(j.get<std::string>());
}

void to_json(nlohmann::json& j, const ParameterSpec& p) {
    j = {{"type", p.type}, {"description", p.description}};
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = {{"content", t.content}};
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content = j.at("content").get<std::vector<TextContent>>();
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    if (j.contains("title")) t.title = j.at("title").get<std::string>();
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

// ---------- LogLevel ----------

namespace {

// Indexed by LogLevel, most to least verbose.
constexpr std::array<const char*, 8> kLogLevelNames = {
    "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency"
};

} // anonymous namespace

std::string log_level_to_string(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < kLogLevelNames.size() ? kLogLevelNames[index] : "info";
}

LogLevel log_level_from_string(const std::string& s) {
    for (size_t i = 0; i < kLogLevelNames.size(); ++i) {
        if (s == kLogLevelNames[i]) return static_cast<LogLevel>(i);
    }
    throw std::invalid_argument("Unknown log level: " + s);
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

} // namespace mcplite
