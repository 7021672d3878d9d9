#include "mcplite/schema.hpp"
#include <algorithm>
#include <cctype>

namespace mcplite {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string after_first_colon(std::string_view line) {
    auto colon = line.find(':');
    return std::string(trim(line.substr(colon + 1)));
}

} // anonymous namespace

// ---------- Annotations ----------

bool GenericType::operator==(const GenericType& o) const {
    return origin == o.origin && args == o.args;
}

std::string annotation_to_string(const TypeAnnotation& annotation) {
    if (std::holds_alternative<std::monostate>(annotation)) return "<none>";
    if (const auto* c = std::get_if<ConcreteType>(&annotation)) return c->spelling;
    if (const auto* f = std::get_if<ForwardRef>(&annotation)) return "'" + f->text + "'";

    const auto& g = std::get<GenericType>(annotation);
    std::string out = g.origin + "[";
    for (size_t i = 0; i < g.args.size(); ++i) {
        if (i) out += ", ";
        out += annotation_to_string(g.args[i]);
    }
    return out + "]";
}

// ---------- TypeTable ----------

TypeTable TypeTable::defaults() {
    TypeTable t;
    t.map("str", ParamType::String);
    t.map("int", ParamType::Integer);
    t.map("float", ParamType::Number);
    t.map("bool", ParamType::Boolean);
    t.map("list", ParamType::Array);
    t.map("dict", ParamType::Object);
    return t;
}

void TypeTable::map(std::string spelling, ParamType type) {
    entries_[std::move(spelling)] = type;
}

std::optional<ParamType> TypeTable::lookup(const std::string& spelling) const {
    auto it = entries_.find(spelling);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

// ---------- Heuristics ----------

namespace heuristics {

std::optional<ParamType> annotation_table(const TypeAnnotation& a, const TypeTable& t) {
    if (const auto* c = std::get_if<ConcreteType>(&a)) {
        return t.lookup(c->spelling);
    }
    return std::nullopt;
}

std::optional<ParamType> generic_origin(const TypeAnnotation& a, const TypeTable& t) {
    if (const auto* g = std::get_if<GenericType>(&a)) {
        return t.lookup(g->origin);
    }
    return std::nullopt;
}

std::optional<ParamType> forward_reference(const TypeAnnotation& a, const TypeTable&) {
    const auto* f = std::get_if<ForwardRef>(&a);
    if (!f) return std::nullopt;

    // Order matters: "int" wins over "list" in "List[int]".
    std::string text = to_lower(f->text);
    if (contains(text, "int")) return ParamType::Integer;
    if (contains(text, "float") || contains(text, "number")) return ParamType::Number;
    if (contains(text, "bool")) return ParamType::Boolean;
    if (contains(text, "list") || contains(text, "array")) return ParamType::Array;
    if (contains(text, "dict") || contains(text, "object")) return ParamType::Object;
    return std::nullopt;
}

} // namespace heuristics

// ---------- Descriptions ----------

std::optional<std::string> extract_param_description(std::string_view doc,
                                                     const std::string& name) {
    const std::string named = name + ":";
    const std::string bulleted = "- " + name + ":";
    const std::string param_tag = "param " + to_lower(name);
    const std::string parameter_tag = "parameter " + to_lower(name);

    size_t pos = 0;
    while (pos <= doc.size()) {
        auto end = doc.find('\n', pos);
        if (end == std::string_view::npos) end = doc.size();
        std::string_view line = trim(doc.substr(pos, end - pos));
        pos = end + 1;

        if (starts_with(line, named) || starts_with(line, bulleted)) {
            return after_first_colon(line);
        }
        std::string lowered = to_lower(line);
        if (contains(lowered, param_tag) || contains(lowered, parameter_tag)) {
            if (line.find(':') == std::string_view::npos) return std::nullopt;
            return after_first_colon(line);
        }
    }
    return std::nullopt;
}

// ---------- SchemaInference ----------

SchemaInference::SchemaInference()
    : table_(TypeTable::defaults()),
      heuristics_{heuristics::annotation_table,
                  heuristics::generic_origin,
                  heuristics::forward_reference} {}

void SchemaInference::map_type(std::string spelling, ParamType type) {
    table_.map(std::move(spelling), type);
}

void SchemaInference::add_heuristic(TypeHeuristic heuristic) {
    heuristics_.push_back(std::move(heuristic));
}

ParamType SchemaInference::infer_type(const TypeAnnotation& annotation) const {
    for (const auto& heuristic : heuristics_) {
        try {
            if (auto type = heuristic(annotation, table_)) return *type;
        } catch (const std::exception&) {
            // A failing user heuristic defers to the next one.
        }
    }
    return ParamType::String;
}

ParameterSpec SchemaInference::infer(const ParameterInfo& param, std::string_view doc) const {
    ParameterSpec spec;
    spec.name = param.name;
    spec.type = infer_type(param.annotation);
    auto description = extract_param_description(doc, param.name);
    spec.description = description ? *description : "Parameter " + param.name;
    return spec;
}

std::pair<std::vector<ParameterSpec>, std::vector<std::string>>
SchemaInference::infer_all(const std::vector<ParameterInfo>& params, std::string_view doc) const {
    std::vector<ParameterSpec> specs;
    std::vector<std::string> required;
    specs.reserve(params.size());
    for (const auto& p : params) {
        specs.push_back(infer(p, doc));
        if (!p.has_default) required.push_back(p.name);
    }
    return {std::move(specs), std::move(required)};
}

} // namespace mcplite
