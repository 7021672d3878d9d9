#pragma once
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcplite {

// ---------- Type annotations ----------

/// A named, non-parameterised type such as "int" or "str".
struct ConcreteType {
    std::string spelling;

    bool operator==(const ConcreteType& o) const { return spelling == o.spelling; }
};

/// Textual annotation supplied at registration, e.g. "List[int]".
struct ForwardRef {
    std::string text;

    bool operator==(const ForwardRef& o) const { return text == o.text; }
};

struct GenericType;

/// std::monostate stands for "no annotation".
using TypeAnnotation = std::variant<std::monostate, ConcreteType, GenericType, ForwardRef>;

/// A parameterised type: origin "list" with argument "int" for
/// std::vector<int>. Only the origin takes part in inference.
struct GenericType {
    std::string origin;
    std::vector<TypeAnnotation> args;

    bool operator==(const GenericType& o) const;
};

std::string annotation_to_string(const TypeAnnotation& annotation);

/// Everything the inference engine knows about one callable parameter.
struct ParameterInfo {
    std::string name;
    TypeAnnotation annotation;
    bool has_default = false;
};

// ---------- Inference ----------

/// Spelling -> ParamType mapping consulted for concrete and generic types.
class TypeTable {
public:
    /// Table preloaded with str, int, float, bool, list and dict.
    static TypeTable defaults();

    void map(std::string spelling, ParamType type);
    [[nodiscard]] std::optional<ParamType> lookup(const std::string& spelling) const;

private:
    std::unordered_map<std::string, ParamType> entries_;
};

/// One inference step; returns std::nullopt to defer to the next one.
using TypeHeuristic = std::function<std::optional<ParamType>(const TypeAnnotation&,
                                                             const TypeTable&)>;

namespace heuristics {
    std::optional<ParamType> annotation_table(const TypeAnnotation& a, const TypeTable& t);
    std::optional<ParamType> generic_origin(const TypeAnnotation& a, const TypeTable& t);
    std::optional<ParamType> forward_reference(const TypeAnnotation& a, const TypeTable& t);
} // namespace heuristics

/// Find the documentation line describing a parameter. Returns std::nullopt
/// when no line mentions it.
[[nodiscard]] std::optional<std::string> extract_param_description(std::string_view doc,
                                                                   const std::string& name);

class SchemaInference {
public:
    /// Default table and the heuristic chain annotation_table ->
    /// generic_origin -> forward_reference.
    SchemaInference();

    /// Register an extra spelling, e.g. map_type("uuid", ParamType::String).
    void map_type(std::string spelling, ParamType type);

    /// Append a heuristic, tried after the built-in ones.
    void add_heuristic(TypeHeuristic heuristic);

    /// Total: falls back to ParamType::String.
    [[nodiscard]] ParamType infer_type(const TypeAnnotation& annotation) const;

    [[nodiscard]] ParameterSpec infer(const ParameterInfo& param, std::string_view doc) const;

    /// Specs for every parameter plus the names of the required ones, both in
    /// declaration order.
    [[nodiscard]] std::pair<std::vector<ParameterSpec>, std::vector<std::string>>
    infer_all(const std::vector<ParameterInfo>& params, std::string_view doc) const;

private:
    TypeTable table_;
    std::vector<TypeHeuristic> heuristics_;
};

} // namespace mcplite
