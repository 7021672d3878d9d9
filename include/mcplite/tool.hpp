#pragma once
#include "error.hpp"
#include "registry.hpp"
#include "schema.hpp"
#include "type_traits.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mcplite {

/// Declares one parameter of a registered callable: its name, and optionally
/// a default value and a textual type annotation.
class Arg {
public:
    explicit Arg(std::string name) : name_(std::move(name)) {}

    /// A default makes the parameter optional. A null default still counts.
    [[nodiscard]] Arg default_value(nlohmann::json value) const {
        Arg copy = *this;
        copy.default_ = std::move(value);
        return copy;
    }

    /// Overrides the annotation derived from the C++ type.
    [[nodiscard]] Arg annotated(std::string text) const {
        Arg copy = *this;
        copy.forward_ref_ = std::move(text);
        return copy;
    }

    const std::string& name() const { return name_; }
    bool has_default() const { return default_.has_value(); }
    const nlohmann::json& default_json() const { return *default_; }
    const std::optional<std::string>& forward_ref() const { return forward_ref_; }

private:
    std::string name_;
    std::optional<nlohmann::json> default_;
    std::optional<std::string> forward_ref_;
};

inline Arg arg(std::string name) { return Arg(std::move(name)); }

/// Display metadata for a tool. `doc` is the free text the per-parameter
/// descriptions are extracted from.
struct ToolInfo {
    std::optional<std::string> title;
    std::string description;
    std::string doc;
};

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

/// nlohmann converts any number (and booleans) to any arithmetic type, so
/// integers are range checked and floats are never truncated.
template <typename Value>
Value integral_from_argument(const nlohmann::json& j) {
    using limits = std::numeric_limits<Value>;
    if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v > static_cast<uint64_t>(limits::max())) {
            throw std::out_of_range(j.dump() + " is out of range");
        }
        return static_cast<Value>(v);
    }
    if (j.is_number_integer()) {
        auto v = j.get<int64_t>();
        bool fits = std::is_signed_v<Value>
            ? v >= static_cast<int64_t>(limits::min())
                  && (sizeof(Value) >= sizeof(int64_t) || v <= static_cast<int64_t>(limits::max()))
            : v >= 0 && static_cast<uint64_t>(v) <= static_cast<uint64_t>(limits::max());
        if (!fits) {
            throw std::out_of_range(j.dump() + " is out of range");
        }
        return static_cast<Value>(v);
    }
    throw std::invalid_argument("expected an integer, got " + std::string(j.type_name()));
}

template <typename Value>
Value from_argument(const nlohmann::json& j) {
    if constexpr (is_optional<Value>::value) {
        if (j.is_null()) return std::nullopt;
        return from_argument<typename Value::value_type>(j);
    } else if constexpr (std::is_same_v<Value, nlohmann::json>) {
        return j;
    } else if constexpr (std::is_integral_v<Value> && !std::is_same_v<Value, bool>) {
        return integral_from_argument<Value>(j);
    } else if constexpr (std::is_floating_point_v<Value>) {
        if (!j.is_number()) {
            throw std::invalid_argument("expected a number, got " + std::string(j.type_name()));
        }
        return j.get<Value>();
    } else {
        return j.get<Value>();
    }
}

template <typename T>
remove_cvref_t<T> extract_argument(const Arg& param, const nlohmann::json& arguments) {
    const nlohmann::json* source = nullptr;
    if (arguments.is_object()) {
        auto it = arguments.find(param.name());
        if (it != arguments.end()) source = &*it;
    }
    if (!source) {
        if (!param.has_default()) {
            throw McpToolError("missing required argument '" + param.name() + "'");
        }
        source = &param.default_json();
    }

    try {
        return from_argument<remove_cvref_t<T>>(*source);
    } catch (const nlohmann::json::exception& e) {
        throw McpToolError("invalid value for argument '" + param.name() + "': " + e.what());
    } catch (const std::logic_error& e) {
        throw McpToolError("invalid value for argument '" + param.name() + "': " + e.what());
    }
}

inline void reject_unknown_arguments(const std::string& tool_name,
                                     const std::vector<Arg>& params,
                                     const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw McpToolError(tool_name + "() arguments must be an object");
    }
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        bool known = false;
        for (const auto& p : params) {
            if (p.name() == it.key()) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw McpToolError(tool_name + "() got an unexpected keyword argument '"
                               + it.key() + "'");
        }
    }
}

template <typename Func, size_t... I>
nlohmann::json invoke_with_json(Func& func, const std::vector<Arg>& params,
                                const nlohmann::json& arguments, std::index_sequence<I...>) {
    using Traits = FunctionTraits<remove_cvref_t<Func>>;
    using Ret = typename Traits::ReturnType;

    if constexpr (std::is_void_v<Ret>) {
        func(extract_argument<typename Traits::template ArgType<I>>(params[I], arguments)...);
        return nullptr;
    } else {
        return nlohmann::json(
            func(extract_argument<typename Traits::template ArgType<I>>(params[I], arguments)...));
    }
}

template <typename T>
TypeAnnotation annotation_for(const Arg& param) {
    if (param.forward_ref()) return ForwardRef{*param.forward_ref()};
    return annotation_of<T>();
}

template <typename Traits, size_t... I>
std::vector<ParameterInfo> parameter_infos(const std::vector<Arg>& params,
                                           std::index_sequence<I...>) {
    return {ParameterInfo{params[I].name(),
                          annotation_for<typename Traits::template ArgType<I>>(params[I]),
                          params[I].has_default()}...};
}

} // namespace detail

/// Parameter metadata plus a name-keyed invoker for a typed callable.
struct BoundTool {
    std::vector<ParameterInfo> parameters;
    ToolInvoker invoke;
};

/// Binds `func` to its declared parameter names. Throws McpToolError when the
/// name list does not match the callable's arity or repeats a name.
template <typename Func>
BoundTool bind_tool(const std::string& tool_name, Func func, std::vector<Arg> params) {
    using Traits = FunctionTraits<remove_cvref_t<Func>>;
    constexpr size_t arity = Traits::arity;

    if (params.size() != arity) {
        throw McpToolError("Parameter name count mismatch for tool '" + tool_name
                           + "': expected " + std::to_string(arity) + ", got "
                           + std::to_string(params.size()));
    }

    std::unordered_set<std::string> seen;
    for (const auto& p : params) {
        if (!seen.insert(p.name()).second) {
            throw McpToolError("Duplicate parameter '" + p.name() + "' for tool '"
                               + tool_name + "'");
        }
    }

    BoundTool bound;
    bound.parameters = detail::parameter_infos<Traits>(params, std::make_index_sequence<arity>{});

    bound.invoke = [tool_name, func = std::move(func), params = std::move(params)](
                       const nlohmann::json& arguments) mutable -> nlohmann::json {
        detail::reject_unknown_arguments(tool_name, params, arguments);
        return detail::invoke_with_json(func, params, arguments,
                                        std::make_index_sequence<Traits::arity>{});
    };
    return bound;
}

} // namespace mcplite
