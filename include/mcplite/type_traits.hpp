#pragma once
#include "schema.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace mcplite {

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

// ---------- C++ type -> TypeAnnotation ----------

/// Maps a parameter's static type to the annotation the inference engine
/// sees. Specialise for user types:
///
///     template <> struct mcplite::AnnotationOf<Uuid> {
///         static TypeAnnotation get() { return ConcreteType{"uuid"}; }
///     };
///
/// Unspecialised types become a ConcreteType spelled with their RTTI name,
/// which no table maps, so they are advertised as strings.
template <typename T, typename = void>
struct AnnotationOf {
    static TypeAnnotation get() { return ConcreteType{typeid(T).name()}; }
};

template <typename T>
TypeAnnotation annotation_of() {
    return AnnotationOf<remove_cvref_t<T>>::get();
}

// nlohmann::json is dynamically typed: it carries no annotation at all.
template <>
struct AnnotationOf<nlohmann::json> {
    static TypeAnnotation get() { return std::monostate{}; }
};

template <>
struct AnnotationOf<bool> {
    static TypeAnnotation get() { return ConcreteType{"bool"}; }
};

template <typename T>
struct AnnotationOf<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>
                                        && !std::is_same_v<T, char>>> {
    static TypeAnnotation get() { return ConcreteType{"int"}; }
};

template <typename T>
struct AnnotationOf<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static TypeAnnotation get() { return ConcreteType{"float"}; }
};

template <>
struct AnnotationOf<std::string> {
    static TypeAnnotation get() { return ConcreteType{"str"}; }
};

template <>
struct AnnotationOf<char> {
    static TypeAnnotation get() { return ConcreteType{"str"}; }
};

namespace detail {

template <typename... Args>
std::vector<TypeAnnotation> annotations_of() {
    return {annotation_of<Args>()...};
}

template <typename T>
struct SequenceAnnotation {
    static TypeAnnotation get() {
        return GenericType{"list", annotations_of<typename T::value_type>()};
    }
};

template <typename T>
struct MappingAnnotation {
    static TypeAnnotation get() {
        return GenericType{"dict", annotations_of<typename T::key_type,
                                                  typename T::mapped_type>()};
    }
};

} // namespace detail

template <typename T, typename A>
struct AnnotationOf<std::vector<T, A>> : detail::SequenceAnnotation<std::vector<T, A>> {};

template <typename T, typename A>
struct AnnotationOf<std::list<T, A>> : detail::SequenceAnnotation<std::list<T, A>> {};

template <typename T, typename A>
struct AnnotationOf<std::deque<T, A>> : detail::SequenceAnnotation<std::deque<T, A>> {};

template <typename T, typename C, typename A>
struct AnnotationOf<std::set<T, C, A>> : detail::SequenceAnnotation<std::set<T, C, A>> {};

template <typename T, typename H, typename E, typename A>
struct AnnotationOf<std::unordered_set<T, H, E, A>>
    : detail::SequenceAnnotation<std::unordered_set<T, H, E, A>> {};

template <typename T, size_t N>
struct AnnotationOf<std::array<T, N>> : detail::SequenceAnnotation<std::array<T, N>> {};

template <typename K, typename V, typename C, typename A>
struct AnnotationOf<std::map<K, V, C, A>> : detail::MappingAnnotation<std::map<K, V, C, A>> {};

template <typename K, typename V, typename H, typename E, typename A>
struct AnnotationOf<std::unordered_map<K, V, H, E, A>>
    : detail::MappingAnnotation<std::unordered_map<K, V, H, E, A>> {};

// Optional and variant have no table entry, so they advertise as strings.
template <typename T>
struct AnnotationOf<std::optional<T>> {
    static TypeAnnotation get() {
        return GenericType{"optional", detail::annotations_of<T>()};
    }
};

template <typename... Ts>
struct AnnotationOf<std::variant<Ts...>> {
    static TypeAnnotation get() {
        return GenericType{"union", detail::annotations_of<Ts...>()};
    }
};

// ---------- Function signature traits ----------

template <typename Func>
struct FunctionTraits;

template <typename Ret, typename... Args>
struct FunctionTraits<Ret(Args...)> {
    using ReturnType = Ret;
    using ArgsTuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template <size_t N>
    using ArgType = std::tuple_element_t<N, ArgsTuple>;
};

template <typename Ret, typename... Args>
struct FunctionTraits<Ret (*)(Args...)> : FunctionTraits<Ret(Args...)> {};

template <typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret (Class::*)(Args...) const> : FunctionTraits<Ret(Args...)> {};

template <typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret (Class::*)(Args...)> : FunctionTraits<Ret(Args...)> {};

// Lambdas and functors decay to their operator()
template <typename Func>
struct FunctionTraits : FunctionTraits<decltype(&remove_cvref_t<Func>::operator())> {};

} // namespace mcplite
