/// @file value.hpp
/// @brief Value types: ScalarValue, Value, ObjType, and tag types.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ydoc_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A byte array value.
using Bytes = std::vector<std::byte>;

/// The three kinds of shared container objects.
enum class ObjType : std::uint8_t {
    map,   ///< A string-keyed map.
    list,  ///< An ordered sequence of values.
    text,  ///< A sequence of Unicode scalars.
};

/// Convert an ObjType to its string representation.
constexpr auto to_string_view(ObjType type) noexcept -> std::string_view {
    switch (type) {
        case ObjType::map:  return "map";
        case ObjType::list: return "list";
        case ObjType::text: return "text";
    }
    return "unknown";
}

/// A closed set of primitive values stored in the document.
///
/// Alternatives: Null, bool, int64_t, uint64_t, double, string, Bytes.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    std::uint64_t,
    double,
    std::string,
    Bytes
>;

/// A value in the document tree: either a nested object type or a scalar.
using Value = std::variant<ObjType, ScalarValue>;

/// Check if a Value holds a scalar (not an object type).
constexpr auto is_scalar(const Value& v) -> bool {
    return std::holds_alternative<ScalarValue>(v);
}

/// Check if a Value holds an object type (map, list, text).
constexpr auto is_object(const Value& v) -> bool {
    return std::holds_alternative<ObjType>(v);
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { fmt::print("{}\n", s); },
///     [](std::int64_t i) { fmt::print("{}\n", i); },
///     [](const auto&) {},
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar from a Value, or nullopt on type mismatch.
/// @code
/// auto id = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const Value& v) -> std::optional<T> {
    if (const auto* sv = std::get_if<ScalarValue>(&v)) {
        if (const auto* t = std::get_if<T>(sv)) {
            return *t;
        }
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<Value>.
template <typename T>
auto get_scalar(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

}  // namespace ydoc_cpp
