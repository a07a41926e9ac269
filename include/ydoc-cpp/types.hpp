/// @file types.hpp
/// @brief Core identity types: ActorId, OpId, ObjId, Prop.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace ydoc_cpp {

/// A 16-byte identifier for the replica that produced an operation.
///
/// The shared tree only edits locally, so every operation it mints carries
/// the zero actor. Lexicographic ordering on raw bytes.
struct ActorId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr ActorId() = default;

    /// Construct from a byte array.
    explicit constexpr ActorId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit ActorId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const ActorId&) const = default;
    auto operator==(const ActorId&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

/// Identifies a single operation: (counter, actor).
///
/// The counter increases monotonically per document, so an OpId also tells
/// whether an element or object was created before or during a transaction.
struct OpId {
    std::uint64_t counter{0};  ///< Monotonically increasing counter.
    ActorId actor{};           ///< The actor that created this operation.

    constexpr OpId() = default;

    /// Construct with a counter and actor.
    constexpr OpId(std::uint64_t c, ActorId a) : counter{c}, actor{a} {}

    auto operator<=>(const OpId&) const = default;
    auto operator==(const OpId&) const -> bool = default;
};

/// Sentinel type representing the document root object.
struct Root {
    auto operator<=>(const Root&) const = default;
    auto operator==(const Root&) const -> bool = default;
};

/// Identifies a shared object (map, list or text) in the document tree.
///
/// Either the root sentinel or the OpId that created the object. An ObjId
/// stays valid for as long as the object it names is reachable; handing it
/// to observers and UI code is how live references are shared.
struct ObjId {
    std::variant<Root, OpId> inner;  ///< Root or the creating OpId.

    /// Default-constructs to the root object.
    constexpr ObjId() : inner{Root{}} {}

    /// Construct from the OpId that created this object.
    explicit constexpr ObjId(OpId id) : inner{id} {}

    /// Check if this is the root object.
    auto is_root() const -> bool {
        return std::holds_alternative<Root>(inner);
    }

    auto operator<=>(const ObjId&) const = default;
    auto operator==(const ObjId&) const -> bool = default;
};

/// The root object. Always a map, always present.
inline constexpr auto root = ObjId{};

/// A key into a map (string) or an index into a list/text (size_t).
using Prop = std::variant<std::string, std::size_t>;

}  // namespace ydoc_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<ydoc_cpp::ActorId> {
    auto operator()(const ydoc_cpp::ActorId& id) const noexcept -> std::size_t {
        // FNV-1a over the 16 bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<ydoc_cpp::OpId> {
    auto operator()(const ydoc_cpp::OpId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(id.counter);
        auto h2 = std::hash<ydoc_cpp::ActorId>{}(id.actor);
        return h1 ^ (h2 << 1);
    }
};

template <>
struct std::hash<ydoc_cpp::ObjId> {
    auto operator()(const ydoc_cpp::ObjId& id) const noexcept -> std::size_t {
        return std::visit([](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, ydoc_cpp::Root>) {
                return 0;
            } else {
                return std::hash<ydoc_cpp::OpId>{}(v);
            }
        }, id.inner);
    }
};

/// @endcond
