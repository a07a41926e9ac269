/// @file event.hpp
/// @brief Change events delivered to observers after a transaction commits.

#pragma once

#include <ydoc-cpp/types.hpp>
#include <ydoc-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ydoc_cpp {

/// A path element: either a map key or a list index.
using PathElement = std::variant<std::string, std::size_t>;

/// A path from an observed object to an event target (e.g. 0 / "outputs").
using Path = std::vector<PathElement>;

// -- Sequence deltas ----------------------------------------------------------

/// Skip over `count` elements that were left unchanged.
struct Retain {
    std::size_t count{0};
    auto operator==(const Retain&) const -> bool = default;
};

/// Remove `count` elements at the current position.
struct Delete {
    std::size_t count{0};
    auto operator==(const Delete&) const -> bool = default;
};

/// Insert a run of text at the current position.
struct InsertText {
    std::string text;
    auto operator==(const InsertText&) const -> bool = default;
};

/// Insert a run of values at the current position.
///
/// Nested objects appear as their ObjType; the live object can be read
/// back through the array target.
struct InsertValues {
    std::vector<Value> values;
    auto operator==(const InsertValues&) const -> bool = default;
};

/// A delta over a Text object, expressed in Unicode scalars.
using TextDelta = std::vector<std::variant<Retain, Delete, InsertText>>;

/// A delta over a List object.
using ArrayDelta = std::vector<std::variant<Retain, Delete, InsertValues>>;

// -- Map changes --------------------------------------------------------------

/// How a single map key changed.
enum class KeyAction : std::uint8_t {
    add,     ///< The key did not exist before.
    update,  ///< The key was overwritten.
    remove,  ///< The key was deleted.
};

/// Convert a KeyAction to its string representation.
constexpr auto to_string_view(KeyAction action) noexcept -> std::string_view {
    switch (action) {
        case KeyAction::add:    return "add";
        case KeyAction::update: return "update";
        case KeyAction::remove: return "delete";
    }
    return "unknown";
}

/// The change recorded for one key of a map.
struct KeyChange {
    KeyAction action{KeyAction::add};
    std::optional<Value> old_value;  ///< Absent for KeyAction::add.
    std::optional<Value> new_value;  ///< Absent for KeyAction::remove.
    auto operator==(const KeyChange&) const -> bool = default;
};

// -- Events -------------------------------------------------------------------

/// A Text object changed.
struct TextEvent {
    ObjId target;     ///< The Text that changed.
    Path path;        ///< Path from the observed object to the target.
    TextDelta delta;  ///< Retains, deletes and inserts, trailing retains dropped.
    auto operator==(const TextEvent&) const -> bool = default;
};

/// A List object changed.
struct ArrayEvent {
    ObjId target;
    Path path;
    ArrayDelta delta;
    auto operator==(const ArrayEvent&) const -> bool = default;
};

/// A Map object changed.
struct MapEvent {
    ObjId target;
    Path path;
    std::map<std::string, KeyChange> keys;  ///< One entry per changed key.
    auto operator==(const MapEvent&) const -> bool = default;
};

/// One event of a committed change-set.
using Event = std::variant<TextEvent, ArrayEvent, MapEvent>;

/// The object an event refers to.
inline auto event_target(const Event& event) -> const ObjId& {
    return std::visit([](const auto& e) -> const ObjId& { return e.target; }, event);
}

/// The path from the observed object to the event target.
inline auto event_path(const Event& event) -> const Path& {
    return std::visit([](const auto& e) -> const Path& { return e.path; }, event);
}

// -- Subscriptions ------------------------------------------------------------

/// Callback for Document::observe(): the single event targeting the object.
using EventCallback = std::function<void(const Event&)>;

/// Callback for Document::observe_deep(): events for the object and its
/// descendants, shallower paths first.
using DeepEventCallback = std::function<void(const std::vector<Event>&)>;

/// Token returned by observe()/observe_deep(), passed back to unobserve().
struct Subscription {
    std::uint64_t id{0};  ///< Zero means "not subscribed".

    explicit operator bool() const { return id != 0; }
    auto operator<=>(const Subscription&) const = default;
    auto operator==(const Subscription&) const -> bool = default;
};

}  // namespace ydoc_cpp
