#pragma once

// Internal header: not installed. Implementation detail of Document.

#include <ydoc-cpp/event.hpp>
#include <ydoc-cpp/types.hpp>
#include <ydoc-cpp/value.hpp>

#include <algorithm>
#include <iterator>
#include <cstdint>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace ydoc_cpp::detail {

// The value at a map key.
struct MapEntry {
    OpId op_id;
    Value value;
};

// An element in a list or text sequence. Text holds one Unicode scalar
// (as UTF-8) per element. Deleted elements stay behind as tombstones until
// the transaction that deleted them commits.
struct ListElement {
    OpId insert_id;
    Value value;
    bool visible = true;
};

// Where an object hangs in the tree: a key of a parent map, or the
// element of a parent list that holds it.
struct ParentLink {
    ObjId parent;
    std::variant<std::string, OpId> slot;
};

// The state of a single shared object in the document tree.
struct ObjectState {
    ObjType type;
    std::map<std::string, MapEntry> map_entries;  // map
    std::vector<ListElement> list_elements;       // list/text
    std::optional<ParentLink> parent;             // nullopt for root
};

// What one transaction touched, in first-touch order.
struct TxLog {
    std::uint64_t start_counter = 0;
    std::vector<ObjId> touched;
    std::unordered_set<ObjId> touched_set;
    // map key -> entry as it was before the transaction first wrote it
    std::map<ObjId, std::map<std::string, std::optional<MapEntry>>> map_before;
    std::unordered_set<OpId> deleted;
    // objects unlinked from a map key by an overwrite or delete
    std::vector<ObjId> detached;
    std::size_t op_count = 0;

    void touch(const ObjId& obj) {
        if (touched_set.insert(obj).second) touched.push_back(obj);
    }

    auto created_here(const OpId& id) const -> bool {
        return id.counter >= start_counter;
    }

    auto created_here(const ObjId& obj) const -> bool {
        const auto* id = std::get_if<OpId>(&obj.inner);
        return id != nullptr && created_here(*id);
    }
};

// An object's position: the chain of objects from root to it, and the
// keys/indices leading there.
struct Location {
    std::vector<ObjId> ancestors;  // root first, the object itself last
    Path path;
};

// An event with its absolute position, before it is cut down to the
// path an individual observer sees.
struct CommittedEvent {
    Event event;
    std::vector<ObjId> ancestors;
};

// The complete internal state of a Document.
struct DocState {
    ActorId actor;
    std::uint64_t next_counter = 1;
    std::map<ObjId, ObjectState> objects;

    DocState() {
        objects[root] = ObjectState{.type = ObjType::map, .map_entries = {},
                                    .list_elements = {}, .parent = std::nullopt};
    }

    auto next_op_id() -> OpId {
        return OpId{next_counter++, actor};
    }

    auto get_object(const ObjId& id) -> ObjectState* {
        auto it = objects.find(id);
        return it != objects.end() ? &it->second : nullptr;
    }

    auto get_object(const ObjId& id) const -> const ObjectState* {
        auto it = objects.find(id);
        return it != objects.end() ? &it->second : nullptr;
    }

    // -- Map operations -------------------------------------------------------

    void map_put(ObjectState& state, const std::string& key, OpId op_id, Value value) {
        state.map_entries.insert_or_assign(key, MapEntry{.op_id = op_id, .value = std::move(value)});
    }

    auto map_entry(const ObjId& obj, const std::string& key) const -> const MapEntry* {
        const auto* state = get_object(obj);
        if (!state) return nullptr;
        auto it = state->map_entries.find(key);
        return it != state->map_entries.end() ? &it->second : nullptr;
    }

    auto map_get(const ObjId& obj, const std::string& key) const -> std::optional<Value> {
        const auto* entry = map_entry(obj, key);
        if (!entry) return std::nullopt;
        return entry->value;
    }

    auto map_keys(const ObjId& obj) const -> std::vector<std::string> {
        const auto* state = get_object(obj);
        if (!state) return {};

        auto result = std::vector<std::string>{};
        result.reserve(state->map_entries.size());
        std::ranges::transform(state->map_entries, std::back_inserter(result),
            [](const auto& pair) { return pair.first; });
        return result;
    }

    auto map_values(const ObjId& obj) const -> std::vector<Value> {
        const auto* state = get_object(obj);
        if (!state) return {};

        auto result = std::vector<Value>{};
        result.reserve(state->map_entries.size());
        std::ranges::transform(state->map_entries, std::back_inserter(result),
            [](const auto& pair) { return pair.second.value; });
        return result;
    }

    // -- List operations ------------------------------------------------------

    // Real index of the visible element at `index`. Tombstones before it are
    // skipped, so an insert lands after them.
    static auto visible_index_to_real(const ObjectState& state, std::size_t index) -> std::size_t {
        auto visible_count = std::size_t{0};
        for (std::size_t i = 0; i < state.list_elements.size(); ++i) {
            if (state.list_elements[i].visible) {
                if (visible_count == index) return i;
                ++visible_count;
            }
        }
        // index == visible_count means "past the end" (for insert at end)
        return state.list_elements.size();
    }

    void list_insert(ObjectState& state, std::size_t index, OpId op_id, Value value) {
        auto real_idx = visible_index_to_real(state, index);
        state.list_elements.insert(
            state.list_elements.begin() + static_cast<std::ptrdiff_t>(real_idx),
            ListElement{.insert_id = op_id, .value = std::move(value), .visible = true});
    }

    // Tombstones the visible element at `index`; returns its id.
    auto list_delete(ObjectState& state, std::size_t index) -> OpId {
        auto real_idx = visible_index_to_real(state, index);
        auto& elem = state.list_elements[real_idx];
        elem.visible = false;
        return elem.insert_id;
    }

    // Inserts a run of elements before the visible element at `index`.
    void list_insert_run(ObjectState& state, std::size_t index, std::vector<ListElement> run) {
        auto real_idx = visible_index_to_real(state, index);
        state.list_elements.insert(
            state.list_elements.begin() + static_cast<std::ptrdiff_t>(real_idx),
            std::make_move_iterator(run.begin()), std::make_move_iterator(run.end()));
    }

    // Tombstones `count` visible elements starting at `index`.
    template <typename Sink>
    void list_delete_run(ObjectState& state, std::size_t index, std::size_t count, Sink&& sink) {
        auto real_idx = visible_index_to_real(state, index);
        for (auto i = real_idx; count > 0 && i < state.list_elements.size(); ++i) {
            auto& elem = state.list_elements[i];
            if (!elem.visible) continue;
            elem.visible = false;
            sink(elem.insert_id);
            --count;
        }
    }

    auto list_get(const ObjId& obj, std::size_t index) const -> std::optional<Value> {
        const auto* state = get_object(obj);
        if (!state) return std::nullopt;

        auto real_idx = visible_index_to_real(*state, index);
        if (real_idx >= state->list_elements.size()) return std::nullopt;
        return state->list_elements[real_idx].value;
    }

    static auto list_length(const ObjectState& state) -> std::size_t {
        return static_cast<std::size_t>(std::ranges::count_if(
            state.list_elements, &ListElement::visible));
    }

    auto list_values(const ObjId& obj) const -> std::vector<Value> {
        const auto* state = get_object(obj);
        if (!state) return {};

        auto result = std::vector<Value>{};
        for (const auto& elem : state->list_elements) {
            if (elem.visible) result.push_back(elem.value);
        }
        return result;
    }

    // -- Text operations ------------------------------------------------------

    auto text_content(const ObjId& obj) const -> std::string {
        const auto* state = get_object(obj);
        if (!state) return {};

        auto result = std::string{};
        for (const auto& elem : state->list_elements) {
            if (!elem.visible) continue;
            if (auto* sv = std::get_if<ScalarValue>(&elem.value)) {
                if (auto* s = std::get_if<std::string>(sv)) {
                    result += *s;
                }
            }
        }
        return result;
    }

    // -- Generic queries ------------------------------------------------------

    auto object_type(const ObjId& obj) const -> std::optional<ObjType> {
        const auto* state = get_object(obj);
        if (!state) return std::nullopt;
        return state->type;
    }

    auto object_length(const ObjId& obj) const -> std::size_t {
        const auto* state = get_object(obj);
        if (!state) return 0;

        switch (state->type) {
            case ObjType::map:
                return state->map_entries.size();
            case ObjType::list:
            case ObjType::text:
                return list_length(*state);
        }
        return 0;
    }

    auto create_object(OpId id, ObjType type, ParentLink link) -> ObjId {
        auto obj_id = ObjId{id};
        objects[obj_id] = ObjectState{.type = type, .map_entries = {},
                                      .list_elements = {}, .parent = std::move(link)};
        return obj_id;
    }

    // -- Tree position --------------------------------------------------------

    // Walks parent links up to the root. nullopt when the object, or any of
    // its ancestors, has been deleted or overwritten.
    auto locate(const ObjId& obj) const -> std::optional<Location> {
        auto location = Location{.ancestors = {obj}, .path = {}};
        auto current = obj;
        while (!current.is_root()) {
            const auto* state = get_object(current);
            if (!state || !state->parent) return std::nullopt;
            const auto& link = *state->parent;
            const auto* parent = get_object(link.parent);
            if (!parent) return std::nullopt;
            const auto& self_id = std::get<OpId>(current.inner);

            if (const auto* key = std::get_if<std::string>(&link.slot)) {
                auto it = parent->map_entries.find(*key);
                if (it == parent->map_entries.end() || it->second.op_id != self_id) {
                    return std::nullopt;
                }
                location.path.emplace_back(*key);
            } else {
                const auto& elem_id = std::get<OpId>(link.slot);
                auto index = std::size_t{0};
                auto found = false;
                for (const auto& elem : parent->list_elements) {
                    if (elem.insert_id == elem_id) {
                        if (!elem.visible) return std::nullopt;
                        found = true;
                        break;
                    }
                    if (elem.visible) ++index;
                }
                if (!found) return std::nullopt;
                location.path.emplace_back(index);
            }
            current = link.parent;
            location.ancestors.push_back(current);
        }
        std::ranges::reverse(location.ancestors);
        std::ranges::reverse(location.path);
        return location;
    }

    // -- Change-set computation -----------------------------------------------

    auto map_event(const ObjId& obj, const TxLog& log) const -> std::optional<Event> {
        auto before_it = log.map_before.find(obj);
        if (before_it == log.map_before.end()) return std::nullopt;

        auto event = MapEvent{.target = obj, .path = {}, .keys = {}};
        for (const auto& [key, before] : before_it->second) {
            const auto* after = map_entry(obj, key);
            if (!before && !after) continue;
            if (!before) {
                event.keys[key] = KeyChange{.action = KeyAction::add,
                                            .old_value = std::nullopt,
                                            .new_value = after->value};
            } else if (!after) {
                event.keys[key] = KeyChange{.action = KeyAction::remove,
                                            .old_value = before->value,
                                            .new_value = std::nullopt};
            } else if (before->op_id != after->op_id) {
                event.keys[key] = KeyChange{.action = KeyAction::update,
                                            .old_value = before->value,
                                            .new_value = after->value};
            }
        }
        if (event.keys.empty()) return std::nullopt;
        return event;
    }

    // Classifies each element against the transaction: inserted here and
    // still visible, deleted here, or untouched and visible. Runs of the same
    // kind are merged; a trailing retain is dropped.
    template <typename Delta, typename Insert, typename Append>
    auto sequence_delta(const ObjectState& state, const TxLog& log, Append append) const -> Delta {
        auto delta = Delta{};
        for (const auto& elem : state.list_elements) {
            if (log.created_here(elem.insert_id)) {
                if (!elem.visible) continue;
                if (delta.empty() || !std::holds_alternative<Insert>(delta.back())) {
                    delta.emplace_back(Insert{});
                }
                append(std::get<Insert>(delta.back()), elem.value);
            } else if (log.deleted.contains(elem.insert_id)) {
                if (delta.empty() || !std::holds_alternative<Delete>(delta.back())) {
                    delta.emplace_back(Delete{});
                }
                ++std::get<Delete>(delta.back()).count;
            } else if (elem.visible) {
                if (delta.empty() || !std::holds_alternative<Retain>(delta.back())) {
                    delta.emplace_back(Retain{});
                }
                ++std::get<Retain>(delta.back()).count;
            }
        }
        if (!delta.empty() && std::holds_alternative<Retain>(delta.back())) {
            delta.pop_back();
        }
        return delta;
    }

    auto text_event(const ObjId& obj, const ObjectState& state, const TxLog& log) const
        -> std::optional<Event> {
        auto delta = sequence_delta<TextDelta, InsertText>(state, log,
            [](InsertText& ins, const Value& value) {
                if (auto s = get_scalar<std::string>(value)) ins.text += *s;
            });
        if (delta.empty()) return std::nullopt;
        return TextEvent{.target = obj, .path = {}, .delta = std::move(delta)};
    }

    auto array_event(const ObjId& obj, const ObjectState& state, const TxLog& log) const
        -> std::optional<Event> {
        auto delta = sequence_delta<ArrayDelta, InsertValues>(state, log,
            [](InsertValues& ins, const Value& value) { ins.values.push_back(value); });
        if (delta.empty()) return std::nullopt;
        return ArrayEvent{.target = obj, .path = {}, .delta = std::move(delta)};
    }

    // One event per touched object that existed before the transaction and is
    // still reachable, ordered by depth (shallower first, then first touch).
    auto collect_events(const TxLog& log) const -> std::vector<CommittedEvent> {
        auto result = std::vector<CommittedEvent>{};
        for (const auto& obj : log.touched) {
            if (log.created_here(obj)) continue;
            const auto* state = get_object(obj);
            if (!state) continue;
            auto location = locate(obj);
            if (!location) continue;

            auto event = std::optional<Event>{};
            switch (state->type) {
                case ObjType::map:  event = map_event(obj, log); break;
                case ObjType::list: event = array_event(obj, *state, log); break;
                case ObjType::text: event = text_event(obj, *state, log); break;
            }
            if (!event) continue;

            std::visit([&](auto& e) { e.path = std::move(location->path); }, *event);
            result.push_back(CommittedEvent{.event = std::move(*event),
                                            .ancestors = std::move(location->ancestors)});
        }
        std::ranges::stable_sort(result, {},
            [](const CommittedEvent& e) { return e.ancestors.size(); });
        return result;
    }

    // -- Compaction -----------------------------------------------------------

    // Drops what a committed transaction left unreachable: the tombstones of
    // the sequences it touched, and every object it unlinked together with
    // its descendants. Runs after collect_events().
    void compact(const TxLog& log) {
        auto dropped = log.detached;
        for (const auto& obj : log.touched) {
            auto* state = get_object(obj);
            if (!state || state->type == ObjType::map) continue;
            for (const auto& elem : state->list_elements) {
                if (!elem.visible && is_object(elem.value)) dropped.emplace_back(elem.insert_id);
            }
            std::erase_if(state->list_elements, [](const ListElement& e) { return !e.visible; });
        }

        while (!dropped.empty()) {
            auto obj = std::move(dropped.back());
            dropped.pop_back();
            auto it = objects.find(obj);
            if (it == objects.end() || obj.is_root()) continue;
            for (const auto& [key, entry] : it->second.map_entries) {
                if (is_object(entry.value)) dropped.emplace_back(entry.op_id);
            }
            for (const auto& elem : it->second.list_elements) {
                if (is_object(elem.value)) dropped.emplace_back(elem.insert_id);
            }
            objects.erase(it);
        }
    }
};

}  // namespace ydoc_cpp::detail
