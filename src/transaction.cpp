#include <ydoc-cpp/transaction.hpp>

#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/error.hpp>

#include "doc_state.hpp"

#include <fmt/format.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <limits>

namespace ydoc_cpp {

namespace {

auto require_object(detail::DocState& state, const ObjId& obj, ObjType type)
    -> detail::ObjectState& {
    auto* obj_state = state.get_object(obj);
    if (!obj_state) {
        throw Error{ErrorKind::invalid_obj_id, "object does not exist"};
    }
    if (obj_state->type != type) {
        throw Error{ErrorKind::invalid_obj_id,
                    fmt::format("expected a {}, found a {}",
                                to_string_view(type), to_string_view(obj_state->type))};
    }
    return *obj_state;
}

auto require_sequence(detail::DocState& state, const ObjId& obj) -> detail::ObjectState& {
    auto* obj_state = state.get_object(obj);
    if (!obj_state) {
        throw Error{ErrorKind::invalid_obj_id, "object does not exist"};
    }
    if (obj_state->type == ObjType::map) {
        throw Error{ErrorKind::invalid_obj_id, "expected a list or text, found a map"};
    }
    return *obj_state;
}

// Records the entry at `key` as it was before this transaction first wrote it.
void remember_key(detail::TxLog& log, const detail::DocState& state,
                  const ObjId& obj, const std::string& key) {
    auto& before = log.map_before[obj];
    if (!before.contains(key)) {
        const auto* entry = state.map_entry(obj, key);
        before.emplace(key, entry ? std::optional<detail::MapEntry>{*entry} : std::nullopt);
    }
    log.touch(obj);
}

// Splits UTF-8 into one string per Unicode scalar.
auto split_scalars(std::string_view text) -> std::vector<std::string> {
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        throw Error{ErrorKind::invalid_operation, "text too large"};
    }
    auto result = std::vector<std::string>{};
    const auto length = static_cast<std::int32_t>(text.size());
    auto i = std::int32_t{0};
    while (i < length) {
        auto start = i;
        U8_FWD_1(text.data(), i, length);
        result.emplace_back(text.substr(static_cast<std::size_t>(start),
                                        static_cast<std::size_t>(i - start)));
    }
    return result;
}

}  // namespace

Transaction::Transaction(Key, Document& doc, detail::DocState& state)
    : doc_{doc}, state_{state}, log_{std::make_unique<detail::TxLog>()} {
    log_->start_counter = state.next_counter;
}

Transaction::~Transaction() {
    commit();
}

auto Transaction::lock() -> std::unique_lock<std::shared_mutex> {
    return std::unique_lock{doc_.mutex_};
}

void Transaction::commit() {
    if (committed_) return;
    committed_ = true;

    auto events = std::vector<detail::CommittedEvent>{};
    {
        auto open_guard = std::scoped_lock{doc_.open_mutex_};
        if (log_->op_count > 0) {
            auto guard = std::unique_lock{doc_.mutex_};
            events = state_.collect_events(*log_);
            state_.compact(*log_);
        }
        if (doc_.open_ == this) doc_.open_ = nullptr;
    }
    if (!events.empty()) doc_.notify(events);
}

void Transaction::detach_entry(const ObjId& obj, const std::string& key) {
    const auto* entry = state_.map_entry(obj, key);
    if (entry && is_object(entry->value)) log_->detached.emplace_back(entry->op_id);
}

auto Transaction::has_changes() const -> bool {
    return log_->op_count > 0;
}

auto Transaction::op_count() const -> std::size_t {
    return log_->op_count;
}

// -- Map writes ---------------------------------------------------------------

void Transaction::put(const ObjId& obj, std::string_view key, ScalarValue val) {
    auto& target = require_object(state_, obj, ObjType::map);
    auto k = std::string{key};
    remember_key(*log_, state_, obj, k);
    detach_entry(obj, k);
    state_.map_put(target, k, state_.next_op_id(), Value{std::move(val)});
    ++log_->op_count;
}

auto Transaction::put_object(const ObjId& obj, std::string_view key, ObjType type) -> ObjId {
    auto& target = require_object(state_, obj, ObjType::map);
    auto k = std::string{key};
    remember_key(*log_, state_, obj, k);
    detach_entry(obj, k);
    auto op_id = state_.next_op_id();
    auto new_obj = state_.create_object(op_id, type, detail::ParentLink{.parent = obj, .slot = k});
    state_.map_put(target, k, op_id, Value{type});
    ++log_->op_count;
    return new_obj;
}

void Transaction::delete_key(const ObjId& obj, std::string_view key) {
    auto& target = require_object(state_, obj, ObjType::map);
    auto k = std::string{key};
    auto it = target.map_entries.find(k);
    if (it == target.map_entries.end()) return;

    remember_key(*log_, state_, obj, k);
    detach_entry(obj, k);
    target.map_entries.erase(it);
    ++log_->op_count;
}

// -- List writes --------------------------------------------------------------

void Transaction::insert(const ObjId& obj, std::size_t index, ScalarValue val) {
    auto& target = require_object(state_, obj, ObjType::list);
    if (index > detail::DocState::list_length(target)) {
        throw Error{ErrorKind::invalid_operation, "list index out of range"};
    }
    log_->touch(obj);
    state_.list_insert(target, index, state_.next_op_id(), Value{std::move(val)});
    ++log_->op_count;
}

auto Transaction::insert_object(const ObjId& obj, std::size_t index, ObjType type) -> ObjId {
    auto& target = require_object(state_, obj, ObjType::list);
    if (index > detail::DocState::list_length(target)) {
        throw Error{ErrorKind::invalid_operation, "list index out of range"};
    }
    log_->touch(obj);
    auto op_id = state_.next_op_id();
    auto new_obj = state_.create_object(op_id, type,
                                        detail::ParentLink{.parent = obj, .slot = op_id});
    state_.list_insert(target, index, op_id, Value{type});
    ++log_->op_count;
    return new_obj;
}

void Transaction::delete_index(const ObjId& obj, std::size_t index) {
    auto& target = require_sequence(state_, obj);
    if (index >= detail::DocState::list_length(target)) {
        throw Error{ErrorKind::invalid_operation, "list index out of range"};
    }
    log_->touch(obj);
    log_->deleted.insert(state_.list_delete(target, index));
    ++log_->op_count;
}

// -- Text writes --------------------------------------------------------------

void Transaction::splice_text(const ObjId& obj, std::size_t pos, std::size_t del,
                              std::string_view text) {
    auto& target = require_object(state_, obj, ObjType::text);
    auto len = detail::DocState::list_length(target);
    if (pos > len || del > len - pos) {
        throw Error{ErrorKind::invalid_operation, "text range out of bounds"};
    }
    if (del == 0 && text.empty()) return;

    log_->touch(obj);
    state_.list_delete_run(target, pos, del, [&](const OpId& id) {
        log_->deleted.insert(id);
        ++log_->op_count;
    });
    auto run = std::vector<detail::ListElement>{};
    for (auto& scalar : split_scalars(text)) {
        run.push_back(detail::ListElement{.insert_id = state_.next_op_id(),
                                          .value = Value{ScalarValue{std::move(scalar)}},
                                          .visible = true});
    }
    log_->op_count += run.size();
    state_.list_insert_run(target, pos, std::move(run));
}

void Transaction::clear(const ObjId& obj) {
    auto* target = state_.get_object(obj);
    if (!target) {
        throw Error{ErrorKind::invalid_obj_id, "object does not exist"};
    }
    switch (target->type) {
        case ObjType::map:
            for (const auto& key : state_.map_keys(obj)) delete_key(obj, key);
            break;
        case ObjType::list: {
            auto n = detail::DocState::list_length(*target);
            if (n == 0) break;
            log_->touch(obj);
            state_.list_delete_run(*target, 0, n, [&](const OpId& id) {
                log_->deleted.insert(id);
                ++log_->op_count;
            });
            break;
        }
        case ObjType::text:
            splice_text(obj, 0, detail::DocState::list_length(*target), {});
            break;
    }
}

// -- Read methods (caller holds the exclusive lock) ---------------------------

auto Transaction::get(const ObjId& obj, std::string_view key) const -> std::optional<Value> {
    return state_.map_get(obj, std::string{key});
}

auto Transaction::get(const ObjId& obj, std::size_t index) const -> std::optional<Value> {
    return state_.list_get(obj, index);
}

auto Transaction::object_type(const ObjId& obj) const -> std::optional<ObjType> {
    return state_.object_type(obj);
}

auto Transaction::get_obj_id(const ObjId& obj, std::string_view key) const -> std::optional<ObjId> {
    const auto* entry = state_.map_entry(obj, std::string{key});
    if (!entry || !is_object(entry->value)) return std::nullopt;
    return ObjId{entry->op_id};
}

auto Transaction::get_obj_id(const ObjId& obj, std::size_t index) const -> std::optional<ObjId> {
    const auto* obj_state = state_.get_object(obj);
    if (!obj_state || obj_state->type == ObjType::map) return std::nullopt;
    auto real_idx = detail::DocState::visible_index_to_real(*obj_state, index);
    if (real_idx >= obj_state->list_elements.size()) return std::nullopt;
    const auto& elem = obj_state->list_elements[real_idx];
    if (!is_object(elem.value)) return std::nullopt;
    return ObjId{elem.insert_id};
}

auto Transaction::length(const ObjId& obj) const -> std::size_t {
    return state_.object_length(obj);
}

auto Transaction::keys(const ObjId& obj) const -> std::vector<std::string> {
    return state_.map_keys(obj);
}

auto Transaction::text(const ObjId& obj) const -> std::string {
    return state_.text_content(obj);
}

}  // namespace ydoc_cpp
