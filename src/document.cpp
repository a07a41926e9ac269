#include <ydoc-cpp/document.hpp>

#include <ydoc-cpp/error.hpp>

#include "doc_state.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>

namespace ydoc_cpp {

Document::Document()
    : state_{std::make_unique<detail::DocState>()} {}

Document::~Document() = default;

// -- Mutation -----------------------------------------------------------------

auto Document::begin_transaction() -> std::unique_ptr<Transaction> {
    return open_transaction(true);
}

auto Document::open_transaction(bool joinable) -> std::unique_ptr<Transaction> {
    auto guard = std::scoped_lock{open_mutex_};
    if (open_) {
        throw Error{ErrorKind::invalid_operation,
                    "a transaction is already open on this document"};
    }
    auto state_guard = std::shared_lock{mutex_};
    auto tx = std::make_unique<Transaction>(Transaction::Key{}, *this, *state_);
    tx->joinable_ = joinable;
    open_ = tx.get();
    return tx;
}

auto Document::joinable_transaction() -> Transaction* {
    if (!open_ || !open_->joinable_) return nullptr;
    if (open_->joined_) {
        throw Error{ErrorKind::invalid_operation,
                    "transact() called inside a transact() callback"};
    }
    return open_;
}

void Document::transact(const std::function<void(Transaction&)>& fn) {
    auto joined = std::unique_lock{open_mutex_};
    if (auto* open = joinable_transaction()) {
        auto scope = JoinScope{*open};
        fn(*open);
        return;
    }
    joined.unlock();

    auto tx = open_transaction(false);
    {
        auto lock = tx->lock();
        fn(*tx);
    }
    tx->commit();
}

// -- Observation --------------------------------------------------------------

auto Document::observe(const ObjId& obj, EventCallback callback) -> Subscription {
    auto lock = std::lock_guard{observers_mutex_};
    auto id = next_subscription_++;
    observers_.emplace(id, Observer{.obj = obj, .shallow = std::move(callback), .deep = {}});
    return Subscription{id};
}

auto Document::observe_deep(const ObjId& obj, DeepEventCallback callback) -> Subscription {
    auto lock = std::lock_guard{observers_mutex_};
    auto id = next_subscription_++;
    observers_.emplace(id, Observer{.obj = obj, .shallow = {}, .deep = std::move(callback)});
    return Subscription{id};
}

void Document::unobserve(Subscription subscription) {
    auto lock = std::lock_guard{observers_mutex_};
    observers_.erase(subscription.id);
}

void Document::notify(const std::vector<detail::CommittedEvent>& events) {
    auto observers = std::vector<Observer>{};
    {
        auto lock = std::lock_guard{observers_mutex_};
        observers.reserve(observers_.size());
        std::ranges::copy(observers_ | std::views::values, std::back_inserter(observers));
    }

    for (const auto& observer : observers) {
        if (observer.shallow) {
            auto it = std::ranges::find_if(events, [&](const detail::CommittedEvent& e) {
                return event_target(e.event) == observer.obj;
            });
            if (it == events.end()) continue;
            auto event = it->event;
            std::visit([](auto& e) { e.path.clear(); }, event);
            observer.shallow(event);
            continue;
        }

        auto selected = std::vector<Event>{};
        for (const auto& committed : events) {
            auto pos = std::ranges::find(committed.ancestors, observer.obj);
            if (pos == committed.ancestors.end()) continue;
            // ancestors[i] -> ancestors[i + 1] is reached through path[i]
            auto depth = static_cast<std::size_t>(pos - committed.ancestors.begin());
            auto event = committed.event;
            std::visit([&](auto& e) {
                e.path.erase(e.path.begin(),
                             e.path.begin() + static_cast<std::ptrdiff_t>(depth));
            }, event);
            selected.push_back(std::move(event));
        }
        if (!selected.empty()) observer.deep(selected);
    }
}

// -- Reading ------------------------------------------------------------------

auto Document::get(const ObjId& obj, std::string_view key) const -> std::optional<Value> {
    auto lock = std::shared_lock{mutex_};
    return state_->map_get(obj, std::string{key});
}

auto Document::get(const ObjId& obj, std::size_t index) const -> std::optional<Value> {
    auto lock = std::shared_lock{mutex_};
    return state_->list_get(obj, index);
}

auto Document::get_obj_id(const ObjId& obj, std::string_view key) const -> std::optional<ObjId> {
    auto lock = std::shared_lock{mutex_};
    const auto* entry = state_->map_entry(obj, std::string{key});
    if (!entry || !is_object(entry->value)) return std::nullopt;
    return ObjId{entry->op_id};
}

auto Document::get_obj_id(const ObjId& obj, std::size_t index) const -> std::optional<ObjId> {
    auto lock = std::shared_lock{mutex_};
    const auto* obj_state = state_->get_object(obj);
    if (!obj_state || obj_state->type == ObjType::map) return std::nullopt;
    auto real_idx = detail::DocState::visible_index_to_real(*obj_state, index);
    if (real_idx >= obj_state->list_elements.size()) return std::nullopt;
    const auto& elem = obj_state->list_elements[real_idx];
    if (!is_object(elem.value)) return std::nullopt;
    return ObjId{elem.insert_id};
}

auto Document::keys(const ObjId& obj) const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    return state_->map_keys(obj);
}

auto Document::values(const ObjId& obj) const -> std::vector<Value> {
    auto lock = std::shared_lock{mutex_};
    auto type = state_->object_type(obj);
    if (!type) return {};
    return *type == ObjType::map ? state_->map_values(obj) : state_->list_values(obj);
}

auto Document::length(const ObjId& obj) const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return state_->object_length(obj);
}

auto Document::text(const ObjId& obj) const -> std::string {
    auto lock = std::shared_lock{mutex_};
    return state_->text_content(obj);
}

auto Document::object_type(const ObjId& obj) const -> std::optional<ObjType> {
    auto lock = std::shared_lock{mutex_};
    return state_->object_type(obj);
}

auto Document::object_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return state_->objects.size();
}

}  // namespace ydoc_cpp
