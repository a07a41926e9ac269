/// @file document.hpp
/// @brief The Document class -- the shared tree all document kinds are built on.

#pragma once

#include <ydoc-cpp/event.hpp>
#include <ydoc-cpp/transaction.hpp>
#include <ydoc-cpp/types.hpp>
#include <ydoc-cpp/value.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace ydoc_cpp {

namespace detail {
struct DocState;
struct CommittedEvent;
}  // namespace detail

/// A shared tree of maps, lists and texts with change observation.
///
/// Document owns the tree and provides a transactional mutation API.
/// Every committed transaction yields one change-set: a list of events, one
/// per object that changed. Observers registered with observe() or
/// observe_deep() receive the part of the change-set they subscribed to,
/// after the transaction has committed and the lock has been released.
///
/// @code
/// auto doc = Document{};
/// auto sub = doc.observe(root, [](const Event& e) { ... });
/// doc.transact([](auto& tx) {
///     tx.put(root, "greeting", "hello");
/// });
/// doc.unobserve(sub);
/// @endcode
///
/// Reads take a shared lock; transactions take the exclusive lock. Only one
/// transaction may be open at a time.
class Document {
public:
    /// Construct a new empty document (a root map).
    Document();
    ~Document();

    Document(const Document&) = delete;
    auto operator=(const Document&) -> Document& = delete;
    Document(Document&&) = delete;
    auto operator=(Document&&) -> Document& = delete;

    // -- Mutation -------------------------------------------------------------

    /// Open a transaction that stays open until committed or destroyed.
    ///
    /// The transaction does not hold the lock between calls; take it with
    /// Transaction::lock() around each batch of writes. While it is open,
    /// transact() calls join it instead of opening their own.
    /// @throws Error{ErrorKind::invalid_operation} if a transaction is
    ///   already open on this document.
    auto begin_transaction() -> std::unique_ptr<Transaction>;

    /// Execute a function within a transaction and commit it.
    ///
    /// If the function throws, the writes it applied are still committed and
    /// observed, then the exception propagates. When a transaction from
    /// begin_transaction() is open, `fn` runs on that one under its lock and
    /// its writes are observed when that transaction commits.
    /// @throws Error{ErrorKind::invalid_operation} when called from inside
    ///   another transact() callback.
    /// @param fn A function that receives a Transaction reference.
    void transact(const std::function<void(Transaction&)>& fn);

    /// Execute a function within a transaction and return its result.
    ///
    /// @code
    /// auto cells = doc.transact([](Transaction& tx) {
    ///     return tx.put_object(root, "cells", ObjType::list);
    /// });
    /// @endcode
    template <typename Fn>
        requires std::invocable<Fn, Transaction&> &&
                 (!std::is_void_v<std::invoke_result_t<Fn, Transaction&>>)
    auto transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&>;

    /// Execute a void function within a transaction (template overload).
    template <typename Fn>
        requires std::invocable<Fn, Transaction&> &&
                 std::is_void_v<std::invoke_result_t<Fn, Transaction&>> &&
                 (!std::convertible_to<Fn, std::function<void(Transaction&)>>)
    void transact(Fn&& fn);

    // -- Observation ----------------------------------------------------------

    /// Receive the event whose target is `obj`, once per commit that changes it.
    auto observe(const ObjId& obj, EventCallback callback) -> Subscription;

    /// Receive the events for `obj` and all its descendants, once per commit
    /// that changes any of them. Paths are relative to `obj`.
    auto observe_deep(const ObjId& obj, DeepEventCallback callback) -> Subscription;

    /// Remove a subscription. Unknown or already removed subscriptions are
    /// ignored.
    void unobserve(Subscription subscription);

    // -- Reading: map operations ----------------------------------------------

    /// Get the value at a map key.
    /// @return The value, or nullopt if the key doesn't exist.
    auto get(const ObjId& obj, std::string_view key) const -> std::optional<Value>;

    // -- Reading: list operations ---------------------------------------------

    /// Get the value at a list index.
    /// @return The value, or nullopt if the index is out of bounds.
    auto get(const ObjId& obj, std::size_t index) const -> std::optional<Value>;

    /// Get the child ObjId stored at a map key, if it holds an object.
    auto get_obj_id(const ObjId& obj, std::string_view key) const -> std::optional<ObjId>;

    /// Get the child ObjId stored at a list index, if it holds an object.
    auto get_obj_id(const ObjId& obj, std::size_t index) const -> std::optional<ObjId>;

    // -- Reading: ranges ------------------------------------------------------

    /// Get all keys in a map, sorted lexicographically.
    auto keys(const ObjId& obj) const -> std::vector<std::string>;

    /// Get all values in a map (in key order) or list (in index order).
    auto values(const ObjId& obj) const -> std::vector<Value>;

    /// Get the number of entries in a map, elements in a list, or scalars in
    /// a text.
    auto length(const ObjId& obj) const -> std::size_t;

    // -- Reading: text --------------------------------------------------------

    /// Get the text content of a text object as a UTF-8 string.
    auto text(const ObjId& obj) const -> std::string;

    // -- Typed getters --------------------------------------------------------

    /// Get a typed scalar value from a map key.
    /// @code
    /// auto id = doc.get<std::string>(cell, "id");
    /// @endcode
    template <typename T>
    auto get(const ObjId& obj, std::string_view key) const -> std::optional<T> {
        return get_scalar<T>(get(obj, key));
    }

    /// Get a typed scalar value from a list index.
    template <typename T>
    auto get(const ObjId& obj, std::size_t index) const -> std::optional<T> {
        return get_scalar<T>(get(obj, index));
    }

    // -- Object type query ----------------------------------------------------

    /// Get the type of an object (map, list, text).
    /// @return The object type, or nullopt if the object doesn't exist.
    auto object_type(const ObjId& obj) const -> std::optional<ObjType>;

    /// Number of objects in the tree, the root included. Objects unlinked by
    /// a committed transaction are no longer counted.
    auto object_count() const -> std::size_t;

private:
    friend class Transaction;

    struct Observer {
        ObjId obj;
        EventCallback shallow;
        DeepEventCallback deep;
    };

    /// Holds the lock of a joined transaction for one transact() callback.
    struct JoinScope {
        explicit JoinScope(Transaction& tx) : tx_{tx}, lock_{tx.lock()} { tx_.joined_ = true; }
        ~JoinScope() { tx_.joined_ = false; }
        JoinScope(const JoinScope&) = delete;
        auto operator=(const JoinScope&) -> JoinScope& = delete;

        Transaction& tx_;
        std::unique_lock<std::shared_mutex> lock_;
    };

    /// The suspended begin_transaction() transaction, or nullptr if none is
    /// open. Call with open_mutex_ held.
    /// @throws Error{ErrorKind::invalid_operation} if a transact() callback
    ///   is already running on it.
    auto joinable_transaction() -> Transaction*;

    /// Register a new transaction as the open one.
    /// @param joinable Whether transact() may write through it.
    auto open_transaction(bool joinable) -> std::unique_ptr<Transaction>;

    /// Called by Transaction::commit() without the lock held.
    void notify(const std::vector<detail::CommittedEvent>& events);

    std::unique_ptr<detail::DocState> state_;
    mutable std::shared_mutex mutex_;

    // Guards open_; held by a joined transact() for its whole callback
    std::recursive_mutex open_mutex_;
    Transaction* open_{nullptr};

    std::mutex observers_mutex_;
    std::map<std::uint64_t, Observer> observers_;
    std::uint64_t next_subscription_{1};
};

// -- Template implementations (must be in header) ----------------------------

template <typename Fn>
    requires std::invocable<Fn, Transaction&> &&
             (!std::is_void_v<std::invoke_result_t<Fn, Transaction&>>)
auto Document::transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&> {
    auto joined = std::unique_lock{open_mutex_};
    if (auto* open = joinable_transaction()) {
        auto scope = JoinScope{*open};
        return fn(*open);
    }
    joined.unlock();

    auto tx = open_transaction(false);
    auto result = [&] {
        auto lock = tx->lock();
        return fn(*tx);
    }();
    tx->commit();
    return result;
}

template <typename Fn>
    requires std::invocable<Fn, Transaction&> &&
             std::is_void_v<std::invoke_result_t<Fn, Transaction&>> &&
             (!std::convertible_to<Fn, std::function<void(Transaction&)>>)
void Document::transact(Fn&& fn) {
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

}  // namespace ydoc_cpp
