/// @file transaction.hpp
/// @brief Transaction class for mutating documents.

#pragma once

#include <ydoc-cpp/types.hpp>
#include <ydoc-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ydoc_cpp {

class Document;

namespace detail {
struct DocState;
struct TxLog;
}  // namespace detail

/// A mutation interface for modifying a Document.
///
/// Transactions are created by Document::transact() or
/// Document::begin_transaction(). Every write is applied to the tree
/// immediately; observers see the combined effect once, when the
/// transaction commits. A transaction that is destroyed without an explicit
/// commit() commits what it has applied so far.
///
/// @code
/// doc.transact([](auto& tx) {
///     tx.put(root, "nbformat", 4);
///     auto cells = tx.put_object(root, "cells", ObjType::list);
///     auto cell = tx.insert_object(cells, 0, ObjType::map);
///     tx.put(cell, "cell_type", "code");
/// });
/// @endcode
///
/// Writes and reads on a Transaction expect the document's exclusive lock to
/// be held: transact() does this for its whole callback; a transaction
/// obtained from begin_transaction() takes it per step with lock().
class Transaction {
public:
    /// Constructor token; only Document can create one.
    class Key {
        friend class Document;
        Key() = default;
    };

    Transaction(Key, Document& doc, detail::DocState& state);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    auto operator=(const Transaction&) -> Transaction& = delete;
    Transaction(Transaction&&) = delete;
    auto operator=(Transaction&&) -> Transaction& = delete;

    /// Acquire the document's exclusive lock for one step of work.
    [[nodiscard]] auto lock() -> std::unique_lock<std::shared_mutex>;

    /// Commit the applied writes and notify observers.
    ///
    /// Must be called without holding lock(). Tombstones and objects the
    /// writes unlinked are dropped from the tree. Observers run on the calling
    /// thread after the lock has been released. Committing twice is a no-op.
    void commit();

    /// True once commit() has run.
    auto committed() const -> bool { return committed_; }

    /// True if any write has been applied.
    auto has_changes() const -> bool;

    /// Number of primitive writes applied so far (one per put, delete,
    /// inserted element or deleted element).
    auto op_count() const -> std::size_t;

    // -- Map writes -----------------------------------------------------------

    /// Set a scalar value at a map key.
    /// @throws Error{ErrorKind::invalid_obj_id} if `obj` is not a map.
    void put(const ObjId& obj, std::string_view key, ScalarValue val);

    /// Create a nested object at a map key.
    /// @return The ObjId of the newly created object.
    auto put_object(const ObjId& obj, std::string_view key, ObjType type) -> ObjId;

    /// Delete a map key. Deleting an absent key is a no-op.
    void delete_key(const ObjId& obj, std::string_view key);

    // -- List writes ----------------------------------------------------------

    /// Insert a scalar value into a list at the given index.
    /// @throws Error{ErrorKind::invalid_operation} if `index > length(obj)`.
    void insert(const ObjId& obj, std::size_t index, ScalarValue val);

    /// Insert a nested object into a list at the given index.
    /// @return The ObjId of the newly created object.
    auto insert_object(const ObjId& obj, std::size_t index, ObjType type) -> ObjId;

    /// Delete an element at a list index.
    /// @throws Error{ErrorKind::invalid_operation} if `index >= length(obj)`.
    void delete_index(const ObjId& obj, std::size_t index);

    // -- Text writes ----------------------------------------------------------

    /// Splice text: delete characters and/or insert new text.
    ///
    /// Positions and counts are in Unicode scalars. `text` must be UTF-8.
    /// @param obj The text object to modify.
    /// @param pos The starting position.
    /// @param del The number of scalars to delete.
    /// @param text The text to insert at the position.
    void splice_text(const ObjId& obj, std::size_t pos, std::size_t del,
                     std::string_view text);

    /// Remove every key of a map or every element of a list or text.
    void clear(const ObjId& obj);

    // -- Scalar convenience overloads (map key) -------------------------------

    /// Put a std::string at a map key.
    void put(const ObjId& obj, std::string_view key, std::string val) {
        put(obj, key, ScalarValue{std::move(val)});
    }
    /// Put a string literal at a map key.
    void put(const ObjId& obj, std::string_view key, const char* val) {
        put(obj, key, ScalarValue{std::string{val}});
    }
    /// Put a string_view at a map key (copies into the document).
    void put(const ObjId& obj, std::string_view key, std::string_view val) {
        put(obj, key, ScalarValue{std::string{val}});
    }
    /// Put an int at a map key (promotes to int64_t).
    void put(const ObjId& obj, std::string_view key, int val) {
        put(obj, key, ScalarValue{static_cast<std::int64_t>(val)});
    }
    /// Put an int64_t at a map key.
    void put(const ObjId& obj, std::string_view key, std::int64_t val) {
        put(obj, key, ScalarValue{val});
    }
    /// Put a double at a map key.
    void put(const ObjId& obj, std::string_view key, double val) {
        put(obj, key, ScalarValue{val});
    }
    /// Put a bool at a map key.
    void put(const ObjId& obj, std::string_view key, bool val) {
        put(obj, key, ScalarValue{val});
    }
    /// Put a Null at a map key.
    void put(const ObjId& obj, std::string_view key, Null val) {
        put(obj, key, ScalarValue{val});
    }

    // -- Scalar convenience overloads (list insert) ---------------------------

    /// Insert a std::string into a list.
    void insert(const ObjId& obj, std::size_t index, std::string val) {
        insert(obj, index, ScalarValue{std::move(val)});
    }
    /// Insert a string literal into a list.
    void insert(const ObjId& obj, std::size_t index, const char* val) {
        insert(obj, index, ScalarValue{std::string{val}});
    }
    /// Insert an int into a list (promotes to int64_t).
    void insert(const ObjId& obj, std::size_t index, int val) {
        insert(obj, index, ScalarValue{static_cast<std::int64_t>(val)});
    }
    /// Insert an int64_t into a list.
    void insert(const ObjId& obj, std::size_t index, std::int64_t val) {
        insert(obj, index, ScalarValue{val});
    }
    /// Insert a bool into a list.
    void insert(const ObjId& obj, std::size_t index, bool val) {
        insert(obj, index, ScalarValue{val});
    }

    // --- Read methods (no locking, the caller holds the exclusive lock) ------

    /// Read the value at a map key within the transaction.
    auto get(const ObjId& obj, std::string_view key) const -> std::optional<Value>;

    /// Read the value at a list index within the transaction.
    auto get(const ObjId& obj, std::size_t index) const -> std::optional<Value>;

    /// Get the object type of an ObjId within the transaction.
    auto object_type(const ObjId& obj) const -> std::optional<ObjType>;

    /// Get the child ObjId for a map key within the transaction.
    auto get_obj_id(const ObjId& obj, std::string_view key) const -> std::optional<ObjId>;

    /// Get the child ObjId for a list index within the transaction.
    auto get_obj_id(const ObjId& obj, std::size_t index) const -> std::optional<ObjId>;

    /// Get the length of a map, list or text (in scalars) within the transaction.
    auto length(const ObjId& obj) const -> std::size_t;

    /// Get all keys of a map object within the transaction.
    auto keys(const ObjId& obj) const -> std::vector<std::string>;

    /// Get text content within the transaction.
    auto text(const ObjId& obj) const -> std::string;

private:
    friend class Document;

    // Records the object held at `key` of `obj`, if any, as unlinked.
    void detach_entry(const ObjId& obj, const std::string& key);

    Document& doc_;
    detail::DocState& state_;
    std::unique_ptr<detail::TxLog> log_;
    bool committed_{false};
    bool joinable_{false};  // opened by begin_transaction()
    bool joined_{false};    // a transact() callback is running on it
};

}  // namespace ydoc_cpp
