/// @file json.hpp
/// @brief nlohmann/json interoperability for ydoc-cpp.
///
/// Provides ADL serialization (to_json/from_json) for values and events,
/// subtree export/import, and the numeric coercion applied to notebook
/// snapshots.

#pragma once

#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/event.hpp>
#include <ydoc-cpp/types.hpp>
#include <ydoc-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>

namespace ydoc_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);

/// Serialize a ScalarValue. Bytes become `{"__type": "bytes", "value": <base64>}`.
void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

/// Object ids serialize as "root" or `{"counter": n}`.
void to_json(nlohmann::json& j, const OpId& id);
void to_json(nlohmann::json& j, const ObjId& id);

/// Nested objects serialize as `{"__type": "map" | "list" | "text"}`.
void to_json(nlohmann::json& j, const Value& v);

/// Events serialize in delta form, e.g.
/// `{"type": "text", "path": [0, "source"], "delta": [{"retain": 3}, {"insert": "x"}]}`.
void to_json(nlohmann::json& j, const TextEvent& e);
void to_json(nlohmann::json& j, const ArrayEvent& e);
void to_json(nlohmann::json& j, const MapEvent& e);
void to_json(nlohmann::json& j, const Event& e);

// =============================================================================
// Subtree export / import
// =============================================================================

/// Export a document (or subtree) as a nlohmann::json value.
///
/// Maps become JSON objects, lists become JSON arrays, texts become JSON
/// strings. Bytes become base64 strings.
/// @param doc The document to export.
/// @param obj The root of the subtree to export (default: document root).
auto export_json(const Document& doc, const ObjId& obj = root) -> nlohmann::json;

/// Export a subtree from inside an open transaction.
auto export_json(const Transaction& tx, const ObjId& obj = root) -> nlohmann::json;

/// Import a JSON value into a document at the given target object.
/// Wraps all mutations in a single transaction.
///
/// An object's entries are put into a target map; an array's elements are
/// appended to a target list.
void import_json(Document& doc, const nlohmann::json& j,
                 const ObjId& target = root);

/// Import a JSON value within an existing transaction.
void import_json(Transaction& tx, const nlohmann::json& j,
                 const ObjId& target = root);

/// Write a JSON value at a map key, creating nested maps and lists.
/// JSON strings become scalar strings, never Text.
void put_json(Transaction& tx, const ObjId& obj, std::string_view key,
              const nlohmann::json& val);

/// Insert a JSON value at a list index, creating nested maps and lists.
void insert_json(Transaction& tx, const ObjId& obj, std::size_t index,
                 const nlohmann::json& val);

// =============================================================================
// Numeric coercion
// =============================================================================

/// Replace, recursively, every floating-point number whose value is integral
/// and survives a round trip through int64 with that integer.
void cast_integral_floats(nlohmann::json& j);

}  // namespace ydoc_cpp
