/// @file cell.hpp
/// @brief Notebook cell records: normalisation, construction and in-place update.
///
/// A live cell is a Map in the notebook's `cells` list:
///
/// | field             | kind | present on          |
/// |-------------------|------|---------------------|
/// | `id`              | str  | all                 |
/// | `cell_type`       | str  | all                 |
/// | `source`          | Text | all                 |
/// | `metadata`        | Map  | all                 |
/// | `execution_count` | int  | code (may be null)  |
/// | `outputs`         | List | code                |
/// | `execution_state` | str  | code, never exposed |
/// | `attachments`     | Map  | raw, markdown       |
///
/// `stream` outputs keep their `text` as a Text so that a kernel can append
/// to it while the output is displayed.

#pragma once

#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/transaction.hpp>
#include <ydoc-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ydoc_cpp {

/// The closed set of notebook cell kinds.
enum class CellType : std::uint8_t {
    code,
    markdown,
    raw,
};

/// Convert a CellType to its nbformat name.
constexpr auto to_string_view(CellType type) noexcept -> std::string_view {
    switch (type) {
        case CellType::code:     return "code";
        case CellType::markdown: return "markdown";
        case CellType::raw:      return "raw";
    }
    return "unknown";
}

/// Parse an nbformat cell type name.
auto parse_cell_type(std::string_view name) -> std::optional<CellType>;

/// The storage kind of a cell field.
enum class FieldKind : std::uint8_t {
    scalar,  ///< Plain value, overwritten on change.
    text,    ///< Text, patched with the text reconciler.
    map,     ///< Map, cleared and refilled on change.
    list,    ///< List, cleared and refilled on change.
};

/// Look up the storage kind of a cell field by name.
constexpr auto field_kind(std::string_view field) noexcept -> FieldKind {
    if (field == "source") return FieldKind::text;
    if (field == "metadata" || field == "attachments") return FieldKind::map;
    if (field == "outputs") return FieldKind::list;
    return FieldKind::scalar;
}

/// A fresh cell id from the installed generator; by default a random
/// (version 4) UUID in canonical lowercase form.
auto generate_cell_id() -> std::string;

/// Produces the ids given to cells that arrive without one.
using CellIdGenerator = std::function<std::string()>;

/// Install a process-wide cell id generator.
///
/// Passing an empty generator restores the random UUID default.
/// @return The previously installed generator (empty if it was the default).
auto set_cell_id_generator(CellIdGenerator generator) -> CellIdGenerator;

/// A desired cell, normalised.
struct CellSpec {
    CellType type{CellType::code};
    std::string id;
    bool minted_id{false};  ///< The snapshot carried no id; `id` was generated.
    nlohmann::json fields;  ///< The cell as it will read back, `id` included.
};

/// Normalise a cell snapshot.
///
/// List-of-lines `source` and stream `text` are joined, `metadata` defaults
/// to an empty object, code cells default `outputs` to an empty list, empty
/// `attachments` are dropped from raw and markdown cells, integral floats
/// become integers, and `execution_state` is discarded. A cell without an
/// `id` is given a fresh one.
/// @throws Error{ErrorKind::invalid_cell} if the snapshot is not an object or
///   lacks a known `cell_type` or a `source`.
auto make_cell_spec(const nlohmann::json& cell) -> CellSpec;

/// Read a live cell the way it is exposed: without `execution_state`, with
/// integral floats cast to integers and without empty `attachments` on raw
/// and markdown cells.
auto read_cell(const Document& doc, const ObjId& cell) -> nlohmann::json;

/// read_cell() from inside an open transaction.
auto read_cell(const Transaction& tx, const ObjId& cell) -> nlohmann::json;

/// Insert a new live cell built from `spec` at `index` of `cells`.
/// Code cells start with `execution_state` "idle".
/// @return The new cell's map.
auto create_cell(Transaction& tx, const ObjId& cells, std::size_t index,
                 const CellSpec& spec) -> ObjId;

/// Try to turn the live cell `live`, which currently reads as `current`,
/// into `desired` without replacing it.
///
/// `source` is patched through the text reconciler, other structural fields
/// are cleared and refilled in place, scalar fields are overwritten and
/// removed fields are deleted, as is `execution_state` when the desired cell
/// is not code. The update is refused, with nothing written,
/// if a structural field would have to be added, if the live field is not
/// of the expected kind, or if new `outputs` contain a `stream` output.
/// @return True if the live cell now reads as `desired`.
auto update_cell(Transaction& tx, const nlohmann::json& current,
                 const CellSpec& desired, const ObjId& live) -> bool;

/// Append a pending `stdin` output to a cell's `outputs`.
/// @return The index of the new output.
auto add_stdin_output(Transaction& tx, const ObjId& outputs,
                      std::string_view prompt = {}, bool password = false) -> std::size_t;

}  // namespace ydoc_cpp
