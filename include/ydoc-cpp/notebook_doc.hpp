/// @file notebook_doc.hpp
/// @brief A notebook document: metadata plus an ordered list of cells.

#pragma once

#include <ydoc-cpp/base_doc.hpp>
#include <ydoc-cpp/scheduler.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <future>
#include <memory>
#include <stop_token>
#include <string_view>

namespace ydoc_cpp {

/// Reads of at least this many cells are spread over the global executor.
inline constexpr std::size_t parallel_read_threshold = 64;

/// A notebook stored as the root map `meta` (`nbformat`, `nbformat_minor`,
/// `metadata`) and the root list `cells`.
///
/// set() reconciles the live cells with a snapshot by cell `id`: unchanged
/// cells are not touched, edited cells are patched in place and only cells
/// that cannot be patched are rebuilt.
///
/// @code
/// auto nb = NotebookDoc{};
/// nb.set(nlohmann::json::parse(file_contents));
/// nb.observe([](std::string_view topic, const std::vector<Event>& events) { ... });
/// auto snapshot = nb.get();
/// @endcode
class NotebookDoc : public BaseDoc {
public:
    explicit NotebookDoc(std::shared_ptr<Document> doc = std::make_shared<Document>());

    auto version() const -> std::string_view override { return "2.0.0"; }

    /// The root map holding notebook-level fields.
    auto meta() const -> const ObjId& { return meta_; }

    /// The root list of cells.
    auto cells() const -> const ObjId& { return cells_; }

    /// Number of cells.
    auto cell_number() const -> std::size_t;

    /// Read one cell. The `id` is omitted for nbformat 4.0 to 4.4.
    /// @throws Error{ErrorKind::invalid_operation} if `index` is out of range.
    auto get_cell(std::size_t index) const -> nlohmann::json;

    /// Append a new cell built from a snapshot.
    void append_cell(const nlohmann::json& cell);

    /// Replace the cell at `index` with a new cell built from a snapshot.
    /// @throws Error{ErrorKind::invalid_operation} if `index` is out of range.
    void set_cell(std::size_t index, const nlohmann::json& cell);

    /// Insert a new cell built from a snapshot before `index`.
    /// @return The new cell's map.
    auto create_cell(std::size_t index, const nlohmann::json& cell) -> ObjId;

    /// The whole notebook as `{cells, metadata, nbformat, nbformat_minor}`.
    ///
    /// A cell whose `id` repeats an earlier one is given a fresh id in the
    /// returned snapshot, and a warning is raised; the live cells are left
    /// as they are.
    auto get() const -> nlohmann::json;

    /// Make the notebook equal to a snapshot.
    void set(const nlohmann::json& notebook);

    /// get() on `loop`, one cell per task.
    auto aget(RunLoop& loop) const -> std::future<nlohmann::json>;

    /// set() on `loop`, one unit of reconciliation per task.
    auto aset(RunLoop& loop, nlohmann::json notebook, std::stop_token stop = {})
        -> std::future<void>;

protected:
    auto topics() const -> std::vector<Topic> override;

private:
    ObjId meta_;
    ObjId cells_;
};

}  // namespace ydoc_cpp
