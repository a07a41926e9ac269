/// @file cell_reconciler.hpp
/// @brief Bring a live notebook (cell list plus metadata) to a desired snapshot.
///
/// Cells are matched by `id`. A matched cell is patched in place when
/// possible, so the handles held by other parties (the `source` Text, a
/// streaming output) survive; everything else is deleted and rebuilt.

#pragma once

#include <ydoc-cpp/cell.hpp>
#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/scheduler.hpp>
#include <ydoc-cpp/transaction.hpp>
#include <ydoc-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ydoc_cpp {

/// nbformat major version written when a snapshot carries none.
inline constexpr std::int64_t default_nbformat = 4;

/// nbformat minor version written when a snapshot carries none.
inline constexpr std::int64_t default_nbformat_minor = 5;

/// The empty code cell a notebook gets when it is set with no cells.
auto default_cell() -> nlohmann::json;

/// Reconcile the notebook stored in `cells` (a list) and `meta` (a map)
/// with `notebook`, a `{cells, metadata, nbformat, nbformat_minor}` snapshot.
///
/// Steps, in order:
///  1. normalise one desired cell per step;
///  2. index one live cell per step by `id` (first occurrence wins);
///  3. check that no generated id collides with another id;
///  4. try update_cell() for one matched desired cell per step; success
///     marks the identity retained;
///  5. walk the live list, one cell per step, deleting cells that are not
///     retained or repeat an identity already kept;
///  6. place one desired cell per step: keep it if the identity is already
///     there, move a retained cell found later by rebuilding it here, or
///     build a new cell;
///  7. truncate the live list to the desired length;
///  8. write `nbformat`, `nbformat_minor` and `metadata` where they differ;
///  9. commit.
///
/// All writes land in one transaction, opened by step 2. The job shares
/// ownership of the document, so it may outlive the facade that queued it.
///
/// @throws Error{ErrorKind::invalid_cell} from a normalisation step.
/// @throws Error{ErrorKind::integrity_violation} if a generated id collides.
class CellReconciliation : public Job {
public:
    CellReconciliation(std::shared_ptr<Document> doc, ObjId cells, ObjId meta,
                       nlohmann::json notebook);

    auto step() -> bool override;
    void cancel() override;

    /// True once the job has written anything.
    auto applied() const -> bool { return applied_; }

    /// Number of live cells that kept their identity and handles.
    auto retained_count() const -> std::size_t { return retained_.size(); }

private:
    enum class Phase : std::uint8_t {
        normalize, index, check_ids, update, remove, place, truncate, meta, commit, done,
    };

    struct LiveCell {
        std::optional<ObjId> obj;  ///< Empty if the list element is not a map.
        std::string id;
        nlohmann::json view;
    };

    auto normalize_step() -> bool;
    auto index_step() -> bool;
    void check_ids();
    auto update_step() -> bool;
    auto remove_step() -> bool;
    auto place_step() -> bool;
    void truncate();
    void write_meta();

    std::shared_ptr<Document> doc_;
    ObjId cells_;
    ObjId meta_;
    nlohmann::json notebook_;
    std::unique_ptr<Transaction> tx_;
    Phase phase_{Phase::normalize};
    std::size_t cursor_{0};
    std::size_t live_index_{0};

    std::vector<CellSpec> desired_;
    std::unordered_set<std::string> desired_ids_;
    std::vector<LiveCell> current_;
    std::unordered_map<std::string, std::size_t> index_;
    std::unordered_set<std::string> retained_;
    std::unordered_set<std::string> kept_;
    std::vector<std::string> live_ids_;
    bool applied_{false};
};

/// Run a CellReconciliation to completion on the calling thread.
/// @return True if anything was written.
auto reconcile_cells(Document& doc, const ObjId& cells, const ObjId& meta,
                     const nlohmann::json& notebook) -> bool;

}  // namespace ydoc_cpp
