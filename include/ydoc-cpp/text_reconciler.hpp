/// @file text_reconciler.hpp
/// @brief Apply a full desired string to a shared Text as a minimal edit script.

#pragma once

#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/scheduler.hpp>
#include <ydoc-cpp/text_diff.hpp>
#include <ydoc-cpp/transaction.hpp>
#include <ydoc-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ydoc_cpp {

/// Below this similarity the text is replaced wholesale.
inline constexpr double similarity_cutoff = 0.6;

/// How a text edit will be carried out.
enum class TextEditMode : std::uint8_t {
    unchanged,  ///< current == desired, nothing to write
    granular,   ///< replay the opcodes
    replace,    ///< clear the text, insert the desired string
};

/// The decision taken for one reconciliation, computed without mutating.
struct TextEditPlan {
    TextEditMode mode{TextEditMode::unchanged};
    double ratio{1.0};              ///< Exact similarity; 0 when the quick bound already failed.
    std::vector<Opcode> opcodes;    ///< Grapheme-aligned edit script (granular mode only).
    std::string desired;            ///< The desired string.
    std::vector<std::size_t> desired_offsets;  ///< Byte offset of each desired scalar.

    /// The desired text for scalars [j1, j2).
    auto desired_slice(std::size_t j1, std::size_t j2) const -> std::string_view {
        return std::string_view{desired}.substr(desired_offsets[j1],
                                                desired_offsets[j2] - desired_offsets[j1]);
    }
};

/// Decide how to turn `current` into `desired`.
///
/// Granular mode is chosen when both the multiset ratio and the exact ratio
/// reach similarity_cutoff and every opcode boundary, widened to the
/// enclosing grapheme cluster, still leaves adjacent opcodes disjoint.
auto plan_text_edits(std::string_view current, std::string_view desired) -> TextEditPlan;

/// Widen every opcode range to the enclosing grapheme clusters.
///
/// @return The widened opcodes, or an empty vector if two adjacent widened
///   ranges overlap on either side.
auto align_to_graphemes(const std::vector<Opcode>& opcodes,
                        const std::vector<bool>& old_boundaries,
                        const std::vector<bool>& new_boundaries) -> std::vector<Opcode>;

/// Apply one opcode to `text`. `offset` is the net length change of the
/// opcodes applied before it and is updated.
/// @throws Error{ErrorKind::unknown_opcode} for a tag outside the four kinds.
void apply_text_edit(Transaction& tx, const ObjId& text, const TextEditPlan& plan,
                     const Opcode& op, std::ptrdiff_t& offset);

/// Write a plan computed for the current content of `text`.
/// @return True if anything was written.
auto apply_text_plan(Transaction& tx, const ObjId& text, const TextEditPlan& plan) -> bool;

/// Make `text`, currently holding `current`, hold `desired`.
/// @return True if anything was written.
auto reconcile_text(Transaction& tx, const ObjId& text,
                    std::string_view current, std::string_view desired) -> bool;

/// Make `text` hold `desired`, in a transaction of its own opened only when
/// the content differs.
/// @return True if anything was written.
/// @throws Error{ErrorKind::invalid_obj_id} if `text` is not a text.
/// @throws Error{ErrorKind::invalid_operation} if the content differs while
///   another transaction is open, such as a suspended TextReconciliation.
auto reconcile_text(Document& doc, const ObjId& text, std::string_view desired) -> bool;

/// plan_text_edits() split into bounded steps: decoding, indexing the
/// desired scalars, the quick bound, one matching-block search per step,
/// the opcodes, then one grapheme scan per string.
class TextEditPlanner {
public:
    TextEditPlanner(std::string current, std::string desired);

    /// Run the next planning step.
    /// @return True while steps remain.
    auto step() -> bool;

    /// True once the plan is complete.
    auto done() const -> bool { return phase_ == Phase::done; }

    /// The finished plan. Only valid once done().
    auto plan() const -> const TextEditPlan& { return plan_; }
    auto take_plan() -> TextEditPlan { return std::move(plan_); }

private:
    enum class Phase : std::uint8_t {
        compare, decode, index, quick_ratio, match, opcodes,
        old_boundaries, new_boundaries, done,
    };

    void reject() { phase_ = Phase::done; }

    std::string current_;
    TextEditPlan plan_;
    std::u32string a_;
    std::u32string b_;
    std::optional<SequenceMatcher> matcher_;
    std::vector<Opcode> opcodes_;
    std::vector<bool> old_boundaries_;
    Phase phase_{Phase::compare};
};

/// reconcile_text() as a step sequence: planning over several steps (see
/// TextEditPlanner), then one opcode per step.
///
/// The job shares ownership of the document, so it may outlive the facade
/// that queued it.
///
/// @code
/// auto job = std::make_shared<TextReconciliation>(doc, source, "new text");
/// run_to_completion(*job);          // or run_async(loop, job)
/// @endcode
class TextReconciliation : public Job {
public:
    TextReconciliation(std::shared_ptr<Document> doc, ObjId text, std::string desired);

    auto step() -> bool override;
    void cancel() override;

    /// True once the job has written anything.
    auto applied() const -> bool { return applied_; }

    /// True once planning has finished.
    auto planned() const -> bool { return phase_ > Phase::plan; }

    /// The plan, available once planned().
    auto plan() const -> const TextEditPlan& { return plan_; }

private:
    enum class Phase : std::uint8_t { read, plan, clear, fill, edit, commit, done };

    auto start_writing() -> bool;

    std::shared_ptr<Document> doc_;
    ObjId text_;
    std::string desired_;
    std::optional<TextEditPlanner> planner_;
    TextEditPlan plan_;
    std::unique_ptr<Transaction> tx_;
    Phase phase_{Phase::read};
    std::size_t next_op_{0};
    std::ptrdiff_t offset_{0};
    bool applied_{false};
};

}  // namespace ydoc_cpp
