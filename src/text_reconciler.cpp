#include <ydoc-cpp/text_reconciler.hpp>

#include <ydoc-cpp/error.hpp>

#include <fmt/format.h>

#include <string>
#include <utility>

namespace ydoc_cpp {

namespace {

auto floor_boundary(const std::vector<bool>& boundaries, std::size_t pos) -> std::size_t {
    while (pos > 0 && !boundaries[pos]) --pos;
    return pos;
}

auto ceil_boundary(const std::vector<bool>& boundaries, std::size_t pos) -> std::size_t {
    while (pos + 1 < boundaries.size() && !boundaries[pos]) ++pos;
    return pos;
}

auto signed_size(std::size_t n) -> std::ptrdiff_t {
    return static_cast<std::ptrdiff_t>(n);
}

}  // namespace

auto align_to_graphemes(const std::vector<Opcode>& opcodes,
                        const std::vector<bool>& old_boundaries,
                        const std::vector<bool>& new_boundaries) -> std::vector<Opcode> {
    auto result = std::vector<Opcode>{};
    result.reserve(opcodes.size());
    for (const auto& op : opcodes) {
        auto widened = Opcode{
            .tag = op.tag,
            .i1 = floor_boundary(old_boundaries, op.i1),
            .i2 = ceil_boundary(old_boundaries, op.i2),
            .j1 = floor_boundary(new_boundaries, op.j1),
            .j2 = ceil_boundary(new_boundaries, op.j2),
        };
        if (!result.empty()) {
            const auto& prev = result.back();
            if (prev.i2 > widened.i1 || prev.j2 > widened.j1) return {};
        }
        result.push_back(widened);
    }
    return result;
}

auto plan_text_edits(std::string_view current, std::string_view desired) -> TextEditPlan {
    auto planner = TextEditPlanner{std::string{current}, std::string{desired}};
    while (planner.step()) {}
    return planner.take_plan();
}

void apply_text_edit(Transaction& tx, const ObjId& text, const TextEditPlan& plan,
                     const Opcode& op, std::ptrdiff_t& offset) {
    const auto pos = static_cast<std::size_t>(signed_size(op.i1) + offset);
    const auto removed = op.i2 - op.i1;
    const auto added = op.j2 - op.j1;
    switch (op.tag) {
        case OpTag::equal:
            return;
        case OpTag::replace:
            tx.splice_text(text, pos, removed, plan.desired_slice(op.j1, op.j2));
            offset += signed_size(added) - signed_size(removed);
            return;
        case OpTag::del:
            tx.splice_text(text, pos, removed, {});
            offset -= signed_size(removed);
            return;
        case OpTag::insert:
            tx.splice_text(text, pos, 0, plan.desired_slice(op.j1, op.j2));
            offset += signed_size(added);
            return;
    }
    throw Error{ErrorKind::unknown_opcode,
                fmt::format("unknown text edit tag {}", static_cast<int>(op.tag))};
}

auto apply_text_plan(Transaction& tx, const ObjId& text, const TextEditPlan& plan) -> bool {
    switch (plan.mode) {
        case TextEditMode::unchanged:
            return false;
        case TextEditMode::replace:
            tx.clear(text);
            if (!plan.desired.empty()) tx.splice_text(text, 0, 0, plan.desired);
            return true;
        case TextEditMode::granular: {
            auto offset = std::ptrdiff_t{0};
            for (const auto& op : plan.opcodes) {
                apply_text_edit(tx, text, plan, op, offset);
            }
            return true;
        }
    }
    return false;
}

auto reconcile_text(Transaction& tx, const ObjId& text,
                    std::string_view current, std::string_view desired) -> bool {
    return apply_text_plan(tx, text, plan_text_edits(current, desired));
}

auto reconcile_text(Document& doc, const ObjId& text, std::string_view desired) -> bool {
    if (doc.object_type(text) != ObjType::text) {
        throw Error{ErrorKind::invalid_obj_id, "reconcile target is not a text"};
    }
    auto plan = plan_text_edits(doc.text(text), desired);
    if (plan.mode == TextEditMode::unchanged) return false;

    auto tx = doc.begin_transaction();
    {
        auto lock = tx->lock();
        apply_text_plan(*tx, text, plan);
    }
    tx->commit();
    return true;
}

// -- TextEditPlanner ----------------------------------------------------------

TextEditPlanner::TextEditPlanner(std::string current, std::string desired)
    : current_{std::move(current)} {
    plan_.desired = std::move(desired);
}

auto TextEditPlanner::step() -> bool {
    switch (phase_) {
        case Phase::compare:
            plan_.desired_offsets = scalar_offsets(plan_.desired);
            if (current_ == plan_.desired) {
                phase_ = Phase::done;
                return false;
            }
            plan_.mode = TextEditMode::replace;
            plan_.ratio = 0.0;
            phase_ = Phase::decode;
            return true;
        case Phase::decode:
            a_ = decode_utf8(current_);
            b_ = decode_utf8(plan_.desired);
            phase_ = Phase::index;
            return true;
        case Phase::index:
            matcher_.emplace(std::move(a_), std::move(b_));
            phase_ = Phase::quick_ratio;
            return true;
        case Phase::quick_ratio:
            if (matcher_->quick_ratio() < similarity_cutoff) {
                reject();
                return false;
            }
            phase_ = Phase::match;
            return true;
        case Phase::match:
            if (matcher_->match_step()) return true;
            plan_.ratio = matcher_->ratio();
            if (plan_.ratio < similarity_cutoff) {
                reject();
                return false;
            }
            phase_ = Phase::opcodes;
            return true;
        case Phase::opcodes:
            opcodes_ = matcher_->opcodes();
            matcher_.reset();
            phase_ = Phase::old_boundaries;
            return true;
        case Phase::old_boundaries:
            old_boundaries_ = grapheme_boundaries(current_);
            phase_ = Phase::new_boundaries;
            return true;
        case Phase::new_boundaries: {
            auto aligned = align_to_graphemes(opcodes_, old_boundaries_,
                                              grapheme_boundaries(plan_.desired));
            if (!aligned.empty()) {
                plan_.mode = TextEditMode::granular;
                plan_.opcodes = std::move(aligned);
            }
            phase_ = Phase::done;
            return false;
        }
        case Phase::done:
            return false;
    }
    return false;
}

// -- TextReconciliation -------------------------------------------------------

TextReconciliation::TextReconciliation(std::shared_ptr<Document> doc, ObjId text,
                                       std::string desired)
    : doc_{std::move(doc)}, text_{std::move(text)}, desired_{std::move(desired)} {}

auto TextReconciliation::step() -> bool {
    switch (phase_) {
        case Phase::read:
            if (doc_->object_type(text_) != ObjType::text) {
                throw Error{ErrorKind::invalid_obj_id, "reconcile target is not a text"};
            }
            planner_.emplace(doc_->text(text_), std::move(desired_));
            phase_ = Phase::plan;
            return true;
        case Phase::plan:
            if (planner_->step()) return true;
            plan_ = planner_->take_plan();
            planner_.reset();
            return start_writing();
        case Phase::clear: {
            {
                auto lock = tx_->lock();
                tx_->clear(text_);
            }
            phase_ = plan_.desired.empty() ? Phase::commit : Phase::fill;
            return true;
        }
        case Phase::fill: {
            {
                auto lock = tx_->lock();
                tx_->splice_text(text_, 0, 0, plan_.desired);
            }
            phase_ = Phase::commit;
            return true;
        }
        case Phase::edit: {
            while (next_op_ < plan_.opcodes.size() &&
                   plan_.opcodes[next_op_].tag == OpTag::equal) {
                ++next_op_;
            }
            if (next_op_ == plan_.opcodes.size()) {
                phase_ = Phase::commit;
                return true;
            }
            auto lock = tx_->lock();
            apply_text_edit(*tx_, text_, plan_, plan_.opcodes[next_op_++], offset_);
            return true;
        }
        case Phase::commit:
            applied_ = tx_->has_changes();
            tx_->commit();
            tx_.reset();
            phase_ = Phase::done;
            return false;
        case Phase::done:
            return false;
    }
    return false;
}

auto TextReconciliation::start_writing() -> bool {
    if (plan_.mode == TextEditMode::unchanged) {
        phase_ = Phase::done;
        return false;
    }
    tx_ = doc_->begin_transaction();
    phase_ = plan_.mode == TextEditMode::replace ? Phase::clear : Phase::edit;
    return true;
}

void TextReconciliation::cancel() {
    if (tx_) {
        applied_ = tx_->has_changes();
        tx_->commit();
        tx_.reset();
    }
    phase_ = Phase::done;
}

}  // namespace ydoc_cpp
