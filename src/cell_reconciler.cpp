#include <ydoc-cpp/cell_reconciler.hpp>

#include <ydoc-cpp/diagnostics.hpp>
#include <ydoc-cpp/error.hpp>
#include <ydoc-cpp/json.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace ydoc_cpp {

namespace {

using nlohmann::json;

auto value_or(const json& object, const char* key, json fallback) -> json {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return fallback;
    return *it;
}

auto desired_metadata(const json& notebook) -> json {
    auto metadata = value_or(notebook, "metadata", json::object());
    if (!metadata.is_object()) metadata = json::object();
    if (!metadata.contains("language_info")) {
        metadata["language_info"] = json{{"name", ""}};
    }
    if (!metadata.contains("kernelspec")) {
        metadata["kernelspec"] = json{{"name", ""}, {"display_name", ""}};
    }
    return metadata;
}

}  // namespace

auto default_cell() -> nlohmann::json {
    return json{
        {"cell_type", "code"},
        {"execution_count", nullptr},
        {"metadata", {{"trusted", true}}},
        {"outputs", json::array()},
        {"source", ""},
        {"id", generate_cell_id()},
    };
}

CellReconciliation::CellReconciliation(std::shared_ptr<Document> doc, ObjId cells, ObjId meta,
                                       nlohmann::json notebook)
    : doc_{std::move(doc)}, cells_{std::move(cells)}, meta_{std::move(meta)},
      notebook_{std::move(notebook)} {
    if (!notebook_.is_object()) {
        throw Error{ErrorKind::invalid_operation, "notebook snapshot must be an object"};
    }
    auto snapshot_cells = value_or(notebook_, "cells", json::array());
    if (!snapshot_cells.is_array()) {
        throw Error{ErrorKind::invalid_cell, "notebook cells must be a list"};
    }
    if (snapshot_cells.empty()) snapshot_cells.push_back(default_cell());
    notebook_["cells"] = std::move(snapshot_cells);
    cast_integral_floats(notebook_);
}

auto CellReconciliation::step() -> bool {
    switch (phase_) {
        case Phase::normalize:
            return normalize_step();
        case Phase::index:
            return index_step();
        case Phase::check_ids:
            check_ids();
            phase_ = Phase::update;
            return true;
        case Phase::update:
            return update_step();
        case Phase::remove:
            return remove_step();
        case Phase::place:
            return place_step();
        case Phase::truncate:
            truncate();
            phase_ = Phase::meta;
            return true;
        case Phase::meta:
            write_meta();
            phase_ = Phase::commit;
            return true;
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

void CellReconciliation::cancel() {
    if (tx_) {
        applied_ = tx_->has_changes();
        tx_->commit();
        tx_.reset();
    }
    phase_ = Phase::done;
}

auto CellReconciliation::normalize_step() -> bool {
    const auto& snapshot_cells = notebook_["cells"];
    if (cursor_ == snapshot_cells.size()) {
        cursor_ = 0;
        phase_ = Phase::index;
        return true;
    }

    auto spec = make_cell_spec(snapshot_cells[cursor_]);
    if (!spec.minted_id && !desired_ids_.insert(spec.id).second) {
        auto fresh = generate_cell_id();
        warn(Warning{
            .kind = WarningKind::duplicate_desired_cell_id,
            .message = "snapshot repeats a cell id, the later cell gets a new one",
            .cell_index = cursor_,
            .old_id = spec.id,
            .new_id = fresh,
        });
        spec.id = std::move(fresh);
        spec.fields["id"] = spec.id;
        spec.minted_id = true;
    }
    desired_.push_back(std::move(spec));
    ++cursor_;
    return true;
}

auto CellReconciliation::index_step() -> bool {
    if (!tx_) tx_ = doc_->begin_transaction();
    auto lock = tx_->lock();
    if (cursor_ >= tx_->length(cells_)) {
        cursor_ = 0;
        phase_ = Phase::check_ids;
        return true;
    }

    auto live = LiveCell{.obj = tx_->get_obj_id(cells_, cursor_)};
    if (live.obj && tx_->object_type(*live.obj) == ObjType::map) {
        live.view = read_cell(*tx_, *live.obj);
        if (auto id = live.view.find("id"); id != live.view.end() && id->is_string()) {
            live.id = id->get<std::string>();
        }
    } else {
        live.obj.reset();
    }
    if (!live.id.empty()) index_.try_emplace(live.id, current_.size());
    current_.push_back(std::move(live));
    ++cursor_;
    return true;
}

void CellReconciliation::check_ids() {
    auto counts = std::unordered_map<std::string, std::size_t>{};
    for (const auto& spec : desired_) ++counts[spec.id];
    for (const auto& live : current_) {
        if (!live.id.empty()) ++counts[live.id];
    }
    for (const auto& spec : desired_) {
        if (spec.minted_id && counts[spec.id] > 1) {
            throw Error{ErrorKind::integrity_violation,
                        fmt::format("generated cell id {} is already in use", spec.id)};
        }
    }
}

auto CellReconciliation::update_step() -> bool {
    if (cursor_ == desired_.size()) {
        cursor_ = 0;
        phase_ = Phase::remove;
        return true;
    }

    const auto& spec = desired_[cursor_++];
    auto match = index_.find(spec.id);
    if (match == index_.end()) return true;

    const auto& live = current_[match->second];
    auto lock = tx_->lock();
    if (update_cell(*tx_, live.view, spec, *live.obj)) {
        retained_.insert(spec.id);
    }
    return true;
}

auto CellReconciliation::remove_step() -> bool {
    if (cursor_ == current_.size()) {
        cursor_ = 0;
        phase_ = Phase::place;
        return true;
    }

    const auto& live = current_[cursor_++];
    if (!live.id.empty() && retained_.contains(live.id) && kept_.insert(live.id).second) {
        live_ids_.push_back(live.id);
        ++live_index_;
        return true;
    }
    auto lock = tx_->lock();
    tx_->delete_index(cells_, live_index_);
    return true;
}

auto CellReconciliation::place_step() -> bool {
    if (cursor_ == desired_.size()) {
        phase_ = Phase::truncate;
        return true;
    }

    const auto index = cursor_++;
    const auto& spec = desired_[index];
    if (index < live_ids_.size() && live_ids_[index] == spec.id) return true;

    auto lock = tx_->lock();
    if (retained_.contains(spec.id)) {
        // Earlier slots already hold other identities, so a retained cell is always later
        auto found = std::find(live_ids_.begin() + static_cast<std::ptrdiff_t>(index),
                               live_ids_.end(), spec.id);
        if (found != live_ids_.end()) {
            tx_->delete_index(cells_, static_cast<std::size_t>(found - live_ids_.begin()));
            live_ids_.erase(found);
        }
    }
    create_cell(*tx_, cells_, index, spec);
    live_ids_.insert(live_ids_.begin() + static_cast<std::ptrdiff_t>(index), spec.id);
    return true;
}

void CellReconciliation::truncate() {
    auto lock = tx_->lock();
    for (auto length = tx_->length(cells_); length > desired_.size(); --length) {
        tx_->delete_index(cells_, length - 1);
    }
    if (live_ids_.size() > desired_.size()) live_ids_.resize(desired_.size());
}

void CellReconciliation::write_meta() {
    auto lock = tx_->lock();
    auto current = export_json(*tx_, meta_);
    cast_integral_floats(current);

    auto differs = [&](const char* key, const json& desired) {
        auto it = current.find(key);
        return it == current.end() || *it != desired;
    };

    auto nbformat = value_or(notebook_, "nbformat", default_nbformat);
    if (differs("nbformat", nbformat)) put_json(*tx_, meta_, "nbformat", nbformat);

    auto minor = value_or(notebook_, "nbformat_minor", default_nbformat_minor);
    if (differs("nbformat_minor", minor)) put_json(*tx_, meta_, "nbformat_minor", minor);

    auto metadata = desired_metadata(notebook_);
    if (!differs("metadata", metadata)) return;
    auto live = tx_->get_obj_id(meta_, "metadata");
    if (live && tx_->object_type(*live) == ObjType::map) {
        tx_->clear(*live);
        import_json(*tx_, metadata, *live);
    } else {
        put_json(*tx_, meta_, "metadata", metadata);
    }
}

auto reconcile_cells(Document& doc, const ObjId& cells, const ObjId& meta,
                     const nlohmann::json& notebook) -> bool {
    // Non-owning: the job does not outlive this call
    auto job = CellReconciliation{std::shared_ptr<Document>{std::shared_ptr<Document>{}, &doc},
                                  cells, meta, notebook};
    run_to_completion(job);
    return job.applied();
}

}  // namespace ydoc_cpp
