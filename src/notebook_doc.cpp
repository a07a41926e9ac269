#include <ydoc-cpp/notebook_doc.hpp>

#include <ydoc-cpp/cell.hpp>
#include <ydoc-cpp/cell_reconciler.hpp>
#include <ydoc-cpp/diagnostics.hpp>
#include <ydoc-cpp/error.hpp>
#include <ydoc-cpp/json.hpp>

#include "executor.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ydoc_cpp {

namespace {

using nlohmann::json;

auto integer_field(const json& meta, const char* key) -> std::int64_t {
    auto it = meta.find(key);
    if (it == meta.end() || !it->is_number()) return 0;
    return it->get<std::int64_t>();
}

// Cell ids appeared in nbformat 4.5
auto strips_cell_ids(const json& meta) -> bool {
    return integer_field(meta, "nbformat") == 4 && integer_field(meta, "nbformat_minor") <= 4;
}

auto differing_fields(const json& a, const json& b) -> std::vector<std::string> {
    auto fields = std::vector<std::string>{};
    for (const auto& [key, value] : a.items()) {
        if (key == "id") continue;
        auto other = b.find(key);
        if (other == b.end() || *other != value) fields.push_back(key);
    }
    for (const auto& [key, value] : b.items()) {
        if (key != "id" && !a.contains(key)) fields.push_back(key);
    }
    return fields;
}

void repair_duplicate_ids(std::vector<json>& cells) {
    auto first = std::unordered_map<std::string, std::size_t>{};
    for (std::size_t i = 0; i < cells.size(); ++i) {
        auto id = cells[i].find("id");
        if (id == cells[i].end() || !id->is_string()) continue;
        auto [seen, inserted] = first.try_emplace(id->get<std::string>(), i);
        if (inserted) continue;

        auto fresh = generate_cell_id();
        warn(Warning{
            .kind = WarningKind::duplicate_cell_id,
            .message = fmt::format("cell {} repeats the id of cell {}, reading it with a new id",
                                   i, seen->second),
            .cell_index = i,
            .old_id = seen->first,
            .new_id = fresh,
            .differing_fields = differing_fields(cells[seen->second], cells[i]),
        });
        cells[i]["id"] = fresh;
        first.emplace(std::move(fresh), i);
    }
}

auto assemble_notebook(json meta, std::vector<json> cells) -> json {
    if (!meta.is_object()) meta = json::object();
    cast_integral_floats(meta);
    std::erase_if(cells, [](const json& cell) { return !cell.is_object(); });

    if (strips_cell_ids(meta)) {
        for (auto& cell : cells) cell.erase("id");
    } else {
        repair_duplicate_ids(cells);
    }

    auto metadata = meta.find("metadata");
    return json{
        {"cells", std::move(cells)},
        {"metadata", metadata != meta.end() ? *metadata : json::object()},
        {"nbformat", integer_field(meta, "nbformat")},
        {"nbformat_minor", integer_field(meta, "nbformat_minor")},
    };
}

// get() as a step sequence: the notebook-level fields first, then one cell
// per step, then assembly
class NotebookRead : public Job {
public:
    NotebookRead(std::shared_ptr<const Document> doc, ObjId meta, ObjId cells)
        : doc_{std::move(doc)}, meta_{std::move(meta)}, cells_{std::move(cells)} {}

    auto step() -> bool override {
        if (!started_) {
            meta_json_ = export_json(*doc_, meta_);
            count_ = doc_->length(cells_);
            started_ = true;
            return true;
        }
        if (views_.size() < count_) {
            auto obj = doc_->get_obj_id(cells_, views_.size());
            views_.push_back(obj ? read_cell(*doc_, *obj) : json{});
            return true;
        }
        result_ = assemble_notebook(std::move(meta_json_), std::move(views_));
        return false;
    }

    auto take() -> json { return std::move(result_); }

private:
    std::shared_ptr<const Document> doc_;
    ObjId meta_;
    ObjId cells_;
    bool started_{false};
    std::size_t count_{0};
    json meta_json_;
    std::vector<json> views_;
    json result_;
};

}  // namespace

NotebookDoc::NotebookDoc(std::shared_ptr<Document> doc)
    : BaseDoc{std::move(doc)},
      meta_{root_object("meta", ObjType::map)},
      cells_{root_object("cells", ObjType::list)} {}

auto NotebookDoc::cell_number() const -> std::size_t {
    return document().length(cells_);
}

auto NotebookDoc::get_cell(std::size_t index) const -> nlohmann::json {
    auto obj = document().get_obj_id(cells_, index);
    if (!obj) {
        throw Error{ErrorKind::invalid_operation,
                    fmt::format("no cell at index {} of {}", index, cell_number())};
    }
    auto cell = read_cell(document(), *obj);
    auto meta = export_json(document(), meta_);
    cast_integral_floats(meta);
    if (strips_cell_ids(meta)) cell.erase("id");
    return cell;
}

void NotebookDoc::append_cell(const nlohmann::json& cell) {
    auto spec = make_cell_spec(cell);
    document().transact([&](Transaction& tx) {
        ydoc_cpp::create_cell(tx, cells_, tx.length(cells_), spec);
    });
}

void NotebookDoc::set_cell(std::size_t index, const nlohmann::json& cell) {
    auto spec = make_cell_spec(cell);
    document().transact([&](Transaction& tx) {
        if (index >= tx.length(cells_)) {
            throw Error{ErrorKind::invalid_operation,
                        fmt::format("no cell at index {} of {}", index, tx.length(cells_))};
        }
        tx.delete_index(cells_, index);
        ydoc_cpp::create_cell(tx, cells_, index, spec);
    });
}

auto NotebookDoc::create_cell(std::size_t index, const nlohmann::json& cell) -> ObjId {
    auto spec = make_cell_spec(cell);
    return document().transact([&](Transaction& tx) {
        return ydoc_cpp::create_cell(tx, cells_, index, spec);
    });
}

auto NotebookDoc::get() const -> nlohmann::json {
    const auto& doc = document();
    auto meta = export_json(doc, meta_);
    auto count = doc.length(cells_);
    auto views = std::vector<json>(count);

    auto read_one = [&](std::size_t i) {
        if (auto obj = doc.get_obj_id(cells_, i)) views[i] = read_cell(doc, *obj);
    };
    if (count >= parallel_read_threshold) {
        detail::parallel_for(count, read_one);
    } else {
        for (std::size_t i = 0; i < count; ++i) read_one(i);
    }
    return assemble_notebook(std::move(meta), std::move(views));
}

void NotebookDoc::set(const nlohmann::json& notebook) {
    reconcile_cells(document(), cells_, meta_, notebook);
}

auto NotebookDoc::aget(RunLoop& loop) const -> std::future<nlohmann::json> {
    auto job = std::make_shared<NotebookRead>(shared_document(), meta_, cells_);
    return run_async(loop, std::move(job), [](NotebookRead& read) { return read.take(); });
}

auto NotebookDoc::aset(RunLoop& loop, nlohmann::json notebook, std::stop_token stop)
    -> std::future<void> {
    auto job = std::make_shared<CellReconciliation>(shared_document(), cells_, meta_,
                                                    std::move(notebook));
    return run_async(loop, std::move(job), std::move(stop));
}

auto NotebookDoc::topics() const -> std::vector<Topic> {
    return {
        Topic{.name = "meta", .obj = meta_, .deep = true},
        Topic{.name = "cells", .obj = cells_, .deep = true},
    };
}

}  // namespace ydoc_cpp
