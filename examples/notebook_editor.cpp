// notebook_editor: saving a notebook without disturbing its live cells
//
// Demonstrates: NotebookDoc set/get, per-topic change events, cell handles
//               surviving a save, stdin outputs, duplicate id warnings

#include <ydoc-cpp/ydoc.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace yd = ydoc_cpp;
using json = nlohmann::json;

namespace {

auto code_cell(std::string id, std::string source) -> json {
    return json{{"id", std::move(id)}, {"cell_type", "code"}, {"source", std::move(source)},
                {"metadata", json::object()}, {"outputs", json::array()},
                {"execution_count", nullptr}};
}

}  // namespace

int main() {
    auto nb = yd::NotebookDoc{};
    nb.observe([](std::string_view topic, const std::vector<yd::Event>& events) {
        std::printf("  [%.*s] %zu event(s)\n", static_cast<int>(topic.size()), topic.data(),
                    events.size());
        for (const auto& event : events) {
            std::printf("    %s\n", json(event).dump().c_str());
        }
    });
    yd::set_warning_handler([](const yd::Warning& warning) {
        std::printf("  warning: %s\n", yd::format_warning(warning).c_str());
    });

    // =========================================================================
    // 1. Load a notebook
    // =========================================================================
    std::printf("=== Load ===\n");
    auto notebook = json{
        {"cells", json::array({
            code_cell("imports", "import math\n"),
            code_cell("compute", "x = math.pi\n"),
            json{{"id", "notes"}, {"cell_type", "markdown"}, {"source", json::array({"# Notes\n", "pi"})}},
        })},
        {"metadata", {{"kernelspec", {{"name", "python3"}, {"display_name", "Python 3"}}}}},
        {"nbformat", 4},
        {"nbformat_minor", 5},
    };
    nb.set(notebook);
    std::printf("cells: %zu\n", nb.cell_number());

    // Hold the source of the second cell the way a collaborating editor would
    auto& doc = nb.document();
    auto compute = *doc.get_obj_id(nb.cells(), std::size_t{1});
    auto compute_source = *doc.get_obj_id(compute, "source");

    // =========================================================================
    // 2. Save an edited copy: only the changed characters are broadcast
    // =========================================================================
    std::printf("\n=== Save with one edit ===\n");
    notebook["cells"][1]["source"] = "x = math.pi * 2\n";
    notebook["cells"][1]["execution_count"] = 3;
    nb.set(notebook);
    std::printf("held source now reads: \"%s\"\n", doc.text(compute_source).c_str());

    // =========================================================================
    // 3. Reorder and insert
    // =========================================================================
    std::printf("\n=== Insert a cell ===\n");
    auto cells = notebook["cells"];
    notebook["cells"] = json::array({cells[0], code_cell("plot", "print(x)\n"), cells[1], cells[2]});
    nb.set(notebook);
    std::printf("held source still reads: \"%s\"\n", doc.text(compute_source).c_str());

    // =========================================================================
    // 4. A kernel asks for input
    // =========================================================================
    std::printf("\n=== stdin ===\n");
    auto plot = *doc.get_obj_id(nb.cells(), std::size_t{1});
    auto outputs = *doc.get_obj_id(plot, "outputs");
    doc.transact([&](yd::Transaction& tx) {
        yd::add_stdin_output(tx, outputs, "name: ");
    });
    std::printf("%s\n", nb.get_cell(1).dump(2).c_str());

    // =========================================================================
    // 5. A duplicated id is repaired when reading
    // =========================================================================
    std::printf("\n=== Duplicate id ===\n");
    nb.append_cell(code_cell("imports", "import os\n"));
    auto snapshot = nb.get();
    std::printf("last cell reads with id %s\n",
                snapshot["cells"].back()["id"].get<std::string>().c_str());

    yd::set_warning_handler({});
    return 0;
}
