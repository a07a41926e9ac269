// ydoc-cpp benchmarks: measures the cost of reconciling whole-content saves.

#include <ydoc-cpp/ydoc.hpp>

#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

using namespace ydoc_cpp;
using json = nlohmann::json;

static auto make_text(std::size_t lines, const std::string& marker) -> std::string {
    auto text = std::string{};
    for (std::size_t i = 0; i < lines; ++i) {
        text += "line " + std::to_string(i) + (i % 50 == 0 ? marker : std::string{}) + "\n";
    }
    return text;
}

static auto make_notebook(std::size_t cells, const std::string& suffix) -> json {
    auto list = json::array();
    for (std::size_t i = 0; i < cells; ++i) {
        list.push_back(json{{"id", "cell-" + std::to_string(i)}, {"cell_type", "code"},
                            {"source", "x_" + std::to_string(i) + " = " + suffix + "\n"},
                            {"metadata", json::object()}, {"outputs", json::array()},
                            {"execution_count", nullptr}});
    }
    return json{{"cells", list}};
}

// =============================================================================
// Text diff
// =============================================================================

static void bm_sequence_ratio(benchmark::State& state) {
    const auto lines = static_cast<std::size_t>(state.range(0));
    const auto a = decode_utf8(make_text(lines, ""));
    const auto b = decode_utf8(make_text(lines, " edited"));
    for (auto _ : state) {
        auto matcher = SequenceMatcher{a, b};
        benchmark::DoNotOptimize(matcher.ratio());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * lines));
}
BENCHMARK(bm_sequence_ratio)->Range(8, 512);

static void bm_plan_text_edits(benchmark::State& state) {
    const auto lines = static_cast<std::size_t>(state.range(0));
    const auto current = make_text(lines, "");
    const auto desired = make_text(lines, " edited");
    for (auto _ : state) {
        benchmark::DoNotOptimize(plan_text_edits(current, desired));
    }
}
BENCHMARK(bm_plan_text_edits)->Range(8, 512);

// =============================================================================
// Document saves
// =============================================================================

static void bm_unicode_doc_set(benchmark::State& state) {
    const auto lines = static_cast<std::size_t>(state.range(0));
    const auto first = make_text(lines, "");
    const auto second = make_text(lines, " edited");
    auto doc = UnicodeDoc{};
    auto flip = false;
    for (auto _ : state) {
        doc.set(flip ? first : second);
        flip = !flip;
    }
}
BENCHMARK(bm_unicode_doc_set)->Range(8, 512);

static void bm_notebook_set_unchanged(benchmark::State& state) {
    const auto cells = static_cast<std::size_t>(state.range(0));
    auto nb = NotebookDoc{};
    const auto notebook = make_notebook(cells, "1");
    nb.set(notebook);
    for (auto _ : state) {
        nb.set(notebook);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * cells));
}
BENCHMARK(bm_notebook_set_unchanged)->Range(8, 2048);

static void bm_notebook_set_edited(benchmark::State& state) {
    const auto cells = static_cast<std::size_t>(state.range(0));
    auto nb = NotebookDoc{};
    const auto first = make_notebook(cells, "1");
    const auto second = make_notebook(cells, "2");
    auto flip = false;
    for (auto _ : state) {
        nb.set(flip ? first : second);
        flip = !flip;
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * cells));
}
BENCHMARK(bm_notebook_set_edited)->Range(8, 2048);

static void bm_notebook_get(benchmark::State& state) {
    const auto cells = static_cast<std::size_t>(state.range(0));
    auto nb = NotebookDoc{};
    nb.set(make_notebook(cells, "1"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(nb.get());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * cells));
}
BENCHMARK(bm_notebook_get)->Range(8, 2048);

static void bm_notebook_aset(benchmark::State& state) {
    const auto cells = static_cast<std::size_t>(state.range(0));
    auto nb = NotebookDoc{};
    const auto first = make_notebook(cells, "1");
    const auto second = make_notebook(cells, "2");
    auto loop = RunLoop{};
    auto flip = false;
    for (auto _ : state) {
        auto done = nb.aset(loop, flip ? first : second);
        loop.run_until_idle();
        done.get();
        flip = !flip;
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * cells));
}
BENCHMARK(bm_notebook_aset)->Range(8, 2048);
