// cooperative_set_demo: keeping a host loop responsive during a large save
//
// Demonstrates: RunLoop, NotebookDoc::aset, heartbeat tasks interleaved with
//               reconciliation steps, cancellation through std::stop_source
//
// Build: cmake --build build -DCMAKE_BUILD_TYPE=Release
// Run:   ./build/cooperative_set_demo

#include <ydoc-cpp/ydoc.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace yd = ydoc_cpp;
using json = nlohmann::json;

struct Timer {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    auto ms() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }
};

namespace {

auto make_notebook(int cell_count, const std::string& suffix) -> json {
    auto cells = json::array();
    for (int i = 0; i < cell_count; ++i) {
        cells.push_back(json{{"id", "cell-" + std::to_string(i)}, {"cell_type", "code"},
                             {"source", "value_" + std::to_string(i) + " = " + suffix + "\n"},
                             {"metadata", json::object()}, {"outputs", json::array()},
                             {"execution_count", nullptr}});
    }
    return json{{"cells", cells}};
}

// Re-posts itself until `remaining` reaches zero, counting its own runs
void heartbeat(yd::RunLoop& loop, std::shared_ptr<int> beats, int remaining) {
    if (remaining == 0) return;
    loop.post([&loop, beats, remaining] {
        ++*beats;
        heartbeat(loop, beats, remaining - 1);
    });
}

}  // namespace

int main() {
    constexpr int cell_count = 5000;

    // =========================================================================
    // 1. Blocking set
    // =========================================================================
    std::printf("=== Blocking set of %d cells ===\n", cell_count);
    {
        auto nb = yd::NotebookDoc{};
        auto t = Timer{};
        nb.set(make_notebook(cell_count, "1"));
        std::printf("  set took %.1f ms, nothing else could run meanwhile\n", t.ms());
    }

    // =========================================================================
    // 2. Cooperative set: the loop keeps serving other tasks
    // =========================================================================
    std::printf("\n=== Cooperative set of %d cells ===\n", cell_count);
    {
        auto nb = yd::NotebookDoc{};
        auto loop = yd::RunLoop{};
        auto beats = std::make_shared<int>(0);

        auto t = Timer{};
        auto done = nb.aset(loop, make_notebook(cell_count, "1"));
        heartbeat(loop, beats, 1000);
        loop.run_until_idle();
        done.get();

        std::printf("  aset took %.1f ms over %zu tasks\n", t.ms(), loop.tasks_run());
        std::printf("  heartbeats served meanwhile: %d\n", *beats);
        std::printf("  longest single task: %.3f ms\n",
                    std::chrono::duration<double, std::milli>(loop.longest_task()).count());

        // A second save only patches what changed
        auto events = std::make_shared<std::size_t>(0);
        nb.observe([events](std::string_view, const std::vector<yd::Event>& batch) {
            *events += batch.size();
        });
        auto edited = nb.get();
        edited["cells"][42]["source"] = "value_42 = 'edited'\n";
        auto again = nb.aset(loop, edited);
        loop.run_until_idle();
        again.get();
        std::printf("  edit of one cell produced %zu event(s)\n", *events);
    }

    // =========================================================================
    // 3. Cancel halfway: work applied so far stays committed
    // =========================================================================
    std::printf("\n=== Cancelled set ===\n");
    {
        auto nb = yd::NotebookDoc{};
        auto loop = yd::RunLoop{};
        auto stop = std::stop_source{};
        auto done = nb.aset(loop, make_notebook(cell_count, "2"), stop.get_token());
        for (int i = 0; i < cell_count * 3; ++i) loop.run_one();
        stop.request_stop();
        loop.run_until_idle();
        try {
            done.get();
        } catch (const yd::Error& e) {
            std::printf("  stopped: %s\n", e.what());
        }
        std::printf("  cells present after the stop: %zu\n", nb.cell_number());
    }
    return 0;
}
