// Fuzz target for NotebookDoc::set(): any JSON input is applied to a notebook
// that already holds a few cells. Malformed snapshots must be rejected with
// an Error and leave the notebook readable; accepted ones must read back
// with the same number of cells.

#include <ydoc-cpp/ydoc.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

namespace {

auto initial_notebook() -> nlohmann::json {
    return nlohmann::json::parse(R"({
        "cells": [
            {"id": "a", "cell_type": "code", "source": "x = 1", "outputs": [], "metadata": {}},
            {"id": "b", "cell_type": "markdown", "source": ["# T\n", "text"], "metadata": {}},
            {"id": "c", "cell_type": "code", "source": "print(x)",
             "outputs": [{"output_type": "stream", "name": "stdout", "text": "1\n"}]}
        ]
    })");
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto snapshot = nlohmann::json::parse(data, data + size, nullptr, false);
    if (snapshot.is_discarded()) return 0;

    ydoc_cpp::set_warning_handler([](const ydoc_cpp::Warning&) {});
    auto nb = ydoc_cpp::NotebookDoc{};
    nb.set(initial_notebook());

    try {
        nb.set(snapshot);
    } catch (const ydoc_cpp::Error&) {
        (void)nb.get();
        return 0;
    }

    const auto cells = snapshot.find("cells");
    const auto expected = cells == snapshot.end() || cells->is_null() || cells->empty()
                              ? std::size_t{1}
                              : cells->size();
    if (nb.get()["cells"].size() != expected) std::abort();
    return 0;
}
