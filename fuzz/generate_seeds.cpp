// Helper to generate seed corpus files for the fuzz targets.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <ydoc-cpp/ydoc.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto text_dir = std::string{"fuzz/corpus/text"};
    const auto notebook_dir = std::string{"fuzz/corpus/notebook"};
    fs::create_directories(text_dir);
    fs::create_directories(notebook_dir);

    // Text seeds: current, NUL, desired
    write_seed(text_dir + "/seed_insert.txt", std::string{"hello world"} + '\0' + "hello brave world");
    write_seed(text_dir + "/seed_replace.txt", std::string{"abcd"} + '\0' + "wxyz");
    write_seed(text_dir + "/seed_emoji.txt",
               std::string{"hi \xF0\x9F\x91\x8B\xF0\x9F\x8F\xBB"} + '\0' + "hi \xF0\x9F\x91\x8B\xF0\x9F\x8F\xBF");
    write_seed(text_dir + "/seed_combining.txt", std::string{"cafe\xCC\x81"} + '\0' + "cafe");

    // Notebook seeds: snapshots read back from a live notebook
    {
        auto nb = ydoc_cpp::NotebookDoc{};
        nb.set(nlohmann::json{{"cells", nlohmann::json::array()}});
        write_seed(notebook_dir + "/seed_empty.json", nb.get().dump());
    }
    {
        auto nb = ydoc_cpp::NotebookDoc{};
        nb.set(nlohmann::json::parse(R"({"cells": [
            {"id": "a", "cell_type": "code", "source": "x = 1"},
            {"id": "c", "cell_type": "code", "source": "print(x)",
             "outputs": [{"output_type": "stream", "name": "stdout", "text": ["1\n"]}]},
            {"id": "b", "cell_type": "raw", "source": "", "attachments": {}}
        ], "nbformat": 4, "nbformat_minor": 4})"));
        write_seed(notebook_dir + "/seed_cells.json", nb.get().dump());
    }
    write_seed(notebook_dir + "/seed_duplicate_ids.json",
               R"({"cells": [{"id": "a", "cell_type": "code", "source": "1"},)"
               R"({"id": "a", "cell_type": "code", "source": "2"}]})");
    return 0;
}
