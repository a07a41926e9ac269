// text_editor: reconciling a shared text with whole-buffer saves
//
// Demonstrates: UnicodeDoc, observe, the plan computed for a save,
//               grapheme-safe replacement, the state topic

#include <ydoc-cpp/ydoc.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace yd = ydoc_cpp;

namespace {

auto mode_name(yd::TextEditMode mode) -> const char* {
    switch (mode) {
        case yd::TextEditMode::unchanged: return "unchanged";
        case yd::TextEditMode::granular:  return "granular";
        case yd::TextEditMode::replace:   return "replace";
    }
    return "?";
}

void show_plan(std::string_view before, std::string_view after) {
    auto plan = yd::plan_text_edits(before, after);
    std::printf("  plan: %s (ratio %.2f), %zu opcode(s)\n", mode_name(plan.mode), plan.ratio,
                plan.opcodes.size());
}

}  // namespace

int main() {
    auto editor = yd::UnicodeDoc{};
    editor.observe([](std::string_view topic, const std::vector<yd::Event>& events) {
        for (const auto& event : events) {
            std::printf("  [%.*s] %s\n", static_cast<int>(topic.size()), topic.data(),
                        nlohmann::json(event).dump().c_str());
        }
    });

    // A save of the whole buffer becomes a small delta
    std::printf("Initial save:\n");
    editor.set("The quick fox jumps over the dog.\n");

    std::printf("\nSecond save:\n");
    show_plan(editor.get(), "The quick brown fox jumps over the lazy dog.\n");
    editor.set("The quick brown fox jumps over the lazy dog.\n");

    // Unrelated content replaces the buffer wholesale
    std::printf("\nUnrelated save:\n");
    show_plan(editor.get(), "Lorem ipsum\n");
    editor.set("Lorem ipsum\n");

    // Changing a skin-tone modifier never splits the emoji
    std::printf("\nEmoji save:\n");
    editor.set("wave \xF0\x9F\x91\x8B\xF0\x9F\x8F\xBB");
    show_plan(editor.get(), "wave \xF0\x9F\x91\x8B\xF0\x9F\x8F\xBF");
    editor.set("wave \xF0\x9F\x91\x8B\xF0\x9F\x8F\xBF");

    // Host bookkeeping travels on its own topic
    std::printf("\nState:\n");
    editor.set_path("notes/readme.txt");
    editor.set_dirty(false);

    // A second view over the same tree sees the content
    auto viewer = yd::UnicodeDoc{editor.shared_document()};
    std::printf("\nViewer reads: \"%s\" (path %s)\n", viewer.get().c_str(),
                viewer.path().value_or("?").c_str());
    return 0;
}
