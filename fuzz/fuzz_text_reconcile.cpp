// Fuzz target for the text reconciler: the input is split at the first NUL
// into a current and a desired string. After reconciliation the text must
// read exactly as desired, whether the edit was granular or a replacement.

#include <ydoc-cpp/ydoc.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    const auto current = std::string{input.substr(0, split)};
    const auto desired = split == std::string_view::npos ? std::string{}
                                                         : std::string{input.substr(split + 1)};

    auto doc = ydoc_cpp::UnicodeDoc{};
    doc.set(current);
    doc.set(desired);

    // Ill-formed UTF-8 is read as U+FFFD, so compare against a clean write
    auto reference = ydoc_cpp::UnicodeDoc{};
    reference.set(desired);
    if (doc.get() != reference.get()) std::abort();

    return 0;
}
