#include <ydoc-cpp/diagnostics.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdio>
#include <mutex>
#include <utility>

namespace ydoc_cpp {

namespace {

auto handler_mutex() -> std::mutex& {
    static auto mutex = std::mutex{};
    return mutex;
}

auto installed_handler() -> WarningHandler& {
    static auto handler = WarningHandler{};
    return handler;
}

}  // namespace

auto format_warning(const Warning& warning) -> std::string {
    auto line = fmt::format("ydoc-cpp warning [{}]: {}", to_string_view(warning.kind),
                            warning.message);
    if (warning.cell_index) {
        line += fmt::format(" (cell {})", *warning.cell_index);
    }
    if (!warning.old_id.empty() || !warning.new_id.empty()) {
        line += fmt::format(" id {} -> {}", warning.old_id, warning.new_id);
    }
    if (!warning.differing_fields.empty()) {
        line += fmt::format("; differing fields: {}",
                            fmt::join(warning.differing_fields, ", "));
    }
    return line;
}

auto set_warning_handler(WarningHandler handler) -> WarningHandler {
    auto lock = std::scoped_lock{handler_mutex()};
    return std::exchange(installed_handler(), std::move(handler));
}

void warn(const Warning& warning) {
    auto handler = WarningHandler{};
    {
        auto lock = std::scoped_lock{handler_mutex()};
        handler = installed_handler();
    }
    if (handler) {
        handler(warning);
        return;
    }
    fmt::print(stderr, "{}\n", format_warning(warning));
}

}  // namespace ydoc_cpp
