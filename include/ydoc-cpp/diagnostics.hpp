/// @file diagnostics.hpp
/// @brief Non-fatal warnings raised while reading or reconciling documents.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ydoc_cpp {

/// Categories of non-fatal warnings.
enum class WarningKind : std::uint8_t {
    duplicate_cell_id,          ///< A live cell reused the id of an earlier cell.
    duplicate_desired_cell_id,  ///< A snapshot passed to set() reused a cell id.
};

/// Convert a WarningKind to its string representation.
constexpr auto to_string_view(WarningKind kind) noexcept -> std::string_view {
    switch (kind) {
        case WarningKind::duplicate_cell_id:         return "duplicate_cell_id";
        case WarningKind::duplicate_desired_cell_id: return "duplicate_desired_cell_id";
    }
    return "unknown";
}

/// A structured warning.
struct Warning {
    WarningKind kind{WarningKind::duplicate_cell_id};
    std::string message;
    std::optional<std::size_t> cell_index;  ///< Index of the offending cell, if any.
    std::string old_id;                     ///< The duplicated identity.
    std::string new_id;                     ///< The identity assigned instead.
    std::vector<std::string> differing_fields;  ///< Fields in which the duplicates differ.
};

/// Receives every warning raised in the process.
using WarningHandler = std::function<void(const Warning&)>;

/// Install a process-wide warning handler.
///
/// Passing an empty handler restores the default, which writes one line per
/// warning to stderr.
/// @return The previously installed handler (empty if it was the default).
auto set_warning_handler(WarningHandler handler) -> WarningHandler;

/// Deliver a warning to the installed handler.
void warn(const Warning& warning);

/// Render a warning as a single line.
auto format_warning(const Warning& warning) -> std::string;

}  // namespace ydoc_cpp
