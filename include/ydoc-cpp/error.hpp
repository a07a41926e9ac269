/// @file error.hpp
/// @brief Error types for the ydoc-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ydoc_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_obj_id,       ///< An ObjId does not refer to a known object of the right type.
    invalid_operation,    ///< An operation is invalid in the current context.
    invalid_cell,         ///< A cell snapshot lacks a field every cell must carry.
    integrity_violation,  ///< A freshly generated identity collided with an existing one.
    unknown_opcode,       ///< A text edit carried a tag outside {equal, replace, delete, insert}.
    cancelled,            ///< An asynchronous job was stopped between steps.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_obj_id:      return "invalid_obj_id";
        case ErrorKind::invalid_operation:   return "invalid_operation";
        case ErrorKind::invalid_cell:        return "invalid_cell";
        case ErrorKind::integrity_violation: return "integrity_violation";
        case ErrorKind::unknown_opcode:      return "unknown_opcode";
        case ErrorKind::cancelled:           return "cancelled";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
///
/// Thrown by the shared tree and the reconcilers; `what()` returns the
/// message.
struct Error : std::runtime_error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : std::runtime_error{msg}, kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool {
        return kind == other.kind && message == other.message;
    }
};

}  // namespace ydoc_cpp
