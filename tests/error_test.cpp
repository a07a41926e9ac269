#include <ydoc-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace ydoc_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_obj_id),      "invalid_obj_id");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation),   "invalid_operation");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_cell),        "invalid_cell");
    EXPECT_EQ(to_string_view(ErrorKind::integrity_violation), "integrity_violation");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_opcode),      "unknown_opcode");
    EXPECT_EQ(to_string_view(ErrorKind::cancelled),           "cancelled");
}

TEST(Error, equality_compares_kind_and_message) {
    const auto a = Error{ErrorKind::invalid_cell, "no source"};
    EXPECT_EQ(a, (Error{ErrorKind::invalid_cell, "no source"}));
    EXPECT_NE(a, (Error{ErrorKind::invalid_operation, "no source"}));
    EXPECT_NE(a, (Error{ErrorKind::invalid_cell, "no cell_type"}));
}

TEST(Error, what_returns_the_message) {
    const auto e = Error{ErrorKind::cancelled, "stopped between steps"};
    EXPECT_EQ(e.kind, ErrorKind::cancelled);
    EXPECT_EQ(std::string{e.what()}, "stopped between steps");
}

TEST(Error, catchable_as_runtime_error) {
    try {
        throw Error{ErrorKind::unknown_opcode, "bad tag"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "bad tag");
        return;
    }
    FAIL() << "Error did not derive from std::runtime_error";
}
