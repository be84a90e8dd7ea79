#include <topbase-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace topbase_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::dirty_working_tree),     "dirty_working_tree");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_branch),         "unknown_branch");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_commit),         "unknown_commit");
    EXPECT_EQ(to_string_view(ErrorKind::conflict_during_replay), "conflict_during_replay");
    EXPECT_EQ(to_string_view(ErrorKind::ambiguous_fork_point),   "ambiguous_fork_point");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_options),        "invalid_options");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_repository),     "invalid_repository");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::unknown_branch, "no such branch"};
    const auto e2 = Error{ErrorKind::unknown_branch, "no such branch"};
    const auto e3 = Error{ErrorKind::unknown_commit, "no such branch"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, context_fields_take_part_in_equality) {
    auto e1 = Error{ErrorKind::conflict_during_replay, "hunk does not apply"};
    auto e2 = e1;
    e2.path = "src/main.cpp";

    EXPECT_NE(e1, e2);
    e1.path = "src/main.cpp";
    EXPECT_EQ(e1, e2);
}

TEST(ReconcileError, what_includes_kind_and_context) {
    auto err = Error{ErrorKind::conflict_during_replay, "could not apply"};
    err.branch = "main";
    err.path = "a.txt";
    const auto ex = ReconcileError{err};

    const auto what = std::string{ex.what()};
    EXPECT_NE(what.find("conflict_during_replay"), std::string::npos);
    EXPECT_NE(what.find("could not apply"), std::string::npos);
    EXPECT_NE(what.find("main"), std::string::npos);
    EXPECT_NE(what.find("a.txt"), std::string::npos);
    EXPECT_EQ(ex.kind(), ErrorKind::conflict_during_replay);
    EXPECT_EQ(ex.error(), err);
}

TEST(ReconcileError, is_a_runtime_error) {
    try {
        throw ReconcileError{Error{ErrorKind::unknown_branch, "gone"}};
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("gone"), std::string::npos);
    }
}
