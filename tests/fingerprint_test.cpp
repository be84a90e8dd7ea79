#include <topbase-cpp/fingerprint.hpp>
#include <topbase-cpp/memory_repository.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace topbase_cpp;
using topbase_cpp::test::HistoryBuilder;
using topbase_cpp::test::numbered_lines;

TEST(Fingerprint, same_change_on_different_parents_matches) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    h.write("main", "a.txt", numbered_lines(20));
    h.branch("side", "main");

    // Shift the file on one side, then make the same edit on both
    h.write("side", "a.txt", "preamble\n" + numbered_lines(20));
    auto main_edit = numbered_lines(20);
    main_edit.replace(main_edit.find("line 15\n"), 8, "fifteen\n");
    auto side_edit = "preamble\n" + main_edit;

    const auto a = h.write("main", "a.txt", main_edit, "edit line 15");
    const auto b = h.write("side", "a.txt", side_edit, "edit line 15");
    ASSERT_NE(a, b);

    EXPECT_EQ(fingerprint(repo, repo.require_commit(a)),
              fingerprint(repo, repo.require_commit(b)));
}

TEST(Fingerprint, different_changes_differ) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto a = h.write("main", "a.txt", "one\n");
    const auto b = h.write("main", "a.txt", "two\n");

    EXPECT_NE(fingerprint(repo, repo.require_commit(a)),
              fingerprint(repo, repo.require_commit(b)));
}

TEST(Fingerprint, ignores_metadata) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    h.write("main", "base.txt", "base\n");
    h.branch("side", "main");
    const auto a = h.write("main", "a.txt", "x\n", "one message");
    const auto b = h.write("side", "a.txt", "x\n", "another message");

    EXPECT_EQ(fingerprint(repo, repo.require_commit(a)),
              fingerprint(repo, repo.require_commit(b)));
}

TEST(Fingerprint, path_is_part_of_the_identity) {
    const auto a = diff_trees(Tree{}, Tree{{"a.txt", FileEntry{.mode = FileMode::regular, .content = "x\n"}}});
    const auto b = diff_trees(Tree{}, Tree{{"b.txt", FileEntry{.mode = FileMode::regular, .content = "x\n"}}});
    EXPECT_NE(fingerprint(a), fingerprint(b));
}

TEST(Fingerprint, mode_change_is_part_of_the_identity) {
    const auto before = Tree{{"s", FileEntry{.mode = FileMode::regular, .content = "x\n"}}};
    const auto after = Tree{{"s", FileEntry{.mode = FileMode::executable, .content = "x\n"}}};
    EXPECT_NE(fingerprint(diff_trees(before, after)), fingerprint(TreeDiff{}));
}

TEST(Fingerprint, merge_commits_have_none) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    h.write("main", "a.txt", "a\n");
    h.branch("side", "main");
    h.write("side", "b.txt", "b\n");
    const auto merge = h.merge("main", "side", h.tree_of("side"));

    EXPECT_FALSE(fingerprint(repo, repo.require_commit(merge)).has_value());
}

TEST(FingerprintCache, computes_each_commit_once) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto a = h.write("main", "a.txt", "a\n");
    const auto b = h.write("main", "a.txt", "b\n");

    auto cache = FingerprintCache{repo};
    const auto first = cache.get(repo.require_commit(b));
    const auto again = cache.get(repo.require_commit(b));
    cache.get(repo.require_commit(a));

    EXPECT_EQ(first, again);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(first, fingerprint(repo, repo.require_commit(b)));
}
