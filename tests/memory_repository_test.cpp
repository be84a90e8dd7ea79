#include <topbase-cpp/error.hpp>
#include <topbase-cpp/memory_repository.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace topbase_cpp;
using topbase_cpp::test::HistoryBuilder;
using topbase_cpp::test::meta;

TEST(MemoryRepository, commit_on_advances_the_branch) {
    auto repo = MemoryRepository{};
    const auto tree = Tree{{"a.txt", FileEntry{.mode = FileMode::regular, .content = "a\n"}}};

    const auto root = repo.commit_on("main", tree, meta("root"));
    EXPECT_EQ(repo.resolve_branch("main"), root);
    EXPECT_TRUE(repo.require_commit(root).is_root());

    const auto child = repo.commit_on("main", tree, meta("child"));
    EXPECT_EQ(repo.resolve_branch("main"), child);
    EXPECT_EQ(repo.require_commit(child).parents, std::vector<CommitId>{root});
    EXPECT_EQ(repo.commit_count(), 2u);
}

TEST(MemoryRepository, create_commit_is_content_addressed) {
    auto repo = MemoryRepository{};
    const auto a = repo.create_commit({}, Tree{}, meta("same"));
    const auto b = repo.create_commit({}, Tree{}, meta("same"));

    EXPECT_EQ(a, b);
    EXPECT_EQ(repo.commit_count(), 1u);
    EXPECT_EQ(a, compute_commit_id({}, Tree{}, meta("same")));
}

TEST(MemoryRepository, create_commit_requires_known_parents) {
    auto repo = MemoryRepository{};
    std::uint8_t raw[32] = {9};
    try {
        repo.create_commit({CommitId{raw}}, Tree{}, meta("orphan"));
        FAIL() << "expected ReconcileError";
    } catch (const ReconcileError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::unknown_commit);
        EXPECT_EQ(e.error().commit, CommitId{raw});
    }
}

TEST(MemoryRepository, unknown_branch_resolves_to_nullopt) {
    auto repo = MemoryRepository{};
    EXPECT_FALSE(repo.resolve_branch("nope").has_value());
    EXPECT_THROW(repo.tip_of("nope"), ReconcileError);
}

TEST(MemoryRepository, move_ref_rejects_missing_commits) {
    auto repo = MemoryRepository{};
    std::uint8_t raw[32] = {1};
    EXPECT_THROW(repo.move_ref("main", CommitId{raw}), ReconcileError);
    EXPECT_TRUE(repo.branches().empty());
}

TEST(MemoryRepository, delete_branch_keeps_commits) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    h.write("main", "a.txt", "a\n");

    EXPECT_TRUE(repo.delete_branch("main"));
    EXPECT_FALSE(repo.delete_branch("main"));
    EXPECT_EQ(repo.commit_count(), 1u);
}

TEST(MemoryRepository, list_commits_follows_first_parents) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto a = h.write("main", "a.txt", "a\n");
    h.branch("side", "main");
    const auto s = h.write("side", "s.txt", "s\n");
    const auto b = h.write("main", "b.txt", "b\n");
    const auto m = h.merge("main", "side", h.tree_of("main"));

    const auto history = repo.list_commits(m);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, m);
    EXPECT_EQ(history[1].id, b);
    EXPECT_EQ(history[2].id, a);

    EXPECT_TRUE(repo.is_merge(m));
    EXPECT_TRUE(repo.ancestors(m).contains(s));
    EXPECT_FALSE(repo.ancestors(b).contains(s));
}

TEST(MemoryRepository, diff_of_root_is_against_the_empty_tree) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto root = h.write("main", "a.txt", "a\n");

    const auto diff = repo.diff(repo.require_commit(root));
    ASSERT_EQ(diff.size(), 1u);
    EXPECT_EQ(diff[0].kind, DeltaKind::added);
}

TEST(MemoryRepository, clean_flag) {
    auto repo = MemoryRepository{};
    EXPECT_TRUE(repo.is_clean());
    repo.set_clean(false);
    EXPECT_FALSE(repo.is_clean());
}
