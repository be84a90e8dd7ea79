#include <topbase-cpp/commit.hpp>
#include <topbase-cpp/types.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace topbase_cpp;

// -- CommitId -----------------------------------------------------------------

TEST(CommitId, default_constructed_is_all_zeros) {
    const auto id = CommitId{};
    EXPECT_TRUE(id.is_zero());
}

TEST(CommitId, constructed_from_raw_bytes) {
    std::uint8_t raw[32] = {};
    raw[0] = 0xab;
    raw[31] = 0x01;
    const auto id = CommitId{raw};

    EXPECT_FALSE(id.is_zero());
    EXPECT_EQ(id.bytes[0], std::byte{0xab});
    EXPECT_EQ(id.bytes[31], std::byte{0x01});
}

TEST(CommitId, ordering_is_lexicographic_on_bytes) {
    std::uint8_t low[32] = {};
    std::uint8_t high[32] = {};
    low[31] = 1;
    high[31] = 2;

    EXPECT_LT(CommitId{low}, CommitId{high});
    EXPECT_GT(CommitId{high}, CommitId{low});
}

TEST(CommitId, hex_round_trip) {
    std::uint8_t raw[32] = {};
    for (int i = 0; i < 32; ++i) raw[i] = static_cast<std::uint8_t>(i * 7);
    const auto id = CommitId{raw};

    const auto hex = to_hex(id);
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 4), "0007");

    auto parsed = commit_id_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST(CommitId, short_hex_is_twelve_characters) {
    std::uint8_t raw[32] = {0xde, 0xad, 0xbe, 0xef, 0x01, 0x23, 0x45};
    EXPECT_EQ(short_hex(CommitId{raw}), "deadbeef0123");
}

TEST(CommitId, from_hex_rejects_bad_input) {
    EXPECT_FALSE(commit_id_from_hex("abc").has_value());
    EXPECT_FALSE(commit_id_from_hex(std::string(64, 'g')).has_value());
    EXPECT_TRUE(commit_id_from_hex(std::string(64, 'F')).has_value());
}

TEST(CommitId, hashable_in_unordered_set) {
    std::uint8_t raw[32] = {1};
    auto set = std::unordered_set<CommitId>{};
    set.insert(CommitId{});
    set.insert(CommitId{raw});
    set.insert(CommitId{raw});
    EXPECT_EQ(set.size(), 2u);
}

// -- Commit identity ----------------------------------------------------------

namespace {

auto sample_meta() -> CommitMetadata {
    return CommitMetadata{
        .author = Signature{.name = "Alice", .email = "alice@example.com", .time = 100},
        .committer = Signature{.name = "Alice", .email = "alice@example.com", .time = 100},
        .message = "initial",
    };
}

}  // namespace

TEST(CommitIdentity, same_content_same_id) {
    const auto tree = Tree{{"a.txt", FileEntry{.mode = FileMode::regular, .content = "hi\n"}}};
    EXPECT_EQ(compute_commit_id({}, tree, sample_meta()),
              compute_commit_id({}, tree, sample_meta()));
}

TEST(CommitIdentity, any_field_changes_the_id) {
    const auto tree = Tree{{"a.txt", FileEntry{.mode = FileMode::regular, .content = "hi\n"}}};
    const auto base = compute_commit_id({}, tree, sample_meta());

    auto other_tree = tree;
    other_tree["a.txt"].mode = FileMode::executable;
    EXPECT_NE(compute_commit_id({}, other_tree, sample_meta()), base);

    auto other_meta = sample_meta();
    other_meta.committer.time = 101;
    EXPECT_NE(compute_commit_id({}, tree, other_meta), base);

    const auto parent = base;
    EXPECT_NE(compute_commit_id({parent}, tree, sample_meta()), base);
}

TEST(CommitIdentity, path_and_content_boundaries_are_unambiguous) {
    const auto a = Tree{{"ab", FileEntry{.mode = FileMode::regular, .content = "c"}}};
    const auto b = Tree{{"a", FileEntry{.mode = FileMode::regular, .content = "bc"}}};
    EXPECT_NE(compute_tree_id(a), compute_tree_id(b));
}

TEST(FileMode, to_string_uses_octal_git_modes) {
    EXPECT_EQ(to_string(FileMode::regular), "100644");
    EXPECT_EQ(to_string(FileMode::executable), "100755");
    EXPECT_EQ(to_string(FileMode::symlink), "120000");
}

TEST(Commit, root_and_merge_predicates) {
    auto commit = Commit{};
    EXPECT_TRUE(commit.is_root());
    EXPECT_FALSE(commit.is_merge());

    commit.parents = {CommitId{}, CommitId{}};
    EXPECT_FALSE(commit.is_root());
    EXPECT_TRUE(commit.is_merge());
}
