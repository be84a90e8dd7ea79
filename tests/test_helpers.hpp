#pragma once

// Shared fixtures for building small histories in a MemoryRepository.

#include <topbase-cpp/memory_repository.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace topbase_cpp::test {

inline auto sig(std::string name, std::int64_t time) -> Signature {
    return Signature{.name = name, .email = name + "@example.com", .time = time};
}

inline auto meta(std::string message, std::int64_t time = 1'700'000'000) -> CommitMetadata {
    return CommitMetadata{
        .author = sig("alice", time),
        .committer = sig("alice", time),
        .message = std::move(message),
    };
}

/// Builds histories commit by commit. Each commit copies the tree of
/// the branch tip, applies the given file writes, and gets a distinct
/// timestamp so identical changes still get distinct ids.
class HistoryBuilder {
public:
    explicit HistoryBuilder(MemoryRepository& repo) : repo_{repo} {}

    auto tree_of(std::string_view branch) const -> Tree {
        auto tip = repo_.resolve_branch(branch);
        if (!tip) return Tree{};
        return repo_.require_commit(*tip).tree;
    }

    /// Write `content` to `path` on `branch` and commit.
    auto write(std::string_view branch, const std::string& path,
               const std::string& content, std::string message = {}) -> CommitId {
        auto tree = tree_of(branch);
        tree[path] = FileEntry{.mode = FileMode::regular, .content = content};
        return commit(branch, tree, message.empty() ? "update " + path : std::move(message));
    }

    /// Remove `path` on `branch` and commit.
    auto remove(std::string_view branch, const std::string& path) -> CommitId {
        auto tree = tree_of(branch);
        tree.erase(path);
        return commit(branch, tree, "remove " + path);
    }

    /// Commit an arbitrary tree on `branch`.
    auto commit(std::string_view branch, const Tree& tree, std::string message) -> CommitId {
        return repo_.commit_on(branch, tree, meta(std::move(message), next_time()));
    }

    /// Create a merge of `other` into `branch` whose tree is `tree`.
    auto merge(std::string_view branch, std::string_view other, const Tree& tree) -> CommitId {
        const auto parents = std::vector<CommitId>{repo_.tip_of(branch), repo_.tip_of(other)};
        const auto id = repo_.create_commit(
            parents, tree, meta("Merge " + std::string{other} + " into " + std::string{branch},
                                next_time()));
        repo_.move_ref(branch, id);
        return id;
    }

    /// Point `name` at the tip of `from`.
    void branch(std::string_view name, std::string_view from) {
        repo_.move_ref(name, repo_.tip_of(from));
    }

private:
    auto next_time() -> std::int64_t { return 1'700'000'000 + clock_++; }

    MemoryRepository& repo_;
    std::int64_t clock_{0};
};

/// Content made of numbered lines "<prefix>1\n" .. "<prefix>n\n".
inline auto numbered_lines(int n, std::string_view prefix = "line ") -> std::string {
    auto out = std::string{};
    for (int i = 1; i <= n; ++i) {
        out += std::string{prefix} + std::to_string(i) + "\n";
    }
    return out;
}

}  // namespace topbase_cpp::test
