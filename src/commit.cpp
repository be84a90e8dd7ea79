#include <topbase-cpp/commit.hpp>

#include "crypto/sha256.hpp"

#include <string>

namespace topbase_cpp {

auto to_string(FileMode mode) -> std::string {
    switch (mode) {
        case FileMode::regular:    return "100644";
        case FileMode::executable: return "100755";
        case FileMode::symlink:    return "120000";
    }
    return "100644";
}

static void hash_signature(crypto::Sha256& hasher, const Signature& s) {
    hasher.update_field(s.name);
    hasher.update_field(s.email);
    hasher.update_u64(static_cast<std::uint64_t>(s.time));
}

// Tree serialization: entry count, then per entry (map order):
// mode, path, SHA-256 of the content.
auto compute_tree_id(const Tree& tree) -> CommitId {
    auto hasher = crypto::Sha256{};
    hasher.update("tree");
    hasher.update_u64(tree.size());
    for (const auto& [path, entry] : tree) {
        hasher.update_u64(static_cast<std::uint64_t>(entry.mode));
        hasher.update_field(path);
        const auto blob = crypto::sha256(std::string_view{entry.content});
        hasher.update(std::span<const std::byte>{blob});
    }
    return CommitId{hasher.finalize()};
}

auto compute_commit_id(const std::vector<CommitId>& parents,
                       const Tree& tree,
                       const CommitMetadata& meta) -> CommitId {
    auto hasher = crypto::Sha256{};
    hasher.update("commit");

    const auto tree_id = compute_tree_id(tree);
    hasher.update(std::span<const std::byte>{tree_id.bytes});

    hasher.update_u64(parents.size());
    for (const auto& p : parents) {
        hasher.update(std::span<const std::byte>{p.bytes});
    }

    hash_signature(hasher, meta.author);
    hash_signature(hasher, meta.committer);
    hasher.update_field(meta.message);
    return CommitId{hasher.finalize()};
}

}  // namespace topbase_cpp
