/// @file commit.hpp
/// @brief Commit, tree and signature types.

#pragma once

#include <topbase-cpp/types.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace topbase_cpp {

/// Who made a commit, and when.
struct Signature {
    std::string name;       ///< Display name.
    std::string email;      ///< Email address.
    std::int64_t time{0};   ///< Seconds since the Unix epoch.

    auto operator==(const Signature&) const -> bool = default;
};

/// File mode of a tree entry, using the git octal values.
enum class FileMode : std::uint32_t {
    regular = 0100644,
    executable = 0100755,
    symlink = 0120000,
};

/// Convert a FileMode to its octal string ("100644", ...).
auto to_string(FileMode mode) -> std::string;

/// A file stored in a tree.
struct FileEntry {
    FileMode mode{FileMode::regular};  ///< File mode.
    std::string content;               ///< Raw file bytes.

    auto operator==(const FileEntry&) const -> bool = default;
};

/// A snapshot of the repository content: path -> file.
///
/// Paths are slash-separated and relative to the repository root.
/// The map ordering gives every tree a canonical serialization.
using Tree = std::map<std::string, FileEntry, std::less<>>;

/// The non-structural part of a commit: signatures and message.
struct CommitMetadata {
    Signature author;     ///< Who wrote the change.
    Signature committer;  ///< Who recorded it.
    std::string message;  ///< Commit message.

    auto operator==(const CommitMetadata&) const -> bool = default;
};

/// An immutable commit.
///
/// A commit with zero parents is a root, one parent is a normal
/// commit, two or more is a merge.
struct Commit {
    CommitId id;                   ///< Content-derived identity.
    std::vector<CommitId> parents; ///< Parent ids, first parent first.
    Signature author;              ///< Who wrote the change.
    Signature committer;           ///< Who recorded it.
    std::string message;           ///< Commit message.
    Tree tree;                     ///< Full content snapshot.

    auto is_root() const -> bool { return parents.empty(); }
    auto is_merge() const -> bool { return parents.size() > 1; }

    /// The metadata of this commit.
    auto metadata() const -> CommitMetadata {
        return CommitMetadata{.author = author, .committer = committer, .message = message};
    }

    auto operator==(const Commit&) const -> bool = default;
};

/// SHA-256 over the canonical serialization of a tree.
auto compute_tree_id(const Tree& tree) -> CommitId;

/// SHA-256 over tree id, parents, signatures and message.
///
/// This is the identity every Repository implementation assigns, so
/// the same commit recreated anywhere has the same id.
auto compute_commit_id(const std::vector<CommitId>& parents,
                       const Tree& tree,
                       const CommitMetadata& meta) -> CommitId;

}  // namespace topbase_cpp
