/// @file repository.hpp
/// @brief The commit graph accessor consumed by the reconciliation engine.

#pragma once

#include <topbase-cpp/commit.hpp>
#include <topbase-cpp/diff.hpp>
#include <topbase-cpp/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace topbase_cpp {

/// View over a version-controlled repository.
///
/// The storage engine is a collaborator: the engine only ever talks to
/// it through this interface, passed explicitly to every operation.
/// Implementations provide the five primitives; the graph queries the
/// engine needs are built on top of them here.
///
/// Reads never mutate. create_commit() only adds an object and never
/// changes what a branch points to; move_ref() is the single publishing
/// step and must be atomic.
class Repository {
public:
    virtual ~Repository() = default;

    // -- Primitives -----------------------------------------------------------

    /// The commit a branch points to, or nullopt if the branch does not exist.
    virtual auto resolve_branch(std::string_view name) const
        -> std::optional<CommitId> = 0;

    /// Look up a commit, or nullopt if it is not stored.
    virtual auto read_commit(const CommitId& id) const
        -> std::optional<Commit> = 0;

    /// Store a new commit and return its id. Storing an identical commit
    /// twice returns the same id.
    virtual auto create_commit(const std::vector<CommitId>& parents,
                               const Tree& tree,
                               const CommitMetadata& meta) -> CommitId = 0;

    /// Atomically rebind (or create) a branch.
    virtual void move_ref(std::string_view branch, const CommitId& new_tip) = 0;

    /// False if the working tree has uncommitted modifications.
    virtual auto is_clean() const -> bool = 0;

    // -- Graph queries --------------------------------------------------------

    /// Like read_commit(), but throws ReconcileError(unknown_commit).
    auto require_commit(const CommitId& id) const -> Commit;

    /// Like resolve_branch(), but throws ReconcileError(unknown_branch).
    auto tip_of(std::string_view branch) const -> CommitId;

    /// Commits along the first-parent chain from `tip`, newest first,
    /// merges included.
    auto list_commits(const CommitId& tip) const -> std::vector<Commit>;

    /// True if the commit has more than one parent.
    auto is_merge(const CommitId& id) const -> bool;

    /// The change a commit introduces relative to its first parent
    /// (the empty tree for a root commit).
    auto diff(const Commit& commit) const -> TreeDiff;

    /// Every commit reachable from `tip` through any parent, `tip` included.
    auto ancestors(const CommitId& tip) const -> std::unordered_set<CommitId>;
};

}  // namespace topbase_cpp
