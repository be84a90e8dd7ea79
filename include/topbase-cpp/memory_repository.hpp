/// @file memory_repository.hpp
/// @brief In-memory, content-addressed Repository implementation.

#pragma once

#include <topbase-cpp/repository.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace topbase_cpp {

/// A complete repository held in memory.
///
/// Commits are keyed by compute_commit_id(), so identical commits are
/// stored once. Branches are plain name -> id bindings. The working
/// tree is not modelled beyond a clean/dirty flag that tests flip to
/// exercise the precondition check.
///
/// @code
/// auto repo = MemoryRepository{};
/// auto c0 = repo.commit_on("master", Tree{{"a.txt", {.content = "a\n"}}},
///                          CommitMetadata{.message = "init"});
/// repo.move_ref("feature", c0);
/// @endcode
class MemoryRepository final : public Repository {
public:
    MemoryRepository() = default;

    // -- Repository -----------------------------------------------------------

    auto resolve_branch(std::string_view name) const
        -> std::optional<CommitId> override;
    auto read_commit(const CommitId& id) const
        -> std::optional<Commit> override;
    auto create_commit(const std::vector<CommitId>& parents,
                       const Tree& tree,
                       const CommitMetadata& meta) -> CommitId override;
    void move_ref(std::string_view branch, const CommitId& new_tip) override;
    auto is_clean() const -> bool override;

    // -- Convenience ----------------------------------------------------------

    /// Create a commit on top of `branch` (a root commit if the branch
    /// does not exist yet) and advance the branch to it.
    auto commit_on(std::string_view branch, const Tree& tree,
                   const CommitMetadata& meta) -> CommitId;

    /// Remove a branch binding. The commits stay stored.
    /// @return false if the branch did not exist.
    auto delete_branch(std::string_view name) -> bool;

    /// Mark the working tree dirty or clean.
    void set_clean(bool clean) { clean_ = clean; }

    /// All branch bindings, sorted by name.
    auto branches() const -> const std::map<std::string, CommitId, std::less<>>& {
        return branches_;
    }

    /// Number of stored commits.
    auto commit_count() const -> std::size_t { return commits_.size(); }

    /// All stored commits, sorted by id.
    auto commits() const -> std::vector<Commit>;

    /// Insert a commit verbatim, keeping its recorded id.
    /// Used when loading fixtures; returns false if the id is already present.
    auto insert_commit(Commit commit) -> bool;

private:
    std::unordered_map<CommitId, Commit> commits_;
    std::map<std::string, CommitId, std::less<>> branches_;
    bool clean_ = true;
};

}  // namespace topbase_cpp
