/// @file dry_run_repository.hpp
/// @brief Read-only Repository substitute for dry runs.

#pragma once

#include <topbase-cpp/log.hpp>
#include <topbase-cpp/repository.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace topbase_cpp {

/// A branch rebinding that a dry run would have published.
struct RefUpdate {
    std::string branch;
    std::optional<CommitId> old_tip;  ///< nullopt if the branch was new.
    CommitId new_tip;

    auto operator==(const RefUpdate&) const -> bool = default;
};

/// Wraps a repository so that a reconciliation can run to completion
/// without changing it.
///
/// Reads fall through to the wrapped repository. Created commits are
/// staged in an overlay and ref moves are recorded as planned updates;
/// later reads observe both, so the engine behaves exactly as it would
/// for real. The wrapped repository is only ever read.
class DryRunRepository final : public Repository {
public:
    /// @param base The repository to read from. Must outlive this object.
    /// @param logger Where planned actions are reported (at info level),
    ///   or nullptr to stay quiet.
    explicit DryRunRepository(const Repository& base, const Logger* logger = nullptr);

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

    // -- Plan -----------------------------------------------------------------

    /// Ref updates in the order they were requested.
    auto planned_updates() const -> const std::vector<RefUpdate>& { return updates_; }

    /// Number of commits that would have been created.
    auto staged_commit_count() const -> std::size_t { return staged_.size(); }

private:
    const Repository& base_;
    const Logger* logger_;
    std::unordered_map<CommitId, Commit> staged_;
    std::map<std::string, CommitId, std::less<>> refs_;
    std::vector<RefUpdate> updates_;
};

}  // namespace topbase_cpp
