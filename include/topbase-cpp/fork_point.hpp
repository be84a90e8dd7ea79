/// @file fork_point.hpp
/// @brief Locating where two diverged histories agree.

#pragma once

#include <topbase-cpp/fingerprint.hpp>
#include <topbase-cpp/repository.hpp>
#include <topbase-cpp/types.hpp>

#include <optional>

namespace topbase_cpp {

/// Where a source and a target history agree.
///
/// `commit` is on the target side, `source_commit` is the commit of the
/// source history carrying the same change. They are the same id when
/// the histories share ancestry, and differ when one side was
/// rewritten. Both are nullopt when nothing matched (the root).
struct ForkPoint {
    std::optional<CommitId> commit;         ///< Target-side commit.
    std::optional<CommitId> source_commit;  ///< Matching source-side commit.

    auto is_root() const -> bool { return !commit.has_value(); }

    auto operator==(const ForkPoint&) const -> bool = default;
};

/// Content-based fork point.
///
/// Walks the merge-free history of `target_tip` newest first and
/// returns the first commit that is itself on the merge-free history
/// of `source_tip`, or whose fingerprint appears there. A change found
/// more than once on the source side pairs with the occurrence whose
/// older commits agree longest with the target's. No match yields the
/// root.
auto resolve_fork_point(const Repository& repo,
                        const CommitId& source_tip,
                        const CommitId& target_tip) -> ForkPoint;

/// Same as above, sharing a fingerprint cache with the caller.
auto resolve_fork_point(const Repository& repo,
                        const CommitId& source_tip,
                        const CommitId& target_tip,
                        FingerprintCache& cache) -> ForkPoint;

/// Ancestry-based fork point: the first commit on the first-parent
/// chain of `source_tip` that is reachable from `target_tip`.
auto resolve_merge_base(const Repository& repo,
                        const CommitId& source_tip,
                        const CommitId& target_tip) -> ForkPoint;

}  // namespace topbase_cpp
