/// @file series.hpp
/// @brief Merge-free commit series unique to a branch.

#pragma once

#include <topbase-cpp/commit.hpp>
#include <topbase-cpp/repository.hpp>
#include <topbase-cpp/types.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace topbase_cpp {

/// The commits unique to a branch since some stop point, oldest first.
///
/// Never contains a merge commit. `tip` is where the walk started and
/// `merges_skipped` counts the merges that were left out, so the
/// fast-forward check can tell whether the series is the branch's
/// literal history.
struct CommitSeries {
    CommitId tip;                    ///< Commit the walk started from.
    std::optional<CommitId> base;    ///< Stop commit, nullopt if the walk hit the root.
    std::vector<Commit> commits;     ///< Non-merge commits, oldest first.
    std::size_t merges_skipped{0};   ///< Merge commits omitted from `commits`.

    auto empty() const -> bool { return commits.empty(); }
    auto size() const -> std::size_t { return commits.size(); }
};

/// Walk the first-parent chain from `tip` until `stop_at` (exclusive).
///
/// Merge commits are omitted and the walk continues through their
/// first parent only, so content that only a merged side branch
/// introduced is not replayed. With `stop_at` nullopt, or not on the
/// chain, the walk runs to the root.
auto build_series(const Repository& repo, const CommitId& tip,
                  const std::optional<CommitId>& stop_at) -> CommitSeries;

/// Like build_series(), stopping at the first commit for which
/// `is_base` returns true.
auto build_series(const Repository& repo, const CommitId& tip,
                  const std::function<bool(const Commit&)>& is_base) -> CommitSeries;

/// The merge-free first-parent history of `tip`, newest first.
auto merge_free_history(const Repository& repo, const CommitId& tip) -> std::vector<Commit>;

}  // namespace topbase_cpp
