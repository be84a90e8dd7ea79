/// @file replay.hpp
/// @brief Re-creating a commit series on top of another commit.

#pragma once

#include <topbase-cpp/commit.hpp>
#include <topbase-cpp/log.hpp>
#include <topbase-cpp/repository.hpp>
#include <topbase-cpp/series.hpp>
#include <topbase-cpp/types.hpp>

#include <cstddef>
#include <optional>

namespace topbase_cpp {

/// Knobs for the replay engine.
struct ReplayOptions {
    /// Committer recorded on replayed commits; the original committer
    /// when unset.
    std::optional<Signature> committer;

    auto operator==(const ReplayOptions&) const -> bool = default;
};

/// What a replay produced.
struct ReplayOutcome {
    CommitId tip;               ///< The new tip; `onto` for an empty series.
    std::size_t created{0};     ///< Commits newly created.
    std::size_t reused{0};      ///< Commits kept as-is because their parent already matched.
};

/// Apply every commit of `series`, oldest first, on top of `onto`.
///
/// Each commit's change against its own parent is applied to the tree
/// of the growing tip, and a new commit with the original author and
/// message is created with the growing tip as its only parent. A commit
/// whose parent already is the growing tip is reused unchanged.
///
/// Only objects are created; no ref is moved.
///
/// @throws ReconcileError(conflict_during_replay) naming the commit and
///   path when a change does not apply.
auto replay(Repository& repo, const CommitSeries& series, const CommitId& onto,
            const ReplayOptions& options, const Logger& logger) -> ReplayOutcome;

}  // namespace topbase_cpp
