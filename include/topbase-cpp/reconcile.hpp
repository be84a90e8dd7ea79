/// @file reconcile.hpp
/// @brief topbase() and rebase(): the entry points used by split-out / split-in.

#pragma once

#include <topbase-cpp/diff.hpp>
#include <topbase-cpp/error.hpp>
#include <topbase-cpp/fork_point.hpp>
#include <topbase-cpp/log.hpp>
#include <topbase-cpp/replay.hpp>
#include <topbase-cpp/repository.hpp>
#include <topbase-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace topbase_cpp {

/// Configuration of a reconciliation.
struct Options {
    /// Refuse to run when the working tree is dirty.
    bool require_clean{true};

    /// Replay settings (committer identity).
    ReplayOptions replay{};

    /// Threshold for the logger built by make_logger().
    LogLevel log_level{LogLevel::warning};

    auto operator==(const Options&) const -> bool = default;
};

/// A stderr logger at the configured threshold.
auto make_logger(const Options& options) -> Logger;

/// Outcome of a successful reconciliation.
struct Result {
    CommitId new_tip;                  ///< Tip of the published branch.
    ForkPoint fork_point;              ///< Where the histories were found to agree.
    /// Commits the rebound branch gains on top of the landing tip,
    /// whether copied or kept with their original ids.
    std::size_t commits_replayed{0};
    std::size_t commits_created{0};    ///< New commits written by replay.
    std::size_t commits_skipped{0};    ///< Series commits dropped as already upstream.
    bool fast_forwarded{false};        ///< True if no commit was created.
    std::vector<Error> warnings;       ///< Non-fatal findings (ambiguous fork point).
};

/// Bring `target` up to date with the commits unique to `source`.
///
/// Finds the content-based fork point, collects the merge-free commits
/// of `source` after it, then either moves `target` to the source tip
/// (when that is a pure fast-forward, keeping every hash) or replays
/// the commits on top of the target tip. `target` is rebound exactly
/// once, at the end, and only on success. Running it again without
/// intervening changes is a no-op.
///
/// @throws ReconcileError dirty_working_tree, unknown_branch,
///   unknown_commit or conflict_during_replay.
auto topbase(Repository& repo, std::string_view source, std::string_view target,
             const Options& options, const Logger& logger) -> Result;

/// topbase() with a logger built from `options`.
auto topbase(Repository& repo, std::string_view source, std::string_view target,
             const Options& options = {}) -> Result;

/// Rebase `source` onto `onto` (default: `target`).
///
/// The fork point is the ancestry merge base of `source` and `target`;
/// commits of `source` after it whose change already exists on
/// `target` since that base are skipped; the rest land on `onto`.
/// `source` is the branch that gets rebound. When `source` already
/// sits directly on the landing tip nothing is rebound and the result
/// reports a fast-forward.
///
/// @throws ReconcileError as topbase().
auto rebase(Repository& repo, std::string_view source, std::string_view target,
            std::optional<std::string_view> onto,
            const Options& options, const Logger& logger) -> Result;

/// rebase() with a logger built from `options`.
auto rebase(Repository& repo, std::string_view source, std::string_view target,
            std::optional<std::string_view> onto = std::nullopt,
            const Options& options = {}) -> Result;

}  // namespace topbase_cpp
