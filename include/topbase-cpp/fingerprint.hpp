/// @file fingerprint.hpp
/// @brief Content identity of a commit's change.

#pragma once

#include <topbase-cpp/commit.hpp>
#include <topbase-cpp/diff.hpp>
#include <topbase-cpp/repository.hpp>
#include <topbase-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace topbase_cpp {

/// Fingerprint of a change.
///
/// Covers, per changed path in order: the path, the kind of change,
/// the old and new modes, and the deleted and inserted lines of every
/// hunk. Hunk positions and context lines are left out, so a change
/// replayed at a different offset keeps its fingerprint.
auto fingerprint(const TreeDiff& diff) -> Fingerprint;

/// Fingerprint of a commit's change against its single parent
/// (the empty tree for a root commit).
///
/// @return nullopt for merge commits, which are never fingerprinted.
auto fingerprint(const Repository& repo, const Commit& commit) -> std::optional<Fingerprint>;

/// Memoizes commit fingerprints for the duration of one reconciliation.
class FingerprintCache {
public:
    explicit FingerprintCache(const Repository& repo) : repo_{repo} {}

    /// Same as fingerprint(repo, commit), computed at most once per id.
    auto get(const Commit& commit) -> std::optional<Fingerprint>;

    auto size() const -> std::size_t { return cache_.size(); }

private:
    const Repository& repo_;
    std::unordered_map<CommitId, std::optional<Fingerprint>> cache_;
};

}  // namespace topbase_cpp
