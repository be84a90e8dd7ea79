#include <topbase-cpp/fork_point.hpp>
#include <topbase-cpp/series.hpp>

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace topbase_cpp {

namespace {

struct Fingerprinted {
    std::vector<Commit> commits;                     // newest first
    std::vector<std::optional<Fingerprint>> prints;  // parallel to commits
};

auto fingerprinted_history(const Repository& repo, const CommitId& tip,
                           FingerprintCache& cache) -> Fingerprinted {
    auto out = Fingerprinted{.commits = merge_free_history(repo, tip), .prints = {}};
    out.prints.reserve(out.commits.size());
    for (const auto& commit : out.commits) out.prints.push_back(cache.get(commit));
    return out;
}

// How many commits older than source[s] and target[t] carry the same
// changes, counted until the first disagreement.
auto agreement(const Fingerprinted& source, std::size_t s,
               const Fingerprinted& target, std::size_t t) -> std::size_t {
    auto n = std::size_t{0};
    while (s + n + 1 < source.prints.size() && t + n + 1 < target.prints.size()) {
        const auto& a = source.prints[s + n + 1];
        const auto& b = target.prints[t + n + 1];
        if (!a || !b || *a != *b) break;
        ++n;
    }
    return n;
}

}  // anonymous namespace

auto resolve_fork_point(const Repository& repo,
                        const CommitId& source_tip,
                        const CommitId& target_tip,
                        FingerprintCache& cache) -> ForkPoint {
    // Shared tip: nothing to compare
    if (source_tip == target_tip) {
        return ForkPoint{.commit = target_tip, .source_commit = source_tip};
    }

    const auto source = fingerprinted_history(repo, source_tip, cache);
    const auto target = fingerprinted_history(repo, target_tip, cache);

    auto source_ids = std::unordered_set<CommitId>{};
    auto positions = std::unordered_map<Fingerprint, std::vector<std::size_t>>{};
    for (std::size_t s = 0; s < source.commits.size(); ++s) {
        source_ids.insert(source.commits[s].id);
        if (source.prints[s]) positions[*source.prints[s]].push_back(s);
    }

    for (std::size_t t = 0; t < target.commits.size(); ++t) {
        const auto& commit = target.commits[t];
        // The target already holds this very commit
        if (source_ids.contains(commit.id)) {
            return ForkPoint{.commit = commit.id, .source_commit = commit.id};
        }

        if (!target.prints[t]) continue;
        auto it = positions.find(*target.prints[t]);
        if (it == positions.end()) continue;

        // Among repeated changes take the occurrence whose older history
        // lines up best with the target's; ties go to the older one.
        auto best = it->second.front();
        auto best_score = agreement(source, best, target, t);
        for (auto s : it->second) {
            const auto score = agreement(source, s, target, t);
            if (score >= best_score) {
                best = s;
                best_score = score;
            }
        }
        return ForkPoint{.commit = commit.id, .source_commit = source.commits[best].id};
    }
    return ForkPoint{};
}

auto resolve_fork_point(const Repository& repo,
                        const CommitId& source_tip,
                        const CommitId& target_tip) -> ForkPoint {
    auto cache = FingerprintCache{repo};
    return resolve_fork_point(repo, source_tip, target_tip, cache);
}

auto resolve_merge_base(const Repository& repo,
                        const CommitId& source_tip,
                        const CommitId& target_tip) -> ForkPoint {
    const auto reachable = repo.ancestors(target_tip);
    for (const auto& commit : repo.list_commits(source_tip)) {
        if (reachable.contains(commit.id)) {
            return ForkPoint{.commit = commit.id, .source_commit = commit.id};
        }
    }
    return ForkPoint{};
}

}  // namespace topbase_cpp
