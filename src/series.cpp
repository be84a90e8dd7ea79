#include <topbase-cpp/series.hpp>

#include <algorithm>
#include <utility>

namespace topbase_cpp {

auto build_series(const Repository& repo, const CommitId& tip,
                  const std::function<bool(const Commit&)>& is_base) -> CommitSeries {
    auto series = CommitSeries{.tip = tip, .base = std::nullopt, .commits = {}, .merges_skipped = 0};

    auto next = std::optional<CommitId>{tip};
    while (next) {
        auto commit = repo.require_commit(*next);
        if (is_base(commit)) {
            series.base = commit.id;
            break;
        }
        next = commit.parents.empty() ? std::nullopt
                                      : std::optional<CommitId>{commit.parents.front()};
        if (commit.is_merge()) {
            ++series.merges_skipped;
        } else {
            series.commits.push_back(std::move(commit));
        }
    }

    std::ranges::reverse(series.commits);
    return series;
}

auto build_series(const Repository& repo, const CommitId& tip,
                  const std::optional<CommitId>& stop_at) -> CommitSeries {
    return build_series(repo, tip, [&](const Commit& c) {
        return stop_at.has_value() && c.id == *stop_at;
    });
}

auto merge_free_history(const Repository& repo, const CommitId& tip) -> std::vector<Commit> {
    auto history = repo.list_commits(tip);
    std::erase_if(history, [](const Commit& c) { return c.is_merge(); });
    return history;
}

}  // namespace topbase_cpp
