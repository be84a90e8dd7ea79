#include <topbase-cpp/fast_forward.hpp>

namespace topbase_cpp {

auto try_fast_forward(const CommitSeries& series, const CommitId& target_tip)
    -> std::optional<CommitId> {
    if (series.empty() || series.merges_skipped > 0) return std::nullopt;
    if (series.commits.back().id != series.tip) return std::nullopt;

    auto expected_parent = target_tip;
    for (const auto& commit : series.commits) {
        if (commit.parents.size() != 1 || commit.parents.front() != expected_parent) {
            return std::nullopt;
        }
        expected_parent = commit.id;
    }
    return series.tip;
}

}  // namespace topbase_cpp
