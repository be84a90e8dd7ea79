#include <topbase-cpp/error.hpp>
#include <topbase-cpp/repository.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace topbase_cpp {

auto Repository::require_commit(const CommitId& id) const -> Commit {
    auto commit = read_commit(id);
    if (!commit) {
        auto err = Error{ErrorKind::unknown_commit, "commit " + to_hex(id) + " is not in the repository"};
        err.commit = id;
        throw ReconcileError{std::move(err)};
    }
    return std::move(*commit);
}

auto Repository::tip_of(std::string_view branch) const -> CommitId {
    auto tip = resolve_branch(branch);
    if (!tip) {
        auto err = Error{ErrorKind::unknown_branch, "no such branch: " + std::string{branch}};
        err.branch = std::string{branch};
        throw ReconcileError{std::move(err)};
    }
    return *tip;
}

auto Repository::list_commits(const CommitId& tip) const -> std::vector<Commit> {
    auto result = std::vector<Commit>{};
    auto next = std::optional<CommitId>{tip};
    while (next) {
        auto commit = require_commit(*next);
        next = commit.parents.empty() ? std::nullopt
                                      : std::optional<CommitId>{commit.parents.front()};
        result.push_back(std::move(commit));
    }
    return result;
}

auto Repository::is_merge(const CommitId& id) const -> bool {
    return require_commit(id).is_merge();
}

auto Repository::diff(const Commit& commit) const -> TreeDiff {
    if (commit.parents.empty()) {
        return diff_trees(Tree{}, commit.tree);
    }
    const auto parent = require_commit(commit.parents.front());
    return diff_trees(parent.tree, commit.tree);
}

auto Repository::ancestors(const CommitId& tip) const -> std::unordered_set<CommitId> {
    auto seen = std::unordered_set<CommitId>{tip};
    auto queue = std::vector<CommitId>{tip};
    while (!queue.empty()) {
        auto id = queue.back();
        queue.pop_back();
        for (const auto& parent : require_commit(id).parents) {
            if (seen.insert(parent).second) {
                queue.push_back(parent);
            }
        }
    }
    return seen;
}

}  // namespace topbase_cpp
