#include <topbase-cpp/error.hpp>
#include <topbase-cpp/memory_repository.hpp>

#include <algorithm>
#include <string>

namespace topbase_cpp {

auto MemoryRepository::resolve_branch(std::string_view name) const -> std::optional<CommitId> {
    auto it = branches_.find(name);
    if (it == branches_.end()) return std::nullopt;
    return it->second;
}

auto MemoryRepository::read_commit(const CommitId& id) const -> std::optional<Commit> {
    auto it = commits_.find(id);
    if (it == commits_.end()) return std::nullopt;
    return it->second;
}

auto MemoryRepository::create_commit(const std::vector<CommitId>& parents,
                                     const Tree& tree,
                                     const CommitMetadata& meta) -> CommitId {
    for (const auto& p : parents) {
        if (!commits_.contains(p)) {
            auto err = Error{ErrorKind::unknown_commit, "parent " + to_hex(p) + " is not in the repository"};
            err.commit = p;
            throw ReconcileError{std::move(err)};
        }
    }
    const auto id = compute_commit_id(parents, tree, meta);
    commits_.try_emplace(id, Commit{
        .id = id,
        .parents = parents,
        .author = meta.author,
        .committer = meta.committer,
        .message = meta.message,
        .tree = tree,
    });
    return id;
}

void MemoryRepository::move_ref(std::string_view branch, const CommitId& new_tip) {
    if (!commits_.contains(new_tip)) {
        auto err = Error{ErrorKind::unknown_commit, "cannot point a branch at a missing commit"};
        err.branch = std::string{branch};
        err.commit = new_tip;
        throw ReconcileError{std::move(err)};
    }
    auto it = branches_.find(branch);
    if (it == branches_.end()) {
        branches_.emplace(std::string{branch}, new_tip);
    } else {
        it->second = new_tip;
    }
}

auto MemoryRepository::is_clean() const -> bool {
    return clean_;
}

auto MemoryRepository::commit_on(std::string_view branch, const Tree& tree,
                                 const CommitMetadata& meta) -> CommitId {
    auto parents = std::vector<CommitId>{};
    if (auto tip = resolve_branch(branch)) parents.push_back(*tip);
    const auto id = create_commit(parents, tree, meta);
    move_ref(branch, id);
    return id;
}

auto MemoryRepository::delete_branch(std::string_view name) -> bool {
    auto it = branches_.find(name);
    if (it == branches_.end()) return false;
    branches_.erase(it);
    return true;
}

auto MemoryRepository::commits() const -> std::vector<Commit> {
    auto result = std::vector<Commit>{};
    result.reserve(commits_.size());
    for (const auto& [id, commit] : commits_) {
        result.push_back(commit);
    }
    std::ranges::sort(result, [](const Commit& a, const Commit& b) { return a.id < b.id; });
    return result;
}

auto MemoryRepository::insert_commit(Commit commit) -> bool {
    const auto id = commit.id;
    return commits_.try_emplace(id, std::move(commit)).second;
}

}  // namespace topbase_cpp
