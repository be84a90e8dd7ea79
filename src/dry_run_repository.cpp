#include <topbase-cpp/dry_run_repository.hpp>
#include <topbase-cpp/error.hpp>

#include <string>

namespace topbase_cpp {

DryRunRepository::DryRunRepository(const Repository& base, const Logger* logger)
    : base_{base}, logger_{logger} {}

auto DryRunRepository::resolve_branch(std::string_view name) const -> std::optional<CommitId> {
    auto it = refs_.find(name);
    if (it != refs_.end()) return it->second;
    return base_.resolve_branch(name);
}

auto DryRunRepository::read_commit(const CommitId& id) const -> std::optional<Commit> {
    auto it = staged_.find(id);
    if (it != staged_.end()) return it->second;
    return base_.read_commit(id);
}

auto DryRunRepository::create_commit(const std::vector<CommitId>& parents,
                                     const Tree& tree,
                                     const CommitMetadata& meta) -> CommitId {
    for (const auto& p : parents) {
        if (!read_commit(p)) {
            auto err = Error{ErrorKind::unknown_commit, "parent " + to_hex(p) + " is not in the repository"};
            err.commit = p;
            throw ReconcileError{std::move(err)};
        }
    }
    const auto id = compute_commit_id(parents, tree, meta);
    if (base_.read_commit(id)) return id;

    auto [it, inserted] = staged_.try_emplace(id, Commit{
        .id = id,
        .parents = parents,
        .author = meta.author,
        .committer = meta.committer,
        .message = meta.message,
        .tree = tree,
    });
    if (inserted && logger_) {
        auto first_line = meta.message.substr(0, meta.message.find('\n'));
        logger_->info("would create commit " + short_hex(id) + " " + first_line);
    }
    return id;
}

void DryRunRepository::move_ref(std::string_view branch, const CommitId& new_tip) {
    if (!read_commit(new_tip)) {
        auto err = Error{ErrorKind::unknown_commit, "cannot point a branch at a missing commit"};
        err.branch = std::string{branch};
        err.commit = new_tip;
        throw ReconcileError{std::move(err)};
    }
    auto old_tip = resolve_branch(branch);
    refs_.insert_or_assign(std::string{branch}, new_tip);
    updates_.push_back(RefUpdate{.branch = std::string{branch}, .old_tip = old_tip, .new_tip = new_tip});

    if (logger_) {
        logger_->info("would move " + std::string{branch} + " from " +
                      (old_tip ? short_hex(*old_tip) : std::string{"(none)"}) +
                      " to " + short_hex(new_tip));
    }
}

auto DryRunRepository::is_clean() const -> bool {
    return base_.is_clean();
}

}  // namespace topbase_cpp
