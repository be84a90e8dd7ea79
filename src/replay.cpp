#include <topbase-cpp/error.hpp>
#include <topbase-cpp/replay.hpp>

#include <string>
#include <utility>
#include <variant>

namespace topbase_cpp {

static auto summary(const Commit& commit) -> std::string {
    return short_hex(commit.id) + " " + commit.message.substr(0, commit.message.find('\n'));
}

auto replay(Repository& repo, const CommitSeries& series, const CommitId& onto,
            const ReplayOptions& options, const Logger& logger) -> ReplayOutcome {
    auto outcome = ReplayOutcome{.tip = onto, .created = 0, .reused = 0};
    if (series.empty()) return outcome;

    auto tree = repo.require_commit(onto).tree;

    for (const auto& commit : series.commits) {
        // Already sitting on the growing tip: keep it, hash included
        if (commit.parents.size() == 1 && commit.parents.front() == outcome.tip) {
            logger.trace("keeping " + summary(commit));
            tree = commit.tree;
            outcome.tip = commit.id;
            ++outcome.reused;
            continue;
        }

        auto applied = apply_diff(tree, repo.diff(commit));
        if (auto* conflict = std::get_if<ApplyConflict>(&applied)) {
            auto err = Error{ErrorKind::conflict_during_replay,
                             "could not apply " + summary(commit) + ": " + conflict->reason};
            err.commit = commit.id;
            err.path = conflict->path;
            logger.error(err.message + " (" + conflict->path + ")");
            throw ReconcileError{std::move(err)};
        }
        tree = std::get<Tree>(std::move(applied));

        auto meta = commit.metadata();
        if (options.committer) meta.committer = *options.committer;

        outcome.tip = repo.create_commit({outcome.tip}, tree, meta);
        ++outcome.created;
        logger.trace("replayed " + summary(commit) + " as " + short_hex(outcome.tip));
    }
    return outcome;
}

}  // namespace topbase_cpp
