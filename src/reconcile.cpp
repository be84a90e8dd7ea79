#include <topbase-cpp/fast_forward.hpp>
#include <topbase-cpp/fingerprint.hpp>
#include <topbase-cpp/reconcile.hpp>
#include <topbase-cpp/series.hpp>

#include <string>
#include <unordered_set>
#include <utility>

namespace topbase_cpp {

namespace {

void require_clean(const Repository& repo, const Options& options, std::string_view branch) {
    if (!options.require_clean || repo.is_clean()) return;
    auto err = Error{ErrorKind::dirty_working_tree,
                     "you have modified changes; stash or commit them before running this command"};
    err.branch = std::string{branch};
    throw ReconcileError{std::move(err)};
}

void warn_if_root(Result& result, std::string_view source, std::string_view target,
                  const Logger& logger) {
    if (!result.fork_point.is_root()) {
        logger.debug("fork point is " + short_hex(*result.fork_point.commit));
        return;
    }
    auto warning = Error{ErrorKind::ambiguous_fork_point,
                         "no commit of " + std::string{target} + " matches a commit of " +
                         std::string{source} + "; its entire history will be replayed"};
    warning.branch = std::string{source};
    logger.warn(warning.message);
    result.warnings.push_back(std::move(warning));
}

}  // anonymous namespace

auto make_logger(const Options& options) -> Logger {
    return Logger{stderr_sink(), options.log_level};
}

// -- topbase ------------------------------------------------------------------

auto topbase(Repository& repo, std::string_view source, std::string_view target,
             const Options& options, const Logger& logger) -> Result {
    logger.debug("topbase " + std::string{source} + " onto " + std::string{target});
    require_clean(repo, options, target);

    const auto source_tip = repo.tip_of(source);
    const auto target_tip = repo.tip_of(target);

    auto result = Result{};
    auto cache = FingerprintCache{repo};
    result.fork_point = resolve_fork_point(repo, source_tip, target_tip, cache);
    warn_if_root(result, source, target, logger);

    const auto series = build_series(repo, source_tip, result.fork_point.source_commit);
    if (series.merges_skipped > 0) {
        logger.info("leaving out " + std::to_string(series.merges_skipped) + " merge commit(s) of " +
                    std::string{source});
    }
    if (series.empty()) {
        logger.info(std::string{target} + " is up to date with " + std::string{source});
        result.new_tip = target_tip;
        return result;
    }

    if (auto tip = try_fast_forward(series, target_tip)) {
        logger.info("fast-forwarding " + std::string{target} + " to " + short_hex(*tip));
        result.new_tip = *tip;
        result.fast_forwarded = true;
    } else {
        logger.info("replaying " + std::to_string(series.size()) + " commit(s) of " +
                    std::string{source} + " onto " + std::string{target});
        const auto outcome = replay(repo, series, target_tip, options.replay, logger);
        result.new_tip = outcome.tip;
        result.commits_created = outcome.created;
    }
    result.commits_replayed = series.size();

    repo.move_ref(target, result.new_tip);
    return result;
}

auto topbase(Repository& repo, std::string_view source, std::string_view target,
             const Options& options) -> Result {
    const auto logger = make_logger(options);
    return topbase(repo, source, target, options, logger);
}

// -- rebase -------------------------------------------------------------------

auto rebase(Repository& repo, std::string_view source, std::string_view target,
            std::optional<std::string_view> onto,
            const Options& options, const Logger& logger) -> Result {
    const auto landing = onto.value_or(target);
    logger.debug("rebase " + std::string{source} + " onto " + std::string{landing} +
                 " (upstream " + std::string{target} + ")");
    require_clean(repo, options, source);

    const auto source_tip = repo.tip_of(source);
    const auto target_tip = repo.tip_of(target);
    const auto landing_tip = repo.tip_of(landing);

    auto result = Result{};
    result.fork_point = resolve_merge_base(repo, source_tip, target_tip);
    warn_if_root(result, source, target, logger);

    // Everything reachable from the upstream counts as already there
    const auto reachable = repo.ancestors(target_tip);
    auto series = build_series(repo, source_tip, [&](const Commit& commit) {
        return reachable.contains(commit.id);
    });

    // Changes the upstream already has since the base are not replayed
    auto cache = FingerprintCache{repo};
    auto upstream = std::unordered_set<Fingerprint>{};
    for (const auto& commit : build_series(repo, target_tip, result.fork_point.commit).commits) {
        if (auto fp = cache.get(commit)) upstream.insert(*fp);
    }
    const auto before = series.commits.size();
    std::erase_if(series.commits, [&](const Commit& commit) {
        auto fp = cache.get(commit);
        if (!fp || !upstream.contains(*fp)) return false;
        logger.info("skipping " + short_hex(commit.id) + ", already in " + std::string{target});
        return true;
    });
    result.commits_skipped = before - series.commits.size();

    if (series.empty()) {
        result.new_tip = landing_tip;
        result.fast_forwarded = true;
        if (landing_tip != source_tip) {
            logger.info("fast-forwarding " + std::string{source} + " to " + short_hex(landing_tip));
            repo.move_ref(source, landing_tip);
        } else {
            logger.info(std::string{source} + " is up to date");
        }
        return result;
    }

    // The source already sits on the landing tip and gains nothing
    if (auto tip = try_fast_forward(series, landing_tip)) {
        logger.info(std::string{source} + " already sits on " + std::string{landing});
        result.new_tip = *tip;
        result.fast_forwarded = true;
        return result;
    }

    logger.info("replaying " + std::to_string(series.size()) + " commit(s) of " +
                std::string{source} + " onto " + std::string{landing});
    const auto outcome = replay(repo, series, landing_tip, options.replay, logger);
    result.new_tip = outcome.tip;
    result.commits_replayed = series.size();
    result.commits_created = outcome.created;
    repo.move_ref(source, result.new_tip);
    return result;
}

auto rebase(Repository& repo, std::string_view source, std::string_view target,
            std::optional<std::string_view> onto, const Options& options) -> Result {
    const auto logger = make_logger(options);
    return rebase(repo, source, target, onto, options, logger);
}

}  // namespace topbase_cpp
