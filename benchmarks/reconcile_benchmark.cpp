// topbase-cpp benchmarks: measures throughput of diffing, fingerprinting
// and whole reconciliations on synthetic histories.

#include <topbase-cpp/topbase.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace topbase_cpp;

static auto numbered(int n, int changed = -1) -> std::string {
    auto out = std::string{};
    for (int i = 0; i < n; ++i) {
        out += (i == changed ? "changed " : "line ") + std::to_string(i) + "\n";
    }
    return out;
}

static auto meta(const std::string& message, std::int64_t time) -> CommitMetadata {
    const auto who = Signature{.name = "bench", .email = "bench@example.com", .time = time};
    return CommitMetadata{.author = who, .committer = who, .message = message};
}

// master: one root commit; new_branch: `commits` edits of a 200-line file.
// With `diverge`, master gets one unrelated commit after the fork.
static auto make_history(int commits, bool diverge) -> MemoryRepository {
    auto repo = MemoryRepository{};
    auto tree = Tree{{"data.txt", FileEntry{.mode = FileMode::regular, .content = numbered(200)}}};
    repo.commit_on("master", tree, meta("root", 0));
    repo.move_ref("new_branch", repo.tip_of("master"));

    for (int i = 0; i < commits; ++i) {
        tree["data.txt"].content = numbered(200, i % 200);
        tree["file" + std::to_string(i)] = FileEntry{.mode = FileMode::regular, .content = "x\n"};
        repo.commit_on("new_branch", tree, meta("commit " + std::to_string(i), i + 1));
    }
    if (diverge) {
        auto master_tree = repo.require_commit(repo.tip_of("master")).tree;
        master_tree["unrelated"] = FileEntry{.mode = FileMode::regular, .content = "u\n"};
        repo.commit_on("master", master_tree, meta("unrelated", 1'000'000));
    }
    return repo;
}

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_lines(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto before = split_lines(numbered(n));
    const auto after = split_lines(numbered(n, n / 2));
    for (auto _ : state) {
        auto hunks = diff_lines(before, after);
        benchmark::DoNotOptimize(hunks);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_diff_lines)->Range(64, 8192);

static void bm_apply_hunks(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    const auto before = numbered(n);
    const auto hunks = diff_lines(split_lines(before), split_lines(numbered(n, n / 2)));
    for (auto _ : state) {
        auto applied = apply_hunks(before, hunks);
        benchmark::DoNotOptimize(applied);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_apply_hunks)->Range(64, 8192);

// =============================================================================
// Fingerprints
// =============================================================================

static void bm_fingerprint_commit(benchmark::State& state) {
    const auto repo = make_history(1, false);
    const auto commit = repo.require_commit(repo.tip_of("new_branch"));
    for (auto _ : state) {
        auto fp = fingerprint(repo, commit);
        benchmark::DoNotOptimize(fp);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_fingerprint_commit);

// =============================================================================
// Reconciliation
// =============================================================================

static void bm_topbase_fast_forward(benchmark::State& state) {
    const auto commits = static_cast<int>(state.range(0));
    const auto repo = make_history(commits, false);
    auto options = Options{};
    options.log_level = LogLevel::off;
    for (auto _ : state) {
        auto dry = DryRunRepository{repo};
        auto result = topbase(dry, "new_branch", "master", options, Logger::silent());
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * commits);
}
BENCHMARK(bm_topbase_fast_forward)->Range(8, 256);

static void bm_topbase_replay(benchmark::State& state) {
    const auto commits = static_cast<int>(state.range(0));
    const auto repo = make_history(commits, true);
    auto options = Options{};
    options.log_level = LogLevel::off;
    for (auto _ : state) {
        auto dry = DryRunRepository{repo};
        auto result = topbase(dry, "new_branch", "master", options, Logger::silent());
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * commits);
}
BENCHMARK(bm_topbase_replay)->Range(8, 256);
