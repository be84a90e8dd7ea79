// topbase_demo: split a feature branch back into master
//
// Builds a small history in memory, lets master diverge, then runs
// topbase() and prints the resulting history and the JSON result.
// A second run shows that reconciling again changes nothing.
//
// Build: cmake --build build
// Run:   ./build/examples/topbase_demo

#include <topbase-cpp/json.hpp>
#include <topbase-cpp/topbase.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace tb = topbase_cpp;

static auto meta(const char* message, std::int64_t time) -> tb::CommitMetadata {
    const auto who = tb::Signature{.name = "Alice", .email = "alice@example.com", .time = time};
    return tb::CommitMetadata{.author = who, .committer = who, .message = message};
}

static void print_history(const tb::Repository& repo, const char* branch) {
    std::printf("%s:\n", branch);
    for (const auto& commit : repo.list_commits(repo.tip_of(branch))) {
        std::printf("  %s %s\n", tb::short_hex(commit.id).c_str(), commit.message.c_str());
    }
}

int main() {
    auto repo = tb::MemoryRepository{};

    // -- master: one commit ---------------------------------------------------
    auto tree = tb::Tree{{"README", tb::FileEntry{.mode = tb::FileMode::regular,
                                                  .content = "topbase demo\n"}}};
    repo.commit_on("master", tree, meta("initial commit", 1));
    repo.move_ref("new_branch", repo.tip_of("master"));

    // -- new_branch: three commits of work -----------------------------------
    for (int i = 1; i <= 3; ++i) {
        const auto name = "part" + std::to_string(i) + ".txt";
        tree[name] = tb::FileEntry{.mode = tb::FileMode::regular, .content = "part " + name + "\n"};
        repo.commit_on("new_branch", tree, meta(("add " + name).c_str(), 10 + i));
    }

    // -- master moves on independently ---------------------------------------
    auto master_tree = repo.require_commit(repo.tip_of("master")).tree;
    master_tree["CHANGELOG"] = tb::FileEntry{.mode = tb::FileMode::regular, .content = "v1\n"};
    repo.commit_on("master", master_tree, meta("start changelog", 20));

    print_history(repo, "new_branch");
    print_history(repo, "master");

    // -- topbase ---------------------------------------------------------------
    auto options = tb::Options{};
    options.log_level = tb::LogLevel::info;

    try {
        const auto result = tb::topbase(repo, "new_branch", "master", options);
        std::printf("\nresult: %s\n\n", nlohmann::json(result).dump(2).c_str());
        print_history(repo, "master");

        const auto again = tb::topbase(repo, "new_branch", "master", options);
        std::printf("\nsecond run replayed %zu commit(s)\n", again.commits_replayed);
    } catch (const tb::ReconcileError& e) {
        std::fprintf(stderr, "topbase failed: %s\n", e.what());
        return 1;
    }

    return 0;
}
