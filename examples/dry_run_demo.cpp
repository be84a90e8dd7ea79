// dry_run_demo: preview a rebase without touching the repository
//
// Loads a history from JSON, runs rebase() against a DryRunRepository
// and prints the commits and ref updates it would have made.
//
// Build: cmake --build build
// Run:   ./build/examples/dry_run_demo

#include <topbase-cpp/json.hpp>
#include <topbase-cpp/topbase.hpp>

#include <cstdio>
#include <string>
#include <string_view>

namespace tb = topbase_cpp;

static auto build_fixture() -> tb::MemoryRepository {
    auto repo = tb::MemoryRepository{};
    const auto who = tb::Signature{.name = "Bob", .email = "bob@example.com", .time = 100};

    auto tree = tb::Tree{{"main.c", tb::FileEntry{.mode = tb::FileMode::regular,
                                                  .content = "int main() { return 0; }\n"}}};
    repo.commit_on("main", tree, tb::CommitMetadata{.author = who, .committer = who,
                                                    .message = "initial"});
    repo.move_ref("feature", repo.tip_of("main"));

    tree["feature.c"] = tb::FileEntry{.mode = tb::FileMode::regular, .content = "void f() {}\n"};
    repo.commit_on("feature", tree, tb::CommitMetadata{.author = who, .committer = who,
                                                       .message = "add feature"});

    auto main_tree = repo.require_commit(repo.tip_of("main")).tree;
    main_tree["Makefile"] = tb::FileEntry{.mode = tb::FileMode::regular, .content = "all:\n"};
    repo.commit_on("main", main_tree, tb::CommitMetadata{.author = who, .committer = who,
                                                         .message = "add Makefile"});
    return repo;
}

int main() {
    // Round-trip through JSON, as a fixture file would be loaded
    const auto text = tb::export_json(build_fixture()).dump();
    auto repo = tb::import_repository(nlohmann::json::parse(text));

    const auto options = tb::parse_options(R"({"log_level": "info"})");

    auto logger = tb::make_logger(options);
    logger.set_prefix("   # ");

    auto dry = tb::DryRunRepository{repo, &logger};
    try {
        const auto result = tb::rebase(dry, "feature", "main", std::nullopt, options, logger);
        std::printf("would replay %zu commit(s), new tip %s\n",
                    result.commits_replayed, tb::short_hex(result.new_tip).c_str());
    } catch (const tb::ReconcileError& e) {
        std::fprintf(stderr, "rebase would fail: %s\n", e.what());
        return 1;
    }

    for (const auto& update : dry.planned_updates()) {
        std::printf("%s\n", nlohmann::json(update).dump().c_str());
    }
    std::printf("feature still at %s\n", tb::short_hex(repo.tip_of("feature")).c_str());
    return 0;
}
