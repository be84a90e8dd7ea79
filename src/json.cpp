#include <topbase-cpp/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace topbase_cpp {

namespace {

[[noreturn]] void invalid(std::string message) {
    throw ReconcileError{Error{ErrorKind::invalid_options, std::move(message)}};
}

[[noreturn]] void malformed(std::string message, std::optional<CommitId> commit = std::nullopt) {
    auto err = Error{ErrorKind::invalid_repository, std::move(message)};
    err.commit = std::move(commit);
    throw ReconcileError{std::move(err)};
}

auto file_mode_from_string(std::string_view text) -> std::optional<FileMode> {
    if (text == "100644") return FileMode::regular;
    if (text == "100755") return FileMode::executable;
    if (text == "120000") return FileMode::symlink;
    return std::nullopt;
}

void tree_to_json(nlohmann::json& j, const Tree& tree) {
    j = nlohmann::json::object();
    for (const auto& [path, entry] : tree) {
        j[path] = nlohmann::json{{"mode", to_string(entry.mode)}, {"content", entry.content}};
    }
}

auto tree_from_json(const nlohmann::json& j) -> Tree {
    auto tree = Tree{};
    for (const auto& [path, entry] : j.items()) {
        const auto mode_text = entry.at("mode").get<std::string>();
        auto mode = file_mode_from_string(mode_text);
        if (!mode) {
            auto err = Error{ErrorKind::invalid_repository, "unknown file mode: " + mode_text};
            err.path = path;
            throw ReconcileError{std::move(err)};
        }
        tree.emplace(path, FileEntry{.mode = *mode,
                                     .content = entry.at("content").get<std::string>()});
    }
    return tree;
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, const CommitId& id) {
    j = to_hex(id);
}

void from_json(const nlohmann::json& j, CommitId& id) {
    const auto text = j.get<std::string>();
    auto parsed = commit_id_from_hex(text);
    if (!parsed) malformed("invalid commit id: " + text);
    id = *parsed;
}

void to_json(nlohmann::json& j, const Fingerprint& fp) {
    j = to_hex(fp);
}

void to_json(nlohmann::json& j, const Signature& s) {
    j = nlohmann::json{{"name", s.name}, {"email", s.email}, {"time", s.time}};
}

void from_json(const nlohmann::json& j, Signature& s) {
    s.name = j.at("name").get<std::string>();
    s.email = j.at("email").get<std::string>();
    s.time = j.value("time", std::int64_t{0});
}

void to_json(nlohmann::json& j, const Commit& c) {
    auto tree = nlohmann::json{};
    tree_to_json(tree, c.tree);
    j = nlohmann::json{
        {"id", c.id},
        {"parents", c.parents},
        {"author", c.author},
        {"committer", c.committer},
        {"message", c.message},
        {"tree", std::move(tree)},
    };
}

void from_json(const nlohmann::json& j, Commit& c) {
    c.id = j.at("id").get<CommitId>();
    c.parents = j.value("parents", std::vector<CommitId>{});
    c.author = j.at("author").get<Signature>();
    c.committer = j.at("committer").get<Signature>();
    c.message = j.value("message", std::string{});
    c.tree = j.contains("tree") ? tree_from_json(j.at("tree")) : Tree{};
}

void to_json(nlohmann::json& j, const ForkPoint& fp) {
    j = nlohmann::json{
        {"commit", fp.commit ? nlohmann::json(*fp.commit) : nlohmann::json(nullptr)},
        {"source_commit",
         fp.source_commit ? nlohmann::json(*fp.source_commit) : nlohmann::json(nullptr)},
    };
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(e.kind)}},
        {"message", e.message},
    };
    if (!e.branch.empty()) j["branch"] = e.branch;
    if (e.commit) j["commit"] = *e.commit;
    if (!e.path.empty()) j["path"] = e.path;
}

void to_json(nlohmann::json& j, const Result& r) {
    j = nlohmann::json{
        {"new_tip", r.new_tip},
        {"fork_point", r.fork_point},
        {"commits_replayed", r.commits_replayed},
        {"commits_created", r.commits_created},
        {"commits_skipped", r.commits_skipped},
        {"fast_forwarded", r.fast_forwarded},
        {"warnings", r.warnings},
    };
}

void to_json(nlohmann::json& j, const RefUpdate& u) {
    j = nlohmann::json{
        {"branch", u.branch},
        {"old_tip", u.old_tip ? nlohmann::json(*u.old_tip) : nlohmann::json(nullptr)},
        {"new_tip", u.new_tip},
    };
}

// -- Configuration ------------------------------------------------------------

void from_json(const nlohmann::json& j, Options& o) {
    if (!j.is_object()) invalid("options must be a JSON object");

    if (auto it = j.find("require_clean"); it != j.end()) {
        if (!it->is_boolean()) invalid("require_clean must be a boolean");
        o.require_clean = it->get<bool>();
    }

    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string()) invalid("log_level must be a string");
        const auto text = it->get<std::string>();
        auto level = log_level_from_string(text);
        if (!level) invalid("unknown log level: " + text);
        o.log_level = *level;
    }

    if (auto it = j.find("committer"); it != j.end()) {
        if (it->is_null()) {
            o.replay.committer.reset();
        } else {
            if (!it->is_object()) invalid("committer must be an object");
            const auto& c = *it;
            if (!c.contains("name") || !c["name"].is_string() ||
                !c.contains("email") || !c["email"].is_string()) {
                invalid("committer needs string name and email");
            }
            if (c.contains("time") && !c["time"].is_number_integer()) {
                invalid("committer time must be an integer");
            }
            o.replay.committer = c.get<Signature>();
        }
    }
}

void to_json(nlohmann::json& j, const Options& o) {
    j = nlohmann::json{
        {"require_clean", o.require_clean},
        {"log_level", std::string{to_string_view(o.log_level)}},
    };
    if (o.replay.committer) j["committer"] = *o.replay.committer;
}

auto parse_options(std::string_view text) -> Options {
    auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) invalid("options are not valid JSON");
    return j.get<Options>();
}

// =============================================================================
// Repository export / import
// =============================================================================

auto export_json(const MemoryRepository& repo) -> nlohmann::json {
    auto branches = nlohmann::json::object();
    for (const auto& [name, tip] : repo.branches()) {
        branches[name] = tip;
    }
    return nlohmann::json{
        {"commits", repo.commits()},
        {"branches", std::move(branches)},
        {"clean", repo.is_clean()},
    };
}

auto import_repository(const nlohmann::json& j) -> MemoryRepository {
    auto repo = MemoryRepository{};

    auto commits = std::vector<Commit>{};
    auto branches = std::vector<std::pair<std::string, CommitId>>{};
    try {
        commits = j.at("commits").get<std::vector<Commit>>();
        if (auto it = j.find("branches"); it != j.end()) {
            for (const auto& [name, tip] : it->items()) {
                branches.emplace_back(name, tip.get<CommitId>());
            }
        }
        repo.set_clean(j.value("clean", true));
    } catch (const nlohmann::json::exception& e) {
        malformed(std::string{"unreadable repository: "} + e.what());
    }

    for (const auto& commit : commits) {
        const auto expected = compute_commit_id(commit.parents, commit.tree, commit.metadata());
        if (expected != commit.id) {
            malformed("recorded id does not match the commit content", commit.id);
        }
        repo.insert_commit(commit);
    }

    for (const auto& commit : commits) {
        for (const auto& parent : commit.parents) {
            if (repo.read_commit(parent)) continue;
            auto err = Error{ErrorKind::unknown_commit,
                             "parent " + short_hex(parent) + " of " + short_hex(commit.id) +
                             " is missing"};
            err.commit = parent;
            throw ReconcileError{std::move(err)};
        }
    }

    for (const auto& [name, tip] : branches) {
        repo.move_ref(name, tip);
    }
    return repo;
}

}  // namespace topbase_cpp
