#include <topbase-cpp/fingerprint.hpp>

#include "crypto/sha256.hpp"

namespace topbase_cpp {

namespace {

// Tags keep the serialization unambiguous.
constexpr std::uint8_t tag_file = 'F';
constexpr std::uint8_t tag_no_mode = '-';
constexpr std::uint8_t tag_run = 'R';
constexpr std::uint8_t tag_deleted = '-';
constexpr std::uint8_t tag_added = '+';

void hash_mode(crypto::Sha256& hasher, const std::optional<FileMode>& mode) {
    if (!mode) {
        hasher.update_byte(tag_no_mode);
        return;
    }
    hasher.update_u64(static_cast<std::uint64_t>(*mode));
}

}  // anonymous namespace

auto fingerprint(const TreeDiff& diff) -> Fingerprint {
    auto hasher = crypto::Sha256{};
    for (const auto& delta : diff) {
        hasher.update_byte(tag_file);
        hasher.update_field(delta.path);
        hasher.update_byte(static_cast<std::uint8_t>(delta.kind));
        hash_mode(hasher, delta.old_mode);
        hash_mode(hasher, delta.new_mode);

        // A run is a maximal stretch of changed lines; context lines and
        // hunk boundaries both end one. Positions are not hashed.
        for (const auto& hunk : delta.hunks) {
            auto in_run = false;
            for (const auto& line : hunk.lines) {
                if (line.origin == LineOrigin::context) {
                    in_run = false;
                    continue;
                }
                if (!in_run) {
                    hasher.update_byte(tag_run);
                    in_run = true;
                }
                hasher.update_byte(line.origin == LineOrigin::deletion ? tag_deleted : tag_added);
                hasher.update_field(line.text);
            }
        }
    }
    return Fingerprint{hasher.finalize()};
}

auto fingerprint(const Repository& repo, const Commit& commit) -> std::optional<Fingerprint> {
    if (commit.is_merge()) return std::nullopt;
    return fingerprint(repo.diff(commit));
}

auto FingerprintCache::get(const Commit& commit) -> std::optional<Fingerprint> {
    auto it = cache_.find(commit.id);
    if (it != cache_.end()) return it->second;
    auto fp = fingerprint(repo_, commit);
    cache_.emplace(commit.id, fp);
    return fp;
}

}  // namespace topbase_cpp
