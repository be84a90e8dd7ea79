#include <topbase-cpp/error.hpp>
#include <topbase-cpp/types.hpp>

#include "encoding/hex.hpp"

#include <string>
#include <utility>

namespace topbase_cpp {

auto to_hex(const CommitId& id) -> std::string {
    return encoding::bytes_to_hex(id.bytes.data(), id.bytes.size());
}

auto to_hex(const Fingerprint& fp) -> std::string {
    return encoding::bytes_to_hex(fp.bytes.data(), fp.bytes.size());
}

auto short_hex(const CommitId& id) -> std::string {
    return encoding::bytes_to_hex(id.bytes.data(), 6);
}

auto commit_id_from_hex(std::string_view hex) -> std::optional<CommitId> {
    auto bytes = encoding::hex_to_bytes<CommitId::size>(hex);
    if (!bytes) return std::nullopt;
    return CommitId{*bytes};
}

// -- ReconcileError -----------------------------------------------------------

static auto describe(const Error& e) -> std::string {
    auto text = std::string{to_string_view(e.kind)} + ": " + e.message;
    if (!e.branch.empty()) text += " (branch " + e.branch + ")";
    if (e.commit) text += " (commit " + short_hex(*e.commit) + ")";
    if (!e.path.empty()) text += " (path " + e.path + ")";
    return text;
}

ReconcileError::ReconcileError(Error error)
    : std::runtime_error{describe(error)}, error_{std::move(error)} {}

}  // namespace topbase_cpp
