/// @file json.hpp
/// @brief nlohmann/json interoperability for topbase-cpp.
///
/// Provides ADL serialization (to_json/from_json) for identities,
/// commits, results and errors, loading Options from configuration,
/// and export/import of a MemoryRepository for fixtures.

#pragma once

#include <topbase-cpp/commit.hpp>
#include <topbase-cpp/dry_run_repository.hpp>
#include <topbase-cpp/error.hpp>
#include <topbase-cpp/fork_point.hpp>
#include <topbase-cpp/memory_repository.hpp>
#include <topbase-cpp/reconcile.hpp>
#include <topbase-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace topbase_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Identity types (hex string) ----------------------------------------------

void to_json(nlohmann::json& j, const CommitId& id);
void from_json(const nlohmann::json& j, CommitId& id);

void to_json(nlohmann::json& j, const Fingerprint& fp);

// -- Commit data --------------------------------------------------------------

void to_json(nlohmann::json& j, const Signature& s);
void from_json(const nlohmann::json& j, Signature& s);

void to_json(nlohmann::json& j, const Commit& c);
void from_json(const nlohmann::json& j, Commit& c);

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::json& j, const ForkPoint& fp);
void to_json(nlohmann::json& j, const Error& e);
void to_json(nlohmann::json& j, const Result& r);
void to_json(nlohmann::json& j, const RefUpdate& u);

// -- Configuration ------------------------------------------------------------

/// Reads the keys present in `j`, leaving the others at their defaults:
/// @code
/// {
///   "require_clean": true,
///   "log_level": "info",
///   "committer": {"name": "Bot", "email": "bot@example.com", "time": 1700000000}
/// }
/// @endcode
/// Throws ReconcileError(invalid_options) on wrong types or unknown levels.
void from_json(const nlohmann::json& j, Options& o);
void to_json(nlohmann::json& j, const Options& o);

/// Parse Options from JSON text.
/// @throws ReconcileError(invalid_options) on malformed JSON.
auto parse_options(std::string_view text) -> Options;

// =============================================================================
// Repository export / import
// =============================================================================

/// Export every commit and branch of a repository.
auto export_json(const MemoryRepository& repo) -> nlohmann::json;

/// Rebuild a repository from export_json() output.
///
/// Commit ids are recomputed and checked against the recorded ones.
/// @throws ReconcileError(invalid_repository) on malformed data or an id
///   mismatch, ReconcileError(unknown_commit) on a dangling parent or branch.
auto import_repository(const nlohmann::json& j) -> MemoryRepository;

}  // namespace topbase_cpp
