/// @file error.hpp
/// @brief Error types for the topbase-cpp library.

#pragma once

#include <topbase-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace topbase_cpp {

/// Categories of errors that can occur during reconciliation.
enum class ErrorKind : std::uint8_t {
    dirty_working_tree,      ///< The working tree has local modifications.
    unknown_branch,          ///< A named branch does not exist.
    unknown_commit,          ///< A commit id is not in the repository.
    conflict_during_replay,  ///< A commit's change does not apply on the new parent.
    ambiguous_fork_point,    ///< No common fingerprint; the whole source is replayed.
    invalid_options,         ///< Configuration could not be parsed.
    invalid_repository,      ///< Exported repository data is malformed or inconsistent.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::dirty_working_tree:     return "dirty_working_tree";
        case ErrorKind::unknown_branch:         return "unknown_branch";
        case ErrorKind::unknown_commit:         return "unknown_commit";
        case ErrorKind::conflict_during_replay: return "conflict_during_replay";
        case ErrorKind::ambiguous_fork_point:   return "ambiguous_fork_point";
        case ErrorKind::invalid_options:        return "invalid_options";
        case ErrorKind::invalid_repository:     return "invalid_repository";
    }
    return "unknown";
}

/// A structured error with a category, a human-readable message and
/// whatever context identifies the offending object.
struct Error {
    ErrorKind kind;                 ///< The category of this error.
    std::string message;            ///< A human-readable description.
    std::string branch{};           ///< Branch involved, if any.
    std::optional<CommitId> commit; ///< Offending commit, if any.
    std::string path{};             ///< Offending file path, if any.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying a structured Error.
///
/// Every fatal failure in the library is reported through this type;
/// what() returns the error message prefixed by its kind.
class ReconcileError : public std::runtime_error {
public:
    explicit ReconcileError(Error error);

    /// The structured error.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace topbase_cpp
