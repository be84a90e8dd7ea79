/// @file diff.hpp
/// @brief Line-level tree diffs and their application onto another base.

#pragma once

#include <topbase-cpp/commit.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace topbase_cpp {

/// Role of a line within a hunk.
enum class LineOrigin : std::uint8_t {
    context,   ///< Present before and after.
    addition,  ///< Inserted by the change.
    deletion,  ///< Removed by the change.
};

/// One line of a hunk. The text keeps its trailing newline, if any.
struct DiffLine {
    LineOrigin origin;
    std::string text;

    auto operator==(const DiffLine&) const -> bool = default;
};

/// A contiguous region of change within a file.
struct Hunk {
    std::size_t old_start{0};    ///< 0-based line index in the old file.
    std::size_t new_start{0};    ///< 0-based line index in the new file.
    std::vector<DiffLine> lines; ///< Context, deletions and additions in file order.

    /// Number of old-file lines the hunk spans (context + deletions).
    auto old_count() const -> std::size_t;

    /// Number of new-file lines the hunk spans (context + additions).
    auto new_count() const -> std::size_t;

    auto operator==(const Hunk&) const -> bool = default;
};

/// How a single path changed.
enum class DeltaKind : std::uint8_t {
    added,
    deleted,
    modified,
};

/// The change to one path.
struct FileDelta {
    std::string path;
    DeltaKind kind{DeltaKind::modified};
    std::optional<FileMode> old_mode;  ///< Absent for added files.
    std::optional<FileMode> new_mode;  ///< Absent for deleted files.
    std::vector<Hunk> hunks;

    auto operator==(const FileDelta&) const -> bool = default;
};

/// A full change between two trees, one delta per changed path in
/// path order.
using TreeDiff = std::vector<FileDelta>;

/// Default number of context lines around each change.
inline constexpr std::size_t default_context_lines = 3;

/// Split file content into lines, each keeping its trailing newline.
/// A final line without a newline is kept as-is.
auto split_lines(std::string_view text) -> std::vector<std::string>;

/// Compute the hunks turning `before` into `after`.
auto diff_lines(const std::vector<std::string>& before,
                const std::vector<std::string>& after,
                std::size_t context = default_context_lines) -> std::vector<Hunk>;

/// Compute the change turning `before` into `after`.
auto diff_trees(const Tree& before, const Tree& after,
                std::size_t context = default_context_lines) -> TreeDiff;

/// Why a diff could not be applied.
struct ApplyConflict {
    std::string path;    ///< The path that failed.
    std::string reason;  ///< A human-readable description.

    auto operator==(const ApplyConflict&) const -> bool = default;
};

/// Apply hunks onto file content.
///
/// Each hunk's pre-image is looked up at its recorded position shifted
/// by the drift of earlier hunks, then searched outward. Returns
/// nullopt if some pre-image is not found exactly.
auto apply_hunks(std::string_view content, const std::vector<Hunk>& hunks)
    -> std::optional<std::string>;

/// Apply a diff onto a (possibly different) base tree.
///
/// @return The patched tree, or the first conflict encountered.
auto apply_diff(const Tree& base, const TreeDiff& diff)
    -> std::variant<Tree, ApplyConflict>;

}  // namespace topbase_cpp
