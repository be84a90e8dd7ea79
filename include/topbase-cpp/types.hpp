/// @file types.hpp
/// @brief Core identity types: CommitId, Fingerprint.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace topbase_cpp {

/// A 32-byte SHA-256 content hash identifying a commit.
///
/// Commits are content-addressed: the id is computed over the tree,
/// parents, signatures and message. Recreating a byte-identical commit
/// therefore yields the same id, which is what makes a fast-forward
/// preserve hashes.
struct CommitId {
    static constexpr std::size_t size = 32;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw hash bytes.

    constexpr CommitId() = default;

    /// Construct from a byte array.
    explicit constexpr CommitId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit CommitId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const CommitId&) const = default;
    auto operator==(const CommitId&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

/// A 32-byte content identity of a commit's change.
///
/// Two commits whose diffs insert and delete the same lines in the same
/// paths (with the same mode changes) share a Fingerprint, regardless
/// of hash, author, timestamp or message.
struct Fingerprint {
    static constexpr std::size_t size = 32;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw digest bytes.

    constexpr Fingerprint() = default;

    /// Construct from a byte array.
    explicit constexpr Fingerprint(std::array<std::byte, size> b) : bytes{b} {}

    auto operator<=>(const Fingerprint&) const = default;
    auto operator==(const Fingerprint&) const -> bool = default;
};

/// Render a commit id as 64 lowercase hex characters.
auto to_hex(const CommitId& id) -> std::string;

/// Render a fingerprint as 64 lowercase hex characters.
auto to_hex(const Fingerprint& fp) -> std::string;

/// The first 12 hex characters of a commit id, for log messages.
auto short_hex(const CommitId& id) -> std::string;

/// Parse a 64-character hex string. Returns nullopt on bad length or digits.
auto commit_id_from_hex(std::string_view hex) -> std::optional<CommitId>;

}  // namespace topbase_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<topbase_cpp::CommitId> {
    auto operator()(const topbase_cpp::CommitId& id) const noexcept -> std::size_t {
        // First 8 bytes of the SHA-256 hash are already well-distributed
        auto result = std::size_t{0};
        const auto* p = reinterpret_cast<const unsigned char*>(id.bytes.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

template <>
struct std::hash<topbase_cpp::Fingerprint> {
    auto operator()(const topbase_cpp::Fingerprint& fp) const noexcept -> std::size_t {
        auto result = std::size_t{0};
        const auto* p = reinterpret_cast<const unsigned char*>(fp.bytes.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

/// @endcond
