#pragma once

// Lowercase hex encoding of fixed-size digests.
// Internal header, not installed.

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace topbase_cpp::encoding {

inline auto bytes_to_hex(const std::byte* data, std::size_t len) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        auto b = static_cast<unsigned char>(data[i]);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

inline auto hex_char_to_nibble(char c) -> std::optional<std::byte> {
    if (c >= '0' && c <= '9') return std::byte(c - '0');
    if (c >= 'a' && c <= 'f') return std::byte(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return std::byte(c - 'A' + 10);
    return std::nullopt;
}

// Decode exactly N bytes. Returns nullopt on wrong length or a non-hex digit.
template <std::size_t N>
auto hex_to_bytes(std::string_view hex) -> std::optional<std::array<std::byte, N>> {
    if (hex.size() != N * 2) return std::nullopt;
    auto out = std::array<std::byte, N>{};
    for (std::size_t i = 0; i < N; ++i) {
        auto hi = hex_char_to_nibble(hex[i * 2]);
        auto lo = hex_char_to_nibble(hex[i * 2 + 1]);
        if (!hi || !lo) return std::nullopt;
        out[i] = (*hi << 4) | *lo;
    }
    return out;
}

}  // namespace topbase_cpp::encoding
