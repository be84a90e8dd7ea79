#include "../src/crypto/sha256.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using namespace topbase_cpp::crypto;

// Helper: convert a hex string to bytes
static auto hex_to_bytes(const std::string& hex) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto byte_str = hex.substr(i, 2);
        result.push_back(static_cast<std::byte>(std::stoul(byte_str, nullptr, 16)));
    }
    return result;
}

// Helper: convert bytes to hex string
static auto bytes_to_hex(std::span<const std::byte> bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    for (auto b : bytes) {
        auto val = static_cast<std::uint8_t>(b);
        result += hex_chars[val >> 4];
        result += hex_chars[val & 0x0F];
    }
    return result;
}

// Helper: hash a string
static auto sha256_string(const std::string& s) -> std::string {
    auto input = std::vector<std::byte>(s.size());
    std::memcpy(input.data(), s.data(), s.size());
    auto digest = sha256(input);
    return bytes_to_hex(digest);
}

// NIST test vectors

TEST(Sha256, empty_string) {
    auto digest = sha256_string("");
    EXPECT_EQ(digest, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, abc) {
    auto digest = sha256_string("abc");
    EXPECT_EQ(digest, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, two_block_message) {
    auto digest = sha256_string("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");
    EXPECT_EQ(digest, "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, long_message) {
    auto digest = sha256_string(
        "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
        "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu");
    EXPECT_EQ(digest, "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST(Sha256, single_byte) {
    auto input = std::vector<std::byte>{std::byte{0x00}};
    auto digest = sha256(input);
    auto hex = bytes_to_hex(digest);
    EXPECT_EQ(hex, "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST(Sha256, sixty_four_bytes_exact_block) {
    // Exactly one block of data
    auto input = std::vector<std::byte>(64, std::byte{0x41});  // 64 'A's
    auto digest = sha256(input);
    auto hex = bytes_to_hex(digest);
    // Known result for 64 x 'A'
    auto expected = sha256_string(std::string(64, 'A'));
    EXPECT_EQ(hex, expected);
}

TEST(Sha256, span_overload_matches_vector_overload) {
    auto input = std::vector<std::byte>{std::byte{0x48}, std::byte{0x65},
                                         std::byte{0x6c}, std::byte{0x6c}, std::byte{0x6f}};
    auto digest1 = sha256(input);
    auto digest2 = sha256(std::span<const std::byte>{input});
    EXPECT_EQ(digest1, digest2);
}

// Incremental hashing

TEST(Sha256, chunked_updates_match_one_shot) {
    const auto text = std::string(1000, 'x') + "tail";
    const auto expected = sha256(std::string_view{text});

    for (std::size_t chunk : {1u, 7u, 63u, 64u, 65u, 200u}) {
        auto hasher = Sha256{};
        for (std::size_t pos = 0; pos < text.size(); pos += chunk) {
            hasher.update(std::string_view{text}.substr(pos, chunk));
        }
        EXPECT_EQ(hasher.finalize(), expected) << "chunk size " << chunk;
    }
}

TEST(Sha256, padding_boundary_at_fifty_six_bytes) {
    // 56 bytes forces the length into a second block
    auto digest = sha256_string(std::string(56, 'a'));
    EXPECT_EQ(digest, "b35439a4ac6f0948b6d6f9e3c6af0f5f590ce20f1bde7090ef7970686ec6738a");
}

TEST(Sha256, fields_are_length_prefixed) {
    auto a = Sha256{};
    a.update_field("ab");
    a.update_field("c");

    auto b = Sha256{};
    b.update_field("a");
    b.update_field("bc");

    EXPECT_NE(a.finalize(), b.finalize());
}

TEST(Sha256, update_u64_is_big_endian) {
    auto a = Sha256{};
    a.update_u64(0x0102030405060708ULL);

    const auto raw = std::vector<std::byte>{
        std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4},
        std::byte{5}, std::byte{6}, std::byte{7}, std::byte{8}};
    EXPECT_EQ(a.finalize(), sha256(raw));
}
