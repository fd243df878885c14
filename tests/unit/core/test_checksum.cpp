/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/checksum.h>

#include <cstring>
#include <random>
#include <string>
#include <vector>

namespace kcenon::chunked_upload::test {

class ChecksumTest : public ::testing::Test {
protected:
    static auto to_bytes(const std::string& content) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(content.size());
        if (!content.empty()) {
            std::memcpy(bytes.data(), content.data(), content.size());
        }
        return bytes;
    }
};

// CRC32 Tests

TEST_F(ChecksumTest, CRC32_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32_KnownValue) {
    // IEEE 802.3 check value
    EXPECT_EQ(checksum::crc32(to_bytes("123456789")), 0xCBF43926u);
}

TEST_F(ChecksumTest, CRC32_Verify) {
    auto data = to_bytes("chunk payload");
    auto crc = checksum::crc32(data);

    EXPECT_TRUE(checksum::verify_crc32(data, crc));
    EXPECT_FALSE(checksum::verify_crc32(data, crc ^ 0x1u));
}

TEST_F(ChecksumTest, CRC32_DetectsSingleBitFlip) {
    auto data = to_bytes("The quick brown fox jumps over the lazy dog");
    auto crc = checksum::crc32(data);

    data[10] ^= std::byte{0x01};
    EXPECT_NE(checksum::crc32(data), crc);
}

// SHA-256 Tests

TEST_F(ChecksumTest, SHA256_EmptyData) {
    std::vector<std::byte> empty;
    auto digest = checksum::sha256(empty);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    auto digest = checksum::sha256(to_bytes("abc"));
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, SHA256_IncrementalMatchesOneShot) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> dis(0, 255);
    std::vector<std::byte> data(100000);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }

    sha256_hasher hasher;
    std::span<const std::byte> view(data);
    std::size_t offset = 0;
    for (std::size_t step : {1u, 7u, 4096u, 30000u}) {
        ASSERT_TRUE(hasher.update(view.subspan(offset, step)).has_value());
        offset += step;
    }
    ASSERT_TRUE(hasher.update(view.subspan(offset)).has_value());

    auto incremental = hasher.finish();
    auto one_shot = checksum::sha256(data);
    ASSERT_TRUE(incremental.has_value());
    ASSERT_TRUE(one_shot.has_value());
    EXPECT_EQ(incremental.value(), one_shot.value());
}

TEST_F(ChecksumTest, SHA256_IsLowercaseHex) {
    auto digest = checksum::sha256(to_bytes("chunked upload"));
    ASSERT_TRUE(digest.has_value());
    ASSERT_EQ(digest.value().size(), 64u);
    for (char c : digest.value()) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

}  // namespace kcenon::chunked_upload::test
