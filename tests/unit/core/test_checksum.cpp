/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <chunk_relay/core/checksum.h>

#include <cstring>
#include <random>
#include <string>
#include <vector>

namespace chunk_relay::test {

class ChecksumTest : public ::testing::Test {
protected:
    static auto bytes_of(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty()) {
            std::memcpy(bytes.data(), text.data(), text.size());
        }
        return bytes;
    }
};

// CRC32 Tests

TEST_F(ChecksumTest, CRC32_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32_KnownValues) {
    // "123456789" -> 0xCBF43926
    auto data = bytes_of("123456789");
    EXPECT_EQ(checksum::crc32(data), 0xCBF43926u);
}

TEST_F(ChecksumTest, CRC32_SingleByte) {
    std::vector<std::byte> data = {std::byte{0x00}};
    auto crc1 = checksum::crc32(data);

    data[0] = std::byte{0xFF};
    auto crc2 = checksum::crc32(data);

    EXPECT_NE(crc1, crc2);
}

TEST_F(ChecksumTest, CRC32_Verify) {
    auto data = bytes_of("123456789");
    EXPECT_TRUE(checksum::verify_crc32(data, 0xCBF43926u));
    EXPECT_FALSE(checksum::verify_crc32(data, 0xCBF43927u));
}

TEST_F(ChecksumTest, CRC32_LargeDataIsStable) {
    std::vector<std::byte> data(1024 * 1024);
    std::mt19937 rng(42);
    for (auto& b : data) {
        b = static_cast<std::byte>(rng() & 0xFF);
    }
    EXPECT_EQ(checksum::crc32(data), checksum::crc32(data));

    auto changed = data;
    changed[data.size() / 2] ^= std::byte{0x01};
    EXPECT_NE(checksum::crc32(data), checksum::crc32(changed));
}

// SHA-256 Tests

TEST_F(ChecksumTest, SHA256_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::sha256(empty),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    EXPECT_EQ(checksum::sha256(bytes_of("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// Digest helpers

TEST_F(ChecksumTest, Compute_CRC32IsEightLowercaseHexDigits) {
    auto digest = checksum::compute(checksum_algorithm::crc32, bytes_of("123456789"));
    EXPECT_EQ(digest, "cbf43926");

    auto zero = checksum::compute(checksum_algorithm::crc32, std::vector<std::byte>{});
    EXPECT_EQ(zero, "00000000");
}

TEST_F(ChecksumTest, Compute_SHA256MatchesDirectCall) {
    auto data = bytes_of("chunk payload");
    EXPECT_EQ(checksum::compute(checksum_algorithm::sha256, data), checksum::sha256(data));
}

TEST_F(ChecksumTest, Verify_AcceptsMatchingDigest) {
    auto data = bytes_of("123456789");
    EXPECT_TRUE(checksum::verify(checksum_algorithm::crc32, data, "cbf43926").has_value());
}

TEST_F(ChecksumTest, Verify_RejectsMismatch) {
    auto data = bytes_of("123456789");
    auto result = checksum::verify(checksum_algorithm::crc32, data, "00000000");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::chunk_checksum_mismatch);

    auto sha = checksum::verify(checksum_algorithm::sha256, data, checksum::sha256(bytes_of("x")));
    ASSERT_FALSE(sha.has_value());
    EXPECT_EQ(sha.error().code, error_code::chunk_checksum_mismatch);
}

}  // namespace chunk_relay::test
