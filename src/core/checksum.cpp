/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <chunk_relay/core/checksum.h>

#include <openssl/sha.h>

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace chunk_relay {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

auto to_hex(const unsigned char* data, std::size_t length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

auto lowercase(const std::string& value) -> std::string {
    std::string out = value;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

}  // namespace

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    uint32_t crc = 0xFFFFFFFF;

    for (std::byte b : data) {
        uint8_t index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }

    return crc ^ 0xFFFFFFFF;
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

auto checksum::compute(checksum_algorithm algorithm, std::span<const std::byte> data)
    -> std::string {
    if (algorithm == checksum_algorithm::sha256) {
        return sha256(data);
    }

    uint32_t value = crc32(data);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}

auto checksum::verify(checksum_algorithm algorithm, std::span<const std::byte> data,
                      const std::string& expected) -> result<void> {
    auto actual = compute(algorithm, data);
    if (actual != lowercase(expected)) {
        return unexpected(error{error_code::chunk_checksum_mismatch,
                                "expected " + expected + ", got " + actual});
    }
    return {};
}

}  // namespace chunk_relay
