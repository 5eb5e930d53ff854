/**
 * @file transfer_types.cpp
 * @brief Implementation of session_id serialization and object ID helpers
 */

#include "chunk_relay/core/transfer_types.h"

#include <array>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>

namespace chunk_relay {

auto session_id::generate() -> session_id {
    session_id id;

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        id.bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // RFC 4122 version 4, variant 1
    id.bytes[6] = (id.bytes[6] & 0x0F) | 0x40;
    id.bytes[8] = (id.bytes[8] & 0x3F) | 0x80;

    return id;
}

auto session_id::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

auto session_id::from_string(std::string_view str) -> std::optional<session_id> {
    std::string hex_str;
    hex_str.reserve(32);

    for (char c : str) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex_str += c;
    }

    if (hex_str.length() != 32) {
        return std::nullopt;
    }

    session_id id;
    for (std::size_t i = 0; i < 16; ++i) {
        id.bytes[i] = static_cast<uint8_t>(
            std::stoul(hex_str.substr(i * 2, 2), nullptr, 16));
    }

    return id;
}

auto make_object_id(std::string_view file_name) -> object_id {
    std::string sanitized;
    sanitized.reserve(file_name.size());
    for (char c : file_name) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || std::iscntrl(uc)) {
            sanitized += '_';
        } else {
            sanitized += c;
        }
    }
    if (sanitized.empty() || sanitized == "." || sanitized == "..") {
        sanitized = "unnamed";
    }

    object_id id;
    id.reserve(object_key_prefix.size() + 37 + sanitized.size());
    id.append(object_key_prefix);
    id.append(session_id::generate().to_string());
    id.push_back('/');
    id.append(sanitized);
    return id;
}

auto object_file_name(const object_id& id) -> std::string {
    auto pos = id.rfind('/');
    if (pos == std::string::npos) {
        return id;
    }
    return id.substr(pos + 1);
}

auto format_size(uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    auto size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", size, units[unit]);
    return buffer;
}

}  // namespace chunk_relay
