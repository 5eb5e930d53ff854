/**
 * @file store_utils.cpp
 * @brief Encoding, signing and parsing helpers shared by the stores
 */

#include <chunk_relay/store/store_utils.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace chunk_relay::store_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::nouppercase;
        }
    }

    return escaped.str();
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return hash;
}

auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return hash;
}

auto hmac_sha256(const std::vector<uint8_t>& key, const std::string& data)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

auto hmac_sha256(const std::string& key, const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> key_bytes(key.begin(), key.end());
    return hmac_sha256(key_bytes, data);
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {

auto to_utc_tm(std::chrono::system_clock::time_point tp) -> std::tm {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    return tm;
}

}  // namespace

auto format_iso8601_time(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d");
    return oss.str();
}

auto parse_rfc3339_time(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream iss(value);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
#ifdef _WIN32
    auto seconds = _mkgmtime(&tm);
#else
    auto seconds = timegm(&tm);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

// ============================================================================
// XML / JSON Utilities
// ============================================================================

auto extract_xml_element(const std::string& xml, const std::string& tag)
    -> std::optional<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return xml.substr(start_pos, end_pos - start_pos);
}

auto extract_xml_elements(const std::string& xml, const std::string& tag)
    -> std::vector<std::string> {
    std::vector<std::string> elements;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    std::size_t pos = 0;
    while (true) {
        auto start_pos = xml.find(open_tag, pos);
        if (start_pos == std::string::npos) {
            break;
        }
        start_pos += open_tag.length();
        auto end_pos = xml.find(close_tag, start_pos);
        if (end_pos == std::string::npos) {
            break;
        }
        elements.push_back(xml.substr(start_pos, end_pos - start_pos));
        pos = end_pos + close_tag.length();
    }

    return elements;
}

namespace {

auto find_json_value_start(const std::string& json, const std::string& key)
    -> std::optional<std::size_t> {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find(':', pos + search.length());
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

// Index of the quote closing the string that opens at pos
auto closing_quote(const std::string& json, std::size_t pos) -> std::size_t {
    for (auto i = pos + 1; i < json.size(); ++i) {
        if (json[i] == '\\') {
            ++i;
        } else if (json[i] == '"') {
            return i;
        }
    }
    return std::string::npos;
}

/**
 * @brief Start of the value of key among the members of the outermost object
 *
 * Keys of nested objects and arrays are skipped.
 */
auto find_top_level_value_start(const std::string& json, const std::string& key)
    -> std::optional<std::size_t> {
    const std::string quoted = "\"" + key + "\"";
    int depth = 0;
    for (std::size_t pos = 0; pos < json.size(); ++pos) {
        char c = json[pos];
        if (c == '"') {
            auto end = closing_quote(json, pos);
            if (end == std::string::npos) {
                return std::nullopt;
            }
            if (depth == 1 && json.compare(pos, end - pos + 1, quoted) == 0) {
                auto colon = json.find_first_not_of(" \t\n\r", end + 1);
                if (colon != std::string::npos && json[colon] == ':') {
                    auto value = json.find_first_not_of(" \t\n\r", colon + 1);
                    if (value == std::string::npos) {
                        return std::nullopt;
                    }
                    return value;
                }
            }
            pos = end;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        }
    }
    return std::nullopt;
}

auto read_json_scalar(const std::string& json, std::size_t pos) -> std::string {
    if (json[pos] == '"') {
        auto end_pos = closing_quote(json, pos);
        if (end_pos == std::string::npos) {
            end_pos = json.size();
        }
        return json.substr(pos + 1, end_pos - pos - 1);
    }

    auto end_pos = json.find_first_of(",}]\n", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    auto value = json.substr(pos, end_pos - pos);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

auto read_json_object(const std::string& json, std::size_t start) -> std::optional<std::string> {
    if (json[start] != '{') {
        return std::nullopt;
    }

    int depth = 0;
    for (auto pos = start; pos < json.size(); ++pos) {
        char c = json[pos];
        if (c == '"') {
            pos = closing_quote(json, pos);
            if (pos == std::string::npos) {
                return std::nullopt;
            }
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return json.substr(start, pos - start + 1);
            }
        }
    }
    return std::nullopt;
}

}  // namespace

auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto start = find_json_value_start(json, key);
    if (!start) {
        return std::nullopt;
    }
    return read_json_scalar(json, *start);
}

auto extract_json_object(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto start = find_json_value_start(json, key);
    if (!start) {
        return std::nullopt;
    }
    return read_json_object(json, *start);
}

auto extract_top_level_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto start = find_top_level_value_start(json, key);
    if (!start) {
        return std::nullopt;
    }
    return read_json_scalar(json, *start);
}

auto extract_top_level_json_object(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto start = find_top_level_value_start(json, key);
    if (!start) {
        return std::nullopt;
    }
    return read_json_object(json, *start);
}

// ============================================================================
// Content Type Detection
// ============================================================================

auto detect_content_type(const std::string& key) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".mp4", "video/mp4"},
        {".m4v", "video/x-m4v"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".avi", "video/x-msvideo"},
        {".mov", "video/quicktime"},
        {".wmv", "video/x-ms-wmv"},
        {".flv", "video/x-flv"},
        {".ts", "video/mp2t"},
        {".mpg", "video/mpeg"},
        {".mpeg", "video/mpeg"},
        {".3gp", "video/3gpp"},
        {".mp3", "audio/mpeg"},
        {".m4a", "audio/mp4"},
        {".aac", "audio/aac"},
        {".flac", "audio/flac"},
        {".ogg", "audio/ogg"},
        {".opus", "audio/opus"},
        {".wav", "audio/wav"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".txt", "text/plain"},
        {".srt", "application/x-subrip"},
        {".vtt", "text/vtt"},
        {".html", "text/html"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".rar", "application/vnd.rar"},
        {".apk", "application/vnd.android.package-archive"},
        {".iso", "application/x-iso9660-image"},
    };

    auto slash_pos = key.find_last_of('/');
    auto dot_pos = key.rfind('.');
    if (dot_pos == std::string::npos ||
        (slash_pos != std::string::npos && dot_pos < slash_pos)) {
        return "application/octet-stream";
    }

    std::string ext = key.substr(dot_pos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

// ============================================================================
// Status Mapping
// ============================================================================

auto is_retryable_status(int status_code) -> bool {
    if (status_code == 429 || status_code == 503) {
        return true;
    }
    return status_code >= 500 && status_code < 600;
}

auto status_to_error(int status_code, const std::string& context) -> error {
    auto message = context + " (HTTP " + std::to_string(status_code) + ")";

    if (status_code == 429) {
        return error{error_code::store_rate_limited, message};
    }
    if (status_code >= 500 && status_code < 600) {
        return error{error_code::store_server_error, message};
    }
    if (status_code == 401 || status_code == 403) {
        return error{error_code::store_access_denied, message};
    }
    if (status_code == 404) {
        return error{error_code::object_not_found, message};
    }
    if (status_code == 416) {
        return error{error_code::range_not_satisfiable, message};
    }
    return error{error_code::store_request_failed, message};
}

}  // namespace chunk_relay::store_utils
