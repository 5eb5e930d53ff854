/**
 * @file http_client.h
 * @brief HTTP seam shared by the remote store implementations
 *
 * Both store variants talk to their backends through http_client_interface.
 * store_http_client implements it over network_system's HTTP client; tests
 * inject in-memory fakes.
 */

#ifndef CHUNK_RELAY_STORE_HTTP_CLIENT_H
#define CHUNK_RELAY_STORE_HTTP_CLIENT_H

#include <chunk_relay/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunk_relay {

using http_headers = std::map<std::string, std::string>;
using http_query = std::map<std::string, std::string>;

/**
 * @brief HTTP response as seen by the stores
 */
struct http_response {
    int status_code = 0;
    http_headers headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        auto wanted = lower(key);
        for (const auto& [name, value] : headers) {
            if (lower(name) == wanted) {
                return value;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Abstract HTTP client
 *
 * A returned error means the request did not produce an HTTP response
 * (connection refused, DNS failure, timeout). HTTP error statuses are
 * returned as responses.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto get(const std::string& url, const http_query& query,
                     const http_headers& headers) -> result<http_response> = 0;

    virtual auto post(const std::string& url, const std::string& body,
                      const http_headers& headers) -> result<http_response> = 0;

    virtual auto post(const std::string& url, const std::vector<uint8_t>& body,
                      const http_headers& headers) -> result<http_response> = 0;

    virtual auto put(const std::string& url, const std::vector<uint8_t>& body,
                     const http_headers& headers) -> result<http_response> = 0;

    virtual auto del(const std::string& url, const http_headers& headers)
        -> result<http_response> = 0;

    virtual auto head(const std::string& url, const http_headers& headers)
        -> result<http_response> = 0;
};

/**
 * @brief http_client_interface over network_system
 *
 * Without network_system every request fails with store_request_failed.
 */
class store_http_client : public http_client_interface {
public:
    explicit store_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~store_http_client() override;

    store_http_client(const store_http_client&) = delete;
    auto operator=(const store_http_client&) -> store_http_client& = delete;

    auto get(const std::string& url, const http_query& query,
             const http_headers& headers) -> result<http_response> override;

    auto post(const std::string& url, const std::string& body,
              const http_headers& headers) -> result<http_response> override;

    auto post(const std::string& url, const std::vector<uint8_t>& body,
              const http_headers& headers) -> result<http_response> override;

    auto put(const std::string& url, const std::vector<uint8_t>& body,
             const http_headers& headers) -> result<http_response> override;

    auto del(const std::string& url, const http_headers& headers)
        -> result<http_response> override;

    auto head(const std::string& url, const http_headers& headers)
        -> result<http_response> override;

    /**
     * @brief Whether requests can actually be sent
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_store_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client_interface>;

}  // namespace chunk_relay

#endif  // CHUNK_RELAY_STORE_HTTP_CLIENT_H
