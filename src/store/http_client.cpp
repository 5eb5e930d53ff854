/**
 * @file http_client.cpp
 * @brief network_system backed HTTP client for the stores
 */

#include <chunk_relay/store/http_client.h>

#include <chunk_relay/config/feature_flags.h>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace chunk_relay {

#if !KCENON_WITH_NETWORK_SYSTEM
namespace {

auto unavailable(const char* method) -> unexpected {
    return unexpected{error{error_code::store_request_failed,
                            std::string("HTTP ") + method +
                                " unavailable: built without network_system"}};
}

}  // namespace
#endif

struct store_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert(const kcenon::network::internal::http_response& resp) -> http_response {
        http_response out;
        out.status_code = resp.status_code;
        out.headers = resp.headers;
        out.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return out;
    }

    template <typename Response>
    static auto finish(Response&& response, const char* method) -> result<http_response> {
        if (response.is_err()) {
            return unexpected{error{error_code::store_request_failed,
                                    std::string("HTTP ") + method + " request failed"}};
        }
        return convert(response.value());
    }
#endif
};

store_http_client::store_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

store_http_client::~store_http_client() = default;

auto store_http_client::get(const std::string& url, const http_query& query,
                            const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->get(url, query, headers), "GET");
#else
    (void)url;
    (void)query;
    (void)headers;
    return unavailable("GET");
#endif
}

auto store_http_client::post(const std::string& url, const std::string& body,
                             const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->post(url, body, headers), "POST");
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable("POST");
#endif
}

auto store_http_client::post(const std::string& url, const std::vector<uint8_t>& body,
                             const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->post(url, body, headers), "POST");
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable("POST");
#endif
}

auto store_http_client::put(const std::string& url, const std::vector<uint8_t>& body,
                            const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string body_str(body.begin(), body.end());
    return impl::finish(impl_->client->put(url, body_str, headers), "PUT");
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable("PUT");
#endif
}

auto store_http_client::del(const std::string& url, const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->del(url, headers), "DELETE");
#else
    (void)url;
    (void)headers;
    return unavailable("DELETE");
#endif
}

auto store_http_client::head(const std::string& url, const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->head(url, headers), "HEAD");
#else
    (void)url;
    (void)headers;
    return unavailable("HEAD");
#endif
}

auto store_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto make_store_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<store_http_client>(timeout);
}

}  // namespace chunk_relay
