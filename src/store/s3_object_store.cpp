/**
 * @file s3_object_store.cpp
 * @brief S3-compatible primary store implementation
 */

#include <chunk_relay/store/s3_object_store.h>

#include <chunk_relay/core/logging.h>
#include <chunk_relay/store/store_utils.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace chunk_relay {

using namespace store_utils;

namespace {

/**
 * @brief Parsed endpoint information
 */
struct endpoint_info {
    std::string host;
    std::string port;
    bool use_ssl = true;
};

auto parse_endpoint(const std::string& endpoint, bool default_ssl) -> endpoint_info {
    endpoint_info info;
    info.use_ssl = default_ssl;
    std::string url = endpoint;

    if (url.starts_with("https://")) {
        info.use_ssl = true;
        url = url.substr(8);
    } else if (url.starts_with("http://")) {
        info.use_ssl = false;
        url = url.substr(7);
    }

    auto colon_pos = url.find(':');
    auto slash_pos = url.find('/');

    if (colon_pos != std::string::npos && colon_pos < slash_pos) {
        info.host = url.substr(0, colon_pos);
        auto port_end = (slash_pos != std::string::npos) ? slash_pos : url.size();
        info.port = url.substr(colon_pos + 1, port_end - colon_pos - 1);
    } else {
        info.host = (slash_pos != std::string::npos) ? url.substr(0, slash_pos) : url;
        info.port = info.use_ssl ? "443" : "80";
    }

    return info;
}

auto to_uint8(std::span<const std::byte> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> out(data.size());
    std::transform(data.begin(), data.end(), out.begin(),
                   [](std::byte b) { return static_cast<uint8_t>(b); });
    return out;
}

auto to_bytes(const std::vector<uint8_t>& data, std::size_t offset, std::size_t count)
    -> std::vector<std::byte> {
    std::vector<std::byte> out(count);
    std::transform(data.begin() + static_cast<std::ptrdiff_t>(offset),
                   data.begin() + static_cast<std::ptrdiff_t>(offset + count), out.begin(),
                   [](uint8_t b) { return static_cast<std::byte>(b); });
    return out;
}

/**
 * @brief Canonical (sorted, encoded) query string
 */
auto canonical_query(const http_query& query) -> std::string {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : query) {
        if (!first) oss << "&";
        oss << url_encode(key) << "=" << url_encode(value);
        first = false;
    }
    return oss.str();
}

auto error_detail(const http_response& resp) -> std::string {
    auto body = resp.get_body_string();
    auto code = extract_xml_element(body, "Code");
    auto message = extract_xml_element(body, "Message");
    if (code && message) {
        return *code + ": " + *message;
    }
    return message.value_or(code.value_or(""));
}

auto response_error(const http_response& resp, const std::string& context) -> error {
    auto err = status_to_error(resp.status_code, context);
    auto detail = error_detail(resp);
    if (!detail.empty()) {
        err.message += ": " + detail;
    }
    return err;
}

}  // namespace

// ============================================================================
// s3_object_store::impl
// ============================================================================

struct s3_object_store::impl {
    /**
     * @brief State of one multipart upload in progress
     */
    struct upload_state {
        std::string upload_id;
        std::string content_type;
        std::map<uint64_t, std::string> etags;  ///< part number -> ETag
    };

    s3_store_config config;
    std::shared_ptr<http_client_interface> http;
    std::string host;
    std::string scheme;

    std::mutex uploads_mutex;
    std::unordered_map<object_id, upload_state> uploads;

    impl(const s3_store_config& cfg, std::shared_ptr<http_client_interface> client)
        : config(cfg), http(std::move(client)) {
        scheme = config.use_ssl ? "https" : "http";

        if (config.endpoint.has_value()) {
            auto info = parse_endpoint(config.endpoint.value(), config.use_ssl);
            scheme = info.use_ssl ? "https" : "http";
            host = info.host;
            if (info.port != "443" && info.port != "80") {
                host += ":" + info.port;
            }
            if (!config.use_path_style) {
                host = config.bucket + "." + host;
            }
        } else if (config.use_path_style) {
            host = "s3." + config.region + ".amazonaws.com";
        } else {
            host = config.bucket + ".s3." + config.region + ".amazonaws.com";
        }
    }

    // ------------------------------------------------------------------------
    // Addressing
    // ------------------------------------------------------------------------

    [[nodiscard]] auto bucket_path() const -> std::string {
        return config.use_path_style ? "/" + config.bucket : "/";
    }

    [[nodiscard]] auto object_path(const object_id& id) const -> std::string {
        auto encoded = url_encode(id, false);
        return config.use_path_style ? "/" + config.bucket + "/" + encoded : "/" + encoded;
    }

    [[nodiscard]] auto make_url(const std::string& path, const std::string& query) const
        -> std::string {
        auto url = scheme + "://" + host + path;
        if (!query.empty()) {
            url += "?" + query;
        }
        return url;
    }

    // ------------------------------------------------------------------------
    // Signature Version 4
    // ------------------------------------------------------------------------

    [[nodiscard]] auto signing_key(const std::string& date_stamp) const
        -> std::vector<uint8_t> {
        auto k_date = hmac_sha256("AWS4" + config.credentials.secret_access_key, date_stamp);
        auto k_region = hmac_sha256(k_date, config.region);
        auto k_service = hmac_sha256(k_region, "s3");
        return hmac_sha256(k_service, "aws4_request");
    }

    /**
     * @brief Build the signed header set for a request
     * @param extra Headers sent with the request; all of them are signed
     */
    [[nodiscard]] auto sign(const std::string& method,
                            const std::string& path,
                            const std::string& query,
                            const std::string& payload_hash,
                            http_headers extra = {}) const -> http_headers {
        auto now = std::chrono::system_clock::now();
        std::string amz_date = format_iso8601_time(now);
        std::string date_stamp = format_date_stamp(now);

        http_headers headers = std::move(extra);
        headers["Host"] = host;
        headers["x-amz-date"] = amz_date;
        headers["x-amz-content-sha256"] = payload_hash;
        if (config.credentials.session_token.has_value()) {
            headers["x-amz-security-token"] = config.credentials.session_token.value();
        }

        // Canonical headers sorted by lowercase name
        std::map<std::string, std::string> sorted_headers;
        for (const auto& [k, v] : headers) {
            std::string lower_key = k;
            std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            sorted_headers[lower_key] = v;
        }

        std::ostringstream canonical_headers;
        std::ostringstream signed_headers_builder;
        bool first = true;
        for (const auto& [k, v] : sorted_headers) {
            canonical_headers << k << ":" << v << "\n";
            if (!first) signed_headers_builder << ";";
            signed_headers_builder << k;
            first = false;
        }
        std::string signed_headers = signed_headers_builder.str();

        std::ostringstream canonical_request;
        canonical_request << method << "\n";
        canonical_request << path << "\n";
        canonical_request << query << "\n";
        canonical_request << canonical_headers.str() << "\n";
        canonical_request << signed_headers << "\n";
        canonical_request << payload_hash;

        std::string algorithm = "AWS4-HMAC-SHA256";
        std::string credential_scope = date_stamp + "/" + config.region + "/s3/aws4_request";

        std::ostringstream string_to_sign;
        string_to_sign << algorithm << "\n";
        string_to_sign << amz_date << "\n";
        string_to_sign << credential_scope << "\n";
        string_to_sign << bytes_to_hex(sha256(canonical_request.str()));

        auto signature = hmac_sha256(signing_key(date_stamp), string_to_sign.str());

        std::ostringstream auth_header;
        auth_header << algorithm << " ";
        auth_header << "Credential=" << config.credentials.access_key_id << "/"
                    << credential_scope << ", ";
        auth_header << "SignedHeaders=" << signed_headers << ", ";
        auth_header << "Signature=" << bytes_to_hex(signature);

        headers["Authorization"] = auth_header.str();
        return headers;
    }

    [[nodiscard]] auto empty_payload_hash() const -> std::string {
        return bytes_to_hex(sha256(""));
    }

    // ------------------------------------------------------------------------
    // Requests
    // ------------------------------------------------------------------------

    auto send_empty(const std::string& method, const std::string& path, const http_query& query,
                    http_headers extra = {}) -> result<http_response> {
        auto query_string = canonical_query(query);
        auto url = make_url(path, query_string);
        auto headers = sign(method, path, query_string, empty_payload_hash(), std::move(extra));

        if (method == "GET") {
            return http->get(url, {}, headers);
        }
        if (method == "HEAD") {
            return http->head(url, headers);
        }
        if (method == "DELETE") {
            return http->del(url, headers);
        }
        if (method == "POST") {
            return http->post(url, std::string{}, headers);
        }
        return http->put(url, std::vector<uint8_t>{}, headers);
    }

    /**
     * @brief Run a read-path request, retrying transient failures
     */
    template <typename T, typename Fn>
    auto with_read_retry(const std::string& what, Fn&& fn) -> result<T> {
        const auto& policy = config.read_retry;
        for (std::size_t attempt = 1;; ++attempt) {
            result<T> outcome = fn();
            if (outcome || !outcome.error().is_transient() || attempt >= policy.max_attempts) {
                return outcome;
            }
            auto delay = calculate_retry_delay(policy, attempt);
            CR_LOG_DEBUG(log_category::store,
                         "s3 " + what + " failed (" + outcome.error().message +
                             "), retrying in " + std::to_string(delay.count()) + " ms");
            std::this_thread::sleep_for(delay);
        }
    }

    auto find_upload(const object_id& id) -> std::optional<upload_state> {
        std::lock_guard<std::mutex> lock(uploads_mutex);
        auto it = uploads.find(id);
        if (it == uploads.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto put_empty_object(const object_id& id, const std::string& content_type)
        -> result<void> {
        auto path = object_path(id);
        auto response = send_empty("PUT", path, {}, {{"Content-Type", content_type}});
        if (!response) {
            return unexpected(response.error());
        }
        if (!response.value().is_success()) {
            return unexpected(response_error(response.value(), "put empty object " + id));
        }
        return {};
    }

    auto abort_upload(const object_id& id, const std::string& upload_id) -> result<void> {
        auto response = send_empty("DELETE", object_path(id), {{"uploadId", upload_id}});
        if (!response) {
            return unexpected(response.error());
        }
        const auto& resp = response.value();
        if (resp.is_success() || resp.status_code == 404) {
            return {};
        }
        return unexpected(response_error(resp, "abort multipart upload " + id));
    }
};

// ============================================================================
// s3_object_store
// ============================================================================

auto s3_object_store::create(const s3_store_config& config,
                             std::shared_ptr<http_client_interface> client)
    -> result<std::shared_ptr<s3_object_store>> {
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (!client) {
        client = make_store_http_client(config.request_timeout);
    }
    return std::make_shared<s3_object_store>(config, std::move(client));
}

s3_object_store::s3_object_store(const s3_store_config& config,
                                 std::shared_ptr<http_client_interface> client)
    : impl_(std::make_unique<impl>(config, std::move(client))) {}

s3_object_store::~s3_object_store() = default;

auto s3_object_store::name() const -> std::string_view {
    return "s3";
}

auto s3_object_store::config() const -> const s3_store_config& {
    return impl_->config;
}

auto s3_object_store::location_of(const object_id& id) const -> std::string {
    return "s3://" + impl_->config.bucket + "/" + id;
}

auto s3_object_store::begin_object(const object_id& id, const std::string& content_type)
    -> result<void> {
    auto type = content_type.empty() ? detect_content_type(id) : content_type;
    auto response = impl_->send_empty("POST", impl_->object_path(id), {{"uploads", ""}},
                                       {{"Content-Type", type}});
    if (!response) {
        return unexpected(response.error());
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        return unexpected(response_error(resp, "initiate multipart upload " + id));
    }

    auto upload_id = extract_xml_element(resp.get_body_string(), "UploadId");
    if (!upload_id || upload_id->empty()) {
        return unexpected(error{error_code::store_response_invalid,
                                "no UploadId in initiate response for " + id});
    }

    impl::upload_state previous;
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(impl_->uploads_mutex);
        auto it = impl_->uploads.find(id);
        if (it != impl_->uploads.end()) {
            previous = std::move(it->second);
            replaced = true;
        }
        impl_->uploads[id] = impl::upload_state{*upload_id, type, {}};
    }

    if (replaced) {
        if (auto aborted = impl_->abort_upload(id, previous.upload_id); !aborted) {
            CR_LOG_WARN(log_category::store,
                        "could not abort superseded upload of " + id + ": " +
                            aborted.error().message);
        }
    }

    CR_LOG_DEBUG(log_category::store, "initiated multipart upload for " + id);
    return {};
}

auto s3_object_store::validate_layout(std::size_t chunk_size, uint64_t object_size_limit) const
    -> result<void> {
    if (chunk_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size, "chunk size is zero"});
    }
    if (object_size_limit <= chunk_size) {
        return {};
    }
    if (chunk_size < min_part_size) {
        return unexpected(error{error_code::invalid_chunk_size,
                                "chunk size " + format_size(chunk_size) +
                                    " is below the S3 minimum part size of " +
                                    format_size(min_part_size)});
    }
    const uint64_t parts = (object_size_limit + chunk_size - 1) / chunk_size;
    if (parts > max_part_count) {
        return unexpected(error{error_code::invalid_chunk_size,
                                "objects up to " + format_size(object_size_limit) + " need " +
                                    std::to_string(parts) + " parts of " +
                                    format_size(chunk_size) + "; S3 allows " +
                                    std::to_string(max_part_count)});
    }
    return {};
}

auto s3_object_store::put_chunk(const object_id& id, const chunk_descriptor& descriptor,
                                std::span<const std::byte> data) -> result<void> {
    auto upload = impl_->find_upload(id);
    if (!upload) {
        return unexpected(error{error_code::invalid_state, "no upload in progress for " + id});
    }

    auto part_number = descriptor.sequence_number + 1;
    if (part_number > max_part_count) {
        return unexpected(error{error_code::invalid_chunk_size,
                                "object needs more than 10000 parts; raise the chunk size"});
    }
    if (data.size() != descriptor.length) {
        return unexpected(error{error_code::internal_error,
                                "chunk length does not match its descriptor"});
    }

    http_query query{{"partNumber", std::to_string(part_number)},
                     {"uploadId", upload->upload_id}};
    auto query_string = canonical_query(query);
    auto path = impl_->object_path(id);
    auto payload_hash = bytes_to_hex(sha256_bytes(data));
    auto headers = impl_->sign("PUT", path, query_string, payload_hash);

    auto response = impl_->http->put(impl_->make_url(path, query_string), to_uint8(data), headers);
    if (!response) {
        return unexpected(response.error());
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        return unexpected(response_error(resp, "upload part " + std::to_string(part_number)));
    }

    auto etag = resp.get_header("ETag");
    if (!etag || etag->empty()) {
        return unexpected(error{error_code::store_response_invalid,
                                "no ETag for part " + std::to_string(part_number)});
    }

    std::lock_guard<std::mutex> lock(impl_->uploads_mutex);
    auto it = impl_->uploads.find(id);
    if (it == impl_->uploads.end() || it->second.upload_id != upload->upload_id) {
        return unexpected(error{error_code::invalid_state,
                                "upload of " + id + " was aborted during part put"});
    }
    it->second.etags[part_number] = *etag;
    return {};
}

auto s3_object_store::complete_object(const stored_object_metadata& metadata)
    -> result<std::string> {
    auto upload = impl_->find_upload(metadata.id);
    if (!upload) {
        return unexpected(error{error_code::invalid_state,
                                "no upload in progress for " + metadata.id});
    }

    // S3 rejects a multipart upload without parts; store an empty object instead
    if (upload->etags.empty()) {
        if (metadata.size != 0) {
            return unexpected(error{error_code::multipart_failed,
                                    "no parts received for " + metadata.id});
        }
        if (auto aborted = impl_->abort_upload(metadata.id, upload->upload_id); !aborted) {
            return unexpected(aborted.error());
        }
        if (auto put = impl_->put_empty_object(metadata.id, upload->content_type); !put) {
            return unexpected(put.error());
        }
        std::lock_guard<std::mutex> lock(impl_->uploads_mutex);
        impl_->uploads.erase(metadata.id);
        return location_of(metadata.id);
    }

    uint64_t expected_part = 1;
    for (const auto& [part_number, etag] : upload->etags) {
        if (part_number != expected_part++) {
            return unexpected(error{error_code::multipart_failed,
                                    "missing part " + std::to_string(expected_part - 1) +
                                        " for " + metadata.id});
        }
    }

    std::ostringstream body;
    body << "<CompleteMultipartUpload>";
    for (const auto& [part_number, etag] : upload->etags) {
        body << "<Part><PartNumber>" << part_number << "</PartNumber><ETag>" << etag
             << "</ETag></Part>";
    }
    body << "</CompleteMultipartUpload>";
    auto payload = body.str();

    http_query query{{"uploadId", upload->upload_id}};
    auto query_string = canonical_query(query);
    auto path = impl_->object_path(metadata.id);
    auto headers = impl_->sign("POST", path, query_string, bytes_to_hex(sha256(payload)),
                               {{"Content-Type", "application/xml"}});

    auto response = impl_->http->post(impl_->make_url(path, query_string), payload, headers);
    if (!response) {
        return unexpected(response.error());
    }

    const auto& resp = response.value();
    auto resp_body = resp.get_body_string();
    if (!resp.is_success()) {
        return unexpected(response_error(resp, "complete multipart upload " + metadata.id));
    }
    // S3 may report a failed completion inside a 200 response
    if (resp_body.find("<Error>") != std::string::npos) {
        return unexpected(error{error_code::multipart_failed,
                                "complete multipart upload " + metadata.id + ": " +
                                    error_detail(resp)});
    }

    {
        std::lock_guard<std::mutex> lock(impl_->uploads_mutex);
        impl_->uploads.erase(metadata.id);
    }

    CR_LOG_INFO(log_category::store,
                "completed " + metadata.id + " (" + std::to_string(upload->etags.size()) +
                    " parts, " + format_size(metadata.size) + ")");
    return location_of(metadata.id);
}

auto s3_object_store::abort_object(const object_id& id) -> result<void> {
    std::optional<impl::upload_state> upload;
    {
        std::lock_guard<std::mutex> lock(impl_->uploads_mutex);
        auto it = impl_->uploads.find(id);
        if (it == impl_->uploads.end()) {
            return {};
        }
        upload = std::move(it->second);
        impl_->uploads.erase(it);
    }

    CR_LOG_DEBUG(log_category::store, "aborting multipart upload for " + id);
    return impl_->abort_upload(id, upload->upload_id);
}

auto s3_object_store::get_range(const object_id& id, uint64_t first, uint64_t last)
    -> result<std::vector<std::byte>> {
    if (last < first) {
        return unexpected(error{error_code::range_not_satisfiable,
                                "range end precedes range start"});
    }

    auto range = "bytes=" + std::to_string(first) + "-" + std::to_string(last);

    return impl_->with_read_retry<std::vector<std::byte>>("get " + range, [&]()
        -> result<std::vector<std::byte>> {
        auto response = impl_->send_empty("GET", impl_->object_path(id), {}, {{"Range", range}});
        if (!response) {
            return unexpected(response.error());
        }

        const auto& resp = response.value();
        if (resp.status_code == 206) {
            return to_bytes(resp.body, 0, resp.body.size());
        }
        if (resp.status_code == 200) {
            // Server ignored the Range header and sent the whole object
            if (first >= resp.body.size()) {
                return unexpected(error{error_code::range_not_satisfiable,
                                        range + " outside object of " +
                                            std::to_string(resp.body.size()) + " bytes"});
            }
            auto end = std::min<uint64_t>(last + 1, resp.body.size());
            return to_bytes(resp.body, static_cast<std::size_t>(first),
                            static_cast<std::size_t>(end - first));
        }
        return unexpected(response_error(resp, "get " + range + " of " + id));
    });
}

auto s3_object_store::head_object(const object_id& id) -> result<object_head> {
    return impl_->with_read_retry<object_head>("head " + id, [&]() -> result<object_head> {
        auto response = impl_->send_empty("HEAD", impl_->object_path(id), {});
        if (!response) {
            return unexpected(response.error());
        }

        const auto& resp = response.value();
        object_head head;
        if (resp.status_code == 404) {
            return head;
        }
        if (!resp.is_success()) {
            return unexpected(response_error(resp, "head " + id));
        }

        head.exists = true;
        auto length = resp.get_header("Content-Length");
        if (!length) {
            return unexpected(error{error_code::store_response_invalid,
                                    "no Content-Length for " + id});
        }
        try {
            head.size = std::stoull(*length);
        } catch (const std::exception&) {
            return unexpected(error{error_code::store_response_invalid,
                                    "invalid Content-Length for " + id});
        }
        head.content_type = resp.get_header("Content-Type").value_or(detect_content_type(id));
        head.etag = resp.get_header("ETag");
        return head;
    });
}

auto s3_object_store::list_objects(const std::string& prefix)
    -> result<std::vector<stored_object_metadata>> {
    std::vector<stored_object_metadata> objects;
    std::optional<std::string> continuation;

    do {
        http_query query{{"list-type", "2"}, {"prefix", prefix}};
        if (continuation) {
            query["continuation-token"] = *continuation;
        }

        auto page = impl_->with_read_retry<std::string>("list " + prefix,
                                                        [&]() -> result<std::string> {
            auto response = impl_->send_empty("GET", impl_->bucket_path(), query);
            if (!response) {
                return unexpected(response.error());
            }
            if (!response.value().is_success()) {
                return unexpected(response_error(response.value(), "list " + prefix));
            }
            return response.value().get_body_string();
        });
        if (!page) {
            return unexpected(page.error());
        }

        const auto& xml = page.value();
        for (const auto& entry : extract_xml_elements(xml, "Contents")) {
            auto key = extract_xml_element(entry, "Key");
            auto size = extract_xml_element(entry, "Size");
            if (!key || !size) {
                return unexpected(error{error_code::store_response_invalid,
                                        "listing entry without Key or Size"});
            }

            stored_object_metadata meta;
            meta.id = *key;
            try {
                meta.size = std::stoull(*size);
            } catch (const std::exception&) {
                return unexpected(error{error_code::store_response_invalid,
                                        "invalid Size for " + *key});
            }
            meta.content_type = detect_content_type(*key);
            if (auto modified = extract_xml_element(entry, "LastModified")) {
                meta.created_at = parse_rfc3339_time(*modified).value_or(
                    std::chrono::system_clock::time_point{});
            }
            meta.primary_location = location_of(*key);
            objects.push_back(std::move(meta));
        }

        continuation.reset();
        if (extract_xml_element(xml, "IsTruncated").value_or("false") == "true") {
            continuation = extract_xml_element(xml, "NextContinuationToken");
        }
    } while (continuation);

    return objects;
}

auto s3_object_store::delete_object(const object_id& id) -> result<void> {
    auto head = head_object(id);
    if (!head) {
        return unexpected(head.error());
    }
    if (!head.value().exists) {
        return unexpected(error{error_code::object_not_found, id});
    }

    auto response = impl_->send_empty("DELETE", impl_->object_path(id), {});
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(response_error(response.value(), "delete " + id));
    }

    CR_LOG_INFO(log_category::store, "deleted " + id);
    return {};
}

auto s3_object_store::presigned_url(const object_id& id, std::chrono::seconds expiry)
    -> result<std::string> {
    if (expiry.count() <= 0) {
        expiry = impl_->config.presign_expiry;
    }

    auto now = std::chrono::system_clock::now();
    std::string date_stamp = format_date_stamp(now);
    std::string amz_date = format_iso8601_time(now);
    std::string path = impl_->object_path(id);

    std::string algorithm = "AWS4-HMAC-SHA256";
    std::string credential_scope = date_stamp + "/" + impl_->config.region + "/s3/aws4_request";
    std::string credential = impl_->config.credentials.access_key_id + "/" + credential_scope;

    http_query query{{"X-Amz-Algorithm", algorithm},
                     {"X-Amz-Credential", credential},
                     {"X-Amz-Date", amz_date},
                     {"X-Amz-Expires", std::to_string(expiry.count())},
                     {"X-Amz-SignedHeaders", "host"}};
    if (impl_->config.credentials.session_token.has_value()) {
        query["X-Amz-Security-Token"] = impl_->config.credentials.session_token.value();
    }
    auto query_string = canonical_query(query);

    std::ostringstream canonical_request;
    canonical_request << "GET\n";
    canonical_request << path << "\n";
    canonical_request << query_string << "\n";
    canonical_request << "host:" << impl_->host << "\n";
    canonical_request << "\n";
    canonical_request << "host\n";
    canonical_request << "UNSIGNED-PAYLOAD";

    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << credential_scope << "\n";
    string_to_sign << bytes_to_hex(sha256(canonical_request.str()));

    auto signature = hmac_sha256(impl_->signing_key(date_stamp), string_to_sign.str());

    return impl_->make_url(path, query_string) + "&X-Amz-Signature=" + bytes_to_hex(signature);
}

auto s3_object_store::check_connection() -> result<void> {
    auto response = impl_->send_empty("HEAD", impl_->bucket_path(), {});
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(response_error(response.value(), "head bucket " + impl_->config.bucket));
    }
    return {};
}

}  // namespace chunk_relay
