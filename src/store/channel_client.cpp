/**
 * @file channel_client.cpp
 * @brief Bot API implementation of the channel transport
 */

#include <chunk_relay/store/channel_client.h>

#include <chunk_relay/core/logging.h>
#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/store/store_utils.h>

#include <algorithm>
#include <charconv>
#include <iterator>
#include <random>
#include <sstream>

namespace chunk_relay {

using namespace store_utils;

namespace {

auto make_boundary() -> std::string {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::ostringstream oss;
    oss << "----chunk-relay-" << std::hex << gen() << gen();
    return oss.str();
}

void append(std::vector<uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

auto unescape_slashes(std::string value) -> std::string {
    std::string::size_type pos = 0;
    while ((pos = value.find("\\/", pos)) != std::string::npos) {
        value.erase(pos, 1);
        ++pos;
    }
    return value;
}

/**
 * @brief Check the "ok" envelope of an API response
 * @return The response body on success
 */
auto check_api_response(const http_response& resp, const std::string& context)
    -> result<std::string> {
    auto body = resp.get_body_string();
    auto ok = extract_json_value(body, "ok");

    if (ok && *ok == "true" && resp.is_success()) {
        return body;
    }

    int status = resp.status_code;
    if (auto code = extract_json_value(body, "error_code")) {
        int parsed = 0;
        auto parse = std::from_chars(code->data(), code->data() + code->size(), parsed);
        if (parse.ec == std::errc{}) {
            status = parsed;
        }
    }
    auto description = extract_json_value(body, "description").value_or("");

    if (status == 400 && description.find("not found") != std::string::npos) {
        return unexpected(error{error_code::object_not_found, context + ": " + description});
    }
    if (!ok && resp.is_success()) {
        return unexpected(error{error_code::store_response_invalid,
                                context + ": response without ok field"});
    }
    auto err = status_to_error(status, context);
    if (!description.empty()) {
        err.message += ": " + description;
    }
    return unexpected(err);
}

}  // namespace

struct bot_api_channel_client::impl {
    channel_store_config config;
    std::shared_ptr<http_client_interface> http;

    impl(const channel_store_config& cfg, std::shared_ptr<http_client_interface> client)
        : config(cfg), http(std::move(client)) {
        while (!config.api_base_url.empty() && config.api_base_url.back() == '/') {
            config.api_base_url.pop_back();
        }
    }

    [[nodiscard]] auto method_url(const std::string& method) const -> std::string {
        return config.api_base_url + "/bot" + config.bot_token + "/" + method;
    }

    [[nodiscard]] auto file_url(const std::string& file_path) const -> std::string {
        return config.api_base_url + "/file/bot" + config.bot_token + "/" + file_path;
    }
};

bot_api_channel_client::bot_api_channel_client(const channel_store_config& config,
                                               std::shared_ptr<http_client_interface> http)
    : impl_(std::make_unique<impl>(config, std::move(http))) {}

bot_api_channel_client::~bot_api_channel_client() = default;

auto bot_api_channel_client::send_document(const std::string& file_name,
                                           const std::string& caption,
                                           std::span<const std::byte> data)
    -> result<channel_document> {
    auto boundary = make_boundary();

    std::vector<uint8_t> body;
    body.reserve(data.size() + 512);

    auto add_field = [&](const std::string& field, const std::string& value) {
        append(body, "--" + boundary + "\r\n");
        append(body, "Content-Disposition: form-data; name=\"" + field + "\"\r\n\r\n");
        append(body, value + "\r\n");
    };
    add_field("chat_id", impl_->config.chat_id);
    if (!caption.empty()) {
        add_field("caption", caption);
    }

    append(body, "--" + boundary + "\r\n");
    append(body, "Content-Disposition: form-data; name=\"document\"; filename=\"" +
                     file_name + "\"\r\n");
    append(body, "Content-Type: application/octet-stream\r\n\r\n");
    std::transform(data.begin(), data.end(), std::back_inserter(body),
                   [](std::byte b) { return static_cast<uint8_t>(b); });
    append(body, "\r\n--" + boundary + "--\r\n");

    http_headers headers{{"Content-Type", "multipart/form-data; boundary=" + boundary}};
    auto response = impl_->http->post(impl_->method_url("sendDocument"), body, headers);
    if (!response) {
        return unexpected(response.error());
    }

    auto checked = check_api_response(response.value(), "sendDocument " + file_name);
    if (!checked) {
        return unexpected(checked.error());
    }
    const auto& json = checked.value();

    channel_document doc;
    auto message = extract_top_level_json_object(json, "result");
    auto message_id =
        message ? extract_top_level_json_value(*message, "message_id") : std::nullopt;
    auto document = message ? extract_top_level_json_object(*message, "document") : std::nullopt;
    auto file_id = document ? extract_top_level_json_value(*document, "file_id") : std::nullopt;
    if (!message_id || !file_id) {
        return unexpected(error{error_code::store_response_invalid,
                                "sendDocument response lacks message_id or file_id"});
    }
    try {
        doc.message_id = std::stoll(*message_id);
    } catch (const std::exception&) {
        return unexpected(error{error_code::store_response_invalid,
                                "invalid message_id in sendDocument response"});
    }
    doc.file_id = *file_id;
    doc.size = data.size();

    CR_LOG_TRACE(log_category::store,
                 "sent document " + file_name + " (" + format_size(doc.size) + ")");
    return doc;
}

auto bot_api_channel_client::fetch_document(const std::string& file_id)
    -> result<std::vector<std::byte>> {
    auto info = impl_->http->get(impl_->method_url("getFile"), {{"file_id", file_id}}, {});
    if (!info) {
        return unexpected(info.error());
    }

    auto checked = check_api_response(info.value(), "getFile");
    if (!checked) {
        return unexpected(checked.error());
    }

    auto file_path = extract_json_value(checked.value(), "file_path");
    if (!file_path) {
        return unexpected(error{error_code::store_response_invalid,
                                "getFile response lacks file_path"});
    }

    auto content = impl_->http->get(impl_->file_url(unescape_slashes(*file_path)), {}, {});
    if (!content) {
        return unexpected(content.error());
    }
    const auto& resp = content.value();
    if (!resp.is_success()) {
        return unexpected(status_to_error(resp.status_code, "download document"));
    }

    std::vector<std::byte> bytes(resp.body.size());
    std::transform(resp.body.begin(), resp.body.end(), bytes.begin(),
                   [](uint8_t b) { return static_cast<std::byte>(b); });
    return bytes;
}

auto bot_api_channel_client::delete_message(int64_t message_id) -> result<void> {
    std::ostringstream body;
    body << "{\"chat_id\":\"" << detail::escape_json_string(impl_->config.chat_id)
         << "\",\"message_id\":" << message_id << "}";

    auto response = impl_->http->post(impl_->method_url("deleteMessage"), body.str(),
                                      {{"Content-Type", "application/json"}});
    if (!response) {
        return unexpected(response.error());
    }

    auto checked = check_api_response(response.value(),
                                      "deleteMessage " + std::to_string(message_id));
    if (!checked) {
        return unexpected(checked.error());
    }
    return {};
}

auto bot_api_channel_client::get_me() -> result<std::string> {
    auto response = impl_->http->get(impl_->method_url("getMe"), {}, {});
    if (!response) {
        return unexpected(response.error());
    }

    auto checked = check_api_response(response.value(), "getMe");
    if (!checked) {
        return unexpected(checked.error());
    }
    return extract_json_value(checked.value(), "username").value_or("");
}

}  // namespace chunk_relay
