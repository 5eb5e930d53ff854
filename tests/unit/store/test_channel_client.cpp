/**
 * @file test_channel_client.cpp
 * @brief Unit tests for the Bot API channel transport
 */

#include <gtest/gtest.h>

#include <chunk_relay/store/channel_client.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chunk_relay::test {
namespace {

struct bot_request {
    std::string method;
    std::string url;
    http_query query;
    http_headers headers;
    std::string body;
};

auto json_response(int status, const std::string& body) -> http_response {
    http_response resp;
    resp.status_code = status;
    resp.headers["Content-Type"] = "application/json";
    resp.body.assign(body.begin(), body.end());
    return resp;
}

/**
 * @brief HTTP fake answering through a per-test handler
 */
class fake_bot_http : public http_client_interface {
public:
    using handler = std::function<result<http_response>(const bot_request&)>;

    handler respond;
    std::vector<bot_request> requests;

    auto get(const std::string& url, const http_query& query, const http_headers& headers)
        -> result<http_response> override {
        return record({"GET", url, query, headers, {}});
    }

    auto post(const std::string& url, const std::string& body, const http_headers& headers)
        -> result<http_response> override {
        return record({"POST", url, {}, headers, body});
    }

    auto post(const std::string& url, const std::vector<uint8_t>& body,
              const http_headers& headers) -> result<http_response> override {
        return record({"POST", url, {}, headers, std::string(body.begin(), body.end())});
    }

    auto put(const std::string& url, const std::vector<uint8_t>& body,
             const http_headers& headers) -> result<http_response> override {
        return record({"PUT", url, {}, headers, std::string(body.begin(), body.end())});
    }

    auto del(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        return record({"DELETE", url, {}, headers, {}});
    }

    auto head(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        return record({"HEAD", url, {}, headers, {}});
    }

private:
    auto record(bot_request request) -> result<http_response> {
        requests.push_back(request);
        if (!respond) {
            return json_response(200, R"({"ok":true,"result":true})");
        }
        return respond(requests.back());
    }
};

auto ends_with(const std::string& value, const std::string& suffix) -> bool {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

class BotApiChannelClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.api_base_url = "https://bot.example/";
        config_.bot_token = "123456:SECRET";
        config_.chat_id = "-1001";
        http_ = std::make_shared<fake_bot_http>();
        client_ = std::make_unique<bot_api_channel_client>(config_, http_);
    }

    channel_store_config config_;
    std::shared_ptr<fake_bot_http> http_;
    std::unique_ptr<bot_api_channel_client> client_;
};

// ============================================================================
// sendDocument
// ============================================================================

TEST_F(BotApiChannelClientTest, SendDocument_BuildsMultipartRequest) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(
            200,
            R"({"ok":true,"result":{"message_id":77,"document":{"file_id":"BQAC-1","file_size":5}}})");
    };

    const std::string payload = "hello";
    std::vector<std::byte> data(payload.size());
    std::transform(payload.begin(), payload.end(), data.begin(),
                   [](char c) { return static_cast<std::byte>(c); });

    auto sent = client_->send_document("clip.mp4.part0", "files/a/clip.mp4 #0", data);
    ASSERT_TRUE(sent.has_value()) << sent.error().message;
    EXPECT_EQ(sent.value().message_id, 77);
    EXPECT_EQ(sent.value().file_id, "BQAC-1");
    EXPECT_EQ(sent.value().size, 5u);

    ASSERT_EQ(http_->requests.size(), 1u);
    const auto& req = http_->requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "https://bot.example/bot123456:SECRET/sendDocument");
    EXPECT_EQ(req.headers.at("Content-Type").rfind("multipart/form-data; boundary=", 0), 0u);
    EXPECT_NE(req.body.find("name=\"chat_id\"\r\n\r\n-1001\r\n"), std::string::npos);
    EXPECT_NE(req.body.find("files/a/clip.mp4 #0"), std::string::npos);
    EXPECT_NE(req.body.find("filename=\"clip.mp4.part0\""), std::string::npos);
    EXPECT_NE(req.body.find("\r\n\r\nhello\r\n--"), std::string::npos);
}

TEST_F(BotApiChannelClientTest, SendDocument_FileIdOfDocumentNotThumbnail) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(
            200,
            R"({"ok":true,"result":{"message_id":78,)"
            R"("reply_to_message":{"message_id":12,"document":{"file_id":"OLD"}},)"
            R"("document":{"file_name":"clip.mp4.part1",)"
            R"("thumbnail":{"file_id":"THUMB","file_unique_id":"t1","width":90},)"
            R"("file_id":"BQAC-2","file_size":3}}})");
    };

    std::vector<std::byte> data(3);
    auto sent = client_->send_document("clip.mp4.part1", "", data);
    ASSERT_TRUE(sent.has_value()) << sent.error().message;
    EXPECT_EQ(sent.value().message_id, 78);
    EXPECT_EQ(sent.value().file_id, "BQAC-2");
}

TEST_F(BotApiChannelClientTest, SendDocument_MissingFileId) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(200, R"({"ok":true,"result":{"message_id":77}})");
    };
    std::vector<std::byte> data(3);
    auto sent = client_->send_document("x", "", data);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::store_response_invalid);
}

TEST_F(BotApiChannelClientTest, SendDocument_RateLimited) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(
            429, R"({"ok":false,"error_code":429,"description":"Too Many Requests: retry after 5"})");
    };
    std::vector<std::byte> data(3);
    auto sent = client_->send_document("x", "", data);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::store_rate_limited);
    EXPECT_TRUE(sent.error().is_transient());
    EXPECT_NE(sent.error().message.find("retry after 5"), std::string::npos);
}

TEST_F(BotApiChannelClientTest, SendDocument_Unauthorized) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(401, R"({"ok":false,"error_code":401,"description":"Unauthorized"})");
    };
    std::vector<std::byte> data(3);
    auto sent = client_->send_document("x", "", data);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::store_access_denied);
}

TEST_F(BotApiChannelClientTest, SendDocument_TransportError) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return unexpected(error{error_code::store_request_failed, "connection refused"});
    };
    std::vector<std::byte> data(3);
    auto sent = client_->send_document("x", "", data);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::store_request_failed);
}

// ============================================================================
// getFile and download
// ============================================================================

TEST_F(BotApiChannelClientTest, FetchDocument_ResolvesPathThenDownloads) {
    http_->respond = [](const bot_request& req) -> result<http_response> {
        if (ends_with(req.url, "/getFile")) {
            return json_response(
                200, R"({"ok":true,"result":{"file_id":"F1","file_path":"documents\/file_3.bin"}})");
        }
        http_response resp;
        resp.status_code = 200;
        resp.body = {1, 2, 3, 4};
        return resp;
    };

    auto fetched = client_->fetch_document("F1");
    ASSERT_TRUE(fetched.has_value()) << fetched.error().message;
    ASSERT_EQ(fetched.value().size(), 4u);
    EXPECT_EQ(fetched.value()[3], std::byte{4});

    ASSERT_EQ(http_->requests.size(), 2u);
    EXPECT_EQ(http_->requests[0].query.at("file_id"), "F1");
    EXPECT_EQ(http_->requests[1].url,
              "https://bot.example/file/bot123456:SECRET/documents/file_3.bin");
}

TEST_F(BotApiChannelClientTest, FetchDocument_UnknownFile) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(
            400, R"({"ok":false,"error_code":400,"description":"Bad Request: file not found"})");
    };
    auto fetched = client_->fetch_document("gone");
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error().code, error_code::object_not_found);
}

TEST_F(BotApiChannelClientTest, FetchDocument_DownloadServerError) {
    http_->respond = [](const bot_request& req) -> result<http_response> {
        if (ends_with(req.url, "/getFile")) {
            return json_response(200, R"({"ok":true,"result":{"file_path":"documents/a"}})");
        }
        return json_response(502, "Bad Gateway");
    };
    auto fetched = client_->fetch_document("F1");
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error().code, error_code::store_server_error);
}

TEST_F(BotApiChannelClientTest, FetchDocument_MissingPath) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(200, R"({"ok":true,"result":{"file_id":"F1"}})");
    };
    auto fetched = client_->fetch_document("F1");
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error().code, error_code::store_response_invalid);
}

// ============================================================================
// deleteMessage and getMe
// ============================================================================

TEST_F(BotApiChannelClientTest, DeleteMessage_SendsJsonBody) {
    ASSERT_TRUE(client_->delete_message(77).has_value());

    ASSERT_EQ(http_->requests.size(), 1u);
    const auto& req = http_->requests[0];
    EXPECT_TRUE(ends_with(req.url, "/deleteMessage"));
    EXPECT_EQ(req.headers.at("Content-Type"), "application/json");
    EXPECT_EQ(req.body, R"({"chat_id":"-1001","message_id":77})");
}

TEST_F(BotApiChannelClientTest, DeleteMessage_AlreadyGone) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(
            400,
            R"({"ok":false,"error_code":400,"description":"Bad Request: message to delete not found"})");
    };
    auto deleted = client_->delete_message(77);
    ASSERT_FALSE(deleted.has_value());
    EXPECT_EQ(deleted.error().code, error_code::object_not_found);
}

TEST_F(BotApiChannelClientTest, GetMe_ReturnsUsername) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(
            200, R"({"ok":true,"result":{"id":1,"is_bot":true,"username":"relay_bot"}})");
    };
    auto me = client_->get_me();
    ASSERT_TRUE(me.has_value());
    EXPECT_EQ(me.value(), "relay_bot");
    EXPECT_EQ(http_->requests[0].url, "https://bot.example/bot123456:SECRET/getMe");
}

TEST_F(BotApiChannelClientTest, GetMe_BodyWithoutEnvelope) {
    http_->respond = [](const bot_request&) -> result<http_response> {
        return json_response(200, "<html>captive portal</html>");
    };
    auto me = client_->get_me();
    ASSERT_FALSE(me.has_value());
    EXPECT_EQ(me.error().code, error_code::store_response_invalid);
}

}  // namespace chunk_relay::test
