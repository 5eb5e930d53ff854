/**
 * @file test_types.cpp
 * @brief Unit tests for error, session and object id types
 */

#include <gtest/gtest.h>

#include <chunk_relay/core/retry_policy.h>
#include <chunk_relay/core/transfer_config.h>
#include <chunk_relay/core/transfer_types.h>
#include <chunk_relay/core/types.h>

#include <unordered_set>

namespace chunk_relay::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::short_read), -100);
    EXPECT_EQ(static_cast<int>(error_code::already_started), -120);
    EXPECT_EQ(static_cast<int>(error_code::chunk_put_failed), -140);
    EXPECT_EQ(static_cast<int>(error_code::invalid_chunk_size), -170);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::range_not_satisfiable), "range not satisfiable");
    EXPECT_STREQ(to_string(error_code::object_not_found), "object not found");
}

TEST_F(ErrorCodeTest, TransientClassification) {
    EXPECT_TRUE(is_transient_error(error_code::store_server_error));
    EXPECT_TRUE(is_transient_error(error_code::store_rate_limited));
    EXPECT_TRUE(is_transient_error(error_code::operation_timeout));
    EXPECT_TRUE(is_transient_error(error_code::store_request_failed));

    EXPECT_FALSE(is_transient_error(error_code::store_access_denied));
    EXPECT_FALSE(is_transient_error(error_code::object_not_found));
    EXPECT_FALSE(is_transient_error(error_code::range_not_satisfiable));
    EXPECT_FALSE(is_transient_error(error_code::chunk_checksum_mismatch));
}

TEST_F(ErrorCodeTest, ErrorFromCodeUsesDefaultMessage) {
    error err(error_code::session_not_found);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "session not found");

    error none;
    EXPECT_FALSE(static_cast<bool>(none));
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected(error{error_code::invalid_state, "bad"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_state);
    EXPECT_EQ(r.error().message, "bad");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error(error_code::internal_error));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::internal_error);
}

// =============================================================================
// session_id Tests
// =============================================================================

class SessionIdTest : public ::testing::Test {};

TEST_F(SessionIdTest, DefaultIsNull) {
    session_id id;
    EXPECT_TRUE(id.is_null());
}

TEST_F(SessionIdTest, GenerateIsUnique) {
    std::unordered_set<session_id> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(session_id::generate());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(SessionIdTest, StringRoundTrip) {
    auto id = session_id::generate();
    auto text = id.to_string();
    EXPECT_EQ(text.size(), 36u);
    EXPECT_EQ(text[8], '-');
    EXPECT_EQ(text[14], '4');  // version nibble

    auto parsed = session_id::from_string(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST_F(SessionIdTest, FromStringRejectsGarbage) {
    EXPECT_FALSE(session_id::from_string("not-a-session").has_value());
    EXPECT_FALSE(session_id::from_string("0123").has_value());
}

// =============================================================================
// State helpers
// =============================================================================

class SessionStateTest : public ::testing::Test {};

TEST_F(SessionStateTest, TerminalStates) {
    EXPECT_FALSE(is_terminal_state(session_state::created));
    EXPECT_FALSE(is_terminal_state(session_state::active));
    EXPECT_TRUE(is_terminal_state(session_state::completed));
    EXPECT_TRUE(is_terminal_state(session_state::failed));
    EXPECT_TRUE(is_terminal_state(session_state::cancelled));
}

TEST_F(SessionStateTest, ToString) {
    EXPECT_EQ(to_string(session_state::active), "active");
    EXPECT_EQ(to_string(transfer_direction::download), "download");
    EXPECT_EQ(to_string(destination_state::failed), "failed");
}

TEST_F(SessionStateTest, ChunkEndOffset) {
    chunk_descriptor descriptor;
    descriptor.offset = 1024;
    descriptor.length = 512;
    EXPECT_EQ(descriptor.end_offset(), 1536u);
}

// =============================================================================
// Object id helpers
// =============================================================================

class ObjectIdTest : public ::testing::Test {};

TEST_F(ObjectIdTest, MakeObjectIdUsesPrefixAndName) {
    auto id = make_object_id("movie.mkv");
    EXPECT_EQ(id.rfind("files/", 0), 0u);
    EXPECT_EQ(object_file_name(id), "movie.mkv");
    EXPECT_NE(make_object_id("movie.mkv"), id);
}

TEST_F(ObjectIdTest, MakeObjectIdSanitizesSeparators) {
    auto id = make_object_id("../etc/passwd");
    EXPECT_EQ(object_file_name(id), ".._etc_passwd");
}

TEST_F(ObjectIdTest, MakeObjectIdHandlesEmptyName) {
    EXPECT_EQ(object_file_name(make_object_id("")), "unnamed");
    EXPECT_EQ(object_file_name(make_object_id("..")), "unnamed");
}

TEST_F(ObjectIdTest, FormatSize) {
    EXPECT_EQ(format_size(0), "0.00 B");
    EXPECT_EQ(format_size(1024), "1.00 KB");
    EXPECT_EQ(format_size(16 * 1024 * 1024), "16.00 MB");
}

// =============================================================================
// Configuration
// =============================================================================

class TransferConfigTest : public ::testing::Test {};

TEST_F(TransferConfigTest, DefaultsAreValid) {
    transfer_config config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.chunk.chunk_size, chunk_config::default_chunk_size);
    EXPECT_EQ(config.effective_range_request_size(), config.chunk.chunk_size);
}

TEST_F(TransferConfigTest, RejectsBadChunkSize) {
    transfer_config config;
    config.chunk.chunk_size = 100;
    auto r = config.validate();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_chunk_size);
}

TEST_F(TransferConfigTest, RejectsZeroInFlight) {
    transfer_config config;
    config.max_in_flight_chunks = 0;
    auto r = config.validate();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);
}

TEST_F(TransferConfigTest, RejectsBadRetryPolicy) {
    transfer_config config;
    config.retry.max_attempts = 0;
    EXPECT_FALSE(config.validate().has_value());

    config.retry.max_attempts = 3;
    config.retry.backoff_multiplier = 0.5;
    EXPECT_FALSE(config.validate().has_value());
}

// =============================================================================
// Retry delay
// =============================================================================

class RetryDelayTest : public ::testing::Test {};

TEST_F(RetryDelayTest, ExponentialWithoutJitter) {
    retry_policy policy;
    policy.use_jitter = false;

    EXPECT_EQ(calculate_retry_delay(policy, 1).count(), 500);
    EXPECT_EQ(calculate_retry_delay(policy, 2).count(), 1000);
    EXPECT_EQ(calculate_retry_delay(policy, 3).count(), 2000);
}

TEST_F(RetryDelayTest, CappedAtMaxDelay) {
    retry_policy policy;
    policy.use_jitter = false;
    EXPECT_EQ(calculate_retry_delay(policy, 50).count(), 30000);
}

TEST_F(RetryDelayTest, JitterStaysInBounds) {
    retry_policy policy;
    for (int i = 0; i < 100; ++i) {
        auto delay = calculate_retry_delay(policy, 2).count();
        EXPECT_GE(delay, 500);
        EXPECT_LE(delay, 1500);
    }
}

}  // namespace chunk_relay::test
