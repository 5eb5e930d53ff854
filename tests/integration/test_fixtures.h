/**
 * @file test_fixtures.h
 * @brief In-memory stores, scripted sources and helpers shared by the tests
 */

#ifndef CHUNK_RELAY_TEST_FIXTURES_H
#define CHUNK_RELAY_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <chunk_relay/chunk_relay.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace chunk_relay::test {

// ============================================================================
// Data helpers
// ============================================================================

inline auto pattern_byte(uint64_t offset) -> std::byte {
    return static_cast<std::byte>((offset * 31 + 7) & 0xFF);
}

/**
 * @brief Deterministic bytes; byte i equals pattern_byte(first + i)
 */
inline auto make_pattern(std::size_t size, uint64_t first = 0) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = pattern_byte(first + i);
    }
    return data;
}

inline auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> out(text.size());
    std::transform(text.begin(), text.end(), out.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return out;
}

/**
 * @brief Retry policy with millisecond delays and no jitter
 */
inline auto fast_retry(std::size_t attempts = 3) -> retry_policy {
    return retry_policy{attempts, std::chrono::milliseconds(1), std::chrono::milliseconds(2), 2.0,
                        false};
}

inline auto small_config(std::size_t chunk_size = chunk_config::min_chunk_size)
    -> transfer_config {
    transfer_config config;
    config.chunk.chunk_size = chunk_size;
    config.retry = fast_retry();
    config.chunk_timeout = std::chrono::milliseconds(2000);
    config.max_in_flight_chunks = 4;
    return config;
}

/**
 * @brief Poll a predicate until it holds or the timeout passes
 */
template <typename Pred>
auto wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// ============================================================================
// memory_store
// ============================================================================

/**
 * @brief Thread-safe in-memory remote_store with failure injection
 */
class memory_store : public remote_store {
public:
    using put_rule = std::function<std::optional<error>(const chunk_descriptor&)>;

    explicit memory_store(std::string name = "memory") : name_(std::move(name)) {}

    [[nodiscard]] auto name() const -> std::string_view override { return name_; }

    [[nodiscard]] auto location_of(const object_id& id) const -> std::string override {
        return "mem://" + name_ + "/" + id;
    }

    // ------------------------------------------------------------------------
    // Failure injection
    // ------------------------------------------------------------------------

    void fail_puts(put_rule rule) {
        std::lock_guard<std::mutex> lock(mutex_);
        put_rule_ = std::move(rule);
    }

    void fail_begin(std::optional<error> err) {
        std::lock_guard<std::mutex> lock(mutex_);
        begin_error_ = std::move(err);
    }

    void fail_complete(std::optional<error> err) {
        std::lock_guard<std::mutex> lock(mutex_);
        complete_error_ = std::move(err);
    }

    void fail_reads(std::optional<error> err) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_error_ = std::move(err);
    }

    void fail_connection(std::optional<error> err) {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_error_ = std::move(err);
    }

    void set_put_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        put_delay_ = delay;
    }

    // ------------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------------

    [[nodiscard]] auto has_object(const object_id& id) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.count(id) != 0;
    }

    [[nodiscard]] auto object_data(const object_id& id) const -> std::vector<std::byte> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(id);
        return it == objects_.end() ? std::vector<std::byte>{} : it->second.data;
    }

    /// Distinct sequence numbers stored for an object, pending or complete
    [[nodiscard]] auto stored_sequences(const object_id& id) const -> std::set<uint64_t> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sequences_.find(id);
        return it == sequences_.end() ? std::set<uint64_t>{} : it->second;
    }

    [[nodiscard]] auto put_attempts() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return put_attempts_;
    }

    [[nodiscard]] auto range_reads() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return range_reads_;
    }

    [[nodiscard]] auto aborts() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborts_;
    }

    [[nodiscard]] auto is_pending(const object_id& id) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.count(id) != 0;
    }

    /**
     * @brief Store a complete object directly
     */
    void seed(const object_id& id, std::vector<std::byte> data,
              const std::string& content_type = "application/octet-stream") {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[id] = stored{std::move(data), content_type, std::chrono::system_clock::now()};
    }

    // ------------------------------------------------------------------------
    // remote_store
    // ------------------------------------------------------------------------

    [[nodiscard]] auto begin_object(const object_id& id, const std::string& content_type)
        -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (begin_error_) {
            return unexpected(*begin_error_);
        }
        pending_[id] = upload{content_type, {}};
        sequences_[id].clear();
        return {};
    }

    [[nodiscard]] auto put_chunk(const object_id& id, const chunk_descriptor& descriptor,
                                 std::span<const std::byte> data) -> result<void> override {
        put_rule rule;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++put_attempts_;
            rule = put_rule_;
            delay = put_delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (rule) {
            if (auto err = rule(descriptor)) {
                return unexpected(*err);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return unexpected(error{error_code::invalid_state, "no upload for " + id});
        }
        it->second.parts[descriptor.sequence_number] =
            part{descriptor.offset, std::vector<std::byte>(data.begin(), data.end())};
        sequences_[id].insert(descriptor.sequence_number);
        return {};
    }

    [[nodiscard]] auto complete_object(const stored_object_metadata& metadata)
        -> result<std::string> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (complete_error_) {
            return unexpected(*complete_error_);
        }
        auto it = pending_.find(metadata.id);
        if (it == pending_.end()) {
            return unexpected(error{error_code::invalid_state, "no upload for " + metadata.id});
        }

        std::vector<std::byte> data;
        uint64_t expected_seq = 0;
        for (const auto& [seq, p] : it->second.parts) {
            if (seq != expected_seq++ || p.offset != data.size()) {
                return unexpected(error{error_code::multipart_failed, "gap in parts"});
            }
            data.insert(data.end(), p.bytes.begin(), p.bytes.end());
        }
        if (data.size() != metadata.size) {
            return unexpected(error{error_code::multipart_failed, "size mismatch"});
        }

        objects_[metadata.id] = stored{std::move(data), it->second.content_type,
                                       metadata.created_at};
        pending_.erase(it);
        return location_of(metadata.id);
    }

    [[nodiscard]] auto abort_object(const object_id& id) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++aborts_;
        pending_.erase(id);
        return {};
    }

    [[nodiscard]] auto get_range(const object_id& id, uint64_t first, uint64_t last)
        -> result<std::vector<std::byte>> override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++range_reads_;
        if (read_error_) {
            return unexpected(*read_error_);
        }
        auto it = objects_.find(id);
        if (it == objects_.end()) {
            return unexpected(error{error_code::object_not_found, id});
        }
        const auto& data = it->second.data;
        if (first >= data.size() || last < first) {
            return unexpected(error{error_code::range_not_satisfiable, "bad range"});
        }
        last = std::min<uint64_t>(last, data.size() - 1);
        return std::vector<std::byte>(data.begin() + static_cast<std::ptrdiff_t>(first),
                                      data.begin() + static_cast<std::ptrdiff_t>(last + 1));
    }

    [[nodiscard]] auto head_object(const object_id& id) -> result<object_head> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (read_error_) {
            return unexpected(*read_error_);
        }
        object_head head;
        auto it = objects_.find(id);
        if (it == objects_.end()) {
            return head;
        }
        head.exists = true;
        head.size = it->second.data.size();
        head.content_type = it->second.content_type;
        head.last_modified = it->second.created_at;
        return head;
    }

    [[nodiscard]] auto list_objects(const std::string& prefix)
        -> result<std::vector<stored_object_metadata>> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (read_error_) {
            return unexpected(*read_error_);
        }
        std::vector<stored_object_metadata> out;
        for (const auto& [id, obj] : objects_) {
            if (id.rfind(prefix, 0) != 0) {
                continue;
            }
            stored_object_metadata meta;
            meta.id = id;
            meta.size = obj.data.size();
            meta.created_at = obj.created_at;
            meta.primary_location = location_of(id);
            out.push_back(std::move(meta));
        }
        return out;
    }

    [[nodiscard]] auto delete_object(const object_id& id) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (objects_.erase(id) == 0) {
            return unexpected(error{error_code::object_not_found, id});
        }
        return {};
    }

    [[nodiscard]] auto presigned_url(const object_id& id, std::chrono::seconds expiry)
        -> result<std::string> override {
        return "https://" + name_ + ".example/" + id + "?expires=" +
               std::to_string(expiry.count());
    }

    [[nodiscard]] auto check_connection() -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_error_) {
            return unexpected(*connection_error_);
        }
        return {};
    }

private:
    struct part {
        uint64_t offset = 0;
        std::vector<std::byte> bytes;
    };

    struct upload {
        std::string content_type;
        std::map<uint64_t, part> parts;
    };

    struct stored {
        std::vector<std::byte> data;
        std::string content_type;
        std::chrono::system_clock::time_point created_at;
    };

    std::string name_;
    mutable std::mutex mutex_;
    std::map<object_id, upload> pending_;
    std::map<object_id, stored> objects_;
    std::map<object_id, std::set<uint64_t>> sequences_;

    put_rule put_rule_;
    std::optional<error> begin_error_;
    std::optional<error> complete_error_;
    std::optional<error> read_error_;
    std::optional<error> connection_error_;
    std::chrono::milliseconds put_delay_{0};

    std::size_t put_attempts_ = 0;
    std::size_t range_reads_ = 0;
    std::size_t aborts_ = 0;
};

// ============================================================================
// Sources
// ============================================================================

/**
 * @brief Shared control of a gated_source
 */
class source_gate {
public:
    explicit source_gate(uint64_t open_until) : open_until_(open_until) {}

    void open_until(uint64_t offset) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_until_ = std::max(open_until_, offset);
        }
        cv_.notify_all();
    }

    void open_all() { open_until(UINT64_MAX); }

    /**
     * @brief Block until bytes before offset may be produced
     */
    void wait_for(uint64_t offset) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return offset <= open_until_; });
    }

    [[nodiscard]] auto limit() const -> uint64_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_until_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t open_until_;
};

/**
 * @brief Sized pattern source that blocks at the gate limit
 */
class gated_source : public byte_source {
public:
    gated_source(uint64_t size, std::shared_ptr<source_gate> gate)
        : size_(size), gate_(std::move(gate)) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (position_ >= size_ || buffer.empty()) {
            return std::size_t{0};
        }
        gate_->wait_for(position_ + 1);
        auto allowed = std::min<uint64_t>(size_, gate_->limit()) - position_;
        auto count = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), allowed));
        for (std::size_t i = 0; i < count; ++i) {
            buffer[i] = pattern_byte(position_ + i);
        }
        position_ += count;
        return count;
    }

    [[nodiscard]] auto size_hint() const -> std::optional<uint64_t> override { return size_; }

private:
    uint64_t size_;
    uint64_t position_ = 0;
    std::shared_ptr<source_gate> gate_;
};

/**
 * @brief Pattern source that fails after a number of bytes
 */
class failing_source : public byte_source {
public:
    failing_source(uint64_t fail_at, std::optional<uint64_t> declared = std::nullopt)
        : fail_at_(fail_at), declared_(declared) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (position_ >= fail_at_) {
            return unexpected(error{error_code::source_read_error, "connection reset"});
        }
        auto count = static_cast<std::size_t>(
            std::min<uint64_t>(buffer.size(), fail_at_ - position_));
        for (std::size_t i = 0; i < count; ++i) {
            buffer[i] = pattern_byte(position_ + i);
        }
        position_ += count;
        return count;
    }

    [[nodiscard]] auto size_hint() const -> std::optional<uint64_t> override { return declared_; }

private:
    uint64_t fail_at_;
    std::optional<uint64_t> declared_;
    uint64_t position_ = 0;
};

/**
 * @brief Unsized pattern source returning at most step bytes per read
 */
class trickle_source : public byte_source {
public:
    trickle_source(uint64_t size, std::size_t step) : size_(size), step_(step) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        auto count = static_cast<std::size_t>(
            std::min<uint64_t>({buffer.size(), step_, size_ - position_}));
        for (std::size_t i = 0; i < count; ++i) {
            buffer[i] = pattern_byte(position_ + i);
        }
        position_ += count;
        return count;
    }

private:
    uint64_t size_;
    std::size_t step_;
    uint64_t position_ = 0;
};

inline auto pattern_source(std::size_t size) -> std::unique_ptr<byte_source> {
    return std::make_unique<memory_source>(make_pattern(size));
}

}  // namespace chunk_relay::test

#endif  // CHUNK_RELAY_TEST_FIXTURES_H
