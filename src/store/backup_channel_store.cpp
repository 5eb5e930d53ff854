/**
 * @file backup_channel_store.cpp
 * @brief Channel-backed backup store implementation
 */

#include <chunk_relay/store/backup_channel_store.h>

#include <chunk_relay/core/checksum.h>
#include <chunk_relay/core/logging.h>
#include <chunk_relay/store/store_utils.h>

#include <algorithm>
#include <list>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace chunk_relay {

namespace {

/**
 * @brief One document holding a contiguous piece of an object
 */
struct segment {
    uint64_t offset = 0;
    uint64_t length = 0;
    int64_t message_id = 0;
    std::string file_id;
    uint32_t crc = 0;
};

/**
 * @brief Index entry of an object
 */
struct object_entry {
    std::string content_type;
    std::map<uint64_t, std::vector<segment>> chunks;  ///< sequence number -> segments
    std::vector<segment> segments;                    ///< ordered by offset once complete
    bool complete = false;
    uint64_t size = 0;
    std::chrono::system_clock::time_point created_at{};
};

auto collect_messages(const object_entry& entry) -> std::vector<int64_t> {
    std::vector<int64_t> ids;
    for (const auto& [seq, segs] : entry.chunks) {
        for (const auto& seg : segs) {
            ids.push_back(seg.message_id);
        }
    }
    return ids;
}

}  // namespace

struct backup_channel_store::impl {
    channel_store_config config;
    std::shared_ptr<channel_client> client;

    mutable std::mutex index_mutex;
    std::unordered_map<object_id, object_entry> index;

    // LRU cache of fetched segments keyed by file ID
    using cache_list = std::list<std::pair<std::string, std::shared_ptr<const std::vector<std::byte>>>>;
    mutable std::mutex cache_mutex;
    cache_list cache;
    std::unordered_map<std::string, cache_list::iterator> cache_lookup;

    impl(const channel_store_config& cfg, std::shared_ptr<channel_client> c)
        : config(cfg), client(std::move(c)) {}

    /**
     * @brief Delete messages, logging failures
     * @return The first failure other than an already missing message
     */
    auto delete_messages(const std::vector<int64_t>& ids) -> result<void> {
        result<void> outcome;
        for (auto id : ids) {
            auto deleted = client->delete_message(id);
            if (!deleted && deleted.error().code != error_code::object_not_found) {
                CR_LOG_WARN(log_category::store,
                            "could not delete channel message " + std::to_string(id) + ": " +
                                deleted.error().message);
                if (outcome) {
                    outcome = unexpected(deleted.error());
                }
            }
        }
        return outcome;
    }

    /**
     * @brief Best-effort cleanup of messages no longer referenced by the index
     */
    void discard_messages(const std::vector<int64_t>& ids) {
        if (ids.empty()) {
            return;
        }
        if (auto deleted = delete_messages(ids); !deleted) {
            CR_LOG_DEBUG(log_category::store,
                         "left unreferenced channel messages behind: " + deleted.error().message);
        }
    }

    auto cache_get(const std::string& file_id) -> std::shared_ptr<const std::vector<std::byte>> {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = cache_lookup.find(file_id);
        if (it == cache_lookup.end()) {
            return nullptr;
        }
        cache.splice(cache.begin(), cache, it->second);
        return it->second->second;
    }

    void cache_put(const std::string& file_id, std::shared_ptr<const std::vector<std::byte>> data) {
        if (config.segment_cache_entries == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = cache_lookup.find(file_id);
        if (it != cache_lookup.end()) {
            cache.erase(it->second);
            cache_lookup.erase(it);
        }
        cache.emplace_front(file_id, std::move(data));
        cache_lookup[file_id] = cache.begin();
        while (cache.size() > config.segment_cache_entries) {
            cache_lookup.erase(cache.back().first);
            cache.pop_back();
        }
    }

    void cache_evict(const std::vector<segment>& segs) {
        std::lock_guard<std::mutex> lock(cache_mutex);
        for (const auto& seg : segs) {
            auto it = cache_lookup.find(seg.file_id);
            if (it != cache_lookup.end()) {
                cache.erase(it->second);
                cache_lookup.erase(it);
            }
        }
    }

    /**
     * @brief Fetch and verify one segment, through the cache
     */
    auto fetch_segment(const segment& seg) -> result<std::shared_ptr<const std::vector<std::byte>>> {
        if (auto cached = cache_get(seg.file_id)) {
            return cached;
        }

        const auto& policy = config.read_retry;
        for (std::size_t attempt = 1;; ++attempt) {
            auto fetched = client->fetch_document(seg.file_id);
            if (fetched) {
                auto& bytes = fetched.value();
                if (bytes.size() != seg.length || checksum::crc32(bytes) != seg.crc) {
                    return unexpected(error{error_code::chunk_checksum_mismatch,
                                            "segment at offset " + std::to_string(seg.offset) +
                                                " failed verification"});
                }
                auto shared = std::make_shared<const std::vector<std::byte>>(std::move(bytes));
                cache_put(seg.file_id, shared);
                return shared;
            }
            if (!fetched.error().is_transient() || attempt >= policy.max_attempts) {
                return unexpected(fetched.error());
            }
            std::this_thread::sleep_for(calculate_retry_delay(policy, attempt));
        }
    }
};

auto backup_channel_store::create(const channel_store_config& config,
                                  std::shared_ptr<channel_client> client)
    -> result<std::shared_ptr<backup_channel_store>> {
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (!client) {
        client = std::make_shared<bot_api_channel_client>(
            config, make_store_http_client(config.request_timeout));
    }
    return std::make_shared<backup_channel_store>(config, std::move(client));
}

backup_channel_store::backup_channel_store(const channel_store_config& config,
                                           std::shared_ptr<channel_client> client)
    : impl_(std::make_unique<impl>(config, std::move(client))) {}

backup_channel_store::~backup_channel_store() = default;

auto backup_channel_store::name() const -> std::string_view {
    return "channel";
}

auto backup_channel_store::location_of(const object_id& id) const -> std::string {
    return "channel://" + impl_->config.chat_id + "/" + id;
}

auto backup_channel_store::cached_segments() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->cache_mutex);
    return impl_->cache.size();
}

auto backup_channel_store::begin_object(const object_id& id, const std::string& content_type)
    -> result<void> {
    std::vector<int64_t> stale;
    {
        std::lock_guard<std::mutex> lock(impl_->index_mutex);
        auto it = impl_->index.find(id);
        if (it != impl_->index.end()) {
            if (it->second.complete) {
                return unexpected(error{error_code::invalid_state, id + " is already stored"});
            }
            stale = collect_messages(it->second);
        }
        object_entry entry;
        entry.content_type =
            content_type.empty() ? store_utils::detect_content_type(id) : content_type;
        impl_->index[id] = std::move(entry);
    }

    impl_->discard_messages(stale);
    return {};
}

auto backup_channel_store::put_chunk(const object_id& id, const chunk_descriptor& descriptor,
                                     std::span<const std::byte> data) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->index_mutex);
        auto it = impl_->index.find(id);
        if (it == impl_->index.end() || it->second.complete) {
            return unexpected(error{error_code::invalid_state, "no upload in progress for " + id});
        }
    }
    if (data.size() != descriptor.length) {
        return unexpected(error{error_code::internal_error,
                                "chunk length does not match its descriptor"});
    }

    auto base_name = object_file_name(id) + ".part" + std::to_string(descriptor.sequence_number);
    auto max_size = impl_->config.max_message_size;
    auto pieces = static_cast<std::size_t>((data.size() + max_size - 1) / max_size);

    std::vector<segment> sent;
    sent.reserve(pieces);
    for (std::size_t i = 0; i < pieces; ++i) {
        auto begin = static_cast<std::size_t>(i * max_size);
        auto count = static_cast<std::size_t>(std::min<uint64_t>(max_size, data.size() - begin));
        auto piece = data.subspan(begin, count);
        auto file_name = pieces == 1 ? base_name : base_name + "." + std::to_string(i);
        auto caption = id + " #" + std::to_string(descriptor.sequence_number);

        auto doc = impl_->client->send_document(file_name, caption, piece);
        if (!doc) {
            std::vector<int64_t> partial;
            for (const auto& seg : sent) {
                partial.push_back(seg.message_id);
            }
            impl_->discard_messages(partial);
            return unexpected(doc.error());
        }

        segment seg;
        seg.offset = descriptor.offset + begin;
        seg.length = count;
        seg.message_id = doc.value().message_id;
        seg.file_id = doc.value().file_id;
        seg.crc = checksum::crc32(piece);
        sent.push_back(std::move(seg));
    }

    std::vector<int64_t> replaced;
    bool orphaned = false;
    {
        std::lock_guard<std::mutex> lock(impl_->index_mutex);
        auto it = impl_->index.find(id);
        if (it == impl_->index.end() || it->second.complete) {
            orphaned = true;
        } else {
            auto& slot = it->second.chunks[descriptor.sequence_number];
            for (const auto& seg : slot) {
                replaced.push_back(seg.message_id);
            }
            slot = std::move(sent);
        }
    }

    if (orphaned) {
        std::vector<int64_t> ids;
        for (const auto& seg : sent) {
            ids.push_back(seg.message_id);
        }
        impl_->discard_messages(ids);
        return unexpected(error{error_code::invalid_state,
                                "upload of " + id + " was aborted during chunk put"});
    }
    impl_->discard_messages(replaced);
    return {};
}

auto backup_channel_store::complete_object(const stored_object_metadata& metadata)
    -> result<std::string> {
    std::lock_guard<std::mutex> lock(impl_->index_mutex);
    auto it = impl_->index.find(metadata.id);
    if (it == impl_->index.end() || it->second.complete) {
        return unexpected(error{error_code::invalid_state,
                                "no upload in progress for " + metadata.id});
    }

    auto& entry = it->second;
    std::vector<segment> ordered;
    uint64_t expected_seq = 0;
    uint64_t expected_offset = 0;
    for (const auto& [seq, segs] : entry.chunks) {
        if (seq != expected_seq++) {
            return unexpected(error{error_code::multipart_failed,
                                    "missing chunk " + std::to_string(expected_seq - 1) +
                                        " for " + metadata.id});
        }
        for (const auto& seg : segs) {
            if (seg.offset != expected_offset) {
                return unexpected(error{error_code::multipart_failed,
                                        "chunk " + std::to_string(seq) +
                                            " is not contiguous for " + metadata.id});
            }
            expected_offset += seg.length;
            if (seg.length > 0) {
                ordered.push_back(seg);
            }
        }
    }
    if (expected_offset != metadata.size) {
        return unexpected(error{error_code::multipart_failed,
                                "received " + std::to_string(expected_offset) + " of " +
                                    std::to_string(metadata.size) + " bytes for " +
                                    metadata.id});
    }

    entry.segments = std::move(ordered);
    entry.complete = true;
    entry.size = metadata.size;
    if (!metadata.content_type.empty()) {
        entry.content_type = metadata.content_type;
    }
    entry.created_at = metadata.created_at;

    CR_LOG_INFO(log_category::store,
                "stored " + metadata.id + " in channel (" +
                    std::to_string(entry.segments.size()) + " segments)");
    return location_of(metadata.id);
}

auto backup_channel_store::abort_object(const object_id& id) -> result<void> {
    std::vector<int64_t> messages;
    {
        std::lock_guard<std::mutex> lock(impl_->index_mutex);
        auto it = impl_->index.find(id);
        if (it == impl_->index.end() || it->second.complete) {
            return {};
        }
        messages = collect_messages(it->second);
        impl_->index.erase(it);
    }
    return impl_->delete_messages(messages);
}

auto backup_channel_store::get_range(const object_id& id, uint64_t first, uint64_t last)
    -> result<std::vector<std::byte>> {
    std::vector<segment> overlapping;
    uint64_t size = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->index_mutex);
        auto it = impl_->index.find(id);
        if (it == impl_->index.end() || !it->second.complete) {
            return unexpected(error{error_code::object_not_found, id});
        }
        size = it->second.size;
        if (first >= size || last < first) {
            return unexpected(error{error_code::range_not_satisfiable,
                                    "bytes=" + std::to_string(first) + "-" +
                                        std::to_string(last) + " outside object of " +
                                        std::to_string(size) + " bytes"});
        }
        last = std::min(last, size - 1);

        const auto& segs = it->second.segments;
        auto pos = std::upper_bound(segs.begin(), segs.end(), first,
                                    [](uint64_t value, const segment& seg) {
                                        return value < seg.offset;
                                    });
        if (pos != segs.begin()) {
            --pos;
        }
        for (; pos != segs.end() && pos->offset <= last; ++pos) {
            overlapping.push_back(*pos);
        }
    }

    std::vector<std::byte> out;
    out.reserve(static_cast<std::size_t>(last - first + 1));
    for (const auto& seg : overlapping) {
        auto data = impl_->fetch_segment(seg);
        if (!data) {
            return unexpected(data.error());
        }
        auto from = std::max(first, seg.offset) - seg.offset;
        auto to = std::min(last + 1, seg.offset + seg.length) - seg.offset;
        out.insert(out.end(), data.value()->begin() + static_cast<std::ptrdiff_t>(from),
                   data.value()->begin() + static_cast<std::ptrdiff_t>(to));
    }
    return out;
}

auto backup_channel_store::head_object(const object_id& id) -> result<object_head> {
    std::lock_guard<std::mutex> lock(impl_->index_mutex);
    object_head head;
    auto it = impl_->index.find(id);
    if (it == impl_->index.end() || !it->second.complete) {
        return head;
    }
    head.exists = true;
    head.size = it->second.size;
    head.content_type = it->second.content_type;
    head.last_modified = it->second.created_at;
    return head;
}

auto backup_channel_store::list_objects(const std::string& prefix)
    -> result<std::vector<stored_object_metadata>> {
    std::vector<stored_object_metadata> objects;
    {
        std::lock_guard<std::mutex> lock(impl_->index_mutex);
        for (const auto& [id, entry] : impl_->index) {
            if (!entry.complete || !id.starts_with(prefix)) {
                continue;
            }
            stored_object_metadata meta;
            meta.id = id;
            meta.size = entry.size;
            meta.content_type = entry.content_type;
            meta.created_at = entry.created_at;
            meta.backup_location = location_of(id);
            objects.push_back(std::move(meta));
        }
    }
    std::sort(objects.begin(), objects.end(),
              [](const auto& a, const auto& b) { return a.id < b.id; });
    return objects;
}

auto backup_channel_store::delete_object(const object_id& id) -> result<void> {
    std::vector<int64_t> messages;
    std::vector<segment> segs;
    {
        std::lock_guard<std::mutex> lock(impl_->index_mutex);
        auto it = impl_->index.find(id);
        if (it == impl_->index.end() || !it->second.complete) {
            return unexpected(error{error_code::object_not_found, id});
        }
        messages = collect_messages(it->second);
        segs = it->second.segments;
        impl_->index.erase(it);
    }

    impl_->cache_evict(segs);
    CR_LOG_INFO(log_category::store, "deleted " + id + " from channel");
    return impl_->delete_messages(messages);
}

auto backup_channel_store::presigned_url(const object_id& id, std::chrono::seconds)
    -> result<std::string> {
    return unexpected(error{error_code::operation_not_supported,
                            "channel store has no direct links for " + id});
}

auto backup_channel_store::check_connection() -> result<void> {
    auto me = impl_->client->get_me();
    if (!me) {
        return unexpected(me.error());
    }
    CR_LOG_DEBUG(log_category::store, "channel reachable as " + me.value());
    return {};
}

}  // namespace chunk_relay
