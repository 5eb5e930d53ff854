/**
 * @file transfer_engine.cpp
 * @brief Transfer engine facade and download stream
 */

#include <chunk_relay/transfer/transfer_engine.h>

#include <chunk_relay/core/logging.h>

#include <algorithm>
#include <map>
#include <mutex>

namespace chunk_relay {

namespace {

/**
 * @brief Metadata of objects completed through this engine
 *
 * Shared with session callbacks through a weak pointer so a callback that
 * fires after the engine is gone does nothing.
 */
struct object_catalog {
    std::mutex mutex;
    std::map<object_id, stored_object_metadata> objects;

    void put(const stored_object_metadata& metadata) {
        std::lock_guard<std::mutex> lock(mutex);
        objects[metadata.id] = metadata;
    }

    auto find(const object_id& id) -> std::optional<stored_object_metadata> {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = objects.find(id);
        if (it == objects.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void erase(const object_id& id) {
        std::lock_guard<std::mutex> lock(mutex);
        objects.erase(id);
    }
};

}  // namespace

// ============================================================================
// download_stream
// ============================================================================

download_stream::download_stream(stored_object_metadata metadata,
                                 std::shared_ptr<const range_server> server,
                                 std::shared_ptr<progress_tracker> tracker,
                                 std::size_t read_size)
    : metadata_(std::move(metadata)),
      server_(std::move(server)),
      tracker_(std::move(tracker)),
      read_size_(read_size == 0 ? 1 : read_size),
      id_(session_id::generate()) {
    if (auto r = tracker_->register_session(id_, transfer_direction::download, metadata_.size);
        !r) {
        CR_LOG_TRACE(log_category::progress, "download not tracked: " + r.error().message);
    }
    if (metadata_.size == 0) {
        finish(session_state::completed);
    }
}

download_stream::~download_stream() {
    if (!is_terminal_state(state_)) {
        finish(session_state::cancelled);
    }
}

void download_stream::finish(session_state final_state) {
    if (is_terminal_state(state_)) {
        return;
    }
    state_ = final_state;
    if (auto r = tracker_->mark_terminal(id_, final_state); !r) {
        CR_LOG_TRACE(log_category::progress, "download state not published: " + r.error().message);
    }

    transfer_log_context ctx;
    ctx.session_id = id_.to_string();
    ctx.object_id = metadata_.id;
    ctx.bytes = delivered_;
    if (failure_) {
        ctx.error_message = failure_->message;
    }
    if (final_state == session_state::failed) {
        CR_LOG_ERROR_CTX(log_category::engine, "download failed", ctx);
    } else {
        CR_LOG_DEBUG_CTX(log_category::engine, "download " + std::string(to_string(final_state)),
                         ctx);
    }
}

auto download_stream::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (failure_) {
        return unexpected(*failure_);
    }
    if (buffer.empty()) {
        return std::size_t{0};
    }

    if (buffer_pos_ == buffer_.size()) {
        if (fetched_ >= metadata_.size) {
            finish(session_state::completed);
            return std::size_t{0};
        }
        const uint64_t last =
            std::min<uint64_t>(metadata_.size - 1, fetched_ + read_size_ - 1);
        auto piece = server_->read(metadata_, fetched_, last);
        if (!piece) {
            failure_ = piece.error();
            finish(session_state::failed);
            return unexpected(piece.error());
        }
        buffer_ = std::move(piece.value().data);
        buffer_pos_ = 0;
        fetched_ = last + 1;
    }

    const auto count = std::min(buffer.size(), buffer_.size() - buffer_pos_);
    std::copy_n(buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_pos_), count,
                buffer.begin());
    buffer_pos_ += count;
    delivered_ += count;

    if (auto r = tracker_->record_progress(id_, delivered_); !r) {
        CR_LOG_TRACE(log_category::progress, "progress not recorded: " + r.error().message);
    }
    if (delivered_ == metadata_.size) {
        finish(session_state::completed);
    }
    return count;
}

auto download_stream::size_hint() const -> std::optional<uint64_t> {
    return metadata_.size;
}

auto download_stream::id() const -> const session_id& {
    return id_;
}

auto download_stream::metadata() const -> const stored_object_metadata& {
    return metadata_;
}

auto download_stream::bytes_read() const noexcept -> uint64_t {
    return delivered_;
}

auto download_stream::state() const noexcept -> session_state {
    return state_;
}

// ============================================================================
// transfer_engine::impl
// ============================================================================

struct transfer_engine::impl {
    transfer_config config;
    std::shared_ptr<remote_store> primary;
    std::shared_ptr<remote_store> backup;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::shared_ptr<progress_tracker> tracker;
    std::shared_ptr<const range_server> ranges;
    std::shared_ptr<object_catalog> catalog = std::make_shared<object_catalog>();

    mutable std::mutex sessions_mutex;
    std::map<session_id, std::shared_ptr<transfer_session>> sessions;

    [[nodiscard]] auto default_destinations() const -> std::vector<destination> {
        std::vector<destination> out;
        out.push_back(destination{primary, true});
        if (backup) {
            out.push_back(destination{backup, config.backup_mandatory});
        }
        return out;
    }

    [[nodiscard]] auto find_session(const session_id& id) const
        -> std::shared_ptr<transfer_session> {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(id);
        return it == sessions.end() ? nullptr : it->second;
    }

    /**
     * @brief Drop terminal sessions older than the retention period
     */
    void purge_finished() {
        std::vector<std::shared_ptr<transfer_session>> expired;
        const auto now = std::chrono::system_clock::now();
        {
            std::lock_guard<std::mutex> lock(sessions_mutex);
            for (auto it = sessions.begin(); it != sessions.end();) {
                auto finished_at = it->second->completed_at();
                if (finished_at && is_terminal_state(it->second->state()) &&
                    now - *finished_at > config.progress_retention) {
                    expired.push_back(std::move(it->second));
                    it = sessions.erase(it);
                } else {
                    ++it;
                }
            }
        }
        tracker->purge_expired(config.progress_retention);
        // expired sessions are destroyed here, outside the lock
    }

    void remember(const session_outcome& outcome) {
        if (outcome.metadata) {
            catalog->put(*outcome.metadata);
        }
    }

    /**
     * @brief Metadata from the catalog, else from the stores
     */
    auto resolve(const object_id& id) -> result<stored_object_metadata> {
        if (auto known = catalog->find(id)) {
            return *known;
        }

        auto from_head = [&](const object_head& head) {
            stored_object_metadata meta;
            meta.id = id;
            meta.size = head.size;
            meta.content_type = head.content_type;
            meta.created_at = head.last_modified.value_or(std::chrono::system_clock::time_point{});
            meta.primary_location = primary->location_of(id);
            return meta;
        };

        auto head = primary->head_object(id);
        if (head) {
            if (!head.value().exists) {
                return unexpected(error{error_code::object_not_found, "object not found: " + id});
            }
            auto meta = from_head(head.value());
            if (backup) {
                auto replica = backup->head_object(id);
                if (replica && replica.value().exists) {
                    meta.backup_location = backup->location_of(id);
                }
            }
            return meta;
        }

        if (!head.error().is_transient() || !backup) {
            return unexpected(head.error());
        }

        auto replica = backup->head_object(id);
        if (replica && replica.value().exists) {
            auto meta = from_head(replica.value());
            meta.backup_location = backup->location_of(id);
            CR_LOG_WARN(log_category::engine,
                        "primary unreachable, resolved " + id + " from backup: " +
                            head.error().message);
            return meta;
        }
        return unexpected(error{error_code::destination_unavailable,
                                std::string(primary->name()) + ": " + head.error().message});
    }
};

// ============================================================================
// transfer_engine::builder
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_primary(std::shared_ptr<remote_store> store) -> builder& {
    primary_ = std::move(store);
    return *this;
}

auto transfer_engine::builder::with_backup(std::shared_ptr<remote_store> store) -> builder& {
    backup_ = std::move(store);
    return *this;
}

auto transfer_engine::builder::with_backup_mandatory(bool mandatory) -> builder& {
    config_.backup_mandatory = mandatory;
    return *this;
}

auto transfer_engine::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk.chunk_size = size;
    return *this;
}

auto transfer_engine::builder::with_max_in_flight(std::size_t chunks) -> builder& {
    config_.max_in_flight_chunks = chunks;
    return *this;
}

auto transfer_engine::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto transfer_engine::builder::with_chunk_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.chunk_timeout = timeout;
    return *this;
}

auto transfer_engine::builder::with_integrity(bool enable, checksum_algorithm algorithm)
    -> builder& {
    config_.chunk.verify_integrity = enable;
    config_.chunk.algorithm = algorithm;
    return *this;
}

auto transfer_engine::builder::with_progress_retention(std::chrono::milliseconds retention)
    -> builder& {
    config_.progress_retention = retention;
    return *this;
}

auto transfer_engine::builder::with_range_request_size(std::size_t size) -> builder& {
    config_.range_request_size = size;
    return *this;
}

auto transfer_engine::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_engine::builder::with_progress_tracker(std::shared_ptr<progress_tracker> tracker)
    -> builder& {
    tracker_ = std::move(tracker);
    return *this;
}

auto transfer_engine::builder::with_config(transfer_config config) -> builder& {
    config_ = config;
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    if (!primary_) {
        return unexpected(error{error_code::invalid_configuration, "primary store is required"});
    }
    if (backup_ && backup_ == primary_) {
        return unexpected(error{error_code::invalid_configuration,
                                "backup store must differ from the primary"});
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    get_logger().initialize();

    auto pool = pool_ ? pool_ : adapters::transfer_pool_factory::create();
    auto tracker = tracker_ ? tracker_ : progress_tracker::global();
    return transfer_engine(config_, primary_, backup_, std::move(pool), std::move(tracker));
}

// ============================================================================
// transfer_engine
// ============================================================================

transfer_engine::transfer_engine(transfer_config config,
                                 std::shared_ptr<remote_store> primary,
                                 std::shared_ptr<remote_store> backup,
                                 std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                                 std::shared_ptr<progress_tracker> tracker)
    : impl_(std::make_unique<impl>()) {
    impl_->config = config;
    impl_->primary = std::move(primary);
    impl_->backup = std::move(backup);
    impl_->pool = std::move(pool);
    impl_->tracker = std::move(tracker);
    impl_->ranges = std::make_shared<const range_server>(
        impl_->primary, impl_->backup, impl_->config.effective_range_request_size());

    CR_LOG_INFO(log_category::engine,
                "engine ready: primary=" + std::string(impl_->primary->name()) +
                    (impl_->backup ? ", backup=" + std::string(impl_->backup->name()) : "") +
                    ", chunk size " + format_size(impl_->config.chunk.chunk_size));
}

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;

transfer_engine::~transfer_engine() {
    if (!impl_) {
        return;
    }
    std::map<session_id, std::shared_ptr<transfer_session>> sessions;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        sessions.swap(impl_->sessions);
    }
    for (auto& [id, session] : sessions) {
        if (is_terminal_state(session->state())) {
            continue;
        }
        if (auto r = session->cancel(); !r) {
            CR_LOG_TRACE(log_category::engine, r.error().message);
        }
    }
}

// ============================================================================
// Uploads
// ============================================================================

auto transfer_engine::upload(const object_id& id,
                             std::unique_ptr<byte_source> source,
                             std::vector<destination> destinations,
                             std::string content_type) -> result<session_id> {
    impl_->purge_finished();

    if (!source) {
        return unexpected(error{error_code::invalid_configuration, "source is null"});
    }

    transfer_session::parameters params;
    params.object = id;
    params.content_type = std::move(content_type);
    params.source = std::move(source);
    params.destinations =
        destinations.empty() ? impl_->default_destinations() : std::move(destinations);
    params.config = impl_->config;
    params.pool = impl_->pool;
    params.tracker = impl_->tracker;

    auto created = transfer_session::create(std::move(params));
    if (!created) {
        return unexpected(created.error());
    }
    auto session = std::move(created.value());

    std::weak_ptr<object_catalog> catalog = impl_->catalog;
    std::weak_ptr<transfer_session> weak_session = session;
    session->on_state_change([catalog, weak_session](session_state, session_state new_state) {
        if (new_state != session_state::completed) {
            return;
        }
        auto owner = catalog.lock();
        auto finished = weak_session.lock();
        if (!owner || !finished) {
            return;
        }
        auto outcome = finished->await_completion(std::chrono::milliseconds(0));
        if (outcome && outcome->metadata) {
            owner->put(*outcome->metadata);
        }
    });

    const auto sid = session->id();
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        impl_->sessions.emplace(sid, session);
    }

    if (auto started = session->start(); !started) {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        impl_->sessions.erase(sid);
        return unexpected(started.error());
    }

    transfer_log_context ctx;
    ctx.session_id = sid.to_string();
    ctx.object_id = id;
    if (auto total = session->total_size()) {
        ctx.bytes = *total;
    }
    CR_LOG_INFO_CTX(log_category::engine, "upload accepted", ctx);
    return sid;
}

auto transfer_engine::upload_file(const std::filesystem::path& path) -> result<session_id> {
    auto source = stream_source::open_file(path);
    if (!source) {
        return unexpected(source.error());
    }
    return upload(make_object_id(path.filename().string()), std::move(source.value()));
}

auto transfer_engine::session(const session_id& id) const
    -> result<std::shared_ptr<transfer_session>> {
    auto found = impl_->find_session(id);
    if (!found) {
        return unexpected(error{error_code::session_not_found,
                                "unknown session " + id.to_string()});
    }
    return found;
}

auto transfer_engine::await_completion(const session_id& id) -> result<session_outcome> {
    auto found = impl_->find_session(id);
    if (!found) {
        return unexpected(error{error_code::session_not_found,
                                "unknown session " + id.to_string()});
    }
    auto outcome = found->await_completion();
    impl_->remember(outcome);
    return outcome;
}

auto transfer_engine::cancel(const session_id& id) -> result<void> {
    auto found = impl_->find_session(id);
    if (!found) {
        return unexpected(error{error_code::session_not_found,
                                "unknown session " + id.to_string()});
    }
    return found->cancel();
}

auto transfer_engine::release(const session_id& id) -> result<void> {
    std::shared_ptr<transfer_session> released;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        auto it = impl_->sessions.find(id);
        if (it == impl_->sessions.end()) {
            return unexpected(error{error_code::session_not_found,
                                    "unknown session " + id.to_string()});
        }
        if (!is_terminal_state(it->second->state())) {
            return unexpected(error{error_code::invalid_state,
                                    "session " + id.to_string() + " is still running"});
        }
        released = std::move(it->second);
        impl_->sessions.erase(it);
    }
    return {};
}

auto transfer_engine::active_sessions() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    return static_cast<std::size_t>(
        std::count_if(impl_->sessions.begin(), impl_->sessions.end(), [](const auto& entry) {
            return !is_terminal_state(entry.second->state());
        }));
}

// ============================================================================
// Reads
// ============================================================================

auto transfer_engine::download(const object_id& id) -> result<std::unique_ptr<download_stream>> {
    auto meta = impl_->resolve(id);
    if (!meta) {
        return unexpected(meta.error());
    }
    return std::unique_ptr<download_stream>(
        new download_stream(std::move(meta.value()), impl_->ranges, impl_->tracker,
                            impl_->config.effective_range_request_size()));
}

auto transfer_engine::download_to(const object_id& id, std::ostream& output)
    -> result<uint64_t> {
    auto stream = download(id);
    if (!stream) {
        return unexpected(stream.error());
    }

    auto& reader = *stream.value();
    std::vector<std::byte> buffer(impl_->config.effective_range_request_size());
    uint64_t written = 0;
    while (true) {
        auto n = reader.read(buffer);
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            break;
        }
        output.write(reinterpret_cast<const char*>(buffer.data()),
                     static_cast<std::streamsize>(n.value()));
        if (!output) {
            return unexpected(error{error_code::internal_error,
                                    "output stream write failed after " +
                                        std::to_string(written) + " bytes"});
        }
        written += n.value();
    }
    return written;
}

auto transfer_engine::stream_range(const object_id& id,
                                   uint64_t start,
                                   std::optional<uint64_t> end) -> result<range_read_result> {
    auto meta = impl_->resolve(id);
    if (!meta) {
        return unexpected(meta.error());
    }
    return impl_->ranges->read(meta.value(), start, end);
}

auto transfer_engine::stream_range(const object_id& id, std::string_view range_header)
    -> result<range_read_result> {
    auto meta = impl_->resolve(id);
    if (!meta) {
        return unexpected(meta.error());
    }
    auto range = parse_range_header(range_header, meta.value().size);
    if (!range) {
        return unexpected(range.error());
    }
    return impl_->ranges->read(meta.value(), range.value());
}

auto transfer_engine::metadata(const object_id& id) -> result<stored_object_metadata> {
    return impl_->resolve(id);
}

// ============================================================================
// Queries and management
// ============================================================================

auto transfer_engine::progress(const session_id& id) -> result<progress_snapshot> {
    impl_->purge_finished();
    return impl_->tracker->snapshot(id);
}

auto transfer_engine::list_objects(const std::string& prefix)
    -> result<std::vector<stored_object_metadata>> {
    auto listed = impl_->primary->list_objects(prefix);
    if (!listed) {
        return unexpected(listed.error());
    }

    std::map<object_id, std::string> replicas;
    if (impl_->backup) {
        auto backed_up = impl_->backup->list_objects(prefix);
        if (backed_up) {
            for (const auto& meta : backed_up.value()) {
                replicas[meta.id] = meta.backup_location.value_or(impl_->backup->location_of(meta.id));
            }
        } else {
            CR_LOG_DEBUG(log_category::engine,
                         "backup listing unavailable: " + backed_up.error().message);
        }
    }

    auto objects = std::move(listed.value());
    for (auto& meta : objects) {
        if (auto it = replicas.find(meta.id); it != replicas.end()) {
            meta.backup_location = it->second;
        }
        if (auto known = impl_->catalog->find(meta.id)) {
            if (meta.content_type.empty()) {
                meta.content_type = known->content_type;
            }
            if (!meta.backup_location) {
                meta.backup_location = known->backup_location;
            }
        }
    }
    return objects;
}

auto transfer_engine::delete_object(const object_id& id) -> result<void> {
    if (auto removed = impl_->primary->delete_object(id); !removed) {
        return removed;
    }
    impl_->catalog->erase(id);

    if (impl_->backup) {
        auto removed = impl_->backup->delete_object(id);
        if (!removed && removed.error().code != error_code::object_not_found) {
            transfer_log_context ctx;
            ctx.object_id = id;
            ctx.destination = std::string(impl_->backup->name());
            ctx.error_message = removed.error().message;
            CR_LOG_WARN_CTX(log_category::engine, "backup copy not deleted", ctx);
        }
    }

    CR_LOG_INFO(log_category::engine, "deleted " + id);
    return {};
}

auto transfer_engine::player_url(const object_id& id, std::chrono::seconds expiry)
    -> result<std::string> {
    if (expiry.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration, "expiry must be positive"});
    }
    return impl_->primary->presigned_url(id, expiry);
}

auto transfer_engine::check_destinations() -> std::vector<destination_check> {
    std::vector<destination_check> checks;
    for (const auto& dest : impl_->default_destinations()) {
        destination_check check;
        check.name = std::string(dest.store->name());
        check.mandatory = dest.mandatory;
        if (auto reachable = dest.store->check_connection(); !reachable) {
            check.failure = reachable.error();
            CR_LOG_WARN(log_category::engine,
                        check.name + " unreachable: " + reachable.error().message);
        }
        checks.push_back(std::move(check));
    }
    return checks;
}

auto transfer_engine::config() const -> const transfer_config& {
    return impl_->config;
}

auto transfer_engine::tracker() const -> std::shared_ptr<progress_tracker> {
    return impl_->tracker;
}

}  // namespace chunk_relay
