/**
 * @file progress_tracker.cpp
 * @brief Implementation of progress_tracker
 */

#include <chunk_relay/core/progress_tracker.h>

#include <chunk_relay/core/logging.h>

#include <atomic>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace chunk_relay {

namespace {

using steady_point = std::chrono::steady_clock::time_point;

struct rate_sample {
    steady_point timestamp;
    uint64_t bytes;
};

}  // namespace

// ============================================================================
// Implementation details
// ============================================================================

struct progress_tracker::impl {
    struct entry {
        // Written only while holding writer_mutex
        std::mutex writer_mutex;
        std::deque<rate_sample> samples;
        progress_snapshot current;
        steady_point started_at;
        std::optional<steady_point> terminal_at;

        // Read without locks
        std::atomic<std::shared_ptr<const progress_snapshot>> published;
    };

    config cfg;
    mutable std::shared_mutex map_mutex;
    std::unordered_map<session_id, std::shared_ptr<entry>> entries;

    std::mutex listener_mutex;
    listener on_publish;

    explicit impl(config c) : cfg(c) {}

    auto find(const session_id& id) const -> std::shared_ptr<entry> {
        std::shared_lock lock(map_mutex);
        auto it = entries.find(id);
        if (it == entries.end()) {
            return nullptr;
        }
        return it->second;
    }

    // Caller holds e.writer_mutex
    void refresh_rate(entry& e, steady_point now) const {
        auto& samples = e.samples;
        if (samples.empty() || samples.back().bytes != e.current.bytes_transferred) {
            samples.push_back({now, e.current.bytes_transferred});
        }

        // Keep one sample at or before the window start as the baseline
        auto window_start = now - cfg.rate_window;
        while (samples.size() > 2 && samples[1].timestamp <= window_start) {
            samples.pop_front();
        }

        double rate = 0.0;
        if (samples.size() >= 2) {
            const auto& oldest = samples.front();
            auto elapsed = std::chrono::duration<double>(now - oldest.timestamp).count();
            if (elapsed > 0.0) {
                rate = static_cast<double>(e.current.bytes_transferred - oldest.bytes) / elapsed;
            }
        }
        e.current.current_rate_bytes_per_sec = rate;
    }

    // Caller holds e.writer_mutex
    void derive(entry& e) const {
        auto& snap = e.current;
        if (snap.total_size && *snap.total_size > 0) {
            snap.percent = static_cast<double>(snap.bytes_transferred) * 100.0 /
                           static_cast<double>(*snap.total_size);
            if (snap.percent > 100.0) snap.percent = 100.0;
        } else if (snap.state == session_state::completed) {
            snap.percent = 100.0;
        } else {
            snap.percent = 0.0;
        }

        snap.eta_seconds.reset();
        if (is_terminal_state(snap.state)) {
            snap.current_rate_bytes_per_sec = 0.0;
            if (snap.state == session_state::completed) {
                snap.eta_seconds = 0.0;
            }
        } else if (snap.total_size && snap.current_rate_bytes_per_sec > 0.0) {
            auto remaining = *snap.total_size > snap.bytes_transferred
                ? *snap.total_size - snap.bytes_transferred
                : 0;
            snap.eta_seconds = static_cast<double>(remaining) / snap.current_rate_bytes_per_sec;
        }
    }

    // Caller holds e.writer_mutex
    auto publish(entry& e) -> std::shared_ptr<const progress_snapshot> {
        derive(e);
        auto snap = std::make_shared<const progress_snapshot>(e.current);
        e.published.store(snap);
        return snap;
    }

    void notify(const std::shared_ptr<const progress_snapshot>& snap) {
        listener callback;
        {
            std::lock_guard lock(listener_mutex);
            callback = on_publish;
        }
        if (callback) {
            callback(*snap);
        }
    }
};

// ============================================================================
// progress_tracker
// ============================================================================

progress_tracker::progress_tracker() : progress_tracker(config{}) {}

progress_tracker::progress_tracker(config cfg) : impl_(std::make_unique<impl>(cfg)) {}

progress_tracker::~progress_tracker() = default;

auto progress_tracker::global() -> std::shared_ptr<progress_tracker> {
    static auto instance = std::make_shared<progress_tracker>();
    return instance;
}

auto progress_tracker::register_session(const session_id& id, transfer_direction direction,
                                        std::optional<uint64_t> total_size) -> result<void> {
    purge_expired();

    auto e = std::make_shared<impl::entry>();
    e->started_at = std::chrono::steady_clock::now();
    e->current.id = id;
    e->current.direction = direction;
    e->current.state = session_state::active;
    e->current.total_size = total_size;
    e->samples.push_back({e->started_at, 0});
    impl_->derive(*e);
    e->published.store(std::make_shared<const progress_snapshot>(e->current));

    {
        std::unique_lock lock(impl_->map_mutex);
        auto [it, inserted] = impl_->entries.emplace(id, e);
        if (!inserted) {
            return unexpected(error{error_code::invalid_state,
                                    "session already registered: " + id.to_string()});
        }
    }

    CR_LOG_DEBUG(log_category::progress, "registered " + id.to_string());
    return {};
}

auto progress_tracker::record_progress(const session_id& id, uint64_t confirmed_bytes)
    -> result<void> {
    auto e = impl_->find(id);
    if (!e) {
        return unexpected(error{error_code::session_not_found, id.to_string()});
    }

    std::shared_ptr<const progress_snapshot> snap;
    {
        std::lock_guard lock(e->writer_mutex);
        if (is_terminal_state(e->current.state) ||
            confirmed_bytes <= e->current.bytes_transferred) {
            return {};
        }
        e->current.bytes_transferred = confirmed_bytes;
        impl_->refresh_rate(*e, std::chrono::steady_clock::now());
        snap = impl_->publish(*e);
    }

    impl_->notify(snap);
    return {};
}

auto progress_tracker::set_total_size(const session_id& id, uint64_t total_size)
    -> result<void> {
    auto e = impl_->find(id);
    if (!e) {
        return unexpected(error{error_code::session_not_found, id.to_string()});
    }

    std::lock_guard lock(e->writer_mutex);
    if (!is_terminal_state(e->current.state)) {
        e->current.total_size = total_size;
        impl_->publish(*e);
    }
    return {};
}

auto progress_tracker::mark_terminal(const session_id& id, session_state state)
    -> result<void> {
    if (!is_terminal_state(state)) {
        return unexpected(error{error_code::invalid_state,
                                "not a terminal state: " + std::string(to_string(state))});
    }

    auto e = impl_->find(id);
    if (!e) {
        return unexpected(error{error_code::session_not_found, id.to_string()});
    }

    std::shared_ptr<const progress_snapshot> snap;
    {
        std::lock_guard lock(e->writer_mutex);
        if (is_terminal_state(e->current.state)) {
            return unexpected(error{error_code::invalid_state,
                                    "session already terminal: " + id.to_string()});
        }
        e->current.state = state;
        e->terminal_at = std::chrono::steady_clock::now();
        snap = impl_->publish(*e);
    }

    impl_->notify(snap);
    return {};
}

auto progress_tracker::snapshot(const session_id& id) -> result<progress_snapshot> {
    auto e = impl_->find(id);
    if (!e) {
        return unexpected(error{error_code::session_not_found, id.to_string()});
    }

    auto snap = e->published.load();
    if (is_terminal_state(snap->state)) {
        // Only the reader that actually erases the entry sees the terminal snapshot
        std::unique_lock lock(impl_->map_mutex);
        auto it = impl_->entries.find(id);
        if (it == impl_->entries.end() || it->second != e) {
            return unexpected(error{error_code::session_not_found, id.to_string()});
        }
        impl_->entries.erase(it);
    }
    return *snap;
}

auto progress_tracker::remove(const session_id& id) -> bool {
    std::unique_lock lock(impl_->map_mutex);
    return impl_->entries.erase(id) > 0;
}

auto progress_tracker::purge_expired() -> std::size_t {
    return purge_expired(impl_->cfg.retention);
}

auto progress_tracker::purge_expired(std::chrono::milliseconds retention) -> std::size_t {
    auto now = std::chrono::steady_clock::now();
    std::size_t removed = 0;

    std::unique_lock lock(impl_->map_mutex);
    for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
        auto snap = it->second->published.load();
        bool expired = false;
        if (is_terminal_state(snap->state)) {
            std::lock_guard entry_lock(it->second->writer_mutex);
            expired = it->second->terminal_at &&
                      now - *it->second->terminal_at >= retention;
        }
        if (expired) {
            it = impl_->entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        CR_LOG_DEBUG(log_category::progress,
                     "purged " + std::to_string(removed) + " expired entries");
    }
    return removed;
}

auto progress_tracker::size() const -> std::size_t {
    std::shared_lock lock(impl_->map_mutex);
    return impl_->entries.size();
}

void progress_tracker::set_listener(listener callback) {
    std::lock_guard lock(impl_->listener_mutex);
    impl_->on_publish = std::move(callback);
}

auto progress_tracker::get_config() const -> const config& {
    return impl_->cfg;
}

}  // namespace chunk_relay
