/**
 * @file transfer_session.cpp
 * @brief Upload session state machine and chunk dispatcher
 */

#include <chunk_relay/transfer/transfer_session.h>

#include <chunk_relay/core/logging.h>
#include <chunk_relay/store/store_utils.h>
#include <chunk_relay/transfer/replication_coordinator.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace chunk_relay {

struct transfer_session::impl {
    session_id id;
    object_id object;
    std::string content_type;
    transfer_config config;
    std::shared_ptr<progress_tracker> tracker;
    std::unique_ptr<chunk_stream> stream;
    std::shared_ptr<replication_coordinator> coordinator;
    std::optional<uint64_t> declared_size;

    mutable std::mutex mutex;
    std::condition_variable terminal;
    session_state state = session_state::created;
    std::optional<session_outcome> outcome;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    state_callback callback;

    std::atomic<bool> cancel_requested{false};
    std::atomic<uint64_t> dispatched{0};
    std::thread dispatcher;

    [[nodiscard]] auto log_context() const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.session_id = id.to_string();
        ctx.object_id = object;
        return ctx;
    }

    void notify(session_state old_state, session_state new_state) {
        state_callback cb;
        {
            std::lock_guard<std::mutex> lock(mutex);
            cb = callback;
        }
        if (cb) {
            cb(old_state, new_state);
        }
    }

    /**
     * @brief Publish the terminal state and wake waiters
     */
    void finish(session_state final_state,
                std::optional<stored_object_metadata> metadata,
                std::optional<error> failure) {
        session_outcome result;
        result.state = final_state;
        result.metadata = std::move(metadata);
        result.confirmed_bytes = coordinator->confirmed_bytes();
        result.destinations = coordinator->statuses();
        result.failure = std::move(failure);

        if (final_state == session_state::completed && !declared_size) {
            if (auto r = tracker->set_total_size(id, stream->bytes_produced()); !r) {
                CR_LOG_TRACE(log_category::session, "total size not published: " + r.error().message);
            }
        }
        if (auto r = tracker->mark_terminal(id, final_state); !r) {
            CR_LOG_TRACE(log_category::session, "terminal state not published: " + r.error().message);
        }

        auto ctx = log_context();
        ctx.bytes = result.confirmed_bytes;
        if (result.failure) {
            ctx.error_message = result.failure->message;
        }

        session_state old_state = session_state::active;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (is_terminal_state(state)) {
                return;
            }
            old_state = state;
            state = final_state;
            completed_at = std::chrono::system_clock::now();
            outcome = std::move(result);
        }
        terminal.notify_all();

        switch (final_state) {
            case session_state::completed:
                CR_LOG_INFO_CTX(log_category::session, "upload completed", ctx);
                break;
            case session_state::cancelled:
                CR_LOG_INFO_CTX(log_category::session, "upload cancelled", ctx);
                break;
            default:
                CR_LOG_ERROR_CTX(log_category::session, "upload failed", ctx);
                break;
        }
        notify(old_state, final_state);
    }

    void fail(error err) {
        coordinator->abort_all();
        finish(session_state::failed, std::nullopt, std::move(err));
    }

    void finish_cancelled() {
        coordinator->abort_all();
        finish(session_state::cancelled, std::nullopt,
               error{error_code::session_cancelled, "cancelled by caller"});
    }

    /**
     * @brief Dispatcher thread body
     */
    void run() {
        const auto ctx = log_context();
        CR_LOG_INFO_CTX(log_category::session, "upload started", ctx);

        if (auto begun = coordinator->begin(content_type); !begun) {
            if (cancel_requested.load()) {
                finish_cancelled();
            } else {
                fail(begun.error());
            }
            return;
        }

        std::optional<error> failure;
        const auto limit = config.max_in_flight_chunks;

        while (!cancel_requested.load()) {
            if (!coordinator->wait_for_capacity(limit)) {
                break;
            }
            if (auto mandatory = coordinator->mandatory_failure()) {
                failure = std::move(mandatory);
                break;
            }

            auto next = stream->next();
            if (!next) {
                failure = next.error();
                break;
            }
            if (!next.value() || cancel_requested.load()) {
                break;
            }

            coordinator->dispatch(std::move(*next.value()));
            dispatched.fetch_add(1);
        }

        coordinator->wait_idle();

        if (cancel_requested.load()) {
            finish_cancelled();
            return;
        }
        if (!failure) {
            failure = coordinator->mandatory_failure();
        }
        if (failure) {
            fail(std::move(*failure));
            return;
        }

        stored_object_metadata metadata;
        metadata.id = object;
        metadata.size = stream->bytes_produced();
        metadata.content_type = content_type;
        metadata.created_at = std::chrono::system_clock::now();

        auto completed = coordinator->complete(std::move(metadata));
        if (!completed) {
            if (cancel_requested.load()) {
                finish_cancelled();
            } else {
                fail(completed.error());
            }
            return;
        }
        finish(session_state::completed, std::move(completed.value()), std::nullopt);
    }
};

auto transfer_session::create(parameters params) -> result<std::shared_ptr<transfer_session>> {
    if (params.object.empty()) {
        return unexpected(error{error_code::invalid_configuration, "object id is empty"});
    }
    if (params.destinations.empty()) {
        return unexpected(error{error_code::invalid_configuration, "no destinations"});
    }
    for (const auto& dest : params.destinations) {
        if (!dest.store) {
            return unexpected(error{error_code::invalid_configuration, "destination is null"});
        }
    }
    if (auto valid = params.config.validate(); !valid) {
        return unexpected(valid.error());
    }

    // The primary always gates completion
    params.destinations.front().mandatory = true;

    auto stream = chunk_stream::create(std::move(params.source), params.config.chunk);
    if (!stream) {
        return unexpected(stream.error());
    }

    const auto& chunking = params.config.chunk;
    const auto size_limit = stream.value()->total_size().value_or(chunking.max_object_size);
    for (const auto& dest : params.destinations) {
        auto layout = dest.store->validate_layout(chunking.chunk_size, size_limit);
        if (!layout) {
            auto message = std::string(dest.store->name()) + ": " + layout.error().message;
            CR_LOG_ERROR(log_category::session, "chunk layout rejected by " + message);
            return unexpected(error{layout.error().code, message});
        }
    }

    if (!params.pool) {
        params.pool = adapters::transfer_pool_factory::create();
    }
    if (!params.tracker) {
        params.tracker = progress_tracker::global();
    }

    return std::shared_ptr<transfer_session>(
        new transfer_session(std::move(params), std::move(stream.value())));
}

transfer_session::transfer_session(parameters params, std::unique_ptr<chunk_stream> stream)
    : impl_(std::make_unique<impl>()) {
    impl_->id = session_id::generate();
    impl_->object = std::move(params.object);
    impl_->content_type = params.content_type.empty()
                              ? store_utils::detect_content_type(impl_->object)
                              : std::move(params.content_type);
    impl_->config = params.config;
    impl_->tracker = std::move(params.tracker);
    impl_->stream = std::move(stream);
    impl_->declared_size = impl_->stream->total_size();
    impl_->coordinator = replication_coordinator::create(
        impl_->object, std::move(params.destinations), impl_->config, std::move(params.pool),
        impl_->id.to_string());
}

transfer_session::~transfer_session() {
    impl_->cancel_requested.store(true);
    impl_->coordinator->cancel();
    if (impl_->dispatcher.joinable()) {
        if (impl_->dispatcher.get_id() == std::this_thread::get_id()) {
            impl_->dispatcher.detach();
        } else {
            impl_->dispatcher.join();
        }
    }
}

auto transfer_session::start() -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->state != session_state::created) {
            return unexpected(error{error_code::already_started,
                                    "session " + impl_->id.to_string() + " is " +
                                        std::string(to_string(impl_->state))});
        }
        impl_->state = session_state::active;
        impl_->started_at = std::chrono::system_clock::now();
    }

    if (auto registered = impl_->tracker->register_session(impl_->id, transfer_direction::upload,
                                                            impl_->declared_size);
        !registered) {
        CR_LOG_WARN(log_category::session, registered.error().message);
    }

    auto tracker = impl_->tracker;
    auto id = impl_->id;
    impl_->coordinator->set_progress_callback([tracker, id](uint64_t confirmed) {
        if (auto r = tracker->record_progress(id, confirmed); !r) {
            CR_LOG_TRACE(log_category::progress, "progress not recorded: " + r.error().message);
        }
    });

    impl_->dispatcher = std::thread([state = impl_.get()] { state->run(); });
    impl_->notify(session_state::created, session_state::active);
    return {};
}

auto transfer_session::cancel() -> result<void> {
    session_state current;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        current = impl_->state;
    }

    if (is_terminal_state(current)) {
        return unexpected(error{error_code::invalid_state,
                                "session " + impl_->id.to_string() + " is already " +
                                    std::string(to_string(current))});
    }

    impl_->cancel_requested.store(true);
    impl_->coordinator->cancel();

    if (current == session_state::created) {
        bool cancelled_here = false;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (impl_->state == session_state::created) {
                session_outcome result;
                result.state = session_state::cancelled;
                result.destinations = impl_->coordinator->statuses();
                result.failure = error{error_code::session_cancelled, "cancelled before start"};
                impl_->state = session_state::cancelled;
                impl_->completed_at = std::chrono::system_clock::now();
                impl_->outcome = std::move(result);
                cancelled_here = true;
            }
        }
        if (cancelled_here) {
            impl_->terminal.notify_all();
            auto published = impl_->tracker->register_session(
                impl_->id, transfer_direction::upload, impl_->declared_size);
            if (published) {
                published = impl_->tracker->mark_terminal(impl_->id, session_state::cancelled);
            }
            if (!published) {
                CR_LOG_TRACE(log_category::session, published.error().message);
            }
            const auto ctx = impl_->log_context();
            CR_LOG_INFO_CTX(log_category::session, "cancelled before start", ctx);
            impl_->notify(session_state::created, session_state::cancelled);
            return {};
        }
    }

    const auto ctx = impl_->log_context();
    CR_LOG_DEBUG_CTX(log_category::session, "cancellation requested", ctx);
    return {};
}

auto transfer_session::await_completion() -> session_outcome {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->terminal.wait(lock, [&] { return impl_->outcome.has_value(); });
    return *impl_->outcome;
}

auto transfer_session::await_completion(std::chrono::milliseconds timeout)
    -> std::optional<session_outcome> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    if (!impl_->terminal.wait_for(lock, timeout, [&] { return impl_->outcome.has_value(); })) {
        return std::nullopt;
    }
    return impl_->outcome;
}

auto transfer_session::id() const -> const session_id& {
    return impl_->id;
}

auto transfer_session::object() const -> const object_id& {
    return impl_->object;
}

auto transfer_session::direction() const noexcept -> transfer_direction {
    return transfer_direction::upload;
}

auto transfer_session::state() const -> session_state {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

auto transfer_session::chunk_size() const noexcept -> std::size_t {
    return impl_->config.chunk.chunk_size;
}

auto transfer_session::total_size() const -> std::optional<uint64_t> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->outcome && impl_->outcome->metadata) {
        return impl_->outcome->metadata->size;
    }
    return impl_->declared_size;
}

auto transfer_session::destinations() const -> std::vector<destination_status> {
    return impl_->coordinator->statuses();
}

auto transfer_session::chunks_dispatched() const -> uint64_t {
    return impl_->dispatched.load();
}

auto transfer_session::started_at() const
    -> std::optional<std::chrono::system_clock::time_point> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->started_at;
}

auto transfer_session::completed_at() const
    -> std::optional<std::chrono::system_clock::time_point> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->completed_at;
}

void transfer_session::on_state_change(state_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callback = std::move(callback);
}

}  // namespace chunk_relay
