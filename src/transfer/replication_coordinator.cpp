/**
 * @file replication_coordinator.cpp
 * @brief Per-destination chunk replication with retry, timeout and acknowledgment tracking
 */

#include <chunk_relay/transfer/replication_coordinator.h>

#include <chunk_relay/core/logging.h>
#include <chunk_relay/core/retry_policy.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>

namespace chunk_relay {

namespace {

constexpr auto poll_slice = std::chrono::milliseconds(50);

template <typename T>
auto ready_future(result<T> value) -> std::shared_future<result<T>> {
    std::promise<result<T>> promise;
    promise.set_value(std::move(value));
    return promise.get_future().share();
}

/**
 * @brief Error carried by a future the pool refused to run, if any
 */
auto refused(std::future<void>& submitted) -> std::optional<std::string> {
    if (submitted.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }
    try {
        submitted.get();
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

/**
 * @brief One operation against one destination across its attempts
 *
 * Only the holder of an attempt's settle flag touches the call, so the
 * fields are never accessed concurrently.
 */
template <typename T>
struct destination_call {
    std::size_t index = 0;
    std::string what;
    std::optional<uint64_t> sequence;
    std::function<result<T>()> op;
    std::function<std::optional<error>()> skip_if;
    std::function<void(result<T>)> done;
    bool honor_cancel = true;
    std::size_t max_attempts = 1;
    std::size_t attempt = 0;
};

using settle_flag = std::shared_ptr<std::atomic<bool>>;

}  // namespace

struct replication_coordinator::impl {
    struct destination_slot {
        destination dest;
        std::string name;
        destination_status status;
        uint64_t next_expected = 0;
        std::map<uint64_t, uint64_t> acked_ahead;  ///< sequence -> end offset, not yet contiguous
        std::optional<std::string> location;
    };

    object_id id;
    std::vector<destination_slot> slots;
    transfer_config config;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::string session_label;
    std::weak_ptr<replication_coordinator> owner;

    mutable std::mutex mutex;
    std::condition_variable resolved;
    std::size_t in_flight = 0;
    progress_callback on_progress;

    std::atomic<bool> cancelled{false};

    impl(object_id object, std::vector<destination> destinations, const transfer_config& cfg,
         std::shared_ptr<adapters::transfer_thread_pool_interface> p, std::string label)
        : id(std::move(object)), config(cfg), pool(std::move(p)), session_label(std::move(label)) {
        slots.reserve(destinations.size());
        for (auto& dest : destinations) {
            destination_slot slot;
            slot.name = std::string(dest.store->name());
            slot.status.destination = slot.name;
            slot.status.mandatory = dest.mandatory;
            slot.dest = std::move(dest);
            slots.push_back(std::move(slot));
        }
    }

    [[nodiscard]] auto log_context(std::size_t index) const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.session_id = session_label;
        ctx.object_id = id;
        ctx.destination = slots[index].name;
        return ctx;
    }

    // ------------------------------------------------------------------------
    // Attempts, deadlines and retries
    //
    // Every attempt runs as a pool task under its destination's stage. A
    // delayed watch task enforces the chunk timeout and cancellation, and
    // retry backoff is a delayed task as well, so no thread sleeps or blocks
    // on behalf of an attempt. Whichever of the attempt and its watch claims
    // the settle flag first decides the attempt's outcome; a late attempt
    // result is dropped.
    // ------------------------------------------------------------------------

    template <typename T>
    void start_call(std::size_t index, std::string what, std::function<result<T>()> op,
                    std::optional<uint64_t> sequence, bool honor_cancel,
                    std::size_t max_attempts, std::function<void(result<T>)> done,
                    std::function<std::optional<error>()> skip_if = {}) {
        auto call = std::make_shared<destination_call<T>>();
        call->index = index;
        call->what = std::move(what);
        call->sequence = sequence;
        call->op = std::move(op);
        call->skip_if = std::move(skip_if);
        call->done = std::move(done);
        call->honor_cancel = honor_cancel;
        call->max_attempts = std::max<std::size_t>(max_attempts, 1);
        launch(call);
    }

    /**
     * @brief Run an operation to its final outcome from a thread outside the pool
     */
    template <typename T>
    auto call_blocking(std::size_t index, std::string what, std::function<result<T>()> op,
                       bool honor_cancel, std::size_t max_attempts) -> result<T> {
        auto promise = std::make_shared<std::promise<result<T>>>();
        auto future = promise->get_future();
        start_call<T>(index, std::move(what), std::move(op), std::nullopt, honor_cancel,
                      max_attempts,
                      [promise](result<T> outcome) { promise->set_value(std::move(outcome)); });
        try {
            return future.get();
        } catch (const std::future_error& e) {
            return unexpected(error{error_code::internal_error,
                                    std::string("pool dropped the operation: ") + e.what()});
        }
    }

    template <typename T>
    void finish_call(const std::shared_ptr<destination_call<T>>& call, result<T> outcome) {
        auto done = std::move(call->done);
        call->done = nullptr;
        call->op = nullptr;
        call->skip_if = nullptr;
        if (done) {
            done(std::move(outcome));
        }
    }

    /**
     * @brief Queue the next attempt and arm its deadline
     */
    template <typename T>
    void launch(const std::shared_ptr<destination_call<T>>& call) {
        if (call->honor_cancel && cancelled.load()) {
            finish_call(call, result<T>(unexpected(
                                  error{error_code::session_cancelled, "session cancelled"})));
            return;
        }

        auto self = owner.lock();
        if (!self) {
            finish_call(call, result<T>(unexpected(
                                  error{error_code::internal_error, "coordinator released"})));
            return;
        }

        ++call->attempt;
        auto settled = std::make_shared<std::atomic<bool>>(false);
        auto op = call->op;
        auto skip_if = call->skip_if;

        auto attempt = [self, call, op, skip_if, settled]() {
            if (skip_if) {
                if (auto err = skip_if()) {
                    if (!settled->exchange(true)) {
                        self->impl_->finish_call(call, result<T>(unexpected(*err)));
                    }
                    return;
                }
            }

            result<T> outcome = unexpected(error{error_code::internal_error});
            try {
                outcome = op();
            } catch (const std::exception& e) {
                outcome = unexpected(error{error_code::internal_error, e.what()});
            }
            if (settled->exchange(true)) {
                return;
            }
            self->impl_->settle(call, std::move(outcome));
        };

        auto submitted = pool->submit_to_stage(std::move(attempt), slots[call->index].name);
        if (auto reason = refused(submitted)) {
            if (!settled->exchange(true)) {
                finish_call(call, result<T>(unexpected(error{
                                      error_code::internal_error, "pool rejected " + call->what +
                                                                      ": " + *reason})));
            }
            return;
        }

        watch(call, settled, std::chrono::steady_clock::now() + config.chunk_timeout);
    }

    /**
     * @brief Resolve an attempt that outlives its deadline or a cancellation
     *
     * Re-arms itself every poll slice until the attempt settles.
     */
    template <typename T>
    void watch(std::shared_ptr<destination_call<T>> call, settle_flag settled,
               std::chrono::steady_clock::time_point deadline) {
        if (settled->load()) {
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        const bool stop_for_cancel = call->honor_cancel && cancelled.load();
        if (stop_for_cancel || now >= deadline) {
            if (settled->exchange(true)) {
                return;
            }
            if (stop_for_cancel) {
                finish_call(call, result<T>(unexpected(
                                      error{error_code::session_cancelled, "attempt abandoned"})));
            } else {
                settle(call, result<T>(unexpected(error{
                                 error_code::operation_timeout,
                                 "no response within " +
                                     std::to_string(config.chunk_timeout.count()) + " ms"})));
            }
            return;
        }

        auto slice = std::clamp(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
            std::chrono::milliseconds(1), poll_slice);
        std::weak_ptr<replication_coordinator> weak = owner;
        auto tick = pool->submit_delayed(
            [weak, call, settled, deadline]() {
                if (auto self = weak.lock()) {
                    self->impl_->watch(call, settled, deadline);
                }
            },
            slice);
        if (auto reason = refused(tick)) {
            if (!settled->exchange(true)) {
                finish_call(call, result<T>(unexpected(
                                      error{error_code::internal_error,
                                            "deadline of " + call->what + " not armed: " +
                                                *reason})));
            }
        }
    }

    /**
     * @brief Finish the call or schedule a retry after an attempt outcome
     */
    template <typename T>
    void settle(const std::shared_ptr<destination_call<T>>& call, result<T> outcome) {
        if (outcome || outcome.error().code == error_code::session_cancelled ||
            !outcome.error().is_transient() || call->attempt >= call->max_attempts) {
            finish_call(call, std::move(outcome));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            ++slots[call->index].status.retry_count;
        }

        auto delay = calculate_retry_delay(config.retry, call->attempt);
        auto ctx = log_context(call->index);
        ctx.chunk_sequence = call->sequence;
        ctx.attempt = static_cast<uint32_t>(call->attempt);
        ctx.error_message = outcome.error().message;
        CR_LOG_DEBUG_CTX(log_category::replication,
                         call->what + " failed, retrying in " + std::to_string(delay.count()) +
                             " ms",
                         ctx);

        backoff(call, std::chrono::steady_clock::now() + delay);
    }

    /**
     * @brief Relaunch the call once the retry delay has passed
     *
     * The delay runs in poll slices so a cancellation ends the call promptly.
     */
    template <typename T>
    void backoff(std::shared_ptr<destination_call<T>> call,
                 std::chrono::steady_clock::time_point resume_at) {
        if (call->honor_cancel && cancelled.load()) {
            finish_call(call, result<T>(unexpected(
                                  error{error_code::session_cancelled, "session cancelled"})));
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= resume_at) {
            launch(call);
            return;
        }

        auto slice = std::clamp(
            std::chrono::duration_cast<std::chrono::milliseconds>(resume_at - now),
            std::chrono::milliseconds(1), poll_slice);
        std::weak_ptr<replication_coordinator> weak = owner;
        auto tick = pool->submit_delayed(
            [weak, call, resume_at]() {
                if (auto self = weak.lock()) {
                    self->impl_->backoff(call, resume_at);
                }
            },
            slice);
        if (auto reason = refused(tick)) {
            finish_call(call, result<T>(unexpected(error{
                                  error_code::internal_error,
                                  "retry of " + call->what + " not scheduled: " + *reason})));
        }
    }

    void mark_failed(std::size_t index, const error& err, const std::string& what) {
        bool mandatory = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& status = slots[index].status;
            if (status.state == destination_state::failed) {
                return;
            }
            status.state = destination_state::failed;
            status.last_error = err;
            mandatory = status.mandatory;
        }

        auto ctx = log_context(index);
        ctx.error_message = err.message;
        if (mandatory) {
            CR_LOG_ERROR_CTX(log_category::replication, what + " failed; destination failed", ctx);
        } else {
            CR_LOG_WARN_CTX(log_category::replication,
                            what + " failed; continuing without best-effort destination", ctx);
        }
    }

    [[nodiscard]] auto failed(std::size_t index) const -> std::optional<error> {
        std::lock_guard<std::mutex> lock(mutex);
        const auto& status = slots[index].status;
        if (status.state == destination_state::failed) {
            return status.last_error.value_or(error{error_code::chunk_put_failed});
        }
        return std::nullopt;
    }

    [[nodiscard]] auto confirmed_locked() const -> uint64_t {
        std::optional<uint64_t> lowest;
        for (const auto& slot : slots) {
            if (slot.status.mandatory) {
                lowest = std::min(lowest.value_or(slot.status.confirmed_bytes),
                                  slot.status.confirmed_bytes);
            }
        }
        return lowest.value_or(0);
    }

    /**
     * @brief Record an acknowledged chunk and advance the contiguous prefix
     */
    void acknowledge(std::size_t index, const chunk_descriptor& descriptor) {
        progress_callback callback;
        uint64_t confirmed = 0;
        bool advanced = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& slot = slots[index];
            auto seq = descriptor.sequence_number;
            if (seq < slot.next_expected || slot.acked_ahead.count(seq) != 0) {
                return;
            }

            auto before = confirmed_locked();
            slot.status.bytes_transferred += descriptor.length;
            slot.acked_ahead[seq] = descriptor.end_offset();
            for (auto it = slot.acked_ahead.find(slot.next_expected); it != slot.acked_ahead.end();
                 it = slot.acked_ahead.find(slot.next_expected)) {
                slot.status.confirmed_bytes = it->second;
                slot.status.last_chunk_acked = slot.next_expected;
                ++slot.next_expected;
                slot.acked_ahead.erase(it);
            }

            confirmed = confirmed_locked();
            advanced = confirmed > before;
            callback = on_progress;
        }

        if (advanced && callback) {
            callback(confirmed);
        }
    }

    /**
     * @brief Put one chunk to one destination; finish receives the final outcome
     */
    void start_put(std::size_t index, std::shared_ptr<const stream_chunk> chunk,
                   std::function<void(result<void>)> finish) {
        const auto descriptor = chunk->descriptor;
        auto store = slots[index].dest.store;
        auto object = id;
        auto what = "put of chunk " + std::to_string(descriptor.sequence_number);

        start_call<void>(
            index, what,
            [store, object, chunk]() -> result<void> {
                return store->put_chunk(object, chunk->descriptor, chunk->data);
            },
            descriptor.sequence_number, true, config.retry.max_attempts,
            [this, index, descriptor, what, finish = std::move(finish)](result<void> outcome) {
                if (outcome) {
                    if (!cancelled.load()) {
                        acknowledge(index, descriptor);
                    }
                } else if (outcome.error().code != error_code::session_cancelled) {
                    mark_failed(index, outcome.error(), what);
                }
                finish(std::move(outcome));
            },
            [this, index]() { return failed(index); });
    }

    void chunk_resolved() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --in_flight;
        }
        resolved.notify_all();
    }

    void abort_destination(std::size_t index) {
        auto store = slots[index].dest.store;
        auto object = id;
        auto outcome = call_blocking<void>(
            index, "abort",
            [store, object]() -> result<void> { return store->abort_object(object); }, false, 1);
        if (!outcome) {
            auto ctx = log_context(index);
            ctx.error_message = outcome.error().message;
            CR_LOG_WARN_CTX(log_category::replication, "abort of partial object failed", ctx);
        }
    }
};

// ============================================================================
// replication_coordinator
// ============================================================================

auto replication_coordinator::create(object_id id,
                                     std::vector<destination> destinations,
                                     const transfer_config& config,
                                     std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                                     std::string session_label)
    -> std::shared_ptr<replication_coordinator> {
    auto coordinator = std::shared_ptr<replication_coordinator>(new replication_coordinator(
        std::move(id), std::move(destinations), config, std::move(pool),
        std::move(session_label)));
    coordinator->impl_->owner = coordinator;
    return coordinator;
}

replication_coordinator::replication_coordinator(
    object_id id,
    std::vector<destination> destinations,
    const transfer_config& config,
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
    std::string session_label)
    : impl_(std::make_unique<impl>(std::move(id), std::move(destinations), config,
                                   std::move(pool), std::move(session_label))) {}

replication_coordinator::~replication_coordinator() = default;

void replication_coordinator::set_progress_callback(progress_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_progress = std::move(callback);
}

auto replication_coordinator::begin(const std::string& content_type) -> result<void> {
    for (std::size_t i = 0; i < impl_->slots.size(); ++i) {
        auto store = impl_->slots[i].dest.store;
        auto object = impl_->id;
        auto outcome = impl_->call_blocking<void>(
            i, "begin",
            [store, object, content_type]() -> result<void> {
                return store->begin_object(object, content_type);
            },
            true, impl_->config.retry.max_attempts);

        if (outcome) {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->slots[i].status.state = destination_state::active;
            continue;
        }
        if (outcome.error().code == error_code::session_cancelled) {
            return outcome;
        }

        impl_->mark_failed(i, outcome.error(), "begin");
        if (impl_->slots[i].dest.mandatory) {
            return unexpected(error{error_code::chunk_put_failed,
                                    impl_->slots[i].name + ": " + outcome.error().message});
        }
    }
    return {};
}

auto replication_coordinator::dispatch(stream_chunk chunk) -> std::vector<put_future> {
    auto shared_chunk = std::make_shared<const stream_chunk>(std::move(chunk));
    std::vector<put_future> futures(impl_->slots.size());

    std::vector<std::size_t> targets;
    for (std::size_t i = 0; i < impl_->slots.size(); ++i) {
        if (auto err = impl_->failed(i)) {
            futures[i] = ready_future<void>(unexpected(*err));
        } else {
            targets.push_back(i);
        }
    }
    if (targets.empty()) {
        return futures;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        ++impl_->in_flight;
    }

    auto self = shared_from_this();
    auto remaining = std::make_shared<std::atomic<std::size_t>>(targets.size());

    for (auto index : targets) {
        auto promise = std::make_shared<std::promise<result<void>>>();
        futures[index] = promise->get_future().share();

        impl_->start_put(index, shared_chunk,
                         [self, promise, remaining](result<void> outcome) {
                             promise->set_value(std::move(outcome));
                             if (remaining->fetch_sub(1) == 1) {
                                 self->impl_->chunk_resolved();
                             }
                         });
    }

    return futures;
}

auto replication_coordinator::wait_for_capacity(std::size_t limit) -> bool {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->resolved.wait(lock, [&] {
        return impl_->in_flight < limit || impl_->cancelled.load();
    });
    return !impl_->cancelled.load();
}

void replication_coordinator::wait_idle() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->resolved.wait(lock, [&] { return impl_->in_flight == 0; });
}

auto replication_coordinator::complete(stored_object_metadata metadata)
    -> result<stored_object_metadata> {
    std::vector<std::size_t> completed;

    auto rollback = [&]() {
        for (auto index : completed) {
            auto deleted = impl_->slots[index].dest.store->delete_object(impl_->id);
            if (!deleted) {
                auto ctx = impl_->log_context(index);
                ctx.error_message = deleted.error().message;
                CR_LOG_WARN_CTX(log_category::replication,
                                "could not remove object after failed completion", ctx);
            }
        }
    };

    for (std::size_t i = 0; i < impl_->slots.size(); ++i) {
        if (impl_->failed(i)) {
            impl_->abort_destination(i);
            continue;
        }

        auto store = impl_->slots[i].dest.store;
        auto outcome = impl_->call_blocking<std::string>(
            i, "complete",
            [store, metadata]() -> result<std::string> { return store->complete_object(metadata); },
            true, impl_->config.retry.max_attempts);

        if (!outcome) {
            if (outcome.error().code == error_code::session_cancelled) {
                rollback();
                return unexpected(outcome.error());
            }
            impl_->mark_failed(i, outcome.error(), "complete");
            impl_->abort_destination(i);
            if (impl_->slots[i].dest.mandatory) {
                rollback();
                return unexpected(error{error_code::chunk_put_failed,
                                        impl_->slots[i].name + ": " + outcome.error().message});
            }
            continue;
        }

        completed.push_back(i);
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->slots[i].status.state = destination_state::complete;
        impl_->slots[i].location = outcome.value();
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (std::size_t i = 0; i < impl_->slots.size(); ++i) {
        const auto& slot = impl_->slots[i];
        if (!slot.location) {
            continue;
        }
        if (i == 0) {
            metadata.primary_location = *slot.location;
        } else if (!metadata.backup_location) {
            metadata.backup_location = *slot.location;
        }
    }
    return metadata;
}

void replication_coordinator::abort_all() {
    for (std::size_t i = 0; i < impl_->slots.size(); ++i) {
        impl_->abort_destination(i);
    }
}

void replication_coordinator::cancel() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->cancelled.store(true);
    }
    impl_->resolved.notify_all();
}

auto replication_coordinator::is_cancelled() const noexcept -> bool {
    return impl_->cancelled.load();
}

auto replication_coordinator::mandatory_failure() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& slot : impl_->slots) {
        if (slot.status.mandatory && slot.status.state == destination_state::failed) {
            auto cause = slot.status.last_error.value_or(error{error_code::chunk_put_failed});
            return error{error_code::chunk_put_failed, slot.name + ": " + cause.message};
        }
    }
    return std::nullopt;
}

auto replication_coordinator::confirmed_bytes() const -> uint64_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->confirmed_locked();
}

auto replication_coordinator::statuses() const -> std::vector<destination_status> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<destination_status> out;
    out.reserve(impl_->slots.size());
    for (const auto& slot : impl_->slots) {
        out.push_back(slot.status);
        out.back().queued_operations = impl_->pool->pending_tasks(slot.name);
    }
    return out;
}

auto replication_coordinator::in_flight() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->in_flight;
}

auto replication_coordinator::object() const -> const object_id& {
    return impl_->id;
}

}  // namespace chunk_relay
