// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for destination operations
 */

#include "chunk_relay/adapters/thread_pool_adapter.h"

#include <condition_variable>
#include <deque>
#include <map>
#include <stdexcept>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace chunk_relay::adapters {

namespace {

auto default_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = static_cast<size_t>(std::thread::hardware_concurrency());
    return count < 4 ? 4 : count;
}

/**
 * @brief Per-stage counters of unfinished tasks
 */
class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

/**
 * @brief Timer thread that releases delayed tasks into a pool
 *
 * A release callback runs on the timer thread once its delay has passed and
 * only queues work; it must not block. Callbacks not yet due when stop() is
 * called are destroyed without running.
 */
class delay_scheduler {
public:
    using clock = std::chrono::steady_clock;

    delay_scheduler() : thread_([this] { run(); }) {}

    ~delay_scheduler() { stop(); }

    delay_scheduler(const delay_scheduler&) = delete;
    delay_scheduler& operator=(const delay_scheduler&) = delete;

    auto schedule(std::chrono::milliseconds delay, std::function<void()> release) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return false;
            }
            due_.emplace(clock::now() + delay, std::move(release));
        }
        changed_.notify_one();
        return true;
    }

    void stop() {
        std::multimap<clock::time_point, std::function<void()>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            dropped.swap(due_);
        }
        changed_.notify_one();
        if (thread_.joinable()) {
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            } else {
                thread_.join();
            }
        }
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (due_.empty()) {
                changed_.wait(lock);
                continue;
            }
            auto next = due_.begin();
            if (next->first > clock::now()) {
                changed_.wait_until(lock, next->first);
                continue;
            }
            auto release = std::move(next->second);
            due_.erase(next);
            lock.unlock();
            release();
            lock.lock();
        }
    }

    std::mutex mutex_;
    std::condition_variable changed_;
    std::multimap<clock::time_point, std::function<void()>> due_;
    bool stopping_{false};
    std::thread thread_;
};

/**
 * @brief Wrap a task so its promise receives the outcome
 */
auto bind_promise(std::function<void()> task, std::shared_ptr<std::promise<void>> promise,
                  std::function<void()> on_finish = {}) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise),
            on_finish = std::move(on_finish)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        if (on_finish) {
            on_finish();
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs one destination operation
 */
class destination_job : public kcenon::thread::job {
public:
    explicit destination_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> active{0};
    stage_tracker tracker;
    delay_scheduler timer;

    void dispatch(std::function<void()> task, const std::string& stage_name,
                  std::shared_ptr<std::promise<void>> promise) {
        tracker.increment(stage_name);
        active.fetch_add(1, std::memory_order_relaxed);

        auto wrapped = bind_promise(std::move(task), std::move(promise),
                                    [this, stage = stage_name]() {
                                        tracker.decrement(stage);
                                        active.fetch_sub(1, std::memory_order_relaxed);
                                    });

        auto job = std::make_unique<destination_job>(std::move(wrapped), stage_name);
        pool->enqueue(std::move(job));
    }
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    if (pimpl_) {
        pimpl_->timer.stop();
    }
    if (pimpl_ && pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name,
                                                            worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    return submit_to_stage(std::move(task), pimpl_->pool_name);
}

std::future<void> thread_system_transfer_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* state = pimpl_.get();
    auto scheduled = pimpl_->timer.schedule(
        delay, [state, task = std::move(task), promise]() mutable {
            state->dispatch(std::move(task), state->pool_name, std::move(promise));
        });
    if (!scheduled) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("chunk_relay pool is shut down")));
    }

    return future;
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pimpl_->dispatch(std::move(task), stage_name, std::move(promise));
    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    return pimpl_->active.load(std::memory_order_relaxed);
}

size_t thread_system_transfer_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_transfer_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_pool_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_pool_transfer_adapter::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    std::string pool_name;
    stage_tracker tracker;
};

network_pool_transfer_adapter::network_pool_transfer_adapter(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
    const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
}

network_pool_transfer_adapter::~network_pool_transfer_adapter() = default;

std::shared_ptr<network_pool_transfer_adapter>
network_pool_transfer_adapter::create_basic(size_t worker_count,
                                             const std::string& pool_name) {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        default_worker_count(worker_count));
    return std::make_shared<network_pool_transfer_adapter>(std::move(pool), pool_name);
}

std::future<void> network_pool_transfer_adapter::submit(std::function<void()> task) {
    return pimpl_->pool->submit(std::move(task));
}

std::future<void> network_pool_transfer_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    return pimpl_->pool->submit_delayed(std::move(task), delay);
}

std::future<void> network_pool_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto* tracker = &pimpl_->tracker;
    auto wrapped = [task = std::move(task), tracker, stage = stage_name]() {
        try {
            task();
        } catch (...) {
            tracker->decrement(stage);
            throw;
        }
        tracker->decrement(stage);
    };

    return pimpl_->pool->submit(std::move(wrapped));
}

size_t network_pool_transfer_adapter::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_pool_transfer_adapter::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_pool_transfer_adapter::pending_tasks() const {
    return pimpl_->pool ? pimpl_->pool->pending_tasks() : 0;
}

size_t network_pool_transfer_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// standalone_transfer_pool implementation
// ============================================================================

struct standalone_transfer_pool::impl {
    std::mutex mutex;
    std::condition_variable queue_not_empty;
    std::deque<std::function<void()>> tasks;
    std::vector<std::thread> workers;
    std::atomic<size_t> active{0};
    bool stopping{false};
    stage_tracker tracker;
    delay_scheduler timer;

    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                queue_not_empty.wait(lock, [this] { return stopping || !tasks.empty(); });
                if (tasks.empty()) {
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            task();
        }
    }

    auto enqueue(std::function<void()> task) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                return false;
            }
            tasks.push_back(std::move(task));
        }
        queue_not_empty.notify_one();
        return true;
    }
};

standalone_transfer_pool::standalone_transfer_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    worker_count = default_worker_count(worker_count);
    pimpl_->workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pimpl_->workers.emplace_back([state = pimpl_.get()] { state->worker_loop(); });
    }
}

standalone_transfer_pool::~standalone_transfer_pool() {
    shutdown();
}

void standalone_transfer_pool::shutdown() {
    pimpl_->timer.stop();
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
    }
    pimpl_->queue_not_empty.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> standalone_transfer_pool::submit(std::function<void()> task) {
    return submit_to_stage(std::move(task), "default");
}

std::future<void> standalone_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->tracker.increment(stage_name);
    pimpl_->active.fetch_add(1, std::memory_order_relaxed);

    auto* state = pimpl_.get();
    auto wrapped = bind_promise(std::move(task), promise,
                                [state, stage = stage_name]() {
                                    state->tracker.decrement(stage);
                                    state->active.fetch_sub(1, std::memory_order_relaxed);
                                });

    if (!pimpl_->enqueue(std::move(wrapped))) {
        pimpl_->tracker.decrement(stage_name);
        pimpl_->active.fetch_sub(1, std::memory_order_relaxed);
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("chunk_relay pool is shut down")));
    }

    return future;
}

std::future<void> standalone_transfer_pool::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* state = pimpl_.get();
    auto release = [state, task = std::move(task), promise]() mutable {
        state->active.fetch_add(1, std::memory_order_relaxed);
        auto wrapped = bind_promise(std::move(task), promise, [state]() {
            state->active.fetch_sub(1, std::memory_order_relaxed);
        });
        if (!state->enqueue(std::move(wrapped))) {
            state->active.fetch_sub(1, std::memory_order_relaxed);
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("chunk_relay pool is shut down")));
        }
    };

    if (!pimpl_->timer.schedule(delay, std::move(release))) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("chunk_relay pool is shut down")));
    }

    return future;
}

size_t standalone_transfer_pool::worker_count() const {
    return pimpl_->workers.size();
}

bool standalone_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t standalone_transfer_pool::pending_tasks() const {
    return pimpl_->active.load(std::memory_order_relaxed);
}

size_t standalone_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    return network_pool_transfer_adapter::create_basic(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<standalone_transfer_pool>(worker_count);
#endif
}

}  // namespace chunk_relay::adapters
