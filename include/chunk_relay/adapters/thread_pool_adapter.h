// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool seam for destination operations
 *
 * Destination attempts run as pool tasks. Tasks are grouped into stages
 * (one per destination) so the coordinator can report how many puts are
 * queued for each destination. Retry backoff and attempt deadlines are
 * scheduled with submit_delayed() instead of sleeping on a worker.
 *
 * Implementations, in order of preference:
 * - thread_system_transfer_adapter over kcenon::thread::thread_pool
 * - network_pool_transfer_adapter over network_system's basic_thread_pool
 * - standalone_transfer_pool with a fixed set of std::thread workers
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace chunk_relay::adapters {

/**
 * @brief Interface for the pool that executes destination operations
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that becomes ready when the task has run
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task with delay (useful for retries with backoff)
     *
     * No worker is held while the delay runs. Tasks whose delay has not
     * passed when the pool stops are dropped; their future reports
     * std::future_errc::broken_promise.
     * @param delay Time to wait before the task is queued
     */
    virtual std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) = 0;

    /**
     * @brief Submit a task counted under a stage name
     * @param stage_name Destination or pipeline stage the task belongs to
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Tasks of one stage submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs tasks on a thread_system thread_pool
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "chunk_relay_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of workers (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "chunk_relay_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Adapter over network_system's thread_pool_interface
 *
 * Lets the stores' HTTP client and the destination puts share one pool.
 */
class network_pool_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit network_pool_transfer_adapter(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
        const std::string& pool_name = "chunk_relay_pool");

    ~network_pool_transfer_adapter() override;

    network_pool_transfer_adapter(const network_pool_transfer_adapter&) = delete;
    network_pool_transfer_adapter& operator=(const network_pool_transfer_adapter&) = delete;

    [[nodiscard]] static std::shared_ptr<network_pool_transfer_adapter> create_basic(
        size_t worker_count = 0,
        const std::string& pool_name = "chunk_relay_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fixed-size pool of std::thread workers
 *
 * Used when neither thread_system nor network_system is available.
 * Destruction stops accepting work, runs the queued tasks and joins.
 */
class standalone_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit standalone_transfer_pool(size_t worker_count = 0);
    ~standalone_transfer_pool() override;

    standalone_transfer_pool(const standalone_transfer_pool&) = delete;
    standalone_transfer_pool& operator=(const standalone_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    /**
     * @brief Stop accepting tasks, finish queued ones and join the workers
     */
    void shutdown();

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available pool implementation
 */
class transfer_pool_factory {
public:
    /**
     * @param worker_count Number of worker threads (0 = auto-detect)
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "chunk_relay_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace chunk_relay::adapters
