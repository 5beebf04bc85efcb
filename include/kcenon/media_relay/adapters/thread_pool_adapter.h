// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Blocking I/O task pool for media_relay_system
 *
 * Transport calls, device reads and reconnection loops block, so they run
 * on an io_task_pool and post their results back to the serial dispatcher.
 *
 * Implementations:
 * - thread_system_io_pool: kcenon thread_system thread_pool
 * - async_io_pool: std::async fallback that keeps its futures
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if MEDIA_RELAY_USE_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::media_relay::adapters {

/**
 * @brief Interface for running blocking work off the serialized context
 */
class io_task_pool {
public:
    virtual ~io_task_pool() = default;

    /**
     * @brief Run a task on a worker
     * @param task The task to execute
     * @param stage Stage label used for per-stage counts ("download", "upload", ...)
     *
     * Exceptions escaping the task are logged and swallowed by the worker.
     */
    virtual void submit(std::function<void()> task, const std::string& stage) = 0;

    /**
     * @brief Block until all submitted tasks have finished
     */
    virtual void wait_idle() = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto active_tasks() const -> std::size_t = 0;

    [[nodiscard]] virtual auto active_tasks(const std::string& stage) const -> std::size_t = 0;
};

#if MEDIA_RELAY_USE_THREAD_SYSTEM

/**
 * @brief io_task_pool over thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_io_pool : public io_task_pool {
public:
    explicit thread_system_io_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                   std::size_t worker_count);
    ~thread_system_io_pool() override;

    thread_system_io_pool(const thread_system_io_pool&) = delete;
    thread_system_io_pool& operator=(const thread_system_io_pool&) = delete;

    /**
     * @brief Create a started pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static auto create_default(std::size_t worker_count = 0,
                                             const std::string& pool_name = "media_relay_io")
        -> std::shared_ptr<thread_system_io_pool>;

    void submit(std::function<void()> task, const std::string& stage) override;
    void wait_idle() override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto active_tasks() const -> std::size_t override;
    [[nodiscard]] auto active_tasks(const std::string& stage) const -> std::size_t override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // MEDIA_RELAY_USE_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Futures are retained until the task finishes so that submit() never
 * blocks on a discarded future; the destructor waits for outstanding work.
 */
class async_io_pool : public io_task_pool {
public:
    async_io_pool();
    ~async_io_pool() override;

    async_io_pool(const async_io_pool&) = delete;
    async_io_pool& operator=(const async_io_pool&) = delete;

    void submit(std::function<void()> task, const std::string& stage) override;
    void wait_idle() override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto active_tasks() const -> std::size_t override;
    [[nodiscard]] auto active_tasks(const std::string& stage) const -> std::size_t override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Picks thread_system when available, std::async otherwise
 */
class io_pool_factory {
public:
    [[nodiscard]] static auto create(std::size_t worker_count = 0,
                                     const std::string& pool_name = "media_relay_io")
        -> std::shared_ptr<io_task_pool>;

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if MEDIA_RELAY_USE_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

/**
 * @brief Tasks one owner has submitted and not yet seen finish
 *
 * An owner whose tasks capture `this` wraps them with track() and calls
 * wait() from its destructor, after cancelling them.
 */
class pending_tasks {
public:
    pending_tasks();

    pending_tasks(const pending_tasks&) = delete;
    pending_tasks& operator=(const pending_tasks&) = delete;

    /**
     * @brief Count task as pending until it returns or throws
     */
    [[nodiscard]] auto track(std::function<void()> task) -> std::function<void()>;

    /**
     * @brief Block until every tracked task has finished
     */
    void wait();

    [[nodiscard]] auto count() const -> std::size_t;

private:
    struct counter;
    std::shared_ptr<counter> counter_;
};

}  // namespace kcenon::media_relay::adapters
