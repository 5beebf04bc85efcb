// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief I/O task pool implementations
 */

#include "kcenon/media_relay/adapters/thread_pool_adapter.h"
#include "kcenon/media_relay/core/logging.h"

#include <condition_variable>
#include <future>
#include <list>
#include <mutex>
#include <thread>
#include <unordered_map>

#if MEDIA_RELAY_USE_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::media_relay::adapters {

// ============================================================================
// Shared bookkeeping
// ============================================================================

namespace {

/**
 * @brief Counts running tasks overall and per stage, and lets callers wait for zero
 */
class task_tracker {
public:
    void begin(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_;
        ++per_stage_[stage];
    }

    void end(const std::string& stage) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (total_ > 0) --total_;
            auto it = per_stage_.find(stage);
            if (it != per_stage_.end() && it->second > 0) --it->second;
        }
        idle_.notify_all();
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return total_ == 0; });
    }

    [[nodiscard]] auto count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

    [[nodiscard]] auto count(const std::string& stage) const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = per_stage_.find(stage);
        return it == per_stage_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t total_ = 0;
    std::unordered_map<std::string, std::size_t> per_stage_;
};

void run_guarded(const std::function<void()>& task, const std::string& stage) {
    try {
        task();
    } catch (const std::exception& e) {
        MR_LOG_ERROR(log_category::executor,
            "I/O task in stage '" + stage + "' threw: " + e.what());
    }
}

auto default_worker_count(std::size_t requested) -> std::size_t {
    if (requested != 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_io_pool implementation
// ============================================================================

#if MEDIA_RELAY_USE_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
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

struct thread_system_io_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t worker_count{0};
    task_tracker tracker;
};

thread_system_io_pool::thread_system_io_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_io_pool::~thread_system_io_pool() {
    pimpl_->tracker.wait_idle();
    if (pimpl_->pool) {
        pimpl_->pool->stop();
    }
}

auto thread_system_io_pool::create_default(std::size_t worker_count,
                                           const std::string& pool_name)
    -> std::shared_ptr<thread_system_io_pool> {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_io_pool>(std::move(pool), worker_count);
}

void thread_system_io_pool::submit(std::function<void()> task, const std::string& stage) {
    pimpl_->tracker.begin(stage);
    auto* tracker = &pimpl_->tracker;
    auto wrapped = [task = std::move(task), tracker, stage]() {
        run_guarded(task, stage);
        tracker->end(stage);
    };
    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped), stage));
}

void thread_system_io_pool::wait_idle() {
    pimpl_->tracker.wait_idle();
}

auto thread_system_io_pool::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto thread_system_io_pool::active_tasks() const -> std::size_t {
    return pimpl_->tracker.count();
}

auto thread_system_io_pool::active_tasks(const std::string& stage) const -> std::size_t {
    return pimpl_->tracker.count(stage);
}

#endif  // MEDIA_RELAY_USE_THREAD_SYSTEM

// ============================================================================
// async_io_pool implementation
// ============================================================================

struct async_io_pool::impl {
    task_tracker tracker;
    std::mutex futures_mutex;
    std::list<std::future<void>> futures;

    void prune() {
        std::lock_guard<std::mutex> lock(futures_mutex);
        futures.remove_if([](const std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
    }
};

async_io_pool::async_io_pool() : pimpl_(std::make_unique<impl>()) {}

async_io_pool::~async_io_pool() {
    wait_idle();
    std::lock_guard<std::mutex> lock(pimpl_->futures_mutex);
    for (auto& f : pimpl_->futures) {
        f.wait();
    }
}

void async_io_pool::submit(std::function<void()> task, const std::string& stage) {
    pimpl_->prune();
    pimpl_->tracker.begin(stage);

    auto* pimpl = pimpl_.get();
    auto future = std::async(std::launch::async, [pimpl, task = std::move(task), stage]() {
        run_guarded(task, stage);
        pimpl->tracker.end(stage);
    });

    std::lock_guard<std::mutex> lock(pimpl_->futures_mutex);
    pimpl_->futures.push_back(std::move(future));
}

void async_io_pool::wait_idle() {
    pimpl_->tracker.wait_idle();
}

auto async_io_pool::worker_count() const -> std::size_t {
    return default_worker_count(0);
}

auto async_io_pool::active_tasks() const -> std::size_t {
    return pimpl_->tracker.count();
}

auto async_io_pool::active_tasks(const std::string& stage) const -> std::size_t {
    return pimpl_->tracker.count(stage);
}

// ============================================================================
// io_pool_factory implementation
// ============================================================================

auto io_pool_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<io_task_pool> {
#if MEDIA_RELAY_USE_THREAD_SYSTEM
    return thread_system_io_pool::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_io_pool>();
#endif
}

// ============================================================================
// pending_tasks implementation
// ============================================================================

struct pending_tasks::counter {
    mutable std::mutex mutex;
    std::condition_variable idle;
    std::size_t count = 0;

    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --count;
        }
        idle.notify_all();
    }
};

pending_tasks::pending_tasks() : counter_(std::make_shared<counter>()) {}

auto pending_tasks::track(std::function<void()> task) -> std::function<void()> {
    {
        std::lock_guard<std::mutex> lock(counter_->mutex);
        ++counter_->count;
    }
    // The counter outlives an owner that returns from wait() while we notify
    return [c = counter_, task = std::move(task)] {
        struct finish_on_exit {
            counter& c;
            ~finish_on_exit() { c.finish(); }
        } guard{*c};
        task();
    };
}

void pending_tasks::wait() {
    std::unique_lock<std::mutex> lock(counter_->mutex);
    counter_->idle.wait(lock, [this] { return counter_->count == 0; });
}

auto pending_tasks::count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(counter_->mutex);
    return counter_->count;
}

}  // namespace kcenon::media_relay::adapters
