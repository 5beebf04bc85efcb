/**
 * @file deferred_io_pool.h
 * @brief I/O pool that holds tasks until the test runs them
 */

#ifndef KCENON_MEDIA_RELAY_TEST_DEFERRED_IO_POOL_H
#define KCENON_MEDIA_RELAY_TEST_DEFERRED_IO_POOL_H

#include <kcenon/media_relay/adapters/thread_pool_adapter.h>

#include <deque>
#include <mutex>
#include <string>

namespace kcenon::media_relay::test {

class deferred_io_pool : public adapters::io_task_pool {
public:
    void submit(std::function<void()> task, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }

    /**
     * @brief Run held tasks on the calling thread, including ones they submit
     * @return Number of tasks run
     */
    auto run_all() -> std::size_t {
        std::size_t count = 0;
        for (;;) {
            std::function<void()> task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (tasks_.empty()) {
                    return count;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
            ++count;
        }
    }

    void wait_idle() override { run_all(); }

    [[nodiscard]] auto worker_count() const -> std::size_t override { return 1; }

    [[nodiscard]] auto active_tasks() const -> std::size_t override {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    [[nodiscard]] auto active_tasks(const std::string&) const -> std::size_t override {
        return active_tasks();
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> tasks_;
};

}  // namespace kcenon::media_relay::test

#endif  // KCENON_MEDIA_RELAY_TEST_DEFERRED_IO_POOL_H
