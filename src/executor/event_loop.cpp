/**
 * @file event_loop.cpp
 * @brief Thread-backed serial_dispatcher
 */

#include <kcenon/media_relay/executor/serial_dispatcher.h>
#include <kcenon/media_relay/core/logging.h>

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kcenon::media_relay {

namespace {

struct timed_task {
    std::chrono::steady_clock::time_point due;
    uint64_t sequence;
    serial_dispatcher::task fn;
};

struct later_first {
    auto operator()(const timed_task& a, const timed_task& b) const -> bool {
        if (a.due != b.due) return a.due > b.due;
        return a.sequence > b.sequence;
    }
};

}  // namespace

struct event_loop::impl {
    std::mutex mutex;
    std::condition_variable cv;
    std::priority_queue<timed_task, std::vector<timed_task>, later_first> tasks;
    uint64_t next_sequence = 0;
    bool stopping = false;
    std::atomic<bool> running{false};
    std::thread worker;
    std::thread::id worker_id;

    void enqueue(std::chrono::steady_clock::time_point due, task t) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            tasks.push(timed_task{due, next_sequence++, std::move(t)});
        }
        cv.notify_one();
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        worker_id = std::this_thread::get_id();
        while (!stopping) {
            if (tasks.empty()) {
                cv.wait(lock);
                continue;
            }
            auto due = tasks.top().due;
            if (due > std::chrono::steady_clock::now()) {
                cv.wait_until(lock, due);
                continue;
            }
            auto fn = std::move(const_cast<timed_task&>(tasks.top()).fn);
            tasks.pop();
            lock.unlock();
            try {
                fn();
            } catch (const std::exception& e) {
                MR_LOG_ERROR(log_category::executor,
                    std::string("Task escaped the event loop with exception: ") + e.what());
            }
            lock.lock();
        }
    }
};

event_loop::event_loop() : impl_(std::make_unique<impl>()) {}

event_loop::~event_loop() {
    stop();
}

void event_loop::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = false;
    }
    impl_->worker = std::thread([this] { impl_->run(); });
}

void event_loop::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = true;
        impl_->tasks = {};
        impl_->worker_id = std::thread::id{};
    }
    impl_->cv.notify_all();
    if (impl_->worker.joinable()) {
        if (impl_->worker.get_id() == std::this_thread::get_id()) {
            impl_->worker.detach();
        } else {
            impl_->worker.join();
        }
    }
}

auto event_loop::is_running() const -> bool {
    return impl_->running.load();
}

void event_loop::post(task t) {
    impl_->enqueue(std::chrono::steady_clock::now(), std::move(t));
}

void event_loop::post_after(std::chrono::milliseconds delay, task t) {
    impl_->enqueue(std::chrono::steady_clock::now() + delay, std::move(t));
}

auto event_loop::in_context() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->worker_id == std::this_thread::get_id();
}

void event_loop::drain() {
    if (!is_running() || in_context()) {
        return;
    }
    // A discarded marker breaks the promise, so stop() never leaves us waiting
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    post([done] { done->set_value(); });
    future.wait();
}

}  // namespace kcenon::media_relay
