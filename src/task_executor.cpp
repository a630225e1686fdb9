#include "task_executor.hpp"

#include <iostream>

namespace voxchord {

TaskExecutor::TaskExecutor(std::size_t threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

bool TaskExecutor::post(std::string name, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            std::cerr << "[Executor] Rejected task after shutdown: " << name << std::endl;
            return false;
        }
        queue_.push_back({std::move(name), std::move(task)});
    }
    work_cv_.notify_one();
    return true;
}

void TaskExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void TaskExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    work_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
}

void TaskExecutor::worker_loop() {
    while (true) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] {
                return !queue_.empty() || (stopping_ && active_ == 0);
            });

            if (queue_.empty()) {
                // Stopping and nothing running that could post more work
                work_cv_.notify_all();
                return;
            }

            item = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            item.task();
        } catch (const std::exception& e) {
            std::cerr << "[Executor] Task '" << item.name << "' failed: " << e.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        work_cv_.notify_all();
        idle_cv_.notify_all();
    }
}

} // namespace voxchord
