#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxchord {

// Fixed pool of worker threads. Tasks carry a name for log output.
// An exception escaping a task is logged and does not stop the worker.
class TaskExecutor {
public:
    using Task = std::function<void()>;

    explicit TaskExecutor(std::size_t threads = 4);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // Returns false once shutdown has completed
    bool post(std::string name, Task task);

    // Blocks until the queue is empty and no task is running
    void wait_idle();

    // Drains queued work (including work posted by running tasks), then joins
    void shutdown();

    std::size_t thread_count() const { return workers_.size(); }

private:
    struct Item {
        std::string name;
        Task task;
    };

    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<Item> queue_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::size_t active_ = 0;
    bool stopping_ = false;
    bool stopped_ = false;
};

} // namespace voxchord
