#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Shardrun {

/**
 * Fixed-width thread pool. Tasks run in submission order as workers free up;
 * an exception thrown by a task is delivered through its future.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename Callback>
    auto Submit(Callback&& callback) -> std::future<std::invoke_result_t<std::decay_t<Callback>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<Callback>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<Callback>(callback));
        auto future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("Submit on stopped WorkerPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return future;
    }

    // Drains queued tasks, then joins every worker.
    void Stop();

    size_t size() const { return num_threads_; }

private:
    void WorkerThread();

    const size_t num_threads_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace Shardrun
