#include "worker_pool.h"

#include <glog/logging.h>

namespace Shardrun {

WorkerPool::WorkerPool(size_t num_threads) : num_threads_(num_threads == 0 ? 1 : num_threads) {
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerThread, this);
    }
    VLOG(2) << "WorkerPool started with " << num_threads_ << " threads";
}

WorkerPool::~WorkerPool() {
    Stop();
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace Shardrun
