#include "task_pool.h"
#include "../utils/logging.h"

TaskPool::TaskPool(const std::string& name, size_t threads) : name_(name) {
    size_t num_threads = (threads == 0) ? std::thread::hardware_concurrency() : threads;
    if (num_threads == 0) num_threads = 1;
    LOG_DEBUG("Starting " << num_threads << " worker(s) for pool '" << name_ << "'");
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
}

TaskPool::~TaskPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        worker.join();
    }
}
