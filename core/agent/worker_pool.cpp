#include "worker_pool.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace hostlink {
namespace agent {

WorkerPool::WorkerPool(size_t threads, std::string name) : name_(std::move(name)) {
    if (threads == 0) {
        threads = 1;
    }
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
    LOG_DEBUG("[Workers] Pool '" << name_ << "' started with " << threads << " threads");
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ && threads_.empty()) {
            return;
        }
        closed_ = true;
    }
    cv_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // closed and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception &e) {
            LOG_ERROR("[Workers] Task in pool '" << name_ << "' threw: " << e.what());
        }
    }
}

}  // namespace agent
}  // namespace hostlink
