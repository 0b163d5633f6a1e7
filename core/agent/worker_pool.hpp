#pragma once

/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool for agent operations
 *
 * The agent's reader thread hands each inbound operation envelope to the
 * pool so that a long exec.run never stalls heartbeats or other requests.
 * Tasks run in FIFO order across N threads; completion order is unspecified.
 */

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace hostlink {
namespace agent {

class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(size_t threads, std::string name);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * @brief Queue a task
     *
     * @return false if the pool is shutting down (task not queued)
     */
    bool submit(Task task);

    /**
     * @brief Stop accepting tasks, run what is queued and join the threads
     *
     * Idempotent. Must not be called from a pool thread.
     */
    void shutdown();

    size_t queued() const;
    size_t size() const { return threads_.size(); }

private:
    void worker_loop();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Task> tasks_;
    bool closed_ = false;
    std::vector<std::thread> threads_;
};

}  // namespace agent
}  // namespace hostlink
