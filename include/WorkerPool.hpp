#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// ============== Worker Pool ==============
// Fixed set of threads draining a FIFO of jobs. Jobs may block for as long
// as they need (a whole elevator ride); the queue absorbs the backlog.

class WorkerPool {
public:
    using Job = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

private:
    std::queue<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_{false};
    std::once_flag joinOnce_;

    std::vector<std::thread> threads_;
    ErrorHandler onError_;

public:
    explicit WorkerPool(int workers, ErrorHandler onError = nullptr);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown has been requested
    bool submit(Job job);

    // Stop accepting work, run what is queued, join all workers. Safe to call
    // from several threads; every caller returns after the join.
    void shutdown();

    bool isShutdown() const { return shutdown_.load(); }
    std::size_t pending() const;
    std::size_t workerCount() const { return threads_.size(); }

private:
    void workerLoop();
};

#endif // WORKER_POOL_HPP
