#include "WorkerPool.hpp"
#include <exception>
#include <stdexcept>

WorkerPool::WorkerPool(int workers, ErrorHandler onError)
    : onError_(std::move(onError)) {
    if (workers < 1) {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }
    threads_.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        threads_.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load()) {
            return false;
        }
        queue_.push(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    std::call_once(joinOnce_, [this] {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_.store(true);
        }
        cv_.notify_all();

        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    });
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WorkerPool::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] {
                return !queue_.empty() || shutdown_.load();
            });

            // Drain before exiting
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop();
        }

        try {
            job();
        } catch (const std::exception& e) {
            if (onError_) {
                onError_(std::string("worker job failed: ") + e.what());
            }
        }
    }
}
