#ifndef TASK_REGISTRY_HPP
#define TASK_REGISTRY_HPP

#include "Types.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <string>

// ============== Task Registry ==============
// In-flight tasks keyed by id, plus a bounded history of terminal outcomes.
// Has its own lock so completion and polling never touch the fleet lock.

class TaskRegistry {
private:
    std::map<std::string, TaskRecord> active_;
    std::map<std::string, TaskRecord> finished_;
    std::deque<std::string> finishedOrder_;  // Oldest first, for pruning
    std::size_t historyLimit_;
    unsigned long nextSequence_ = 1;
    mutable std::mutex mutex_;

public:
    explicit TaskRegistry(std::size_t historyLimit = 1024);

    // Issues "elevator_<unit>_<seq>" and records it as Running
    std::string registerTask(int elevatorId);

    // Drops a Running record that never started (reservation rolled back)
    void discard(const std::string& taskId);

    TaskRecord complete(const std::string& taskId);
    TaskRecord fail(const std::string& taskId, const std::string& reason);

    TaskRecord lookup(const std::string& taskId) const;
    std::size_t activeCount() const;

private:
    TaskRecord finish(const std::string& taskId, TaskStatus status,
                      const std::string& reason);
    bool wasIssued(const std::string& taskId) const;
};

#endif // TASK_REGISTRY_HPP
